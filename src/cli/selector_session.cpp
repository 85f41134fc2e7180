#include "cli/selector_session.hpp"

#include <algorithm>

#include "cli/terminal_input.hpp"

namespace pps {

SelectorSession::SelectorSession(std::vector<Record> records, size_t max_rows)
    : all_records_(std::move(records)), max_rows_(std::max<size_t>(max_rows, 1)) {
    Refilter();
}

void SelectorSession::HandleKey(int key) {
    if (Done()) return;

    switch (key) {
        case ESC:
        case CTRL_C:
            state_ = SelectorState::Cancelled;
            return;
        case ENTER:
            // Nothing to pick from an empty result list.
            if (!filtered_.empty()) {
                selected_ = filtered_[cursor_].record.name;
                state_ = SelectorState::Selected;
            }
            return;
        case UP:
            if (cursor_ > 0) --cursor_;
            break;
        case DOWN:
            if (cursor_ + 1 < filtered_.size()) ++cursor_;
            break;
        case BACKSPACE:
            if (query_.empty()) return;
            query_.pop_back();
            Refilter();
            break;
        default:
            if (key < 32 || key > 126) return;
            // A bare 'q' quits; once a filter is being typed it is just input.
            if (key == 'q' && query_.empty()) {
                state_ = SelectorState::Cancelled;
                return;
            }
            query_.push_back(static_cast<char>(key));
            Refilter();
            break;
    }
    ClampCursor();
    ScrollToCursor();
}

const Record* SelectorSession::CursorRecord() const {
    if (filtered_.empty()) return nullptr;
    return &filtered_[cursor_].record;
}

size_t SelectorSession::VisibleCount() const {
    return std::min(max_rows_, filtered_.size() - window_start_);
}

void SelectorSession::Refilter() {
    filtered_ = rank_records(all_records_, query_);
    ClampCursor();
    ScrollToCursor();
}

void SelectorSession::ClampCursor() {
    if (filtered_.empty()) {
        cursor_ = 0;
    } else if (cursor_ >= filtered_.size()) {
        cursor_ = filtered_.size() - 1;
    }
}

void SelectorSession::ScrollToCursor() {
    if (cursor_ < window_start_) {
        window_start_ = cursor_;
    } else if (cursor_ >= window_start_ + max_rows_) {
        window_start_ = cursor_ + 1 - max_rows_;
    }
    // Keep the window full when the list shrank underneath it.
    if (filtered_.size() <= max_rows_) {
        window_start_ = 0;
    } else if (window_start_ + max_rows_ > filtered_.size()) {
        window_start_ = filtered_.size() - max_rows_;
    }
}

} // namespace pps

// Keystroke-driven state of the interactive profile chooser. Pure: it never
// touches the terminal, so it can be driven from tests.
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "kernel/fuzzy_matcher.hpp"
#include "pps_types.hpp"

namespace pps {

enum class SelectorState { Browsing, Selected, Cancelled };

class SelectorSession {
public:
    explicit SelectorSession(std::vector<Record> records, size_t max_rows = 10);

    // Apply one key code (see cli/terminal_input.hpp). Ignored once the
    // session has reached Selected or Cancelled.
    void HandleKey(int key);

    SelectorState State() const { return state_; }
    bool Done() const { return state_ != SelectorState::Browsing; }
    // Set only in the Selected state.
    const std::optional<std::string>& SelectedName() const { return selected_; }

    const std::string& Query() const { return query_; }
    const std::vector<RankedRecord>& Filtered() const { return filtered_; }
    size_t Cursor() const { return cursor_; }
    const Record* CursorRecord() const;

    // Visible slice of Filtered(): [WindowStart(), WindowStart() + VisibleCount()).
    size_t WindowStart() const { return window_start_; }
    size_t VisibleCount() const;
    size_t MaxRows() const { return max_rows_; }

private:
    void Refilter();
    void ClampCursor();
    void ScrollToCursor();

    std::vector<Record> all_records_;
    std::string query_;
    std::vector<RankedRecord> filtered_;
    size_t cursor_ = 0;
    size_t window_start_ = 0;
    size_t max_rows_;
    SelectorState state_ = SelectorState::Browsing;
    std::optional<std::string> selected_;
};

} // namespace pps

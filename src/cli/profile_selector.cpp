#include "cli/profile_selector.hpp"

#include <cstdio>

#ifndef _WIN32
#include <sys/ioctl.h>
#include <unistd.h>
#endif

#include "cli/terminal_input.hpp"
#include "ftxui/dom/elements.hpp"
#include "ftxui/screen/screen.hpp"
#include "ftxui/screen/terminal.hpp"

using namespace ftxui;

namespace pps {

std::string format_profile_display(const Record& record) {
    return record.name + " -> " + record.backend;
}

int terminal_columns(int fd) {
#ifndef _WIN32
    struct winsize ws{};
    if (ioctl(fd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
        return ws.ws_col;
    }
#else
    (void)fd;
#endif
    return Terminal::Size().dimx;
}

ProfileSelector::ProfileSelector(std::vector<Record> records, SelectorOptions options,
                                 std::ostream& out)
    : records_(std::move(records)), options_(std::move(options)), out_(out) {}

Element ProfileSelector::RenderFrame(const SelectorSession& session, const SelectorOptions& options) {
    const auto& filtered = session.Filtered();
    Elements rows;
    if (filtered.empty()) {
        rows.push_back(text("  No matching profiles") | dim);
    }
    const size_t end = session.WindowStart() + session.VisibleCount();
    for (size_t i = session.WindowStart(); i < end; ++i) {
        const bool is_cursor = (i == session.Cursor());
        auto row = text((is_cursor ? "> " : "  ") + format_profile_display(filtered[i].record));
        if (is_cursor) row |= inverted;
        rows.push_back(row);
    }
    return vbox({
        hbox({text(options.prompt + " ") | bold, text(session.Query())}),
        vbox(std::move(rows)),
        text(options.help) | dim,
    });
}

void ProfileSelector::Emit(const std::string& data) {
    out_ << data << std::flush;
    if (!out_) {
        throw ProfileError(ProfileErrc::TerminalIo, "Failed to draw the profile selector");
    }
}

std::optional<std::string> ProfileSelector::Run() {
    SelectorSession session(records_, options_.page_size);
    {
        TerminalInput term_input;
        // Moves back to the top of the last frame, wiping its lines, so a
        // shorter frame leaves nothing stale behind.
        std::string clear_region;

        auto draw = [&] {
            auto document = RenderFrame(session, options_);
            // Lines must not wrap or ResetPosition undercounts. Sized from
            // stderr since stdout is usually a pipe.
            auto screen = Screen::Create(Dimension::Fixed(terminal_columns(fileno(stderr))),
                                         Dimension::Fit(document));
            Render(screen, document);
            Emit(clear_region + screen.ToString());
            clear_region = screen.ResetPosition(/*clear=*/true);
        };

        try {
            draw();
            while (!session.Done()) {
                session.HandleKey(term_input.GetChar());
                if (!session.Done()) draw();
            }
        } catch (const ProfileError&) {
            out_ << clear_region << std::flush;
            throw;
        }
        Emit(clear_region);
    }

    if (session.State() == SelectorState::Cancelled) {
        Emit(options_.prompt + " <canceled>\n");
        return std::nullopt;
    }
    const Record* chosen = session.CursorRecord();
    Emit(options_.prompt + " " + (chosen ? format_profile_display(*chosen) : *session.SelectedName()) + "\n");
    return session.SelectedName();
}

} // namespace pps

// Inline (non full-screen) fuzzy profile chooser
#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "cli/selector_session.hpp"
#include "ftxui/dom/elements.hpp"
#include "pps_types.hpp"

namespace pps {

struct SelectorOptions {
    std::string prompt = "Select Pulumi Profile:";
    std::string help = "↑↓ to move, enter to select, type to filter";
    size_t page_size = 10;
};

// "<name> -> <backend>"
std::string format_profile_display(const Record& record);

// Column count of the terminal behind `fd`, or FTXUI's own estimate when
// `fd` is not a terminal.
int terminal_columns(int fd);

class ProfileSelector {
public:
    ProfileSelector(std::vector<Record> records, SelectorOptions options,
                    std::ostream& out = std::cerr);

    // Takes over stdin in raw mode and draws below the current cursor line.
    // Returns the chosen name, or nullopt when the user cancelled. Terminal
    // failures propagate as ProfileError(TerminalIo) after the drawn region
    // has been erased.
    std::optional<std::string> Run();

    static ftxui::Element RenderFrame(const SelectorSession& session, const SelectorOptions& options);

private:
    void Emit(const std::string& data);

    std::vector<Record> records_;
    SelectorOptions options_;
    std::ostream& out_;
};

} // namespace pps

#pragma once
#include <optional>
#include <string>

#include "cli/command/commands.hpp"
#include "cli_config.hpp"

namespace pps {

struct CliOptions {
    std::optional<std::string> activate;
    std::optional<std::string> new_profile;
    std::optional<std::string> edit;
    std::optional<std::string> remove;
    bool deactivate = false;
    bool current_shell = false;
    bool add = false;
    bool list = false;
};

struct CommandIo {
    std::istream& in;
    std::ostream& out;
    std::ostream& err;
    ChooseFn choose;
};

// Run the single action selected by `options`, in the order add, edit,
// delete, list, deactivate, new, activate, interactive selection. Errors are
// reported on io.err as one "Error: ..." line.
int process_command(const CliOptions& options, const CliConfig& config, const CommandIo& io);

// Chooser backed by the inline terminal selector, drawing on stderr.
ChooseFn make_terminal_chooser(const CliConfig& config);

} // namespace pps

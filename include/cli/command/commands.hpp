#pragma once

#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "cli_config.hpp"
#include "kernel/current_selection.hpp"
#include "kernel/record_store.hpp"

namespace pps {

enum ExitCode : int {
    kExitOk = 0,
    kExitError = 1,
    kExitCancelled = 2,
};

// Interactive chooser: the picked profile name, or nullopt when cancelled.
using ChooseFn = std::function<std::optional<std::string>(const std::vector<Record>&)>;

// Everything a command handler may touch. `persistent` is false in
// current-shell mode (-c).
struct CommandContext {
    const CliConfig& config;
    RecordStore& store;
    CurrentSelection& selection;
    bool persistent;
    std::istream& in;
    std::ostream& out;
    std::ostream& err;
    ChooseFn choose;
};

// Each handle_<command> executes the command and returns the process exit
// code. ProfileError escapes to the caller.

// --add: prompt for name and backend, append to the store
int handle_add(CommandContext& ctx);

// --edit NAME: prompt for a new backend
int handle_edit(CommandContext& ctx, const std::string& name);

// --delete NAME
int handle_delete(CommandContext& ctx, const std::string& name);

// --list
int handle_list(CommandContext& ctx);

// --deactivate
int handle_deactivate(CommandContext& ctx);

// --new NAME: activate a name that need not be registered
int handle_new(CommandContext& ctx, const std::string& name);

// --activate NAME
int handle_activate(CommandContext& ctx, const std::string& name);

// default: interactive selection
int handle_select(CommandContext& ctx);

// Print a confirmation (persistent) or the shell command line (current shell).
void report_selection(CommandContext& ctx, const SelectionResult& result);

} // namespace pps

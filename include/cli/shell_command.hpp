// Render a ShellInstruction as one line of shell syntax for eval.
#pragma once

#include <optional>
#include <string>

#include "kernel/current_selection.hpp"

namespace pps {

enum class ShellFlavor { Posix, Fish, Nushell };

// Flavor from the value of $SHELL (basename "fish" or "nu"); posix otherwise.
ShellFlavor detect_shell_flavor(const std::string& shell_env);

// Parse a config value: "posix", "fish", "nu"/"nushell". "auto" and unknown
// values yield nullopt.
std::optional<ShellFlavor> parse_shell_flavor(const std::string& value);

// Config override if set, else $SHELL.
ShellFlavor resolve_shell_flavor(const std::string& configured);

// export VAR="value" / set -gx VAR "value" / $env.VAR = "value", or the
// matching unset form.
std::string format_shell_command(const ShellInstruction& instruction, ShellFlavor flavor);

} // namespace pps

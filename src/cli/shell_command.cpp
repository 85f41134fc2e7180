#include "cli/shell_command.hpp"

#include <cstdlib>

#include "pps_types.hpp"

namespace pps {

namespace {

std::string quote(const std::string& value, ShellFlavor flavor) {
    std::string out = "\"";
    for (char c : value) {
        bool escape = (c == '\\' || c == '"');
        if (flavor == ShellFlavor::Posix && (c == '$' || c == '`')) escape = true;
        if (flavor == ShellFlavor::Fish && c == '$') escape = true;
        if (escape) out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

} // namespace

ShellFlavor detect_shell_flavor(const std::string& shell_env) {
    const std::string base = fs::path(shell_env).filename().string();
    if (base == "fish") return ShellFlavor::Fish;
    if (base == "nu" || base == "nushell") return ShellFlavor::Nushell;
    return ShellFlavor::Posix;
}

std::optional<ShellFlavor> parse_shell_flavor(const std::string& value) {
    if (value == "posix" || value == "bash" || value == "zsh" || value == "sh") return ShellFlavor::Posix;
    if (value == "fish") return ShellFlavor::Fish;
    if (value == "nu" || value == "nushell") return ShellFlavor::Nushell;
    return std::nullopt;
}

ShellFlavor resolve_shell_flavor(const std::string& configured) {
    if (auto flavor = parse_shell_flavor(configured)) return *flavor;
    const char* shell = std::getenv("SHELL");
    return detect_shell_flavor(shell ? shell : "");
}

std::string format_shell_command(const ShellInstruction& instruction, ShellFlavor flavor) {
    const std::string& var = instruction.variable;
    if (instruction.kind == ShellInstruction::Kind::Unset) {
        switch (flavor) {
            case ShellFlavor::Fish: return "set -e " + var;
            case ShellFlavor::Nushell: return "hide-env " + var;
            case ShellFlavor::Posix: break;
        }
        return "unset " + var;
    }
    const std::string value = quote(instruction.value, flavor);
    switch (flavor) {
        case ShellFlavor::Fish: return "set -gx " + var + " " + value;
        case ShellFlavor::Nushell: return "$env." + var + " = " + value;
        case ShellFlavor::Posix: break;
    }
    return "export " + var + "=" + value;
}

} // namespace pps

#include <optional>
#include <string>

#include "cli/command/commands.hpp"
#include "cli/profile_selector.hpp"

namespace pps {

int handle_list(CommandContext& ctx) {
    const auto& records = ctx.store.load();
    if (records.empty()) {
        ctx.out << "No profiles found.\n";
        return kExitOk;
    }
    const std::optional<std::string> active = ctx.selection.read_pointer();
    ctx.out << "Available profiles:\n";
    for (const auto& record : records) {
        ctx.out << (active && *active == record.name ? "* " : "  ")
                << format_profile_display(record) << "\n";
    }
    return kExitOk;
}

} // namespace pps

#include <string>
#include <variant>

#include "cli/command/commands.hpp"
#include "cli/shell_command.hpp"

namespace pps {

void report_selection(CommandContext& ctx, const SelectionResult& result) {
    if (const auto* instruction = std::get_if<ShellInstruction>(&result)) {
        ctx.out << format_shell_command(*instruction, resolve_shell_flavor(ctx.config.shell)) << "\n";
        return;
    }
    const auto& persisted = std::get<PersistResult>(result);
    switch (persisted.action) {
        case PersistResult::Action::Activated:
            ctx.out << "Pulumi profile activated: " << persisted.name;
            if (!persisted.backend.empty()) ctx.out << " (" << persisted.backend << ")";
            ctx.out << "\n";
            break;
        case PersistResult::Action::Deactivated:
            ctx.out << "Pulumi profile deactivated\n";
            break;
        case PersistResult::Action::NothingToDeactivate:
            ctx.out << "No active Pulumi profile to deactivate\n";
            break;
    }
}

int handle_deactivate(CommandContext& ctx) {
    report_selection(ctx, ctx.selection.deactivate(ctx.persistent));
    return kExitOk;
}

int handle_new(CommandContext& ctx, const std::string& name) {
    // Unregistered names bypass the store entirely.
    report_selection(ctx, ctx.selection.set_unregistered(name, ctx.persistent));
    return kExitOk;
}

int handle_activate(CommandContext& ctx, const std::string& name) {
    const auto& records = ctx.store.load();
    if (!ctx.store.contains(name)) {
        ctx.err << "Profile '" << name << "' not found in Pulumi profiles\n";
        ctx.err << "Available profiles:\n";
        for (const auto& record : records) ctx.err << "  " << record.name << "\n";
        return kExitError;
    }
    report_selection(ctx, ctx.selection.activate_known(name, ctx.persistent));
    return kExitOk;
}

int handle_select(CommandContext& ctx) {
    const auto& records = ctx.store.load();
    if (records.empty()) {
        ctx.err << "No Pulumi profiles found in " << ctx.store.path().string() << "\n";
        ctx.err << "Use --add to create your first profile\n";
        return kExitError;
    }
    std::optional<std::string> chosen = ctx.choose(records);
    if (!chosen) {
        ctx.err << "No profile selected\n";
        return kExitCancelled;
    }
    report_selection(ctx, ctx.selection.activate_known(*chosen, ctx.persistent));
    return kExitOk;
}

} // namespace pps

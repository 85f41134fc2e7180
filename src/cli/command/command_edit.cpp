#include <string>

#include "cli/ask.hpp"
#include "cli/command/commands.hpp"

namespace pps {

int handle_edit(CommandContext& ctx, const std::string& name) {
    ctx.store.load();
    const Record* existing = ctx.store.find(name);
    if (!existing) {
        throw ProfileError(ProfileErrc::NotFound, "Profile '" + name + "' not found");
    }
    const std::string backend = ask(ctx.in, ctx.err, "New backend URL:", existing->backend);
    ctx.store.edit(name, backend);
    ctx.out << "Profile '" << name << "' updated successfully\n";
    return kExitOk;
}

} // namespace pps

#include <string>

#include "cli/command/commands.hpp"

namespace pps {

int handle_delete(CommandContext& ctx, const std::string& name) {
    ctx.store.load();
    ctx.store.remove(name);
    ctx.out << "Profile '" << name << "' deleted successfully\n";
    return kExitOk;
}

} // namespace pps

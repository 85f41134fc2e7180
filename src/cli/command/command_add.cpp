#include <string>

#include "cli/ask.hpp"
#include "cli/command/commands.hpp"

namespace pps {

int handle_add(CommandContext& ctx) {
    ctx.store.load();
    const std::string name = ask(ctx.in, ctx.err, "Profile name:");
    if (name.empty()) {
        throw ProfileError(ProfileErrc::InvalidArgument, "Profile name must not be empty");
    }
    // Fail before asking for the backend.
    if (ctx.store.contains(name)) {
        throw ProfileError(ProfileErrc::Duplicate, "Profile '" + name + "' already exists");
    }
    const std::string backend = ask(ctx.in, ctx.err,
        "Backend URL (e.g. s3://my-bucket/state, file://./state, https://api.pulumi.com):");
    ctx.store.add(name, backend);
    ctx.out << "Profile '" << name << "' added successfully\n";
    return kExitOk;
}

} // namespace pps

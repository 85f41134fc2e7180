#include "cli/process_command.hpp"

#include <exception>
#include <iostream>

#include "cli/profile_selector.hpp"
#include "kernel/user_paths.hpp"

namespace pps {

int process_command(const CliOptions& options, const CliConfig& config, const CommandIo& io) {
  try {
    RecordStore store(config.profiles_path.empty() ? default_profiles_path()
                                                   : expand_user_path(config.profiles_path));
    CurrentSelection selection(store,
                               config.current_profile_path.empty() ? default_current_profile_path()
                                                                   : expand_user_path(config.current_profile_path),
                               config.env_var);
    CommandContext ctx{config, store, selection, !options.current_shell,
                       io.in, io.out, io.err, io.choose};

    if (options.add) return handle_add(ctx);
    if (options.edit) return handle_edit(ctx, *options.edit);
    if (options.remove) return handle_delete(ctx, *options.remove);
    if (options.list) return handle_list(ctx);
    if (options.deactivate) return handle_deactivate(ctx);
    if (options.new_profile) return handle_new(ctx, *options.new_profile);
    if (options.activate) return handle_activate(ctx, *options.activate);
    return handle_select(ctx);
  } catch (const ProfileError& e) {
    io.err << "Error: " << e.what() << "\n";
    return kExitError;
  } catch (const std::exception& e) {
    io.err << "Error: " << e.what() << "\n";
    return kExitError;
  }
}

ChooseFn make_terminal_chooser(const CliConfig& config) {
  SelectorOptions options;
  options.prompt = config.prompt;
  options.page_size = static_cast<size_t>(config.page_size > 0 ? config.page_size : 1);
  return [options](const std::vector<Record>& records) {
    ProfileSelector selector(records, options, std::cerr);
    return selector.Run();
  };
}

} // namespace pps

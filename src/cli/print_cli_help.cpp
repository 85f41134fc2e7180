#include "cli/print_cli_help.hpp"

namespace pps {

void print_cli_help(std::ostream& out) {
  out
      << "Usage: pulumi-profile [options]\n\n"
      << "Interactive Pulumi profile selector. Without options, pick a profile\n"
      << "from an inline fuzzy-filtered list.\n\n"
      << "Options:\n"
      << "  -h, --help                 Show this help message\n"
      << "  -V, --version              Print the version\n"
      << "  -a, --activate <profile>   Activate a profile by name (skips selection)\n"
      << "  -n, --new <profile>        Activate a profile name that is not in the list\n"
      << "  -d, --deactivate           Deactivate PULUMI_BACKEND_URL\n"
      << "  -c, --current              Print a shell command for the current shell\n"
      << "                             instead of persisting the choice\n"
      << "      --add                  Add a new profile interactively\n"
      << "      --edit <profile>       Edit an existing profile's backend URL\n"
      << "      --delete <profile>     Delete a profile\n"
      << "  -l, --list                 List all profiles\n"
      << "      --config <file>        Use a specific configuration file\n"
      << "\n"
      << "Exit status: 0 on success, 1 on error, 2 when the selection is cancelled.\n";
}

} // namespace pps

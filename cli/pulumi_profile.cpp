#include <getopt.h>

#include <iostream>
#include <string>

#include "cli/print_cli_help.hpp"
#include "cli/process_command.hpp"
#include "cli_config.hpp"
#include "kernel/user_paths.hpp"

using namespace pps;

int main(int argc, char** argv) {
    CliOptions options;
    std::string custom_config_path;

    const char* const short_opts = "hVa:n:dcl";
    const option long_opts[] = {
        {"help", no_argument, nullptr, 'h'}, {"version", no_argument, nullptr, 'V'},
        {"activate", required_argument, nullptr, 'a'}, {"new", required_argument, nullptr, 'n'},
        {"deactivate", no_argument, nullptr, 'd'}, {"current", no_argument, nullptr, 'c'},
        {"list", no_argument, nullptr, 'l'}, {"add", no_argument, nullptr, 1001},
        {"edit", required_argument, nullptr, 1002}, {"delete", required_argument, nullptr, 1003},
        {"config", required_argument, nullptr, 2001},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'h': print_cli_help(std::cout); return kExitOk;
        case 'V': std::cout << "pulumi-profile " << kVersion << "\n"; return kExitOk;
        case 'a': options.activate = optarg; break;
        case 'n': options.new_profile = optarg; break;
        case 'd': options.deactivate = true; break;
        case 'c': options.current_shell = true; break;
        case 'l': options.list = true; break;
        case 1001: options.add = true; break;
        case 1002: options.edit = optarg; break;
        case 1003: options.remove = optarg; break;
        case 2001: custom_config_path = optarg; break;
        default: print_cli_help(std::cerr); return kExitError;
        }
    }
    if (optind < argc) {
        std::cerr << "Error: unexpected argument '" << argv[optind] << "'\n";
        print_cli_help(std::cerr);
        return kExitError;
    }

    CliConfig config;
    try {
        if (custom_config_path.empty()) {
            load_or_create_config(default_config_path().string(), config, /*create_if_missing=*/true);
        } else {
            load_or_create_config(custom_config_path, config, /*create_if_missing=*/false);
        }
    } catch (const ProfileError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitError;
    }

    CommandIo io{std::cin, std::cout, std::cerr, make_terminal_chooser(config)};
    return process_command(options, config, io);
}

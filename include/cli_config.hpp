// Lightweight CLI configuration definition and I/O declarations
#pragma once

#include <string>

namespace pps {

struct CliConfig {
    std::string loaded_config_path;
    // Empty paths resolve to the defaults under ~/.pulumi
    std::string profiles_path;
    std::string current_profile_path;
    std::string env_var = "PULUMI_BACKEND_URL";
    // auto | posix | fish | nu
    std::string shell = "auto";
    int page_size = 10;
    std::string prompt = "Select Pulumi Profile:";
};

// Persist the configuration to a YAML file at `path`.
// Returns true on success.
bool write_config_to_file(const CliConfig& config, const std::string& path);

// Load an existing config from `config_path` if it exists. If it does not
// exist and `create_if_missing` is set, write one with the defaults.
// A file that fails to parse only produces a warning on stderr.
void load_or_create_config(const std::string& config_path, CliConfig& config,
                           bool create_if_missing);

} // namespace pps

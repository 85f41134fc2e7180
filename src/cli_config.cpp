// CLI configuration YAML read/write implementation
#include "cli_config.hpp"

#include <algorithm>
#include <iostream>
#include <yaml-cpp/yaml.h>

#include "kernel/user_paths.hpp"
#include "pps_types.hpp"

namespace pps {

bool write_config_to_file(const CliConfig& config, const std::string& path) {
    YAML::Node root;
    root["_comment1"] = "pulumi-profile configuration. Empty paths use ~/.pulumi defaults.";
    root["profiles_path"] = config.profiles_path;
    root["current_profile_path"] = config.current_profile_path;
    root["env_var"] = config.env_var;
    root["shell"] = config.shell;
    root["page_size"] = config.page_size;
    root["prompt"] = config.prompt;

    YAML::Emitter out;
    out << root;
    try {
        write_file_atomic(path, std::string(out.c_str()) + "\n");
        return true;
    } catch (const ProfileError&) {
        return false;
    }
}

void load_or_create_config(const std::string& config_path, CliConfig& config,
                           bool create_if_missing) {
    std::error_code ec;
    if (fs::exists(config_path, ec)) {
        config.loaded_config_path = fs::absolute(config_path, ec).string();
        try {
            // Applied only once every key has converted.
            CliConfig parsed = config;
            YAML::Node root = YAML::LoadFile(config_path);
            if (root["profiles_path"]) parsed.profiles_path = root["profiles_path"].as<std::string>();
            if (root["current_profile_path"]) parsed.current_profile_path = root["current_profile_path"].as<std::string>();
            if (root["env_var"]) parsed.env_var = root["env_var"].as<std::string>();
            if (root["shell"]) parsed.shell = root["shell"].as<std::string>();
            if (root["page_size"]) parsed.page_size = std::max(1, root["page_size"].as<int>());
            if (root["prompt"]) parsed.prompt = root["prompt"].as<std::string>();
            config = parsed;
        } catch (const std::exception& e) {
            std::cerr << "Warning: Could not parse config file '" << config_path
                      << "'. Using default settings. Error: " << e.what() << std::endl;
        }
        if (config.env_var.empty()) {
            std::cerr << "Warning: 'env_var' is empty in '" << config_path
                      << "'. Using PULUMI_BACKEND_URL." << std::endl;
            config.env_var = "PULUMI_BACKEND_URL";
        }
    } else if (create_if_missing) {
        if (write_config_to_file(config, config_path)) {
            config.loaded_config_path = fs::absolute(config_path, ec).string();
        } else {
            std::cerr << "Warning: Could not create default config file '" << config_path << "'." << std::endl;
        }
    } else {
        std::cerr << "Warning: Config file '" << config_path << "' not found. Using default settings." << std::endl;
    }
}

} // namespace pps

// Locations of the per-user files under ~/.pulumi
#pragma once

#include "pps_types.hpp"

namespace pps {

// Resolve the user's home directory from $HOME, then the password database.
// Throws ProfileError(Io) when neither is available.
PPS_API fs::path home_directory();

PPS_API fs::path pulumi_directory();
PPS_API fs::path default_profiles_path();
PPS_API fs::path default_current_profile_path();
PPS_API fs::path default_config_path();

// `configured` with a leading "~/" expanded.
PPS_API fs::path expand_user_path(const std::string& configured);

// Write `content` to a sibling temp file and rename it over `path`.
// Parent directories are created as needed.
PPS_API void write_file_atomic(const fs::path& path, const std::string& content);

} // namespace pps

#include "kernel/user_paths.hpp"

#include <cstdlib>
#include <fstream>
#include <system_error>

#ifdef _WIN32
#include <process.h>
#include <shlobj.h>
#else
#include <pwd.h>
#include <unistd.h>
#endif

namespace pps {

fs::path home_directory() {
    fs::path home_dir;
#ifdef _WIN32
    char path[MAX_PATH];
    if (SHGetFolderPathA(NULL, CSIDL_PROFILE, NULL, 0, path) == S_OK) {
        home_dir = path;
    }
#else
    const char* home = getenv("HOME");
    if (home == nullptr || *home == '\0') {
        struct passwd* pw = getpwuid(getuid());
        if (pw) {
            home = pw->pw_dir;
        }
    }
    if (home) {
        home_dir = home;
    }
#endif
    if (home_dir.empty()) {
        throw ProfileError(ProfileErrc::Io, "Unable to determine home directory");
    }
    return home_dir;
}

fs::path pulumi_directory() { return home_directory() / ".pulumi"; }

fs::path default_profiles_path() { return pulumi_directory() / "profiles.json"; }

fs::path default_current_profile_path() { return pulumi_directory() / "current_profile"; }

fs::path default_config_path() { return pulumi_directory() / "profile_selector.yaml"; }

fs::path expand_user_path(const std::string& configured) {
    if (configured == "~") return home_directory();
    if (configured.rfind("~/", 0) == 0) return home_directory() / configured.substr(2);
    return configured;
}

void write_file_atomic(const fs::path& path, const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw ProfileError(ProfileErrc::Io, "Failed to create directory " +
                               path.parent_path().string() + ": " + ec.message());
        }
    }

#ifdef _WIN32
    const int pid = _getpid();
#else
    const int pid = static_cast<int>(getpid());
#endif
    fs::path temp_path = path;
    temp_path += ".tmp." + std::to_string(pid);

    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw ProfileError(ProfileErrc::Io, "Failed to open file for writing: " + temp_path.string());
        }
        out << content;
        out.flush();
        if (!out) {
            out.close();
            fs::remove(temp_path, ec);
            throw ProfileError(ProfileErrc::Io, "Failed to write file: " + temp_path.string());
        }
    }

    fs::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        throw ProfileError(ProfileErrc::Io, "Failed to replace " + path.string() + ": " + ec.message());
    }
}

} // namespace pps

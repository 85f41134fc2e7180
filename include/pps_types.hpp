#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace pps {
namespace fs = std::filesystem;

#if defined(_WIN32)
    #if defined(PPS_LIB_BUILD)
        #define PPS_API __declspec(dllexport)
    #else
        #define PPS_API __declspec(dllimport)
    #endif
#else // Non-Windows platforms
    #if defined(PPS_LIB_BUILD)
        #define PPS_API __attribute__((visibility("default")))
    #else
        #define PPS_API
    #endif
#endif

// A named backend entry of the profile store.
struct Record {
    std::string name;
    std::string backend;

    bool operator==(const Record& other) const {
        return name == other.name && backend == other.backend;
    }
    bool operator!=(const Record& other) const { return !(*this == other); }
};

enum class ProfileErrc {
    Unknown = 1, NotFound, Duplicate, MalformedStore,
    InvalidArgument, Io, TerminalIo,
};

struct PPS_API ProfileError : public std::runtime_error {
    ProfileError(ProfileErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    ProfileErrc code() const noexcept { return code_; }
private:
    ProfileErrc code_;
};

} // namespace pps

// Active-profile pointer: persisted to a file, or handed back as a
// shell instruction for the invoking process only.
#pragma once

#include <optional>
#include <string>
#include <variant>

#include "kernel/record_store.hpp"
#include "pps_types.hpp"

namespace pps {

// Outcome of a persistent operation (the pointer file was written or removed).
struct PersistResult {
    enum class Action { Activated, Deactivated, NothingToDeactivate };
    Action action = Action::Activated;
    std::string name;
    // Backend of a registered profile; empty for unregistered names and
    // deactivation.
    std::string backend;
};

// Environment change the calling shell has to apply itself.
struct ShellInstruction {
    enum class Kind { Export, Unset };
    Kind kind = Kind::Export;
    std::string variable;
    std::string value;
};

using SelectionResult = std::variant<PersistResult, ShellInstruction>;

class PPS_API CurrentSelection {
public:
    CurrentSelection(const RecordStore& store, fs::path pointer_path,
                     std::string variable = "PULUMI_BACKEND_URL");

    // `name` must be a registered profile (ProfileError(NotFound) otherwise).
    SelectionResult activate_known(const std::string& name, bool persistent) const;
    // Any non-empty name; the exported value is the name itself.
    SelectionResult set_unregistered(const std::string& name, bool persistent) const;
    // Removing an absent pointer file is not an error.
    SelectionResult deactivate(bool persistent) const;

    // Trimmed content of the pointer file, nullopt if absent or blank.
    std::optional<std::string> read_pointer() const;

    const fs::path& pointer_path() const { return pointer_path_; }
    const std::string& variable() const { return variable_; }

private:
    void write_pointer(const std::string& name) const;

    const RecordStore& store_;
    fs::path pointer_path_;
    std::string variable_;
};

} // namespace pps

#include "kernel/current_selection.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

#include "kernel/user_paths.hpp"

namespace pps {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\v\f";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

} // namespace

CurrentSelection::CurrentSelection(const RecordStore& store, fs::path pointer_path,
                                   std::string variable)
    : store_(store), pointer_path_(std::move(pointer_path)), variable_(std::move(variable)) {}

SelectionResult CurrentSelection::activate_known(const std::string& name, bool persistent) const {
    const Record* record = store_.find(name);
    if (!record) {
        throw ProfileError(ProfileErrc::NotFound, "Profile '" + name + "' not found in " + store_.path().string());
    }
    if (!persistent) {
        return ShellInstruction{ShellInstruction::Kind::Export, variable_, record->backend};
    }
    write_pointer(record->name);
    return PersistResult{PersistResult::Action::Activated, record->name, record->backend};
}

SelectionResult CurrentSelection::set_unregistered(const std::string& name, bool persistent) const {
    if (name.empty()) {
        throw ProfileError(ProfileErrc::InvalidArgument, "Profile name must not be empty");
    }
    if (!persistent) {
        return ShellInstruction{ShellInstruction::Kind::Export, variable_, name};
    }
    write_pointer(name);
    return PersistResult{PersistResult::Action::Activated, name, ""};
}

SelectionResult CurrentSelection::deactivate(bool persistent) const {
    if (!persistent) {
        return ShellInstruction{ShellInstruction::Kind::Unset, variable_, ""};
    }
    std::error_code ec;
    bool removed = fs::remove(pointer_path_, ec);
    if (ec) {
        throw ProfileError(ProfileErrc::Io, "Failed to remove " + pointer_path_.string() + ": " + ec.message());
    }
    PersistResult result;
    result.action = removed ? PersistResult::Action::Deactivated : PersistResult::Action::NothingToDeactivate;
    return result;
}

std::optional<std::string> CurrentSelection::read_pointer() const {
    std::ifstream in(pointer_path_, std::ios::binary);
    if (!in) return std::nullopt;
    std::string name = trim(std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>()));
    if (name.empty()) return std::nullopt;
    return name;
}

void CurrentSelection::write_pointer(const std::string& name) const {
    write_file_atomic(pointer_path_, name);
}

} // namespace pps

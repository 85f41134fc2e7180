#include "kernel/record_store.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <unordered_set>

#include "kernel/user_paths.hpp"

namespace pps {

using ordered_json = nlohmann::ordered_json;

namespace {

[[noreturn]] void throw_malformed(const std::string& origin, const std::string& detail) {
    throw ProfileError(ProfileErrc::MalformedStore,
                       "Malformed profile store " + origin + ": " + detail);
}

std::string read_string_field(const ordered_json& entry, const char* key,
                              size_t index, const std::string& origin) {
    auto it = entry.find(key);
    if (it == entry.end() || !it->is_string()) {
        throw_malformed(origin, "entry " + std::to_string(index) + " has no string field '" + key + "'");
    }
    std::string value = it->get<std::string>();
    if (value.empty()) {
        throw_malformed(origin, "entry " + std::to_string(index) + " has an empty '" + key + "'");
    }
    return value;
}

void require_non_empty(const std::string& value, const char* what) {
    if (value.empty()) {
        throw ProfileError(ProfileErrc::InvalidArgument, std::string("Profile ") + what + " must not be empty");
    }
}

} // namespace

std::vector<Record> parse_records(const std::string& text, const std::string& origin) {
    std::vector<Record> records;
    if (std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); })) {
        return records;
    }

    ordered_json root;
    try {
        root = ordered_json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw_malformed(origin, e.what());
    }
    if (!root.is_array()) throw_malformed(origin, "root is not an array of profiles");

    std::unordered_set<std::string> seen;
    records.reserve(root.size());
    for (size_t i = 0; i < root.size(); ++i) {
        const auto& entry = root[i];
        if (!entry.is_object()) {
            throw_malformed(origin, "entry " + std::to_string(i) + " is not an object");
        }
        if (entry.size() != 2) {
            throw_malformed(origin, "entry " + std::to_string(i) + " must have exactly 'name' and 'backend'");
        }
        Record record{read_string_field(entry, "name", i, origin),
                      read_string_field(entry, "backend", i, origin)};
        if (!seen.insert(record.name).second) {
            throw_malformed(origin, "duplicate profile name '" + record.name + "'");
        }
        records.push_back(std::move(record));
    }
    return records;
}

std::string serialize_records(const std::vector<Record>& records) {
    ordered_json root = ordered_json::array();
    for (const auto& r : records) {
        ordered_json entry;
        entry["name"] = r.name;
        entry["backend"] = r.backend;
        root.push_back(std::move(entry));
    }
    return root.dump(2) + "\n";
}

RecordStore::RecordStore(fs::path store_path) : path_(std::move(store_path)) {}

const std::vector<Record>& RecordStore::load() {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        records_.clear();
        return records_;
    }

    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        throw ProfileError(ProfileErrc::Io, "Failed to read profile store: " + path_.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    records_ = parse_records(text, path_.string());
    return records_;
}

const Record* RecordStore::find(const std::string& name) const {
    auto it = std::find_if(records_.begin(), records_.end(),
                           [&](const Record& r) { return r.name == name; });
    return it == records_.end() ? nullptr : &*it;
}

void RecordStore::add(const std::string& name, const std::string& backend) {
    require_non_empty(name, "name");
    require_non_empty(backend, "backend");
    if (contains(name)) {
        throw ProfileError(ProfileErrc::Duplicate, "Profile '" + name + "' already exists");
    }
    auto next = records_;
    next.push_back({name, backend});
    persist(next);
    records_ = std::move(next);
}

void RecordStore::edit(const std::string& name, const std::string& new_backend) {
    auto next = records_;
    auto it = std::find_if(next.begin(), next.end(), [&](const Record& r) { return r.name == name; });
    if (it == next.end()) {
        throw ProfileError(ProfileErrc::NotFound, "Profile '" + name + "' not found");
    }
    require_non_empty(new_backend, "backend");
    it->backend = new_backend;
    persist(next);
    records_ = std::move(next);
}

void RecordStore::remove(const std::string& name) {
    auto next = records_;
    auto it = std::find_if(next.begin(), next.end(), [&](const Record& r) { return r.name == name; });
    if (it == next.end()) {
        throw ProfileError(ProfileErrc::NotFound, "Profile '" + name + "' not found");
    }
    next.erase(it);
    persist(next);
    records_ = std::move(next);
}

void RecordStore::persist(const std::vector<Record>& records) const {
    write_file_atomic(path_, serialize_records(records));
}

} // namespace pps

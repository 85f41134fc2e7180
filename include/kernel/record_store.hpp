// Profile record store backed by a JSON file
#pragma once

#include <string>
#include <vector>

#include "pps_types.hpp"

namespace pps {

// Parse the JSON text of a store file. `origin` names the source in error
// messages. Throws ProfileError(MalformedStore) on any shape violation or
// duplicate name. Whitespace-only text yields an empty sequence.
PPS_API std::vector<Record> parse_records(const std::string& text, const std::string& origin);

// Pretty-printed JSON array, keys in `name`, `backend` order.
PPS_API std::string serialize_records(const std::vector<Record>& records);

// Ordered, name-unique set of records. Every mutation rewrites the whole
// file atomically before returning; a failed write leaves the in-memory
// records untouched. Concurrent writers are not detected (last writer wins).
class PPS_API RecordStore {
public:
    explicit RecordStore(fs::path store_path);

    // Re-read the backing file. A missing file yields an empty store.
    const std::vector<Record>& load();

    void add(const std::string& name, const std::string& backend);
    void edit(const std::string& name, const std::string& new_backend);
    void remove(const std::string& name);

    const std::vector<Record>& list() const { return records_; }
    const Record* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }

    const fs::path& path() const { return path_; }

private:
    void persist(const std::vector<Record>& records) const;

    fs::path path_;
    std::vector<Record> records_;
};

} // namespace pps

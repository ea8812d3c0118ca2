#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <list>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "key_material.hpp"
#include "secret_kind.hpp"
#include "store_file.hpp"

namespace confshield {

struct SecretRecord {
    SecretKind kind;
    std::string original_value;
    std::string placeholder;
    std::string first_seen_in;
    std::chrono::system_clock::time_point created_at;
    // Files the value was seen in, in first-seen order. The only mutable field.
    std::vector<std::string> seen_in;
};

struct StoreOptions {
    std::filesystem::path store_path;
    // 0 fails immediately when another process holds the store.
    std::chrono::milliseconds lock_timeout{0};
};

struct StoreStatistics {
    size_t total = 0;
    std::map<SecretKind, size_t> by_kind;
};

// Encrypted bidirectional index between secret values and placeholders.
//
// One instance belongs to one workflow session. open() takes the exclusive
// store lock and loads the existing file (a missing file is an empty store);
// the lock is held until close() or destruction. Mutations stay in memory
// until persist(), which rewrites the whole file atomically.
//
// Per-kind index counters only ever grow: reset() and expire_older_than()
// drop records but never make an index available again.
class MappingStore {
public:
    MappingStore(StoreOptions options, KeyMaterial key);
    ~MappingStore();

    MappingStore(const MappingStore&) = delete;
    MappingStore& operator=(const MappingStore&) = delete;

    /**
     * Acquires the store lock and loads the store file if present.
     * @throws StoreLockedError if another process holds the store.
     * @throws StoreIntegrityError if the file exists but fails validation.
     */
    void open();

    // Releases the lock and wipes in-memory records. Unpersisted changes are lost.
    void close();

    bool is_open() const { return lock_.has_value(); }

    /**
     * Replaces the in-memory state with the decrypted store file. On any
     * failure the in-memory state is left as it was.
     * @throws StoreNotFoundError if there is no store file.
     * @throws StoreKeyMismatchError, StoreIntegrityError
     */
    void load();

    // Encrypts and atomically writes the full record set.
    void persist();

    const SecretRecord* lookup_by_value(const std::string& value) const;
    const SecretRecord* lookup_by_placeholder(const std::string& placeholder) const;

    /**
     * Registers a new secret under the next index for its kind.
     * @throws DuplicateValueError if the value is already registered.
     */
    const SecretRecord& create(SecretKind kind, const std::string& value, const std::string& filename);

    // Adds filename to the record's seen_in list. Returns false if the placeholder is unknown.
    bool note_seen(const std::string& placeholder, const std::string& filename);

    // Drops every record; counters are kept.
    void reset();

    // Drops records created more than `age` ago. Returns how many were removed.
    size_t expire_older_than(std::chrono::seconds age);

    // Index the next create() for this kind would use.
    uint32_t next_index(SecretKind kind) const;

    size_t size() const { return records_.size(); }
    bool dirty() const { return dirty_; }
    StoreStatistics statistics() const;

    // Records in creation order.
    const std::list<SecretRecord>& records() const { return records_; }

    const std::filesystem::path& path() const { return options_.store_path; }
    std::filesystem::path lock_path() const;

private:
    StoreOptions options_;
    KeyMaterial key_;
    std::optional<StoreLock> lock_;

    std::list<SecretRecord> records_;
    std::unordered_map<std::string, std::list<SecretRecord>::iterator> by_value_;
    std::unordered_map<std::string, std::list<SecretRecord>::iterator> by_placeholder_;
    std::array<uint32_t, kKindTable.size()> counters_{};
    bool dirty_ = false;

    void require_lock(const char* operation) const;
    void erase_record(std::list<SecretRecord>::iterator it);
    void wipe_records();
};

}

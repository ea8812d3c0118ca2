#include "mapping_store.hpp"
#include "errors.hpp"
#include "input_validator.hpp"
#include "placeholder_codec.hpp"
#include "security_logger.hpp"
#include "store_cipher.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <stdexcept>

#include <boost/json.hpp>
#include <openssl/crypto.h>

namespace json = boost::json;

namespace confshield {

namespace {

constexpr int64_t kPayloadFormat = 1;

void cleanse(std::string& s) {
    if (!s.empty()) OPENSSL_cleanse(&s[0], s.size());
}

[[noreturn]] void corrupt(const std::filesystem::path& path, const std::string& what) {
    throw StoreIntegrityError("mapping store payload is invalid (" + what + "): " + path.string());
}

std::string require_string(const json::object& obj, const char* field, const std::filesystem::path& path) {
    const json::value* v = obj.if_contains(field);
    if (!v || !v->is_string()) corrupt(path, std::string("missing string field '") + field + "'");
    return std::string(v->as_string());
}

int64_t require_int(const json::object& obj, const char* field, const std::filesystem::path& path) {
    const json::value* v = obj.if_contains(field);
    if (!v || !v->is_int64()) corrupt(path, std::string("missing integer field '") + field + "'");
    return v->as_int64();
}

}

MappingStore::MappingStore(StoreOptions options, KeyMaterial key)
    : options_(std::move(options)), key_(std::move(key)) {}

MappingStore::~MappingStore() {
    wipe_records();
}

std::filesystem::path MappingStore::lock_path() const {
    std::filesystem::path p = options_.store_path;
    p += ".lock";
    return p;
}

void MappingStore::require_lock(const char* operation) const {
    if (!lock_) {
        throw std::logic_error(std::string("MappingStore::") + operation + " called without open()");
    }
}

void MappingStore::open() {
    if (lock_) return;
    lock_.emplace(StoreLock::acquire(lock_path(), options_.lock_timeout));

    try {
        load();
    } catch (const StoreNotFoundError&) {
        wipe_records();
        counters_.fill(0);
        dirty_ = false;
    } catch (const StoreIntegrityError& e) {
        SecurityLogger::log(SecurityLogger::Level::CRITICAL, SecurityLogger::EventType::INTEGRITY_FAILURE,
                            path().string(), std::string(error_kind_name(e.kind())) + ": " + e.what());
        lock_.reset();
        throw;
    } catch (...) {
        lock_.reset();
        throw;
    }

    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::STORE_OPENED,
                        path().string(), std::to_string(records_.size()) + " records");
}

void MappingStore::close() {
    if (dirty_) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::STORE_PERSISTED,
                            path().string(), "closing with unpersisted changes");
    }
    wipe_records();
    counters_.fill(0);
    dirty_ = false;
    lock_.reset();
}

void MappingStore::load() {
    require_lock("load");

    std::vector<unsigned char> envelope = read_file(options_.store_path);
    std::string plain = StoreCipher::open(key_, envelope, path().string());

    json::value root;
    try {
        root = InputValidator::safe_parse_json(plain);
    } catch (const std::exception&) {
        cleanse(plain);
        corrupt(path(), "malformed JSON");
    }
    cleanse(plain);

    const json::object* obj = root.if_object();
    if (!obj) corrupt(path(), "root is not an object");
    if (require_int(*obj, "format", path()) != kPayloadFormat) corrupt(path(), "unsupported payload format");

    std::array<uint32_t, kKindTable.size()> counters{};
    const json::value* counters_v = obj->if_contains("counters");
    if (!counters_v || !counters_v->is_object()) corrupt(path(), "missing counters");
    for (const auto& kv : counters_v->as_object()) {
        auto kind = kind_from_prefix(std::string(kv.key()));
        if (!kind) corrupt(path(), "unknown kind in counters");
        if (!kv.value().is_int64()) corrupt(path(), "counter is not an integer");
        int64_t n = kv.value().as_int64();
        if (n < 0 || n > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
            corrupt(path(), "counter out of range");
        }
        counters[static_cast<size_t>(*kind)] = static_cast<uint32_t>(n);
    }

    const json::value* records_v = obj->if_contains("records");
    if (!records_v || !records_v->is_array()) corrupt(path(), "missing records");

    std::list<SecretRecord> records;
    std::unordered_map<std::string, std::list<SecretRecord>::iterator> by_value;
    std::unordered_map<std::string, std::list<SecretRecord>::iterator> by_placeholder;

    for (const auto& item : records_v->as_array()) {
        const json::object* r = item.if_object();
        if (!r) corrupt(path(), "record is not an object");

        SecretRecord rec;
        auto kind = kind_from_prefix(require_string(*r, "kind", path()));
        if (!kind) corrupt(path(), "unknown record kind");
        rec.kind = *kind;
        rec.original_value = require_string(*r, "value", path());
        rec.placeholder = require_string(*r, "placeholder", path());
        rec.first_seen_in = require_string(*r, "first_seen_in", path());
        rec.created_at = std::chrono::system_clock::time_point(
            std::chrono::seconds(require_int(*r, "created_at", path())));

        const json::value* seen = r->if_contains("seen_in");
        if (!seen || !seen->is_array()) corrupt(path(), "missing seen_in");
        for (const auto& f : seen->as_array()) {
            if (!f.is_string()) corrupt(path(), "seen_in entry is not a string");
            rec.seen_in.emplace_back(f.as_string());
        }

        if (rec.original_value.empty()) corrupt(path(), "empty value");
        auto id = PlaceholderCodec::decode(rec.placeholder);
        if (!id || id->kind != rec.kind) corrupt(path(), "placeholder does not match kind");
        if (id->index > counters[static_cast<size_t>(rec.kind)]) corrupt(path(), "placeholder index above counter");
        if (by_value.count(rec.original_value)) corrupt(path(), "duplicate value");
        if (by_placeholder.count(rec.placeholder)) corrupt(path(), "duplicate placeholder " + rec.placeholder);

        records.push_back(std::move(rec));
        auto it = std::prev(records.end());
        by_value.emplace(it->original_value, it);
        by_placeholder.emplace(it->placeholder, it);
    }

    wipe_records();
    records_.swap(records);
    by_value_.swap(by_value);
    by_placeholder_.swap(by_placeholder);
    counters_ = counters;
    dirty_ = false;
}

void MappingStore::persist() {
    require_lock("persist");

    json::object counters;
    for (const auto& info : kKindTable) {
        uint32_t n = counters_[static_cast<size_t>(info.kind)];
        if (n > 0) counters[info.prefix] = static_cast<int64_t>(n);
    }

    json::array records;
    for (const auto& rec : records_) {
        json::object r;
        r["kind"] = kind_prefix(rec.kind);
        r["value"] = rec.original_value;
        r["placeholder"] = rec.placeholder;
        r["first_seen_in"] = rec.first_seen_in;
        r["created_at"] = static_cast<int64_t>(
            std::chrono::duration_cast<std::chrono::seconds>(rec.created_at.time_since_epoch()).count());
        json::array seen;
        for (const auto& f : rec.seen_in) seen.emplace_back(f);
        r["seen_in"] = std::move(seen);
        records.emplace_back(std::move(r));
    }

    json::object root;
    root["format"] = kPayloadFormat;
    root["counters"] = std::move(counters);
    root["records"] = std::move(records);

    std::string plain = json::serialize(root);
    std::vector<unsigned char> envelope;
    try {
        envelope = StoreCipher::seal(key_, plain);
    } catch (...) {
        cleanse(plain);
        throw;
    }
    cleanse(plain);

    write_file_atomic(options_.store_path, envelope);
    dirty_ = false;

    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::STORE_PERSISTED,
                        path().string(), std::to_string(records_.size()) + " records");
}

const SecretRecord* MappingStore::lookup_by_value(const std::string& value) const {
    auto it = by_value_.find(value);
    return it == by_value_.end() ? nullptr : &*it->second;
}

const SecretRecord* MappingStore::lookup_by_placeholder(const std::string& placeholder) const {
    auto it = by_placeholder_.find(placeholder);
    return it == by_placeholder_.end() ? nullptr : &*it->second;
}

const SecretRecord& MappingStore::create(SecretKind kind, const std::string& value, const std::string& filename) {
    if (value.empty()) {
        throw std::invalid_argument("cannot register an empty " + kind_name(kind) + " value");
    }
    if (const SecretRecord* existing = lookup_by_value(value)) {
        throw DuplicateValueError("value already registered as " + existing->placeholder +
                                  " (seen in " + filename + ")");
    }

    uint32_t index = next_index(kind);
    std::string placeholder = PlaceholderCodec::encode(kind, index);
    if (by_placeholder_.count(placeholder)) {
        throw StoreIntegrityError("placeholder " + placeholder + " already allocated: " + path().string());
    }

    SecretRecord rec;
    rec.kind = kind;
    rec.original_value = value;
    rec.placeholder = std::move(placeholder);
    rec.first_seen_in = filename;
    rec.created_at = std::chrono::system_clock::now();
    rec.seen_in.push_back(filename);

    records_.push_back(std::move(rec));
    auto it = std::prev(records_.end());
    by_value_.emplace(it->original_value, it);
    by_placeholder_.emplace(it->placeholder, it);
    counters_[static_cast<size_t>(kind)] = index;
    dirty_ = true;

    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::SECRET_REGISTERED,
                        filename, "new " + kind_name(kind) + " as " + it->placeholder);
    return *it;
}

bool MappingStore::note_seen(const std::string& placeholder, const std::string& filename) {
    auto it = by_placeholder_.find(placeholder);
    if (it == by_placeholder_.end()) return false;

    auto& seen = it->second->seen_in;
    if (std::find(seen.begin(), seen.end(), filename) == seen.end()) {
        seen.push_back(filename);
        dirty_ = true;
    }
    return true;
}

void MappingStore::reset() {
    if (!records_.empty()) dirty_ = true;
    wipe_records();
}

size_t MappingStore::expire_older_than(std::chrono::seconds age) {
    auto cutoff = std::chrono::system_clock::now() - age;
    size_t removed = 0;
    for (auto it = records_.begin(); it != records_.end();) {
        auto next = std::next(it);
        if (it->created_at < cutoff) {
            erase_record(it);
            ++removed;
        }
        it = next;
    }
    if (removed > 0) dirty_ = true;
    return removed;
}

uint32_t MappingStore::next_index(SecretKind kind) const {
    uint32_t current = counters_[static_cast<size_t>(kind)];
    if (current == std::numeric_limits<uint32_t>::max()) {
        throw std::overflow_error("placeholder index space exhausted for " + kind_name(kind));
    }
    return current + 1;
}

StoreStatistics MappingStore::statistics() const {
    StoreStatistics stats;
    stats.total = records_.size();
    for (const auto& rec : records_) {
        ++stats.by_kind[rec.kind];
    }
    return stats;
}

void MappingStore::erase_record(std::list<SecretRecord>::iterator it) {
    by_value_.erase(it->original_value);
    by_placeholder_.erase(it->placeholder);
    cleanse(it->original_value);
    records_.erase(it);
}

void MappingStore::wipe_records() {
    by_value_.clear();
    by_placeholder_.clear();
    for (auto& rec : records_) cleanse(rec.original_value);
    records_.clear();
}

}

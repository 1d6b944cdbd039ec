#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "scheduler.hpp"
#include "storage_medium.hpp"
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace pulsesync {

// ============================================================================
// stored_entry - a value plus its versioning and integrity metadata
// ============================================================================

template<typename T>
struct stored_entry {
    T data{};
    int64_t version = 0;
    millis_t created_at = 0;
    millis_t last_modified = 0;
    std::string checksum;

    /// Local mutation not yet confirmed by the remote
    bool is_offline = false;

    /// How the last conflict on this key was resolved, if any
    std::optional<conflict_strategy> resolution;
};

// ============================================================================
// conflict_info - computed when a remote value meets a local entry
// ============================================================================

struct conflict_info {
    int64_t local_version = 0;
    int64_t server_version = 0;
    millis_t local_timestamp = 0;
    millis_t server_timestamp = 0;

    /// Versions differ AND the local write is strictly newer than the server's
    bool has_conflict = false;
};

void to_json(json& j, const conflict_info& info);
void from_json(const json& j, conflict_info& info);

struct storage_info {
    size_t used = 0;
    size_t available = 0;
    size_t total = 0;
    size_t item_count = 0;
};

struct store_options {
    std::string prefix = "pulsesync_";
    size_t quota_bytes = 5 * 1024 * 1024;
    int write_retries = 3;
    std::chrono::milliseconds write_retry_delay{1000};
};

/// A write that still failed after all retries. Callers must treat the
/// value as not persisted.
class store_write_error : public std::runtime_error {
public:
    store_write_error(const std::string& key, int attempts, const std::string& cause)
        : std::runtime_error("write of '" + key + "' failed after " +
                             std::to_string(attempts) + " attempts: " + cause)
        , key_(key) {}

    const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

/// 32-bit rolling hash (h = h*31 + byte) of the canonical JSON text, base 36.
std::string compute_checksum(const json& data);

/// One-level merge: every top-level field of `local` overrides `server`.
/// Nested objects are replaced wholesale, never merged. Non-objects yield `server`.
json shallow_merge(const json& server, const json& local);

// ============================================================================
// versioned_store
// ============================================================================
//
// Namespaced, integrity-checked persistence over a storage_medium. The entry
// (data, metadata and checksum) is serialized into one medium value, so the
// checksum can never be written apart from the data it covers.
//
// Reads are total: a missing, unreadable or corrupted entry comes back as
// nullopt (corrupted entries are evicted). If the medium fails the
// availability probe every operation degrades to a safe default.

class versioned_store {
public:
    using entry_list = std::vector<std::pair<std::string, stored_entry<json>>>;

    versioned_store(storage_medium& medium, timer_service& timers, store_options options = {});

    versioned_store(const versioned_store&) = delete;
    versioned_store& operator=(const versioned_store&) = delete;

    /// Confirmed write: clears the offline flag and resolution tag.
    /// Omitted version means "now". Throws store_write_error when retries run out.
    template<typename T>
    void set(const std::string& key, const T& data, std::optional<int64_t> version = std::nullopt) {
        set_json(key, json(data), version);
    }

    /// Pending local write: keeps the existing version and sets the offline flag.
    template<typename T>
    void mark_offline(const std::string& key, const T& data) {
        mark_offline_json(key, json(data));
    }

    template<typename T>
    std::optional<stored_entry<T>> get(const std::string& key) {
        auto raw = get_json(key);
        if (!raw) return std::nullopt;

        stored_entry<T> entry;
        entry.data = raw->data.template get<T>();
        entry.version = raw->version;
        entry.created_at = raw->created_at;
        entry.last_modified = raw->last_modified;
        entry.checksum = std::move(raw->checksum);
        entry.is_offline = raw->is_offline;
        entry.resolution = raw->resolution;
        return entry;
    }

    void set_json(const std::string& key, const json& data, std::optional<int64_t> version = std::nullopt);
    void mark_offline_json(const std::string& key, const json& data);
    std::optional<stored_entry<json>> get_json(const std::string& key);

    /// Writes a fully specified entry. Recomputes the checksum and stamps
    /// last_modified; returns what was written.
    stored_entry<json> write_entry(const std::string& key, stored_entry<json> entry);

    void remove(const std::string& key);
    bool exists(const std::string& key);
    std::vector<std::string> keys(const std::string& prefix = "");
    void clear();

    storage_info get_storage_info();

    /// Every entry carrying the offline flag, in key order.
    entry_list offline_items();

    template<typename T>
    static conflict_info detect_conflict(const stored_entry<T>* local,
                                         int64_t server_version,
                                         millis_t server_timestamp) {
        conflict_info info;
        info.server_version = server_version;
        info.server_timestamp = server_timestamp;
        if (!local) return info;

        info.local_version = local->version;
        info.local_timestamp = local->last_modified;
        info.has_conflict = local->version != server_version &&
                            local->last_modified > server_timestamp;
        return info;
    }

    /// Applies strategy to a conflicting pair, persists the outcome under key
    /// and returns it.
    stored_entry<json> resolve_conflict(const std::string& key,
                                        const stored_entry<json>& local,
                                        const json& server_data,
                                        int64_t server_version,
                                        conflict_strategy strategy);

    millis_t last_sync();
    void update_last_sync();

    /// Probes the medium once (write/read/remove of a test key) and caches the result.
    bool is_available();

    timer_service& timers() { return timers_; }
    const store_options& options() const { return options_; }

private:
    storage_medium& medium_;
    timer_service& timers_;
    store_options options_;
    std::optional<bool> available_;

    std::string full_key(const std::string& key) const { return options_.prefix + key; }
    std::vector<std::string> namespaced_keys();
    void write_with_retry(const std::string& key, const std::string& value);
    void evict(const std::string& key, const char* reason);
};

} // namespace pulsesync

#endif // __cplusplus

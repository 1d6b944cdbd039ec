#include "pulsesync/versioned_store.hpp"
#include "pulsesync/log.hpp"
#include <algorithm>

namespace pulsesync {

namespace {

constexpr const char* availability_key = "__storage_test__";
constexpr const char* last_sync_key = "last_sync";

json serialize(const stored_entry<json>& entry) {
    json j = {
        {"data", entry.data},
        {"version", entry.version},
        {"createdAt", entry.created_at},
        {"lastModified", entry.last_modified},
        {"checksum", entry.checksum},
        {"isOffline", entry.is_offline}
    };
    if (entry.resolution) {
        j["resolution"] = to_string(*entry.resolution);
    }
    return j;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // anonymous namespace

const char* to_string(conflict_strategy strategy) {
    switch (strategy) {
        case conflict_strategy::local:  return "local";
        case conflict_strategy::server: return "server";
        case conflict_strategy::merge:  return "merge";
    }
    return "server";
}

std::optional<conflict_strategy> conflict_strategy_from_string(const std::string& name) {
    if (name == "local") return conflict_strategy::local;
    if (name == "server") return conflict_strategy::server;
    if (name == "merge") return conflict_strategy::merge;
    return std::nullopt;
}

void to_json(json& j, const conflict_info& info) {
    j = json{
        {"localVersion", info.local_version},
        {"serverVersion", info.server_version},
        {"localTimestamp", info.local_timestamp},
        {"serverTimestamp", info.server_timestamp},
        {"hasConflict", info.has_conflict}
    };
}

void from_json(const json& j, conflict_info& info) {
    info.local_version = j.value("localVersion", int64_t{0});
    info.server_version = j.value("serverVersion", int64_t{0});
    info.local_timestamp = j.value("localTimestamp", millis_t{0});
    info.server_timestamp = j.value("serverTimestamp", millis_t{0});
    info.has_conflict = j.value("hasConflict", false);
}

std::string compute_checksum(const json& data) {
    const std::string text = dump_text(data);
    uint32_t hash = 0;
    for (unsigned char c : text) {
        hash = hash * 31u + c;  // wraps like a signed 32-bit accumulator
    }
    int64_t signed_hash = static_cast<int32_t>(hash);
    return to_base36(static_cast<uint64_t>(signed_hash < 0 ? -signed_hash : signed_hash));
}

json shallow_merge(const json& server, const json& local) {
    if (!server.is_object() || !local.is_object()) {
        return server;
    }
    json merged = server;
    merged.update(local);
    return merged;
}

// ============================================================================
// versioned_store
// ============================================================================

versioned_store::versioned_store(storage_medium& medium, timer_service& timers, store_options options)
    : medium_(medium), timers_(timers), options_(std::move(options)) {}

bool versioned_store::is_available() {
    if (available_) return *available_;

    const std::string key = full_key(availability_key);
    try {
        medium_.set_item(key, availability_key);
        auto value = medium_.get_item(key);
        medium_.remove_item(key);
        available_ = value && *value == availability_key;
    } catch (const storage_error& e) {
        LOG_WARN("store", "Storage medium unavailable: %s", e.what());
        available_ = false;
    }
    return *available_;
}

void versioned_store::write_with_retry(const std::string& key, const std::string& value) {
    const int attempts = options_.write_retries + 1;
    for (int attempt = 1;; ++attempt) {
        try {
            medium_.set_item(full_key(key), value);
            return;
        } catch (const storage_error& e) {
            if (attempt >= attempts) {
                LOG_ERROR("store", "Write of %s failed after %d attempts: %s",
                          key.c_str(), attempts, e.what());
                throw store_write_error(key, attempts, e.what());
            }
            LOG_WARN("store", "Write of %s failed (%s), retrying (%d/%d)",
                     key.c_str(), e.what(), attempt, options_.write_retries);
            timers_.sleep_for(options_.write_retry_delay);
        }
    }
}

stored_entry<json> versioned_store::write_entry(const std::string& key, stored_entry<json> entry) {
    if (!is_available()) {
        LOG_WARN("store", "Storage unavailable, dropping write of %s", key.c_str());
        return entry;
    }

    entry.checksum = compute_checksum(entry.data);
    entry.last_modified = timers_.now_ms();
    if (entry.created_at == 0) {
        entry.created_at = entry.last_modified;
    }
    write_with_retry(key, dump_text(serialize(entry)));
    return entry;
}

void versioned_store::set_json(const std::string& key, const json& data, std::optional<int64_t> version) {
    auto existing = get_json(key);

    stored_entry<json> entry;
    entry.data = data;
    entry.version = version.value_or(timers_.now_ms());
    entry.created_at = existing ? existing->created_at : 0;
    write_entry(key, std::move(entry));
}

void versioned_store::mark_offline_json(const std::string& key, const json& data) {
    auto existing = get_json(key);

    stored_entry<json> entry;
    entry.data = data;
    entry.version = existing ? existing->version : timers_.now_ms();
    entry.created_at = existing ? existing->created_at : 0;
    entry.is_offline = true;
    write_entry(key, std::move(entry));
}

std::optional<stored_entry<json>> versioned_store::get_json(const std::string& key) {
    if (!is_available()) return std::nullopt;

    std::optional<std::string> raw;
    try {
        raw = medium_.get_item(full_key(key));
    } catch (const storage_error& e) {
        LOG_WARN("store", "Read of %s failed: %s", key.c_str(), e.what());
        return std::nullopt;
    }
    if (!raw) return std::nullopt;

    stored_entry<json> entry;
    try {
        json j = json::parse(*raw);
        if (!j.is_object() || !j.contains("data") || !j.contains("checksum")) {
            evict(key, "malformed entry");
            return std::nullopt;
        }
        entry.data = j.at("data");
        entry.checksum = j.at("checksum").get<std::string>();
        entry.version = j.value("version", int64_t{0});
        entry.created_at = j.value("createdAt", millis_t{0});
        entry.last_modified = j.value("lastModified", millis_t{0});
        entry.is_offline = j.value("isOffline", false);
        if (j.contains("resolution") && j["resolution"].is_string()) {
            entry.resolution = conflict_strategy_from_string(j["resolution"].get<std::string>());
        }
    } catch (const json::exception& e) {
        LOG_DEBUG("store", "Unreadable entry %s: %s", key.c_str(), e.what());
        evict(key, "unparseable entry");
        return std::nullopt;
    }

    if (compute_checksum(entry.data) != entry.checksum) {
        evict(key, "checksum mismatch");
        return std::nullopt;
    }
    return entry;
}

void versioned_store::evict(const std::string& key, const char* reason) {
    LOG_WARN("store", "Evicting %s: %s", key.c_str(), reason);
    try {
        medium_.remove_item(full_key(key));
    } catch (const storage_error& e) {
        LOG_ERROR("store", "Failed to evict %s: %s", key.c_str(), e.what());
    }
}

void versioned_store::remove(const std::string& key) {
    if (!is_available()) return;
    try {
        medium_.remove_item(full_key(key));
    } catch (const storage_error& e) {
        LOG_ERROR("store", "Failed to remove %s: %s", key.c_str(), e.what());
    }
}

bool versioned_store::exists(const std::string& key) {
    if (!is_available()) return false;
    try {
        return medium_.get_item(full_key(key)).has_value();
    } catch (const storage_error& e) {
        LOG_WARN("store", "Existence check of %s failed: %s", key.c_str(), e.what());
        return false;
    }
}

std::vector<std::string> versioned_store::namespaced_keys() {
    std::vector<std::string> result;
    if (!is_available()) return result;

    std::vector<std::string> all;
    try {
        all = medium_.all_keys();
    } catch (const storage_error& e) {
        LOG_WARN("store", "Listing keys failed: %s", e.what());
        return result;
    }
    for (auto& key : all) {
        if (starts_with(key, options_.prefix)) {
            result.push_back(std::move(key));
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<std::string> versioned_store::keys(const std::string& prefix) {
    std::vector<std::string> result;
    const std::string availability = full_key(availability_key);
    for (const auto& key : namespaced_keys()) {
        if (key == availability) continue;
        std::string bare = key.substr(options_.prefix.size());
        if (starts_with(bare, prefix)) {
            result.push_back(std::move(bare));
        }
    }
    return result;
}

void versioned_store::clear() {
    auto all = namespaced_keys();
    if (all.empty()) return;
    try {
        medium_.remove_items(all);
    } catch (const storage_error& e) {
        LOG_ERROR("store", "Clear failed: %s", e.what());
    }
}

storage_info versioned_store::get_storage_info() {
    storage_info info;
    if (!is_available()) return info;

    for (const auto& key : namespaced_keys()) {
        try {
            auto value = medium_.get_item(key);
            if (!value) continue;
            info.used += key.size() + value->size();
            ++info.item_count;
        } catch (const storage_error& e) {
            LOG_WARN("store", "Size of %s unknown: %s", key.c_str(), e.what());
        }
    }
    info.total = options_.quota_bytes;
    info.available = info.total > info.used ? info.total - info.used : 0;
    return info;
}

versioned_store::entry_list versioned_store::offline_items() {
    entry_list items;
    for (const auto& key : keys()) {
        auto entry = get_json(key);
        if (entry && entry->is_offline) {
            items.emplace_back(key, std::move(*entry));
        }
    }
    return items;
}

stored_entry<json> versioned_store::resolve_conflict(const std::string& key,
                                                     const stored_entry<json>& local,
                                                     const json& server_data,
                                                     int64_t server_version,
                                                     conflict_strategy strategy) {
    LOG_INFO("store", "Resolving conflict on %s (local v%lld, server v%lld) with '%s'",
             key.c_str(), static_cast<long long>(local.version),
             static_cast<long long>(server_version), to_string(strategy));

    stored_entry<json> resolved;
    resolved.created_at = local.created_at;
    resolved.resolution = strategy;

    switch (strategy) {
        case conflict_strategy::local:
            resolved.data = local.data;
            resolved.version = local.version;
            resolved.is_offline = true;
            break;
        case conflict_strategy::server:
            resolved.data = server_data;
            resolved.version = server_version;
            resolved.is_offline = false;
            break;
        case conflict_strategy::merge:
            resolved.data = shallow_merge(server_data, local.data);
            resolved.version = std::max(local.version, server_version) + 1;
            resolved.is_offline = true;
            break;
    }
    return write_entry(key, std::move(resolved));
}

millis_t versioned_store::last_sync() {
    auto entry = get_json(last_sync_key);
    if (!entry || !entry->data.is_number_integer()) return 0;
    return entry->data.get<millis_t>();
}

void versioned_store::update_last_sync() {
    const millis_t now = timers_.now_ms();
    set_json(last_sync_key, now, now);
}

} // namespace pulsesync

#include "pulsesync/storage_medium.hpp"
#include "pulsesync/log.hpp"

namespace pulsesync {

// ============================================================================
// sqlite_storage_medium
// ============================================================================

namespace {

constexpr int kv_schema_version = 1;

storage_error to_storage_error(const db_error& e) {
    if (e.code() == SQLITE_FULL) {
        return storage_error(std::string("quota exceeded: ") + e.what());
    }
    return storage_error(e.what());
}

} // anonymous namespace

sqlite_storage_medium::sqlite_storage_medium(const std::string& path) {
    try {
        db_ = std::make_unique<database>(path);
        if (db_->schema_version() < kv_schema_version) {
            transaction txn(*db_);
            db_->execute("CREATE TABLE IF NOT EXISTS kv_store ("
                         "key TEXT PRIMARY KEY NOT NULL, "
                         "value TEXT NOT NULL)");
            db_->set_schema_version(kv_schema_version);
            txn.commit();
        }
    } catch (const db_error& e) {
        // Left unopened: every operation reports the medium as unavailable
        LOG_ERROR("storage", "Failed to open storage at %s: %s", path.c_str(), e.what());
        db_.reset();
    }
}

database& sqlite_storage_medium::open_db() {
    if (!db_) {
        throw storage_error("storage medium unavailable");
    }
    return *db_;
}

std::optional<std::string> sqlite_storage_medium::get_item(const std::string& key) {
    try {
        return open_db().query_value("SELECT value FROM kv_store WHERE key = ?", {key});
    } catch (const db_error& e) {
        throw to_storage_error(e);
    }
}

void sqlite_storage_medium::set_item(const std::string& key, const std::string& value) {
    try {
        open_db().execute("INSERT INTO kv_store (key, value) VALUES (?, ?) "
                          "ON CONFLICT (key) DO UPDATE SET value = excluded.value",
                          {key, value});
    } catch (const db_error& e) {
        throw to_storage_error(e);
    }
}

void sqlite_storage_medium::remove_item(const std::string& key) {
    try {
        open_db().execute("DELETE FROM kv_store WHERE key = ?", {key});
    } catch (const db_error& e) {
        throw to_storage_error(e);
    }
}

std::vector<std::string> sqlite_storage_medium::all_keys() {
    try {
        return open_db().query_column("SELECT key FROM kv_store ORDER BY key");
    } catch (const db_error& e) {
        throw to_storage_error(e);
    }
}

void sqlite_storage_medium::remove_items(const std::vector<std::string>& keys) {
    if (keys.empty()) return;
    try {
        database& db = open_db();
        transaction txn(db);
        for (const auto& key : keys) {
            db.execute("DELETE FROM kv_store WHERE key = ?", {key});
        }
        txn.commit();
    } catch (const db_error& e) {
        throw to_storage_error(e);
    }
}

// ============================================================================
// memory_storage_medium
// ============================================================================

void memory_storage_medium::check_available() const {
    if (!available_) {
        throw storage_error("storage medium unavailable");
    }
}

std::optional<std::string> memory_storage_medium::get_item(const std::string& key) {
    check_available();
    auto it = items_.find(key);
    if (it == items_.end()) return std::nullopt;
    return it->second;
}

void memory_storage_medium::set_item(const std::string& key, const std::string& value) {
    check_available();
    ++write_attempts_;
    if (failing_writes_ > 0) {
        --failing_writes_;
        throw storage_error("simulated write failure");
    }
    if (quota_) {
        size_t used = key.size() + value.size();
        for (const auto& [k, v] : items_) {
            if (k != key) used += k.size() + v.size();
        }
        if (used > *quota_) {
            throw storage_error("quota exceeded");
        }
    }
    items_[key] = value;
}

void memory_storage_medium::remove_item(const std::string& key) {
    check_available();
    items_.erase(key);
}

std::vector<std::string> memory_storage_medium::all_keys() {
    check_available();
    std::vector<std::string> keys;
    keys.reserve(items_.size());
    for (const auto& [key, value] : items_) {
        keys.push_back(key);
    }
    return keys;
}

} // namespace pulsesync

#pragma once

#ifdef __cplusplus

#include "db.hpp"
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace pulsesync {

/// Raised by a storage medium when an operation cannot be carried out
/// (medium missing, quota exceeded, I/O failure).
class storage_error : public std::runtime_error {
public:
    explicit storage_error(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// Storage medium interface
// ============================================================================
//
// Raw string key/value persistence underneath versioned_store. Keys arrive
// already namespaced. Every method may throw storage_error.

class storage_medium {
public:
    virtual ~storage_medium() = default;

    virtual std::optional<std::string> get_item(const std::string& key) = 0;
    virtual void set_item(const std::string& key, const std::string& value) = 0;
    virtual void remove_item(const std::string& key) = 0;
    virtual std::vector<std::string> all_keys() = 0;

    // Bulk removal; media with transactions override this.
    virtual void remove_items(const std::vector<std::string>& keys) {
        for (const auto& key : keys) {
            remove_item(key);
        }
    }
};

// ============================================================================
// SQLite-backed medium
// ============================================================================

class sqlite_storage_medium : public storage_medium {
public:
    /// Opens (or creates) the database at path; ":memory:" for a private in-memory store.
    /// A database that cannot be opened leaves the medium unavailable.
    explicit sqlite_storage_medium(const std::string& path);

    std::optional<std::string> get_item(const std::string& key) override;
    void set_item(const std::string& key, const std::string& value) override;
    void remove_item(const std::string& key) override;
    std::vector<std::string> all_keys() override;
    void remove_items(const std::vector<std::string>& keys) override;

    [[nodiscard]] bool is_open() const noexcept { return db_ != nullptr; }
    database& db() { return open_db(); }

private:
    std::unique_ptr<database> db_;

    database& open_db();
};

// ============================================================================
// In-memory medium with fault injection (tests, non-persistent hosts)
// ============================================================================

class memory_storage_medium : public storage_medium {
public:
    std::optional<std::string> get_item(const std::string& key) override;
    void set_item(const std::string& key, const std::string& value) override;
    void remove_item(const std::string& key) override;
    std::vector<std::string> all_keys() override;

    // Every operation throws while unavailable (privacy mode, missing medium)
    void set_available(bool available) { available_ = available; }

    // The next n set_item calls throw (transient write failures)
    void fail_next_writes(int n) { failing_writes_ = n; }

    // Writes that would push the total size past the quota throw
    void set_quota(std::optional<size_t> bytes) { quota_ = bytes; }

    [[nodiscard]] size_t write_attempts() const noexcept { return write_attempts_; }
    [[nodiscard]] size_t size() const noexcept { return items_.size(); }

private:
    std::map<std::string, std::string> items_;
    bool available_ = true;
    int failing_writes_ = 0;
    size_t write_attempts_ = 0;
    std::optional<size_t> quota_;

    void check_available() const;
};

} // namespace pulsesync

#endif // __cplusplus

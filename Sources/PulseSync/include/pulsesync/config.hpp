#pragma once

#ifdef __cplusplus

#include "log.hpp"
#include "versioned_store.hpp"
#include "connectivity_monitor.hpp"
#include "dashboard_repository.hpp"
#include <stdexcept>
#include <string>

namespace pulsesync {

class config_error : public std::runtime_error {
public:
    explicit config_error(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// sync_config - every tunable of the sync layer in one place
// ============================================================================
//
// JSON form (all keys optional, unknown keys ignored):
//
//   {
//     "storagePrefix": "pulsesync_",   "storageQuotaBytes": 5242880,
//     "writeRetries": 3,               "writeRetryDelayMs": 1000,
//     "probeIntervalMs": 30000,        "probeTimeoutMs": 5000,
//     "drainIntervalMs": 10000,        "foregroundProbeDelayMs": 1000,
//     "defaultMaxRetries": 3,          "healthUrl": "/health",
//     "conflictStrategy": "server",    "autoSync": true,
//     "autoSyncIntervalMs": 30000,     "autoSyncRetryDelayMs": 5000,
//     "autoSyncMaxRetries": 3,         "logLevel": "off"
//   }

struct sync_config {
    store_options store;
    monitor_options monitor;
    repository_options repository;
    std::string health_url = "/health";
    log_level level = log_level::off;

    /// Throws config_error on malformed JSON, wrong types or invalid values.
    static sync_config from_json_string(const std::string& text);
    static sync_config from_json(const json& j);
};

/// Reads and parses a configuration file. Throws config_error.
sync_config load_sync_config(const std::string& path);

} // namespace pulsesync

#endif // __cplusplus

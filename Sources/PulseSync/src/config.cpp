#include "pulsesync/config.hpp"
#include <fstream>
#include <sstream>

namespace pulsesync {

namespace {

template<typename T>
bool read_field(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return false;
    try {
        out = it->get<T>();
    } catch (const json::exception&) {
        throw config_error(std::string("invalid type for '") + key + "': " + it->dump());
    }
    return true;
}

void read_bool(const json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    if (!it->is_boolean()) {
        throw config_error(std::string("'") + key + "' must be a boolean");
    }
    out = it->get<bool>();
}

void read_interval(const json& j, const char* key, std::chrono::milliseconds& out) {
    int64_t ms = 0;
    if (!read_field(j, key, ms)) return;
    if (ms <= 0) {
        throw config_error(std::string("'") + key + "' must be positive");
    }
    out = std::chrono::milliseconds{ms};
}

void read_count(const json& j, const char* key, int& out) {
    int value = 0;
    if (!read_field(j, key, value)) return;
    if (value < 0) {
        throw config_error(std::string("'") + key + "' must not be negative");
    }
    out = value;
}

} // anonymous namespace

sync_config sync_config::from_json(const json& j) {
    if (!j.is_object()) {
        throw config_error("configuration must be a JSON object");
    }

    sync_config config;

    // Store
    read_field(j, "storagePrefix", config.store.prefix);
    int64_t quota = 0;
    if (read_field(j, "storageQuotaBytes", quota)) {
        if (quota <= 0) throw config_error("'storageQuotaBytes' must be positive");
        config.store.quota_bytes = static_cast<size_t>(quota);
    }
    read_count(j, "writeRetries", config.store.write_retries);
    int64_t retry_delay = 0;
    if (read_field(j, "writeRetryDelayMs", retry_delay)) {
        if (retry_delay < 0) throw config_error("'writeRetryDelayMs' must not be negative");
        config.store.write_retry_delay = std::chrono::milliseconds{retry_delay};
    }

    // Monitor
    read_interval(j, "probeIntervalMs", config.monitor.probe_interval);
    read_interval(j, "probeTimeoutMs", config.monitor.probe_timeout);
    read_interval(j, "drainIntervalMs", config.monitor.drain_interval);
    read_interval(j, "foregroundProbeDelayMs", config.monitor.foreground_probe_delay);
    read_count(j, "defaultMaxRetries", config.monitor.default_max_retries);
    if (config.monitor.default_max_retries == 0) {
        throw config_error("'defaultMaxRetries' must be at least 1");
    }
    read_field(j, "healthUrl", config.health_url);

    // Repository
    std::string strategy;
    if (read_field(j, "conflictStrategy", strategy)) {
        auto parsed = conflict_strategy_from_string(strategy);
        if (!parsed) throw config_error("unknown conflict strategy '" + strategy + "'");
        config.repository.strategy = *parsed;
    }
    read_bool(j, "autoSync", config.repository.auto_sync);
    read_interval(j, "autoSyncIntervalMs", config.repository.auto_sync_interval);
    read_interval(j, "autoSyncRetryDelayMs", config.repository.auto_sync_retry_delay);
    read_count(j, "autoSyncMaxRetries", config.repository.auto_sync_max_retries);

    // Logging
    std::string level;
    if (read_field(j, "logLevel", level)) {
        auto parsed = log_level_from_string(level);
        if (!parsed) throw config_error("unknown log level '" + level + "'");
        config.level = *parsed;
    }

    return config;
}

sync_config sync_config::from_json_string(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw config_error(std::string("malformed configuration: ") + e.what());
    }
    return from_json(j);
}

sync_config load_sync_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw config_error("cannot open configuration file " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return sync_config::from_json_string(buffer.str());
}

} // namespace pulsesync

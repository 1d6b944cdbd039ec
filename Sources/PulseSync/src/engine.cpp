#include "pulsesync/engine.hpp"
#include "pulsesync/log.hpp"

namespace pulsesync {

sync_engine::sync_engine(const sync_config& config,
                         std::unique_ptr<storage_medium> medium,
                         std::shared_ptr<http_client> client,
                         const std::string& base_url,
                         timer_service& timers)
    : medium_(std::move(medium)) {
    set_log_level(config.level);

    std::string root = base_url;
    while (!root.empty() && root.back() == '/') {
        root.pop_back();
    }

    store_ = std::make_unique<versioned_store>(*medium_, timers, config.store);
    auto probe = std::make_shared<http_reachability_probe>(client, root + config.health_url);
    monitor_ = std::make_unique<connectivity_monitor>(timers, probe, config.monitor);
    auto api = std::make_shared<http_dashboard_api>(client, root);
    repository_ = std::make_unique<dashboard_repository>(*store_, *monitor_, api, config.repository);

    LOG_INFO("engine", "Sync layer ready for %s", root.c_str());
}

sync_engine::sync_engine(const sync_config& config,
                         const std::string& db_path,
                         std::shared_ptr<http_client> client,
                         const std::string& base_url,
                         timer_service& timers)
    : sync_engine(config, std::make_unique<sqlite_storage_medium>(db_path),
                  std::move(client), base_url, timers) {}

sync_engine::~sync_engine() {
    // Repository detaches from the monitor, so it goes first
    repository_.reset();
    monitor_.reset();
    store_.reset();
}

} // namespace pulsesync

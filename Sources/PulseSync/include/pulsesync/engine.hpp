#pragma once

#ifdef __cplusplus

#include "config.hpp"
#include "storage_medium.hpp"
#include "versioned_store.hpp"
#include "connectivity_monitor.hpp"
#include "dashboard_api.hpp"
#include "dashboard_repository.hpp"
#include "network.hpp"
#include "scheduler.hpp"
#include <memory>
#include <string>

namespace pulsesync {

// ============================================================================
// sync_engine - the whole sync layer wired from one configuration
// ============================================================================
//
// Owns the medium, store, monitor and repository, and talks to
// <base_url>/dashboards through the given HTTP client. Reachability is probed
// with HEAD <base_url><health_url>. Applies the configured log level.

class sync_engine {
public:
    sync_engine(const sync_config& config,
                std::unique_ptr<storage_medium> medium,
                std::shared_ptr<http_client> client,
                const std::string& base_url,
                timer_service& timers);

    /// SQLite file at db_path (":memory:" for a throwaway store).
    sync_engine(const sync_config& config,
                const std::string& db_path,
                std::shared_ptr<http_client> client,
                const std::string& base_url,
                timer_service& timers);

    ~sync_engine();

    sync_engine(const sync_engine&) = delete;
    sync_engine& operator=(const sync_engine&) = delete;

    dashboard_repository& repository() { return *repository_; }
    connectivity_monitor& monitor() { return *monitor_; }
    versioned_store& store() { return *store_; }

private:
    std::unique_ptr<storage_medium> medium_;
    std::unique_ptr<versioned_store> store_;
    std::unique_ptr<connectivity_monitor> monitor_;
    std::unique_ptr<dashboard_repository> repository_;
};

} // namespace pulsesync

#endif // __cplusplus

#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "scheduler.hpp"
#include "versioned_store.hpp"
#include "connectivity_monitor.hpp"
#include "dashboard.hpp"
#include "dashboard_api.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pulsesync {

/// What the view layer gets back for a dashboard.
struct dashboard_snapshot {
    dashboard value;

    /// Served from local state that the remote has not confirmed
    bool is_offline = false;

    std::optional<conflict_info> conflict;
    std::optional<conflict_strategy> resolution;
};

struct sync_result {
    bool success = false;
    size_t synced_count = 0;
    size_t conflict_count = 0;
    std::vector<std::string> errors;
};

struct sync_status {
    millis_t last_sync_timestamp = 0;
    size_t pending_change_count = 0;
    bool is_online = false;

    /// Ids of dashboards with a recorded, uncleared conflict
    std::vector<std::string> conflict_keys;
};

struct repository_options {
    conflict_strategy strategy = conflict_strategy::server;
    bool auto_sync = true;
    std::chrono::milliseconds auto_sync_interval{30000};
    std::chrono::milliseconds auto_sync_retry_delay{5000};
    int auto_sync_max_retries = 3;
};

// ============================================================================
// dashboard_repository
// ============================================================================
//
// Local-first façade over the dashboard service. Every write lands in the
// store before the remote is contacted; unconfirmed writes stay flagged
// offline until a push succeeds. Persisted layout (under the store prefix):
//
//   dashboard_<id>    one entry per dashboard
//   dashboards_list   ordered id list
//   delete_<id>       tombstone for a deletion awaiting remote confirmation
//   conflict_<id>     last conflict_info seen for the dashboard
//   last_sync         time of the last bulk sync
//
// Dashboards created offline carry a temporary id (temp_<ms>_<suffix>) until
// the remote assigns one; the id is then replaced everywhere.
//
// The store, monitor and timer service must outlive the repository.

class dashboard_repository {
public:
    using listener = connectivity_monitor::listener;
    using listener_id = connectivity_monitor::listener_id;

    dashboard_repository(versioned_store& store,
                         connectivity_monitor& monitor,
                         std::shared_ptr<dashboard_api> api,
                         repository_options options = {});
    ~dashboard_repository();

    dashboard_repository(const dashboard_repository&) = delete;
    dashboard_repository& operator=(const dashboard_repository&) = delete;

    // Reads
    std::optional<dashboard_snapshot> get_dashboard(const std::string& id);
    std::vector<dashboard_snapshot> get_dashboards();

    // Writes. nullopt/false when the remote rejected the change or the
    // store could not persist it.
    std::optional<dashboard_snapshot> create_dashboard(const dashboard_draft& draft);
    std::optional<dashboard_snapshot> update_dashboard(const std::string& id, const dashboard_patch& patch);
    bool delete_dashboard(const std::string& id);

    /// Pushes every pending local change. Uses the configured strategy when
    /// none is given.
    sync_result sync_offline_changes(std::optional<conflict_strategy> strategy = std::nullopt);

    sync_status get_sync_status();

    listener_id on_network_status_change(listener fn);
    bool off_network_status_change(listener_id id);

    void clear_conflict(const std::string& id);
    void clear_offline_data();

    void set_conflict_strategy(conflict_strategy strategy) { options_.strategy = strategy; }
    [[nodiscard]] conflict_strategy get_conflict_strategy() const noexcept { return options_.strategy; }

    [[nodiscard]] bool is_syncing() const noexcept { return syncing_; }

    /// Detaches from the monitor and cancels auto-sync. Idempotent.
    void destroy();

    static bool is_temporary_id(const std::string& id);

private:
    struct item_outcome {
        bool synced = false;
        bool conflict = false;
    };

    versioned_store& store_;
    connectivity_monitor& monitor_;
    std::shared_ptr<dashboard_api> api_;
    repository_options options_;

    listener_id status_listener_ = 0;
    std::vector<listener_id> forwarded_listeners_;
    bool was_online_ = false;

    scheduled_task auto_sync_timer_;
    scheduled_task auto_sync_retry_;

    bool syncing_ = false;
    bool destroyed_ = false;

    // Per-item push shared by bulk sync and queue replay. Throws api_error.
    item_outcome sync_item(const std::string& key, conflict_strategy strategy);

    void run_auto_sync(int attempt);
    void on_status_change(const network_status& status);
    void replay_action(const queued_action& action);

    void adopt_created(const std::string& temp_id, const dashboard& server);
    dashboard_snapshot snapshot_of(const stored_entry<dashboard>& entry, bool offline);
    void record_conflict(const std::string& id, const conflict_info& conflict);

    std::vector<std::string> read_list();
    void write_list(const std::vector<std::string>& ids);
    void add_to_list(const std::string& id);
    void remove_from_list(const std::string& id);

    void queue_action(action_kind kind, const std::string& id);
    void drop_actions(const std::string& id);
    void rename_actions(const std::string& old_id, const std::string& new_id);
};

} // namespace pulsesync

#endif // __cplusplus

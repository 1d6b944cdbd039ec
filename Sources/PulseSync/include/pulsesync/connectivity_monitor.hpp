#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "scheduler.hpp"
#include "network.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pulsesync {

// ============================================================================
// Network status
// ============================================================================

/// Link quality as reported by the platform (all fields optional).
struct link_info {
    std::optional<std::string> connection_type;  // "wifi", "cellular", ...
    std::optional<std::string> effective_type;   // "4g", "3g", ...
    std::optional<double> downlink_mbps;
    std::optional<int64_t> rtt_ms;
};

struct network_status {
    bool is_online = false;
    std::optional<millis_t> last_online;
    std::optional<millis_t> last_offline;
    std::optional<link_info> link;
};

// ============================================================================
// Retry queue
// ============================================================================

enum class action_kind {
    create,
    update,
    remove,
    subscribe,
    unsubscribe
};

const char* to_string(action_kind kind);
std::optional<action_kind> action_kind_from_string(const std::string& name);

struct queued_action {
    std::string id;  // <kind>_<timestamp>_<suffix>
    action_kind kind = action_kind::create;
    json payload;
    millis_t enqueued_at = 0;
    int retry_count = 0;
    int max_retries = 3;
};

struct queue_stats {
    size_t total = 0;
    std::map<action_kind, size_t> by_kind;
    std::optional<millis_t> oldest;
    std::optional<millis_t> newest;
};

struct drain_result {
    size_t attempted = 0;
    size_t succeeded = 0;
    size_t dropped = 0;
    std::vector<std::string> errors;
};

struct monitor_options {
    std::chrono::milliseconds probe_interval{30000};
    std::chrono::milliseconds probe_timeout{5000};
    std::chrono::milliseconds drain_interval{10000};
    std::chrono::milliseconds foreground_probe_delay{1000};
    int default_max_retries = 3;
};

// ============================================================================
// connectivity_monitor
// ============================================================================
//
// Online/offline state machine plus the queue of actions waiting for the
// remote. Transitions come from reachability probes (periodic, or shortly
// after the app returns to the foreground) and from platform link signals.
// Signals that would not change the state are ignored, so observed
// transitions strictly alternate.
//
// On every Offline -> Online transition listeners run first, then the queue
// is drained. While online the queue is also drained periodically.
//
// Action handlers perform the effect of a queued action and report failure by
// throwing. Kinds with no handler (and no default handler) fail.

class connectivity_monitor {
public:
    using listener = std::function<void(const network_status&)>;
    using listener_id = uint64_t;
    using action_handler = std::function<void(const queued_action&)>;

    connectivity_monitor(timer_service& timers,
                         std::shared_ptr<reachability_probe> probe,
                         monitor_options options = {},
                         bool initially_online = true);
    ~connectivity_monitor();

    connectivity_monitor(const connectivity_monitor&) = delete;
    connectivity_monitor& operator=(const connectivity_monitor&) = delete;

    // Status
    [[nodiscard]] bool is_online() const noexcept { return status_.is_online; }
    [[nodiscard]] const network_status& status() const noexcept { return status_; }

    // Platform signals
    void handle_online();
    void handle_offline();
    void handle_foreground();
    void handle_link_change(const link_info& link);

    /// Runs the reachability probe now and applies the result. Returns it.
    bool check_connectivity();

    // Listeners (called synchronously, in registration order)
    listener_id add_listener(listener fn);
    bool remove_listener(listener_id id);

    // Queue. max_retries must be at least 1 (invalid_argument otherwise).
    std::string enqueue(action_kind kind, json payload, std::optional<int> max_retries = std::nullopt);
    bool dequeue(const std::string& id);
    [[nodiscard]] std::vector<queued_action> list() const { return queue_; }
    [[nodiscard]] size_t pending_count() const noexcept { return queue_.size(); }
    void clear_queue();
    [[nodiscard]] queue_stats stats() const;

    /// Rewrites payloads of queued actions in place (e.g. id replacement).
    void update_payloads(const std::function<void(queued_action&)>& fn);

    void set_action_handler(action_kind kind, action_handler handler);
    void set_default_action_handler(action_handler handler);

    /// Processes a snapshot of the queue, oldest first. No-op while offline
    /// or while another drain is running.
    drain_result drain();

    /// Cancels timers, clears listeners, handlers and queue. Idempotent.
    void destroy();

private:
    timer_service& timers_;
    std::shared_ptr<reachability_probe> probe_;
    monitor_options options_;
    network_status status_;

    std::vector<std::pair<listener_id, listener>> listeners_;
    listener_id next_listener_id_ = 1;

    std::vector<queued_action> queue_;
    std::map<action_kind, action_handler> handlers_;
    action_handler default_handler_;

    scheduled_task probe_timer_;
    scheduled_task drain_timer_;
    scheduled_task foreground_probe_;

    bool draining_ = false;
    bool destroyed_ = false;

    void set_online(bool online);
    void notify_listeners();
    void run_action(const queued_action& action);
};

} // namespace pulsesync

#endif // __cplusplus

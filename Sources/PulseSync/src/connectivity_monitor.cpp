#include "pulsesync/connectivity_monitor.hpp"
#include "pulsesync/log.hpp"
#include <algorithm>
#include <stdexcept>

namespace pulsesync {

const char* to_string(action_kind kind) {
    switch (kind) {
        case action_kind::create:      return "create";
        case action_kind::update:      return "update";
        case action_kind::remove:      return "delete";
        case action_kind::subscribe:   return "subscribe";
        case action_kind::unsubscribe: return "unsubscribe";
    }
    return "unknown";
}

std::optional<action_kind> action_kind_from_string(const std::string& name) {
    if (name == "create") return action_kind::create;
    if (name == "update") return action_kind::update;
    if (name == "delete") return action_kind::remove;
    if (name == "subscribe") return action_kind::subscribe;
    if (name == "unsubscribe") return action_kind::unsubscribe;
    return std::nullopt;
}

connectivity_monitor::connectivity_monitor(timer_service& timers,
                                           std::shared_ptr<reachability_probe> probe,
                                           monitor_options options,
                                           bool initially_online)
    : timers_(timers), probe_(std::move(probe)), options_(options) {
    status_.is_online = initially_online;
    if (initially_online) {
        status_.last_online = timers_.now_ms();
    } else {
        status_.last_offline = timers_.now_ms();
    }

    if (probe_) {
        probe_timer_ = scheduled_task(timers_, timers_.schedule_every(options_.probe_interval, [this]() {
            check_connectivity();
        }));
    }
    drain_timer_ = scheduled_task(timers_, timers_.schedule_every(options_.drain_interval, [this]() {
        if (status_.is_online && !queue_.empty()) {
            drain();
        }
    }));
}

connectivity_monitor::~connectivity_monitor() {
    destroy();
}

// ============================================================================
// State machine
// ============================================================================

void connectivity_monitor::set_online(bool online) {
    if (destroyed_ || status_.is_online == online) return;

    status_.is_online = online;
    if (online) {
        status_.last_online = timers_.now_ms();
        LOG_INFO("network", "Connection restored");
    } else {
        status_.last_offline = timers_.now_ms();
        LOG_INFO("network", "Connection lost");
    }

    notify_listeners();

    if (online) {
        auto result = drain();
        if (result.attempted > 0) {
            LOG_INFO("network", "Replayed %zu queued actions (%zu succeeded, %zu dropped)",
                     result.attempted, result.succeeded, result.dropped);
        }
    }
}

void connectivity_monitor::handle_online() {
    set_online(true);
}

void connectivity_monitor::handle_offline() {
    set_online(false);
}

void connectivity_monitor::handle_foreground() {
    if (destroyed_) return;
    foreground_probe_ = scheduled_task(timers_, timers_.schedule_after(options_.foreground_probe_delay, [this]() {
        check_connectivity();
    }));
}

void connectivity_monitor::handle_link_change(const link_info& link) {
    if (destroyed_) return;
    status_.link = link;
    notify_listeners();
}

bool connectivity_monitor::check_connectivity() {
    if (destroyed_ || !probe_) return status_.is_online;

    bool reachable = probe_->probe(options_.probe_timeout);
    if (!reachable) {
        LOG_DEBUG("network", "Reachability probe failed");
    }
    set_online(reachable);
    return reachable;
}

// ============================================================================
// Listeners
// ============================================================================

connectivity_monitor::listener_id connectivity_monitor::add_listener(listener fn) {
    listener_id id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(fn));
    return id;
}

bool connectivity_monitor::remove_listener(listener_id id) {
    auto it = std::find_if(listeners_.begin(), listeners_.end(),
                           [id](const auto& entry) { return entry.first == id; });
    if (it == listeners_.end()) return false;
    listeners_.erase(it);
    return true;
}

void connectivity_monitor::notify_listeners() {
    // Listeners may add or remove listeners while being notified
    auto snapshot = listeners_;
    const network_status status = status_;
    for (const auto& [id, fn] : snapshot) {
        try {
            fn(status);
        } catch (const std::exception& e) {
            LOG_ERROR("network", "Status listener %llu threw: %s",
                      static_cast<unsigned long long>(id), e.what());
        }
    }
}

// ============================================================================
// Queue
// ============================================================================

std::string connectivity_monitor::enqueue(action_kind kind, json payload, std::optional<int> max_retries) {
    if (max_retries && *max_retries < 1) {
        throw std::invalid_argument("enqueue requires max_retries >= 1");
    }

    queued_action action;
    action.enqueued_at = timers_.now_ms();
    action.id = std::string(to_string(kind)) + "_" + std::to_string(action.enqueued_at) + "_" + random_suffix();
    action.kind = kind;
    action.payload = std::move(payload);
    action.max_retries = max_retries.value_or(options_.default_max_retries);

    LOG_DEBUG("queue", "Queued %s", action.id.c_str());
    queue_.push_back(std::move(action));
    return queue_.back().id;
}

bool connectivity_monitor::dequeue(const std::string& id) {
    auto it = std::find_if(queue_.begin(), queue_.end(),
                           [&id](const queued_action& a) { return a.id == id; });
    if (it == queue_.end()) return false;
    queue_.erase(it);
    return true;
}

void connectivity_monitor::clear_queue() {
    queue_.clear();
}

queue_stats connectivity_monitor::stats() const {
    queue_stats stats;
    stats.total = queue_.size();
    for (const auto& action : queue_) {
        ++stats.by_kind[action.kind];
        if (!stats.oldest || action.enqueued_at < *stats.oldest) stats.oldest = action.enqueued_at;
        if (!stats.newest || action.enqueued_at > *stats.newest) stats.newest = action.enqueued_at;
    }
    return stats;
}

void connectivity_monitor::update_payloads(const std::function<void(queued_action&)>& fn) {
    for (auto& action : queue_) {
        fn(action);
    }
}

void connectivity_monitor::set_action_handler(action_kind kind, action_handler handler) {
    handlers_[kind] = std::move(handler);
}

void connectivity_monitor::set_default_action_handler(action_handler handler) {
    default_handler_ = std::move(handler);
}

void connectivity_monitor::run_action(const queued_action& action) {
    auto it = handlers_.find(action.kind);
    if (it != handlers_.end() && it->second) {
        it->second(action);
        return;
    }
    if (default_handler_) {
        default_handler_(action);
        return;
    }
    throw std::runtime_error(std::string("no handler for ") + to_string(action.kind) + " actions");
}

drain_result connectivity_monitor::drain() {
    drain_result result;
    if (destroyed_ || !status_.is_online || draining_) return result;

    struct drain_guard {
        bool& flag;
        explicit drain_guard(bool& f) : flag(f) { flag = true; }
        ~drain_guard() { flag = false; }
    } guard(draining_);

    auto find = [this](const std::string& id) {
        return std::find_if(queue_.begin(), queue_.end(),
                            [&id](const queued_action& a) { return a.id == id; });
    };

    const auto snapshot = queue_;
    for (const auto& queued : snapshot) {
        // Handlers may settle other queued actions along the way
        auto it = find(queued.id);
        if (it == queue_.end()) continue;

        const queued_action action = *it;
        ++result.attempted;
        try {
            run_action(action);
            dequeue(action.id);
            ++result.succeeded;
        } catch (const std::exception& e) {
            it = find(action.id);
            if (it == queue_.end()) continue;

            ++it->retry_count;
            if (it->retry_count >= it->max_retries) {
                result.errors.push_back("Action " + action.id + " (" + to_string(action.kind) +
                                        ") dropped after " + std::to_string(it->retry_count) +
                                        " attempts: " + e.what());
                LOG_WARN("queue", "%s", result.errors.back().c_str());
                queue_.erase(it);
                ++result.dropped;
            } else {
                LOG_DEBUG("queue", "Action %s failed (%d/%d): %s", action.id.c_str(),
                          it->retry_count, it->max_retries, e.what());
            }
        }
    }
    return result;
}

void connectivity_monitor::destroy() {
    if (destroyed_) return;
    destroyed_ = true;
    probe_timer_.cancel();
    drain_timer_.cancel();
    foreground_probe_.cancel();
    listeners_.clear();
    handlers_.clear();
    default_handler_ = nullptr;
    queue_.clear();
}

} // namespace pulsesync

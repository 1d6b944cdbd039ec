#include "pulsesync/dashboard_repository.hpp"
#include "pulsesync/log.hpp"
#include <algorithm>

namespace pulsesync {

namespace {

constexpr const char* dashboard_prefix = "dashboard_";
constexpr const char* tombstone_prefix = "delete_";
constexpr const char* conflict_prefix = "conflict_";
constexpr const char* list_key = "dashboards_list";

std::string dashboard_key(const std::string& id) { return dashboard_prefix + id; }
std::string tombstone_key(const std::string& id) { return tombstone_prefix + id; }
std::string conflict_key(const std::string& id) { return conflict_prefix + id; }

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool is_sync_key(const std::string& key) {
    return starts_with(key, dashboard_prefix) || starts_with(key, tombstone_prefix);
}

std::string id_from_key(const std::string& key) {
    if (starts_with(key, dashboard_prefix)) return key.substr(std::char_traits<char>::length(dashboard_prefix));
    if (starts_with(key, tombstone_prefix)) return key.substr(std::char_traits<char>::length(tombstone_prefix));
    return key;
}

} // anonymous namespace

bool dashboard_repository::is_temporary_id(const std::string& id) {
    return starts_with(id, "temp_");
}

dashboard_repository::dashboard_repository(versioned_store& store,
                                           connectivity_monitor& monitor,
                                           std::shared_ptr<dashboard_api> api,
                                           repository_options options)
    : store_(store), monitor_(monitor), api_(std::move(api)), options_(options) {
    was_online_ = monitor_.is_online();

    status_listener_ = monitor_.add_listener([this](const network_status& status) {
        on_status_change(status);
    });

    auto replay = [this](const queued_action& action) { replay_action(action); };
    monitor_.set_action_handler(action_kind::create, replay);
    monitor_.set_action_handler(action_kind::update, replay);
    monitor_.set_action_handler(action_kind::remove, replay);

    if (options_.auto_sync) {
        auto& timers = store_.timers();
        auto_sync_timer_ = scheduled_task(timers, timers.schedule_every(options_.auto_sync_interval, [this]() {
            if (monitor_.is_online() && !syncing_) {
                run_auto_sync(1);
            }
        }));
    }
}

dashboard_repository::~dashboard_repository() {
    destroy();
}

void dashboard_repository::destroy() {
    if (destroyed_) return;
    destroyed_ = true;

    auto_sync_timer_.cancel();
    auto_sync_retry_.cancel();

    monitor_.remove_listener(status_listener_);
    for (auto id : forwarded_listeners_) {
        monitor_.remove_listener(id);
    }
    forwarded_listeners_.clear();

    monitor_.set_action_handler(action_kind::create, nullptr);
    monitor_.set_action_handler(action_kind::update, nullptr);
    monitor_.set_action_handler(action_kind::remove, nullptr);
}

// ============================================================================
// Network status
// ============================================================================

void dashboard_repository::on_status_change(const network_status& status) {
    const bool reconnected = status.is_online && !was_online_;
    was_online_ = status.is_online;

    if (!status.is_online) {
        auto_sync_retry_.cancel();
        return;
    }
    if (reconnected && options_.auto_sync) {
        LOG_INFO("repo", "Back online, syncing pending changes");
        run_auto_sync(1);
    }
}

void dashboard_repository::run_auto_sync(int attempt) {
    if (destroyed_) return;

    auto result = sync_offline_changes();
    if (result.success) return;

    if (!monitor_.is_online() || syncing_) return;
    if (attempt > options_.auto_sync_max_retries) {
        LOG_ERROR("repo", "Auto-sync giving up after %d retries", options_.auto_sync_max_retries);
        return;
    }

    auto delay = options_.auto_sync_retry_delay * attempt;
    LOG_WARN("repo", "Auto-sync failed with %zu errors, retry %d in %lld ms",
             result.errors.size(), attempt, static_cast<long long>(delay.count()));
    auto& timers = store_.timers();
    auto_sync_retry_ = scheduled_task(timers, timers.schedule_after(delay, [this, attempt]() {
        run_auto_sync(attempt + 1);
    }));
}

dashboard_repository::listener_id dashboard_repository::on_network_status_change(listener fn) {
    auto id = monitor_.add_listener(std::move(fn));
    forwarded_listeners_.push_back(id);
    return id;
}

bool dashboard_repository::off_network_status_change(listener_id id) {
    auto it = std::find(forwarded_listeners_.begin(), forwarded_listeners_.end(), id);
    if (it == forwarded_listeners_.end()) return false;
    forwarded_listeners_.erase(it);
    return monitor_.remove_listener(id);
}

// ============================================================================
// Reads
// ============================================================================

dashboard_snapshot dashboard_repository::snapshot_of(const stored_entry<dashboard>& entry, bool offline) {
    dashboard_snapshot snapshot;
    snapshot.value = entry.data;
    snapshot.is_offline = offline;
    snapshot.resolution = entry.resolution;
    if (auto marker = store_.get<conflict_info>(conflict_key(entry.data.id))) {
        snapshot.conflict = marker->data;
    }
    return snapshot;
}

void dashboard_repository::record_conflict(const std::string& id, const conflict_info& conflict) {
    store_.set(conflict_key(id), conflict);
}

std::optional<dashboard_snapshot> dashboard_repository::get_dashboard(const std::string& id) {
    const std::string key = dashboard_key(id);
    try {
        if (store_.exists(tombstone_key(id))) {
            return std::nullopt;
        }

        auto local_view = [&]() -> std::optional<dashboard_snapshot> {
            auto local = store_.get<dashboard>(key);
            if (!local) return std::nullopt;
            return snapshot_of(*local, true);
        };

        if (!monitor_.is_online() || is_temporary_id(id)) {
            return local_view();
        }

        dashboard server;
        try {
            server = api_->fetch_dashboard(id);
        } catch (const api_error& e) {
            LOG_DEBUG("repo", "Fetch of %s failed (%s), serving local copy", id.c_str(), e.what());
            return local_view();
        }

        auto local = store_.get_json(key);
        // Only pending local edits can conflict; a clean copy is replaced by the server value below
        if (local && local->is_offline) {
            auto conflict = versioned_store::detect_conflict(&*local, server.version, server.updated_at);
            if (conflict.has_conflict) {
                auto resolved = store_.resolve_conflict(key, *local, json(server), server.version,
                                                        options_.strategy);
                record_conflict(id, conflict);
                if (resolved.is_offline) {
                    queue_action(action_kind::update, id);
                }

                dashboard_snapshot snapshot;
                snapshot.value = resolved.data.get<dashboard>();
                snapshot.is_offline = resolved.is_offline;
                snapshot.conflict = conflict;
                snapshot.resolution = options_.strategy;
                return snapshot;
            }

            if (local->version == server.version) {
                // Local edit on top of the current server version, not pushed yet
                stored_entry<dashboard> pending;
                pending.data = local->data.get<dashboard>();
                pending.resolution = local->resolution;
                return snapshot_of(pending, true);
            }
        }

        store_.set(key, server, server.version);
        add_to_list(id);

        dashboard_snapshot snapshot;
        snapshot.value = std::move(server);
        return snapshot;
    } catch (const store_write_error& e) {
        LOG_ERROR("repo", "Could not persist dashboard %s: %s", id.c_str(), e.what());
        return std::nullopt;
    }
}

std::vector<dashboard_snapshot> dashboard_repository::get_dashboards() {
    std::vector<dashboard_snapshot> result;

    auto local_view = [this]() {
        std::vector<dashboard_snapshot> local;
        for (const auto& id : read_list()) {
            if (auto entry = store_.get<dashboard>(dashboard_key(id))) {
                local.push_back(snapshot_of(*entry, true));
            }
        }
        return local;
    };

    if (!monitor_.is_online()) {
        return local_view();
    }

    std::vector<dashboard> remote;
    try {
        remote = api_->list_dashboards();
    } catch (const api_error& e) {
        LOG_DEBUG("repo", "Listing dashboards failed (%s), serving local copies", e.what());
        return local_view();
    }

    try {
        std::vector<std::string> ids;
        for (auto& server : remote) {
            if (store_.exists(tombstone_key(server.id))) continue;

            const std::string key = dashboard_key(server.id);
            auto local = store_.get<dashboard>(key);
            ids.push_back(server.id);
            if (local && local->is_offline) {
                result.push_back(snapshot_of(*local, true));
                continue;
            }
            store_.set(key, server, server.version);
            dashboard_snapshot snapshot;
            snapshot.value = std::move(server);
            result.push_back(std::move(snapshot));
        }

        // Keep local work the server has not seen; forget clean copies it no longer has
        for (const auto& id : read_list()) {
            if (std::find(ids.begin(), ids.end(), id) != ids.end()) continue;
            auto local = store_.get<dashboard>(dashboard_key(id));
            if (!local) continue;
            if (local->is_offline) {
                ids.push_back(id);
                result.push_back(snapshot_of(*local, true));
            } else {
                store_.remove(dashboard_key(id));
                store_.remove(conflict_key(id));
            }
        }

        write_list(ids);
    } catch (const store_write_error& e) {
        LOG_ERROR("repo", "Could not persist dashboard list: %s", e.what());
    }
    return result;
}

// ============================================================================
// Writes
// ============================================================================

std::optional<dashboard_snapshot> dashboard_repository::create_dashboard(const dashboard_draft& draft) {
    const millis_t now = store_.timers().now_ms();
    const std::string temp_id = "temp_" + std::to_string(now) + "_" + random_suffix();
    const std::string key = dashboard_key(temp_id);
    dashboard local = make_local_dashboard(draft, temp_id, now);

    try {
        store_.mark_offline(key, local);
        add_to_list(temp_id);

        if (!monitor_.is_online()) {
            queue_action(action_kind::create, temp_id);
            dashboard_snapshot snapshot;
            snapshot.value = std::move(local);
            snapshot.is_offline = true;
            return snapshot;
        }

        try {
            dashboard server = api_->create_dashboard(draft);
            adopt_created(temp_id, server);
            dashboard_snapshot snapshot;
            snapshot.value = std::move(server);
            return snapshot;
        } catch (const api_error& e) {
            if (e.is_network()) {
                LOG_INFO("repo", "Create of %s deferred: %s", temp_id.c_str(), e.what());
                queue_action(action_kind::create, temp_id);
                dashboard_snapshot snapshot;
                snapshot.value = std::move(local);
                snapshot.is_offline = true;
                return snapshot;
            }
            LOG_WARN("repo", "Create rejected (%s): %s", to_string(e.error_kind()), e.what());
            store_.remove(key);
            remove_from_list(temp_id);
            return std::nullopt;
        }
    } catch (const store_write_error& e) {
        LOG_ERROR("repo", "Could not persist new dashboard: %s", e.what());
        return std::nullopt;
    }
}

std::optional<dashboard_snapshot> dashboard_repository::update_dashboard(const std::string& id,
                                                                         const dashboard_patch& patch) {
    const std::string key = dashboard_key(id);
    try {
        auto previous = store_.get_json(key);
        if (!previous && monitor_.is_online() && !is_temporary_id(id)) {
            try {
                dashboard server = api_->fetch_dashboard(id);
                store_.set(key, server, server.version);
                add_to_list(id);
                previous = store_.get_json(key);
            } catch (const api_error& e) {
                LOG_DEBUG("repo", "Fetch before update of %s failed: %s", id.c_str(), e.what());
            }
        }
        if (!previous) {
            LOG_WARN("repo", "Update of unknown dashboard %s", id.c_str());
            return std::nullopt;
        }

        dashboard updated = previous->data.get<dashboard>();
        apply_patch(updated, patch);
        updated.updated_at = store_.timers().now_ms();
        store_.mark_offline(key, updated);

        const bool temporary = is_temporary_id(id);
        const action_kind kind = temporary ? action_kind::create : action_kind::update;

        if (!monitor_.is_online()) {
            queue_action(kind, id);
            dashboard_snapshot snapshot;
            snapshot.value = std::move(updated);
            snapshot.is_offline = true;
            snapshot.resolution = previous->resolution;
            return snapshot;
        }

        try {
            dashboard server;
            if (temporary) {
                server = api_->create_dashboard(to_draft(updated));
                adopt_created(id, server);
            } else {
                server = api_->update_dashboard(id, to_patch(updated));
                store_.set(key, server, server.version);
                drop_actions(id);
            }
            dashboard_snapshot snapshot;
            snapshot.value = std::move(server);
            return snapshot;
        } catch (const api_error& e) {
            if (e.is_network()) {
                LOG_INFO("repo", "Update of %s deferred: %s", id.c_str(), e.what());
                queue_action(kind, id);
                dashboard_snapshot snapshot;
                snapshot.value = std::move(updated);
                snapshot.is_offline = true;
                return snapshot;
            }
            LOG_WARN("repo", "Update of %s rejected (%s): %s", id.c_str(),
                     to_string(e.error_kind()), e.what());
            store_.write_entry(key, *previous);
            return std::nullopt;
        }
    } catch (const store_write_error& e) {
        LOG_ERROR("repo", "Could not persist update of %s: %s", id.c_str(), e.what());
        return std::nullopt;
    }
}

bool dashboard_repository::delete_dashboard(const std::string& id) {
    try {
        store_.remove(dashboard_key(id));
        store_.remove(conflict_key(id));
        remove_from_list(id);
        drop_actions(id);

        if (is_temporary_id(id)) {
            // Never reached the server
            return true;
        }

        store_.mark_offline(tombstone_key(id), json{{"id", id}});

        if (!monitor_.is_online()) {
            queue_action(action_kind::remove, id);
            return true;
        }

        try {
            api_->delete_dashboard(id);
        } catch (const api_error& e) {
            if (e.is_network()) {
                LOG_INFO("repo", "Delete of %s deferred: %s", id.c_str(), e.what());
                queue_action(action_kind::remove, id);
                return true;
            }
            if (e.error_kind() != api_error::kind::not_found) {
                LOG_WARN("repo", "Delete of %s rejected: %s", id.c_str(), e.what());
                store_.remove(tombstone_key(id));
                return false;
            }
        }
        store_.remove(tombstone_key(id));
        return true;
    } catch (const store_write_error& e) {
        LOG_ERROR("repo", "Could not record deletion of %s: %s", id.c_str(), e.what());
        return false;
    }
}

void dashboard_repository::adopt_created(const std::string& temp_id, const dashboard& server) {
    LOG_DEBUG("repo", "%s is now %s", temp_id.c_str(), server.id.c_str());
    store_.set(dashboard_key(server.id), server, server.version);
    store_.remove(dashboard_key(temp_id));

    auto ids = read_list();
    auto it = std::find(ids.begin(), ids.end(), temp_id);
    if (it != ids.end()) {
        *it = server.id;
    } else if (std::find(ids.begin(), ids.end(), server.id) == ids.end()) {
        ids.push_back(server.id);
    }
    write_list(ids);

    rename_actions(temp_id, server.id);
    drop_actions(server.id);
}

// ============================================================================
// Synchronization
// ============================================================================

dashboard_repository::item_outcome dashboard_repository::sync_item(const std::string& key,
                                                                   conflict_strategy strategy) {
    item_outcome outcome;
    const std::string id = id_from_key(key);

    if (starts_with(key, tombstone_prefix)) {
        if (!store_.exists(key)) return outcome;
        try {
            api_->delete_dashboard(id);
        } catch (const api_error& e) {
            if (e.error_kind() != api_error::kind::not_found) throw;
        }
        store_.remove(key);
        drop_actions(id);
        outcome.synced = true;
        return outcome;
    }

    auto entry = store_.get_json(key);
    if (!entry || !entry->is_offline) {
        // Already settled by an earlier push
        return outcome;
    }

    if (is_temporary_id(id)) {
        dashboard server = api_->create_dashboard(to_draft(entry->data.get<dashboard>()));
        adopt_created(id, server);
        outcome.synced = true;
        return outcome;
    }

    dashboard server = api_->fetch_dashboard(id);
    auto conflict = versioned_store::detect_conflict(&*entry, server.version, server.updated_at);

    json to_push = entry->data;
    if (conflict.has_conflict) {
        auto resolved = store_.resolve_conflict(key, *entry, json(server), server.version, strategy);
        record_conflict(id, conflict);
        outcome.conflict = true;
        if (!resolved.is_offline) {
            // Remote won; nothing to push
            drop_actions(id);
            outcome.synced = true;
            return outcome;
        }
        to_push = resolved.data;
    }

    dashboard pushed = api_->update_dashboard(id, to_patch(to_push.get<dashboard>()));
    store_.set(key, pushed, pushed.version);
    drop_actions(id);
    outcome.synced = true;
    return outcome;
}

sync_result dashboard_repository::sync_offline_changes(std::optional<conflict_strategy> strategy) {
    sync_result result;
    if (syncing_) {
        result.errors.push_back("Sync already in progress");
        return result;
    }
    if (!monitor_.is_online()) {
        result.errors.push_back("Device is offline");
        return result;
    }

    struct sync_guard {
        bool& flag;
        explicit sync_guard(bool& f) : flag(f) { flag = true; }
        ~sync_guard() { flag = false; }
    } guard(syncing_);

    const conflict_strategy effective = strategy.value_or(options_.strategy);
    auto items = store_.offline_items();
    LOG_INFO("repo", "Syncing %zu pending changes with '%s'", items.size(), to_string(effective));

    for (const auto& [key, entry] : items) {
        if (!is_sync_key(key)) continue;
        try {
            auto outcome = sync_item(key, effective);
            if (outcome.synced) ++result.synced_count;
            if (outcome.conflict) ++result.conflict_count;
        } catch (const api_error& e) {
            result.errors.push_back(key + ": " + e.what());
        } catch (const store_write_error& e) {
            result.errors.push_back(key + ": " + e.what());
        }
    }

    try {
        store_.update_last_sync();
    } catch (const store_write_error& e) {
        result.errors.push_back(std::string("last_sync: ") + e.what());
    }

    result.success = result.errors.empty();
    if (!result.success) {
        LOG_WARN("repo", "Sync finished with %zu errors", result.errors.size());
    }
    return result;
}

void dashboard_repository::replay_action(const queued_action& action) {
    if (syncing_) {
        throw std::runtime_error("sync in progress");
    }
    const std::string key = action.payload.value("key", std::string());
    if (key.empty() || !is_sync_key(key)) {
        throw std::runtime_error("action " + action.id + " has no dashboard key");
    }
    sync_item(key, options_.strategy);
}

sync_status dashboard_repository::get_sync_status() {
    sync_status status;
    status.is_online = monitor_.is_online();
    if (!store_.is_available()) return status;

    status.last_sync_timestamp = store_.last_sync();
    for (const auto& [key, entry] : store_.offline_items()) {
        if (is_sync_key(key)) ++status.pending_change_count;
    }
    const size_t prefix_length = std::char_traits<char>::length(conflict_prefix);
    for (const auto& key : store_.keys(conflict_prefix)) {
        status.conflict_keys.push_back(key.substr(prefix_length));
    }
    return status;
}

void dashboard_repository::clear_conflict(const std::string& id) {
    store_.remove(conflict_key(id));
}

void dashboard_repository::clear_offline_data() {
    store_.clear();
    monitor_.clear_queue();
}

// ============================================================================
// Id list and queued actions
// ============================================================================

std::vector<std::string> dashboard_repository::read_list() {
    auto entry = store_.get<std::vector<std::string>>(list_key);
    return entry ? entry->data : std::vector<std::string>{};
}

void dashboard_repository::write_list(const std::vector<std::string>& ids) {
    store_.set(list_key, ids);
}

void dashboard_repository::add_to_list(const std::string& id) {
    auto ids = read_list();
    if (std::find(ids.begin(), ids.end(), id) != ids.end()) return;
    ids.push_back(id);
    write_list(ids);
}

void dashboard_repository::remove_from_list(const std::string& id) {
    auto ids = read_list();
    auto it = std::find(ids.begin(), ids.end(), id);
    if (it == ids.end()) return;
    ids.erase(it);
    write_list(ids);
}

void dashboard_repository::queue_action(action_kind kind, const std::string& id) {
    for (const auto& action : monitor_.list()) {
        if (action.payload.value("id", std::string()) != id) continue;
        // One create covers every later edit of a temporary dashboard
        if (action.kind == kind || action.kind == action_kind::create) return;
    }
    const std::string key = kind == action_kind::remove ? tombstone_key(id) : dashboard_key(id);
    monitor_.enqueue(kind, json{{"key", key}, {"id", id}});
}

void dashboard_repository::drop_actions(const std::string& id) {
    for (const auto& action : monitor_.list()) {
        if (action.payload.value("id", std::string()) == id) {
            monitor_.dequeue(action.id);
        }
    }
}

void dashboard_repository::rename_actions(const std::string& old_id, const std::string& new_id) {
    monitor_.update_payloads([&](queued_action& action) {
        if (action.payload.value("id", std::string()) != old_id) return;
        action.payload["id"] = new_id;
        action.payload["key"] = action.kind == action_kind::remove ? tombstone_key(new_id)
                                                                   : dashboard_key(new_id);
    });
}

} // namespace pulsesync

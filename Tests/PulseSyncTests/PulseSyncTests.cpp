#include <PulseSync.hpp>
#include <cassert>
#include <iostream>
#include <filesystem>
#include <fstream>
#include <algorithm>

#include "RepositoryTests.hpp"

using namespace std::chrono_literals;
using pulsesync::json;

// ============================================================================
// Test: Timer services
// ============================================================================

void test_manual_timers() {
    std::cout << "Testing manual timer service..." << std::endl;

    pulsesync::manual_timer_service timers(1000);
    std::vector<std::string> fired;

    timers.schedule_after(100ms, [&] { fired.push_back("A"); });
    timers.schedule_after(50ms, [&] { fired.push_back("B"); });
    auto every = timers.schedule_every(40ms, [&] { fired.push_back("C"); });

    timers.advance(100ms);
    assert((fired == std::vector<std::string>{"C", "B", "C", "A"}));
    assert(timers.now_ms() == 1100);

    timers.cancel(every);
    fired.clear();
    timers.advance(1s);
    assert(fired.empty());
    assert(timers.pending_count() == 0);

    // Same due time: registration order
    timers.schedule_after(10ms, [&] { fired.push_back("X"); });
    timers.schedule_after(10ms, [&] { fired.push_back("Y"); });
    timers.advance(10ms);
    assert((fired == std::vector<std::string>{"X", "Y"}));

    // scheduled_task cancels on scope exit
    int count = 0;
    {
        pulsesync::scheduled_task task(timers, timers.schedule_after(10ms, [&] { ++count; }));
        assert(task.is_active());
    }
    timers.advance(20ms);
    assert(count == 0);

    pulsesync::scheduled_task moved;
    assert(!moved);
    {
        pulsesync::scheduled_task task(timers, timers.schedule_every(5ms, [&] { ++count; }));
        moved = std::move(task);
    }
    timers.advance(10ms);
    assert(count == 2);
    moved.cancel();
    timers.advance(10ms);
    assert(count == 2);

    // Sleeping moves the clock without firing anything
    timers.schedule_after(5ms, [&] { ++count; });
    auto before = timers.now_ms();
    timers.sleep_for(1s);
    assert(timers.now_ms() == before + 1000);
    assert(timers.total_slept() == 1s);
    assert(count == 2);
    timers.advance(0ms);
    assert(count == 3);

    bool threw = false;
    try {
        timers.schedule_every(0ms, [] {});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Manual timer test passed!" << std::endl;
}

void test_run_loop_timers() {
    std::cout << "Testing run loop timer service..." << std::endl;

    pulsesync::run_loop_timer_service timers;
    int once = 0;
    int repeated = 0;
    timers.schedule_after(0ms, [&] { ++once; });
    assert(timers.run_pending() == 1);
    assert(once == 1);
    assert(timers.run_pending() == 0);

    auto id = timers.schedule_every(5ms, [&] { ++repeated; });
    timers.run_for(30ms);
    assert(repeated >= 1);
    timers.cancel(id);

    std::cout << "  Run loop timer test passed!" << std::endl;
}

// ============================================================================
// Test: Versioned store
// ============================================================================

void test_checksum() {
    std::cout << "Testing checksum..." << std::endl;

    // "a" serializes to "\"a\"": ((34*31)+97)*31+34 = 35715 = "rk3" in base 36
    assert(pulsesync::compute_checksum(json("a")) == "rk3");
    assert(pulsesync::compute_checksum(json::object()) == "31e");

    // Key order does not matter, values do
    json one = {{"b", 2}, {"a", 1}};
    json two = {{"a", 1}, {"b", 2}};
    assert(pulsesync::compute_checksum(one) == pulsesync::compute_checksum(two));
    two["b"] = 3;
    assert(pulsesync::compute_checksum(one) != pulsesync::compute_checksum(two));

    // Long input wraps the 32-bit accumulator; output stays base 36
    auto sum = pulsesync::compute_checksum(json(std::string(1000, 'z')));
    assert(!sum.empty());
    assert(std::all_of(sum.begin(), sum.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z');
    }));

    // Invalid UTF-8 hashes as its U+FFFD replacement
    assert(pulsesync::compute_checksum(json("bad\xff")) ==
           pulsesync::compute_checksum(json("bad\xEF\xBF\xBD")));

    std::cout << "  Checksum test passed!" << std::endl;
}

void test_store_round_trip() {
    std::cout << "Testing store round trip..." << std::endl;

    pulsesync::manual_timer_service timers;
    pulsesync::memory_storage_medium medium;
    pulsesync::versioned_store store(medium, timers);

    pulsesync::dashboard d;
    d.id = "a";
    d.name = "Alpha";
    d.tags = {"fx", "rates"};
    pulsesync::widget w;
    w.id = "w1";
    w.type = "price-chart";
    w.title = "EURUSD";
    w.config = {{"symbol", "EURUSD"}, {"range", "1d"}};
    d.widgets.push_back(w);

    const auto t0 = timers.now_ms();
    store.set("dashboard_a", d, 5);

    auto entry = store.get<pulsesync::dashboard>("dashboard_a");
    assert(entry);
    assert(entry->data.name == "Alpha");
    assert(entry->data.widgets.size() == 1);
    assert(entry->data.widgets[0].config["symbol"] == "EURUSD");
    assert(entry->version == 5);
    assert(entry->created_at == t0);
    assert(entry->last_modified == t0);
    assert(entry->checksum == pulsesync::compute_checksum(json(d)));
    assert(!entry->is_offline);
    assert(!entry->resolution);

    // Stored under the namespace prefix
    assert(medium.get_item("pulsesync_dashboard_a"));

    // Rewrite keeps created_at; omitted version means "now"
    timers.advance(2s);
    d.name = "Alpha 2";
    store.set("dashboard_a", d);
    entry = store.get<pulsesync::dashboard>("dashboard_a");
    assert(entry->created_at == t0);
    assert(entry->last_modified == t0 + 2000);
    assert(entry->version == t0 + 2000);

    // Offline write keeps the version and flags the entry
    timers.advance(1s);
    d.name = "Alpha 3";
    store.mark_offline("dashboard_a", d);
    entry = store.get<pulsesync::dashboard>("dashboard_a");
    assert(entry->is_offline);
    assert(entry->version == t0 + 2000);
    assert(entry->data.name == "Alpha 3");

    store.set("plain", 42);
    auto offline = store.offline_items();
    assert(offline.size() == 1);
    assert(offline[0].first == "dashboard_a");

    // Type mismatch is a programming error and propagates
    bool threw = false;
    try {
        store.get<std::string>("plain");
    } catch (const json::exception&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Store round trip test passed!" << std::endl;
}

void test_store_corruption() {
    std::cout << "Testing corruption eviction..." << std::endl;

    pulsesync::manual_timer_service timers;
    pulsesync::memory_storage_medium medium;
    pulsesync::versioned_store store(medium, timers);

    store.set("k", json{{"balance", 100}});
    auto raw = json::parse(*medium.get_item("pulsesync_k"));
    raw["data"]["balance"] = 1000000;
    medium.set_item("pulsesync_k", raw.dump());

    assert(!store.get<json>("k"));
    assert(!medium.get_item("pulsesync_k"));
    assert(!store.exists("k"));

    medium.set_item("pulsesync_garbage", "not json {");
    assert(!store.get<json>("garbage"));
    assert(!medium.get_item("pulsesync_garbage"));

    medium.set_item("pulsesync_shape", "[1,2,3]");
    assert(!store.get_json("shape"));
    assert(!medium.get_item("pulsesync_shape"));

    std::cout << "  Corruption eviction test passed!" << std::endl;
}

void test_store_namespace_ops() {
    std::cout << "Testing store namespace operations..." << std::endl;

    pulsesync::manual_timer_service timers;
    pulsesync::memory_storage_medium medium;
    medium.set_item("other_app_key", "untouched");

    pulsesync::versioned_store store(medium, timers);
    store.set("dashboard_1", 1);
    store.set("dashboard_2", 2);
    store.set("conflict_1", 3);

    assert((store.keys() == std::vector<std::string>{"conflict_1", "dashboard_1", "dashboard_2"}));
    assert((store.keys("dashboard_") == std::vector<std::string>{"dashboard_1", "dashboard_2"}));
    assert(store.exists("dashboard_1"));

    store.remove("dashboard_1");
    assert(!store.exists("dashboard_1"));

    auto info = store.get_storage_info();
    assert(info.item_count == 2);
    assert(info.total == 5 * 1024 * 1024);
    size_t expected = 0;
    for (const auto& key : {"pulsesync_dashboard_2", "pulsesync_conflict_1"}) {
        expected += std::string(key).size() + medium.get_item(key)->size();
    }
    assert(info.used == expected);
    assert(info.available == info.total - info.used);

    store.clear();
    assert(store.keys().empty());
    assert(medium.get_item("other_app_key") == std::optional<std::string>("untouched"));

    std::cout << "  Namespace operations test passed!" << std::endl;
}

void test_store_unavailable() {
    std::cout << "Testing unavailable medium..." << std::endl;

    pulsesync::manual_timer_service timers;
    pulsesync::memory_storage_medium medium;
    medium.set_available(false);
    pulsesync::versioned_store store(medium, timers);

    assert(!store.is_available());
    store.set("k", 1);
    assert(!store.get<int>("k"));
    assert(!store.exists("k"));
    assert(store.keys().empty());
    store.remove("k");
    store.clear();
    auto info = store.get_storage_info();
    assert(info.used == 0 && info.total == 0 && info.item_count == 0);
    assert(store.last_sync() == 0);

    // Cached: the medium coming back later is not noticed
    medium.set_available(true);
    assert(!store.is_available());

    std::cout << "  Unavailable medium test passed!" << std::endl;
}

void test_store_write_retry() {
    std::cout << "Testing write retry..." << std::endl;

    pulsesync::manual_timer_service timers;
    pulsesync::memory_storage_medium medium;
    pulsesync::versioned_store store(medium, timers);
    assert(store.is_available());

    // Two transient failures, third attempt lands
    auto attempts = medium.write_attempts();
    medium.fail_next_writes(2);
    store.set("k", 1);
    assert(medium.write_attempts() == attempts + 3);
    assert(timers.total_slept() == 2s);
    assert(store.get<int>("k")->data == 1);

    // Persistent failure: one attempt plus three retries, then an error
    attempts = medium.write_attempts();
    medium.fail_next_writes(100);
    bool threw = false;
    try {
        store.set("k", 2);
    } catch (const pulsesync::store_write_error& e) {
        threw = true;
        assert(e.key() == "k");
    }
    assert(threw);
    assert(medium.write_attempts() == attempts + 4);
    assert(timers.total_slept() == 5s);
    assert(store.get<int>("k")->data == 1);
    medium.fail_next_writes(0);

    // Quota exhaustion surfaces the same way
    medium.set_quota(64);
    threw = false;
    try {
        store.set("big", std::string(200, 'x'));
    } catch (const pulsesync::store_write_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Write retry test passed!" << std::endl;
}

void test_conflict_detection() {
    std::cout << "Testing conflict detection..." << std::endl;

    pulsesync::stored_entry<json> local;
    local.version = 1;
    local.last_modified = 2000;

    auto none = pulsesync::versioned_store::detect_conflict<json>(nullptr, 7, 1000);
    assert(!none.has_conflict);
    assert(none.local_version == 0 && none.local_timestamp == 0);
    assert(none.server_version == 7 && none.server_timestamp == 1000);

    auto newer = pulsesync::versioned_store::detect_conflict(&local, 2, 1000);
    assert(newer.has_conflict);
    assert(newer.local_version == 1 && newer.local_timestamp == 2000);

    // Same version never conflicts
    assert(!pulsesync::versioned_store::detect_conflict(&local, 1, 1000).has_conflict);
    // Server change is the newer one
    assert(!pulsesync::versioned_store::detect_conflict(&local, 2, 3000).has_conflict);
    // Equal timestamps are not "strictly newer"
    assert(!pulsesync::versioned_store::detect_conflict(&local, 2, 2000).has_conflict);

    // Marker form round-trips
    auto restored = json(newer).get<pulsesync::conflict_info>();
    assert(restored.has_conflict && restored.server_version == 2);

    std::cout << "  Conflict detection test passed!" << std::endl;
}

void test_conflict_resolution() {
    std::cout << "Testing conflict resolution..." << std::endl;

    pulsesync::manual_timer_service timers;
    pulsesync::memory_storage_medium medium;
    pulsesync::versioned_store store(medium, timers);

    json server = {{"name", "server"}, {"limit", 10}, {"nested", {{"x", 1}, {"y", 2}}}};
    json local_data = {{"name", "local"}, {"nested", {{"x", 9}}}};

    store.set("k", local_data, 4);
    store.mark_offline("k", local_data);
    auto local = *store.get_json("k");

    auto kept = store.resolve_conflict("k", local, server, 6, pulsesync::conflict_strategy::local);
    assert(kept.data == local_data);
    assert(kept.version == 4);
    assert(kept.is_offline);
    assert(store.get_json("k")->resolution == pulsesync::conflict_strategy::local);

    auto adopted = store.resolve_conflict("k", local, server, 6, pulsesync::conflict_strategy::server);
    assert(adopted.data == server);
    assert(adopted.version == 6);
    assert(!adopted.is_offline);
    assert(store.get_json("k")->resolution == pulsesync::conflict_strategy::server);

    auto merged = store.resolve_conflict("k", local, server, 6, pulsesync::conflict_strategy::merge);
    assert(merged.version == 7);
    assert(merged.is_offline);
    assert(merged.data["name"] == "local");
    assert(merged.data["limit"] == 10);
    // One level only: nested objects are replaced, not merged
    assert(merged.data["nested"] == json({{"x", 9}}));
    assert(store.get_json("k")->data == merged.data);

    // Merging the same local changes again changes nothing
    assert(pulsesync::shallow_merge(merged.data, local_data) == merged.data);
    assert(pulsesync::shallow_merge(json::array(), local_data) == json::array());

    assert(std::string(pulsesync::to_string(pulsesync::conflict_strategy::merge)) == "merge");
    assert(pulsesync::conflict_strategy_from_string("local") == pulsesync::conflict_strategy::local);
    assert(!pulsesync::conflict_strategy_from_string("newest"));

    std::cout << "  Conflict resolution test passed!" << std::endl;
}

void test_sqlite_medium() {
    std::cout << "Testing SQLite medium..." << std::endl;

    std::string test_path = "/tmp/pulsesync_medium_test.db";
    std::filesystem::remove(test_path);
    std::filesystem::remove(test_path + "-wal");
    std::filesystem::remove(test_path + "-shm");

    pulsesync::manual_timer_service timers;
    {
        pulsesync::sqlite_storage_medium medium(test_path);
        pulsesync::versioned_store store(medium, timers);
        store.set("dashboard_1", json{{"name", "Persistent"}}, 3);
        store.mark_offline("dashboard_2", json{{"name", "Pending"}});
        assert(medium.db().table_exists("kv_store"));
        assert(medium.db().schema_version() == 1);
    }

    {
        // Reopen and verify data persisted
        pulsesync::sqlite_storage_medium medium(test_path);
        pulsesync::versioned_store store(medium, timers);
        auto entry = store.get_json("dashboard_1");
        assert(entry && entry->data["name"] == "Persistent");
        assert(entry->version == 3);
        assert(store.offline_items().size() == 1);

        store.clear();
        assert(store.keys().empty());
    }

    {
        pulsesync::sqlite_storage_medium memory(":memory:");
        memory.set_item("a", "1");
        memory.set_item("a", "2");
        assert(memory.get_item("a") == std::optional<std::string>("2"));
        assert(memory.all_keys().size() == 1);
        memory.remove_items({"a"});
        assert(!memory.get_item("a"));
    }

    {
        // A database that cannot be opened leaves the medium unavailable
        pulsesync::sqlite_storage_medium broken("/nonexistent_dir/pulsesync/x.db");
        assert(!broken.is_open());
        bool threw = false;
        try {
            broken.get_item("a");
        } catch (const pulsesync::storage_error&) {
            threw = true;
        }
        assert(threw);

        pulsesync::versioned_store store(broken, timers);
        assert(!store.is_available());
        store.set("k", 1);
        assert(!store.get<int>("k"));
        assert(store.keys().empty());
    }

    std::filesystem::remove(test_path);
    std::filesystem::remove(test_path + "-wal");
    std::filesystem::remove(test_path + "-shm");

    std::cout << "  SQLite medium test passed!" << std::endl;
}

// ============================================================================
// Test: Connectivity monitor
// ============================================================================

void test_monitor_transitions() {
    std::cout << "Testing connectivity transitions..." << std::endl;

    pulsesync::manual_timer_service timers;
    auto probe = std::make_shared<pulsesync::mock_reachability_probe>();
    pulsesync::connectivity_monitor monitor(timers, probe);
    assert(monitor.is_online());

    std::vector<bool> seen;
    monitor.add_listener([&](const pulsesync::network_status& s) { seen.push_back(s.is_online); });

    // Repeated signals do not produce transitions
    monitor.handle_online();
    assert(seen.empty());

    probe->set_reachable(false);
    timers.advance(30s);
    assert(!monitor.is_online());
    assert(monitor.status().last_offline == timers.now_ms());
    assert(probe->last_timeout() == 5s);
    monitor.handle_offline();
    assert((seen == std::vector<bool>{false}));

    probe->set_reachable(true);
    timers.advance(30s);
    assert(monitor.is_online());
    assert(monitor.status().last_online == timers.now_ms());
    assert((seen == std::vector<bool>{false, true}));

    // Foreground: probe one second later
    auto probes = probe->probe_count();
    monitor.handle_foreground();
    timers.advance(999ms);
    assert(probe->probe_count() == probes);
    timers.advance(1ms);
    assert(probe->probe_count() == probes + 1);

    // Link changes notify without a transition
    pulsesync::link_info link;
    link.connection_type = "wifi";
    link.rtt_ms = 40;
    monitor.handle_link_change(link);
    assert(seen.size() == 3 && seen.back());
    assert(monitor.status().link && monitor.status().link->connection_type == std::optional<std::string>("wifi"));
    assert(monitor.check_connectivity());

    std::cout << "  Connectivity transitions test passed!" << std::endl;
}

void test_monitor_listeners() {
    std::cout << "Testing status listeners..." << std::endl;

    pulsesync::manual_timer_service timers;
    pulsesync::connectivity_monitor monitor(timers, nullptr);

    std::vector<std::string> events;
    monitor.add_listener([&](const pulsesync::network_status&) {
        events.push_back("first");
        throw std::runtime_error("listener bug");
    });
    auto second = monitor.add_listener([&](const pulsesync::network_status& s) {
        events.push_back(s.is_online ? "second:online" : "second:offline");
    });
    monitor.set_default_action_handler([&](const pulsesync::queued_action&) {
        events.push_back("drain");
    });

    monitor.handle_offline();
    monitor.enqueue(pulsesync::action_kind::subscribe, json{{"symbol", "AAPL"}});
    monitor.handle_online();

    // A throwing listener does not stop later ones; drain follows listeners
    assert((events == std::vector<std::string>{
        "first", "second:offline", "first", "second:online", "drain"}));
    assert(monitor.pending_count() == 0);

    assert(monitor.remove_listener(second));
    assert(!monitor.remove_listener(second));

    std::cout << "  Status listeners test passed!" << std::endl;
}

void test_bounded_retry() {
    std::cout << "Testing bounded retry..." << std::endl;

    pulsesync::manual_timer_service timers;
    pulsesync::connectivity_monitor monitor(timers, nullptr);

    int calls = 0;
    monitor.set_action_handler(pulsesync::action_kind::update, [&](const pulsesync::queued_action&) {
        ++calls;
        throw std::runtime_error("server said no");
    });
    auto id = monitor.enqueue(pulsesync::action_kind::update, json{{"id", "x"}});
    assert(id.rfind("update_", 0) == 0);

    auto first = monitor.drain();
    assert(first.attempted == 1 && first.succeeded == 0 && first.dropped == 0);
    assert(first.errors.empty());
    assert(monitor.list()[0].retry_count == 1);

    auto second = monitor.drain();
    assert(second.errors.empty());
    assert(monitor.list()[0].retry_count == 2);

    auto third = monitor.drain();
    assert(third.dropped == 1);
    assert(third.errors.size() == 1);
    assert(third.errors[0].find(id) != std::string::npos);
    assert(monitor.pending_count() == 0);

    auto fourth = monitor.drain();
    assert(fourth.attempted == 0);
    assert(calls == 3);

    // Kinds nobody handles fail like any other action
    monitor.enqueue(pulsesync::action_kind::unsubscribe, json::object(), 1);
    auto unhandled = monitor.drain();
    assert(unhandled.dropped == 1);

    // Every action gets at least one attempt
    for (int bad : {0, -1}) {
        bool threw = false;
        try {
            monitor.enqueue(pulsesync::action_kind::subscribe, json::object(), bad);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }
    assert(monitor.pending_count() == 0);

    // Offline: nothing is attempted
    monitor.enqueue(pulsesync::action_kind::update, json::object());
    monitor.handle_offline();
    assert(monitor.drain().attempted == 0);
    assert(monitor.pending_count() == 1);

    std::cout << "  Bounded retry test passed!" << std::endl;
}

void test_queue_stats_and_destroy() {
    std::cout << "Testing queue stats and destroy..." << std::endl;

    pulsesync::manual_timer_service timers;
    auto probe = std::make_shared<pulsesync::mock_reachability_probe>();
    auto monitor = std::make_unique<pulsesync::connectivity_monitor>(timers, probe);
    assert(timers.pending_count() == 2);  // probe + drain

    const auto t0 = timers.now_ms();
    monitor->enqueue(pulsesync::action_kind::create, json::object());
    timers.set_now(t0 + 5000);
    monitor->enqueue(pulsesync::action_kind::update, json::object());
    monitor->enqueue(pulsesync::action_kind::update, json::object());

    auto stats = monitor->stats();
    assert(stats.total == 3);
    assert(stats.by_kind[pulsesync::action_kind::create] == 1);
    assert(stats.by_kind[pulsesync::action_kind::update] == 2);
    assert(stats.oldest == t0);
    assert(stats.newest == t0 + 5000);

    auto first = monitor->list().front();
    assert(monitor->dequeue(first.id));
    assert(!monitor->dequeue(first.id));
    monitor->clear_queue();
    assert(monitor->pending_count() == 0);

    assert(std::string(pulsesync::to_string(pulsesync::action_kind::remove)) == "delete");
    assert(pulsesync::action_kind_from_string("delete") == pulsesync::action_kind::remove);
    assert(!pulsesync::action_kind_from_string("patch"));

    monitor->enqueue(pulsesync::action_kind::create, json::object());
    monitor->handle_foreground();
    monitor->destroy();
    assert(monitor->pending_count() == 0);
    assert(timers.pending_count() == 0);
    monitor->destroy();
    monitor.reset();

    std::cout << "  Queue stats and destroy test passed!" << std::endl;
}

// ============================================================================
// Test: HTTP adapter and reachability probe
// ============================================================================

static std::string envelope(const json& data) {
    return json{{"success", true}, {"data", data}}.dump();
}

template<typename F>
static pulsesync::api_error::kind expect_api_error(F&& fn) {
    try {
        fn();
    } catch (const pulsesync::api_error& e) {
        return e.error_kind();
    }
    assert(false && "expected api_error");
    return pulsesync::api_error::kind::network;
}

void test_http_dashboard_api() {
    std::cout << "Testing HTTP dashboard API..." << std::endl;

    auto client = std::make_shared<pulsesync::mock_http_client>();
    pulsesync::http_dashboard_api api(client, "https://api.test/v1/");
    api.set_header("Authorization", "Bearer t");

    json wire = {
        {"id", "d1"}, {"name", "Rates"}, {"ownerId", "u1"}, {"isDefault", true},
        {"widgets", json::array()}, {"layout", {{"columns", 6}}},
        {"tags", {"fx"}}, {"createdAt", 1000}, {"updatedAt", 2000}, {"version", 4}
    };

    client->enqueue_response(200, envelope(wire));
    auto fetched = api.fetch_dashboard("d1");
    assert(fetched.id == "d1" && fetched.is_default && fetched.version == 4);
    assert(fetched.layout.columns == 6 && fetched.layout.rows == 8);
    assert(fetched.updated_at == 2000);
    const auto& get = client->requests().back();
    assert(get.method == "GET");
    assert(get.url == "https://api.test/v1/dashboards/d1");
    assert(get.headers.at("Authorization") == "Bearer t");

    pulsesync::dashboard_draft draft;
    draft.name = "Rates";
    client->enqueue_response(201, envelope(wire));
    api.create_dashboard(draft);
    const auto& post = client->requests().back();
    assert(post.method == "POST");
    assert(post.url == "https://api.test/v1/dashboards");
    assert(post.headers.at("Content-Type") == "application/json");
    assert(json::parse(post.body_string())["name"] == "Rates");

    pulsesync::dashboard_patch patch;
    patch.tags = std::vector<std::string>{"fx", "rates"};
    // Malformed bytes in a field are replaced, not a serialization failure
    client->enqueue_response(201, envelope(wire));
    api.create_dashboard([] {
        pulsesync::dashboard_draft bad;
        bad.name = "bad\xff";
        return bad;
    }());
    assert(json::parse(client->requests().back().body_string())["name"] == "bad\xEF\xBF\xBD");

    client->enqueue_response(200, envelope(wire));
    api.update_dashboard("d1", patch);
    auto sent = json::parse(client->requests().back().body_string());
    assert(client->requests().back().method == "PUT");
    assert(sent.size() == 1 && sent["tags"].size() == 2);

    client->enqueue_response(204);
    api.delete_dashboard("d1");
    assert(client->requests().back().method == "DELETE");

    client->enqueue_response(200, envelope(json::array({wire, wire})));
    assert(api.list_dashboards().size() == 2);

    // Error mapping
    using kind = pulsesync::api_error::kind;
    client->enqueue_response(404, R"({"success":false,"error":"Dashboard not found"})");
    assert(expect_api_error([&] { api.fetch_dashboard("nope"); }) == kind::not_found);

    client->enqueue_response(503);
    assert(expect_api_error([&] { api.fetch_dashboard("d1"); }) == kind::network);

    client->enqueue_response(0);
    assert(expect_api_error([&] { api.fetch_dashboard("d1"); }) == kind::network);

    client->enqueue_response(422, R"({"success":false,"error":"name is required"})");
    try {
        api.create_dashboard(pulsesync::dashboard_draft{});
        assert(false);
    } catch (const pulsesync::api_error& e) {
        assert(e.error_kind() == kind::rejected);
        assert(std::string(e.what()) == "name is required");
    }

    client->enqueue_response(200, R"({"success":false,"error":"nope"})");
    assert(expect_api_error([&] { api.fetch_dashboard("d1"); }) == kind::rejected);

    client->enqueue_response(200, envelope(json{{"unexpected", true}}));
    assert(expect_api_error([&] { api.fetch_dashboard("d1"); }) == kind::rejected);

    client->set_unreachable(true);
    assert(expect_api_error([&] { api.list_dashboards(); }) == kind::network);
    client->set_unreachable(false);

    // No transport wired: every call is a network failure
    pulsesync::http_dashboard_api detached(nullptr, "https://api.test");
    assert(expect_api_error([&] { detached.list_dashboards(); }) == kind::network);

    std::cout << "  HTTP dashboard API test passed!" << std::endl;
}

void test_http_probe() {
    std::cout << "Testing HTTP reachability probe..." << std::endl;

    auto client = std::make_shared<pulsesync::mock_http_client>();
    pulsesync::http_reachability_probe probe(client, "https://api.test/health");

    client->enqueue_response(200);
    assert(probe.probe(5s));
    assert(client->requests().back().method == "HEAD");
    assert(client->requests().back().url == "https://api.test/health");
    assert(client->requests().back().timeout == 5s);

    client->enqueue_response(500);
    assert(!probe.probe(5s));

    client->set_unreachable(true);
    assert(!probe.probe(5s));
    client->set_unreachable(false);

    // Unscripted requests get the fallback answer
    client->clear_requests();
    client->set_fallback(pulsesync::http_response::from_string(204, ""));
    assert(probe.probe(5s));
    assert(client->requests().size() == 1);

    pulsesync::http_reachability_probe detached(nullptr, "https://api.test/health");
    assert(!detached.probe(5s));

    std::cout << "  HTTP reachability probe test passed!" << std::endl;
}

// ============================================================================
// Test: Configuration and engine wiring
// ============================================================================

void test_config() {
    std::cout << "Testing configuration..." << std::endl;

    auto defaults = pulsesync::sync_config::from_json_string("{}");
    assert(defaults.store.prefix == "pulsesync_");
    assert(defaults.store.quota_bytes == 5242880);
    assert(defaults.store.write_retries == 3);
    assert(defaults.monitor.probe_interval == 30s);
    assert(defaults.monitor.drain_interval == 10s);
    assert(defaults.repository.strategy == pulsesync::conflict_strategy::server);
    assert(defaults.repository.auto_sync);
    assert(defaults.health_url == "/health");
    assert(defaults.level == pulsesync::log_level::off);

    auto custom = pulsesync::sync_config::from_json_string(R"({
        "storagePrefix": "mp_",
        "writeRetries": 5,
        "writeRetryDelayMs": 250,
        "probeIntervalMs": 15000,
        "foregroundProbeDelayMs": 500,
        "defaultMaxRetries": 2,
        "healthUrl": "/api/health",
        "conflictStrategy": "merge",
        "autoSync": false,
        "autoSyncMaxRetries": 0,
        "logLevel": "debug",
        "someFutureKey": [1, 2, 3]
    })");
    assert(custom.store.prefix == "mp_");
    assert(custom.store.write_retries == 5);
    assert(custom.store.write_retry_delay == 250ms);
    assert(custom.monitor.probe_interval == 15s);
    assert(custom.monitor.foreground_probe_delay == 500ms);
    assert(custom.monitor.default_max_retries == 2);
    assert(custom.health_url == "/api/health");
    assert(custom.repository.strategy == pulsesync::conflict_strategy::merge);
    assert(!custom.repository.auto_sync);
    assert(custom.repository.auto_sync_max_retries == 0);
    assert(custom.level == pulsesync::log_level::debug);

    const char* invalid[] = {
        "{",
        "[]",
        R"({"probeIntervalMs": 0})",
        R"({"probeIntervalMs": "fast"})",
        R"({"writeRetries": -1})",
        R"({"defaultMaxRetries": 0})",
        R"({"conflictStrategy": "newest"})",
        R"({"autoSync": "yes"})",
        R"({"logLevel": "verbose"})",
    };
    for (const char* text : invalid) {
        bool threw = false;
        try {
            pulsesync::sync_config::from_json_string(text);
        } catch (const pulsesync::config_error&) {
            threw = true;
        }
        assert(threw);
    }

    std::string path = "/tmp/pulsesync_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"drainIntervalMs": 2500})";
    }
    assert(pulsesync::load_sync_config(path).monitor.drain_interval == 2500ms);
    std::filesystem::remove(path);

    bool threw = false;
    try {
        pulsesync::load_sync_config(path);
    } catch (const pulsesync::config_error&) {
        threw = true;
    }
    assert(threw);

    assert(pulsesync::log_level_from_string("warn") == pulsesync::log_level::warn);
    assert(std::string(pulsesync::to_string(pulsesync::log_level::info)) == "info");

    std::cout << "  Configuration test passed!" << std::endl;
}

void test_engine() {
    std::cout << "Testing engine wiring..." << std::endl;

    auto config = pulsesync::sync_config::from_json_string(R"({"autoSync": false, "logLevel": "off"})");
    pulsesync::manual_timer_service timers;
    auto client = std::make_shared<pulsesync::mock_http_client>();
    pulsesync::sync_engine engine(config, std::make_unique<pulsesync::memory_storage_medium>(),
                                  client, "https://api.test/", timers);
    assert(engine.monitor().is_online());
    assert(pulsesync::get_log_level() == pulsesync::log_level::off);

    json wire = {{"id", "d9"}, {"name", "Ops"}, {"version", 1}, {"updatedAt", timers.now_ms()}};
    client->enqueue_response(201, envelope(wire));
    pulsesync::dashboard_draft draft;
    draft.name = "Ops";
    auto created = engine.repository().create_dashboard(draft);
    assert(created && !created->is_offline);
    assert(created->value.id == "d9");
    assert(client->requests().back().url == "https://api.test/dashboards");
    assert(engine.store().exists("dashboard_d9"));

    // Health check answers 503 (fallback): the engine goes offline
    timers.advance(30s);
    assert(client->requests().back().method == "HEAD");
    assert(client->requests().back().url == "https://api.test/health");
    assert(!engine.monitor().is_online());

    auto offline = engine.repository().create_dashboard(draft);
    assert(offline && offline->is_offline);
    assert(engine.repository().get_sync_status().pending_change_count == 1);

    engine.repository().set_conflict_strategy(pulsesync::conflict_strategy::merge);
    assert(engine.repository().get_conflict_strategy() == pulsesync::conflict_strategy::merge);

    std::cout << "  Engine wiring test passed!" << std::endl;
}

void test_engine_without_storage() {
    std::cout << "Testing engine on unopenable storage..." << std::endl;

    auto config = pulsesync::sync_config::from_json_string(R"({"autoSync": false})");
    pulsesync::manual_timer_service timers;
    auto client = std::make_shared<pulsesync::mock_http_client>();
    pulsesync::sync_engine engine(config, std::string("/nonexistent_dir/x/y.db"),
                                  client, "https://api.test", timers);

    assert(!engine.store().is_available());
    auto status = engine.repository().get_sync_status();
    assert(status.last_sync_timestamp == 0);
    assert(status.pending_change_count == 0);
    assert(status.conflict_keys.empty());
    assert(status.is_online);

    // Remote answers 503: nothing local to fall back on
    assert(!engine.repository().get_dashboard("d1"));
    assert(engine.repository().get_dashboards().empty());

    std::cout << "  Engine on unopenable storage test passed!" << std::endl;
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "=== PulseSync Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        // Scheduling
        test_manual_timers();
        test_run_loop_timers();

        // Versioned store
        test_checksum();
        test_store_round_trip();
        test_store_corruption();
        test_store_namespace_ops();
        test_store_unavailable();
        test_store_write_retry();
        test_conflict_detection();
        test_conflict_resolution();
        test_sqlite_medium();

        // Connectivity monitor
        test_monitor_transitions();
        test_monitor_listeners();
        test_bounded_retry();
        test_queue_stats_and_destroy();

        // Remote API
        test_http_dashboard_api();
        test_http_probe();

        // Configuration
        test_config();
        test_engine();
        test_engine_without_storage();

        // Repository
        std::cout << "Testing dashboard repository..." << std::endl;
        repository_tests::test_online_crud();
        repository_tests::test_rejected_writes_are_undone();
        repository_tests::test_offline_create_reaches_server_once();
        repository_tests::test_queue_replay_without_auto_sync();
        repository_tests::test_temp_id_replaced_in_queue();
        repository_tests::test_offline_delete();
        repository_tests::test_delete_remote_outcomes();
        repository_tests::test_sync_conflict_server_wins();
        repository_tests::test_sync_conflict_local_wins();
        repository_tests::test_sync_conflict_merge();
        repository_tests::test_read_path_conflict();
        repository_tests::test_read_keeps_pending_change();
        repository_tests::test_read_replaces_clean_copy();
        repository_tests::test_list_merges_pending_creations();
        repository_tests::test_concurrent_sync_rejected();
        repository_tests::test_sync_collects_errors();
        repository_tests::test_auto_sync_retries();
        repository_tests::test_sync_status_degrades();
        repository_tests::test_status_listeners_and_destroy();
        repository_tests::test_invalid_utf8_names_are_stored();

        std::cout << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << "All tests passed!" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}

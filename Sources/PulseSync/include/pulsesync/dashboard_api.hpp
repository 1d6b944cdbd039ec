#pragma once

#ifdef __cplusplus

#include "dashboard.hpp"
#include "network.hpp"
#include "scheduler.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace pulsesync {

// ============================================================================
// Remote API errors
// ============================================================================

class api_error : public std::runtime_error {
public:
    enum class kind {
        network,    // unreachable, timed out, 5xx; worth retrying
        rejected,   // the server refused the request (validation, conflict)
        not_found
    };

    api_error(kind k, const std::string& msg) : std::runtime_error(msg), kind_(k) {}

    kind error_kind() const noexcept { return kind_; }
    bool is_network() const noexcept { return kind_ == kind::network; }

private:
    kind kind_;
};

const char* to_string(api_error::kind k);

// ============================================================================
// Dashboard API
// ============================================================================
//
// The remote dashboard service as the repository sees it. Every call is
// synchronous and reports failure by throwing api_error.

class dashboard_api {
public:
    virtual ~dashboard_api() = default;

    virtual dashboard fetch_dashboard(const std::string& id) = 0;
    virtual dashboard create_dashboard(const dashboard_draft& draft) = 0;
    virtual dashboard update_dashboard(const std::string& id, const dashboard_patch& patch) = 0;
    virtual void delete_dashboard(const std::string& id) = 0;
    virtual std::vector<dashboard> list_dashboards() = 0;
};

// ============================================================================
// HTTP/JSON implementation
// ============================================================================
//
//   GET    <base>/dashboards          list
//   GET    <base>/dashboards/<id>     fetch
//   POST   <base>/dashboards          create
//   PUT    <base>/dashboards/<id>     update
//   DELETE <base>/dashboards/<id>     delete
//
// Responses use the envelope {"success": bool, "data": ..., "error": "..."}.
// Transport exceptions, status 0 and 5xx are network errors; 404 is
// not_found; any other non-2xx or success=false is rejected.

class http_dashboard_api : public dashboard_api {
public:
    http_dashboard_api(std::shared_ptr<http_client> client,
                       std::string base_url,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds{10000});

    dashboard fetch_dashboard(const std::string& id) override;
    dashboard create_dashboard(const dashboard_draft& draft) override;
    dashboard update_dashboard(const std::string& id, const dashboard_patch& patch) override;
    void delete_dashboard(const std::string& id) override;
    std::vector<dashboard> list_dashboards() override;

    void set_header(const std::string& name, const std::string& value) { headers_[name] = value; }

private:
    std::shared_ptr<http_client> client_;
    std::string base_url_;
    std::chrono::milliseconds timeout_;
    HeadersMap headers_;

    json send(const std::string& method, const std::string& path,
              const std::optional<json>& body = std::nullopt);
};

// ============================================================================
// In-memory implementation for testing
// ============================================================================
//
// Behaves like a well-behaved server: assigns ids ("srv_<n>"), bumps the
// version on every write and stamps updatedAt from the timer service.

class mock_dashboard_api : public dashboard_api {
public:
    explicit mock_dashboard_api(timer_service& timers) : timers_(timers) {}

    dashboard fetch_dashboard(const std::string& id) override;
    dashboard create_dashboard(const dashboard_draft& draft) override;
    dashboard update_dashboard(const std::string& id, const dashboard_patch& patch) override;
    void delete_dashboard(const std::string& id) override;
    std::vector<dashboard> list_dashboards() override;

    // Every call fails with a network error while unreachable
    void set_reachable(bool reachable) { reachable_ = reachable; }

    // The next n calls fail with the given kind
    void fail_next(int n, api_error::kind k = api_error::kind::network) {
        failing_calls_ = n;
        failure_kind_ = k;
    }

    // Called at the start of every operation with its name ("fetch", "create", ...)
    void set_call_hook(std::function<void(const std::string&)> hook) { hook_ = std::move(hook); }

    // Simulate changes made by another client
    dashboard& seed(dashboard d);
    dashboard& remote_edit(const std::string& id, const dashboard_patch& patch);

    bool has(const std::string& id) const { return dashboards_.count(id) > 0; }
    const dashboard& get(const std::string& id) const { return dashboards_.at(id); }
    size_t size() const { return dashboards_.size(); }

    size_t call_count(const std::string& op) const;
    void reset_counts() { calls_.clear(); }

private:
    timer_service& timers_;
    std::map<std::string, dashboard> dashboards_;
    std::map<std::string, size_t> calls_;
    std::function<void(const std::string&)> hook_;
    bool reachable_ = true;
    int failing_calls_ = 0;
    api_error::kind failure_kind_ = api_error::kind::network;
    int next_id_ = 1;

    void begin_call(const std::string& op);
};

} // namespace pulsesync

#endif // __cplusplus

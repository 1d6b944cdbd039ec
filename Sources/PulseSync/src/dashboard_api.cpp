#include "pulsesync/dashboard_api.hpp"
#include "pulsesync/log.hpp"

namespace pulsesync {

const char* to_string(api_error::kind k) {
    switch (k) {
        case api_error::kind::network:   return "network";
        case api_error::kind::rejected:  return "rejected";
        case api_error::kind::not_found: return "not_found";
    }
    return "unknown";
}

// ============================================================================
// http_dashboard_api
// ============================================================================

http_dashboard_api::http_dashboard_api(std::shared_ptr<http_client> client,
                                       std::string base_url,
                                       std::chrono::milliseconds timeout)
    : client_(std::move(client)), base_url_(std::move(base_url)), timeout_(timeout) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

json http_dashboard_api::send(const std::string& method, const std::string& path,
                              const std::optional<json>& body) {
    if (!client_) {
        throw api_error(api_error::kind::network, "no HTTP client configured");
    }

    http_request request;
    request.method = method;
    request.url = base_url_ + path;
    request.headers = headers_;
    request.headers["Accept"] = "application/json";
    request.timeout = timeout_;
    if (body) {
        request.set_json_body(dump_text(*body));
    }

    http_response response;
    try {
        response = client_->send(request);
    } catch (const std::exception& e) {
        LOG_DEBUG("api", "%s %s failed: %s", method.c_str(), request.url.c_str(), e.what());
        throw api_error(api_error::kind::network, e.what());
    }

    const int status = response.status_code;
    if (status == 0 || status >= 500) {
        throw api_error(api_error::kind::network,
                        method + " " + path + " failed with status " + std::to_string(status));
    }

    json envelope;
    if (!response.body.empty()) {
        envelope = json::parse(response.body_string(), nullptr, false);
        if (envelope.is_discarded()) {
            envelope = json();
        }
    }
    std::string message = envelope.is_object() ? envelope.value("error", std::string()) : std::string();
    if (message.empty()) {
        message = method + " " + path + " failed with status " + std::to_string(status);
    }

    if (status == 404) {
        throw api_error(api_error::kind::not_found, message);
    }
    if (!response.is_success()) {
        throw api_error(api_error::kind::rejected, message);
    }
    if (!envelope.is_object()) {
        // DELETE may legitimately answer 204 with no body
        if (response.body.empty()) return json();
        throw api_error(api_error::kind::rejected, "malformed response from " + path);
    }
    if (!envelope.value("success", false)) {
        throw api_error(api_error::kind::rejected, message);
    }
    return envelope.value("data", json());
}

dashboard http_dashboard_api::fetch_dashboard(const std::string& id) {
    try {
        return send("GET", "/dashboards/" + id).get<dashboard>();
    } catch (const json::exception& e) {
        throw api_error(api_error::kind::rejected, std::string("invalid dashboard payload: ") + e.what());
    }
}

dashboard http_dashboard_api::create_dashboard(const dashboard_draft& draft) {
    try {
        return send("POST", "/dashboards", json(draft)).get<dashboard>();
    } catch (const json::exception& e) {
        throw api_error(api_error::kind::rejected, std::string("invalid dashboard payload: ") + e.what());
    }
}

dashboard http_dashboard_api::update_dashboard(const std::string& id, const dashboard_patch& patch) {
    try {
        return send("PUT", "/dashboards/" + id, json(patch)).get<dashboard>();
    } catch (const json::exception& e) {
        throw api_error(api_error::kind::rejected, std::string("invalid dashboard payload: ") + e.what());
    }
}

void http_dashboard_api::delete_dashboard(const std::string& id) {
    send("DELETE", "/dashboards/" + id);
}

std::vector<dashboard> http_dashboard_api::list_dashboards() {
    try {
        json data = send("GET", "/dashboards");
        if (data.is_null()) return {};
        return data.get<std::vector<dashboard>>();
    } catch (const json::exception& e) {
        throw api_error(api_error::kind::rejected, std::string("invalid dashboard list: ") + e.what());
    }
}

// ============================================================================
// mock_dashboard_api
// ============================================================================

void mock_dashboard_api::begin_call(const std::string& op) {
    ++calls_[op];
    if (hook_) hook_(op);
    if (!reachable_) {
        throw api_error(api_error::kind::network, "server unreachable");
    }
    if (failing_calls_ > 0) {
        --failing_calls_;
        throw api_error(failure_kind_, std::string("simulated ") + to_string(failure_kind_) + " failure");
    }
}

size_t mock_dashboard_api::call_count(const std::string& op) const {
    auto it = calls_.find(op);
    return it == calls_.end() ? 0 : it->second;
}

dashboard mock_dashboard_api::fetch_dashboard(const std::string& id) {
    begin_call("fetch");
    auto it = dashboards_.find(id);
    if (it == dashboards_.end()) {
        throw api_error(api_error::kind::not_found, "Dashboard " + id + " not found");
    }
    return it->second;
}

dashboard mock_dashboard_api::create_dashboard(const dashboard_draft& draft) {
    begin_call("create");
    if (draft.name.empty()) {
        throw api_error(api_error::kind::rejected, "name is required");
    }
    const millis_t now = timers_.now_ms();
    dashboard d = make_local_dashboard(draft, "srv_" + std::to_string(next_id_++), now);
    d.version = 1;
    return dashboards_[d.id] = d;
}

dashboard mock_dashboard_api::update_dashboard(const std::string& id, const dashboard_patch& patch) {
    begin_call("update");
    auto it = dashboards_.find(id);
    if (it == dashboards_.end()) {
        throw api_error(api_error::kind::not_found, "Dashboard " + id + " not found");
    }
    if (patch.name && patch.name->empty()) {
        throw api_error(api_error::kind::rejected, "name must not be empty");
    }
    apply_patch(it->second, patch);
    it->second.version += 1;
    it->second.updated_at = timers_.now_ms();
    return it->second;
}

void mock_dashboard_api::delete_dashboard(const std::string& id) {
    begin_call("delete");
    if (dashboards_.erase(id) == 0) {
        throw api_error(api_error::kind::not_found, "Dashboard " + id + " not found");
    }
}

std::vector<dashboard> mock_dashboard_api::list_dashboards() {
    begin_call("list");
    std::vector<dashboard> result;
    result.reserve(dashboards_.size());
    for (const auto& [id, d] : dashboards_) {
        result.push_back(d);
    }
    return result;
}

dashboard& mock_dashboard_api::seed(dashboard d) {
    std::string id = d.id;
    return dashboards_[id] = std::move(d);
}

dashboard& mock_dashboard_api::remote_edit(const std::string& id, const dashboard_patch& patch) {
    auto& d = dashboards_.at(id);
    apply_patch(d, patch);
    d.version += 1;
    d.updated_at = timers_.now_ms();
    return d;
}

} // namespace pulsesync

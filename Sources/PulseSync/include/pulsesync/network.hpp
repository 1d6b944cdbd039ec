#pragma once

#ifdef __cplusplus

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace pulsesync {

using HeadersMap = std::map<std::string, std::string>;

// ============================================================================
// HTTP Client Interface
// ============================================================================
//
// Abstract interface for HTTP operations. The application supplies the
// transport (libcurl, platform HTTP stack, ...). Calls are synchronous and run
// on the caller's thread; a transport that cannot reach the host either
// throws transport_error or answers with status 0.

struct http_response {
    int status_code = 0;
    HeadersMap headers;
    std::vector<uint8_t> body;

    bool is_success() const { return status_code >= 200 && status_code < 300; }
    std::string body_string() const {
        return std::string(body.begin(), body.end());
    }

    static http_response from_string(int status, const std::string& s) {
        http_response response;
        response.status_code = status;
        response.body = std::vector<uint8_t>(s.begin(), s.end());
        return response;
    }
};

struct http_request {
    std::string method = "GET";
    std::string url;
    HeadersMap headers;
    std::vector<uint8_t> body;

    // Zero means the transport's own default
    std::chrono::milliseconds timeout{0};

    void set_body(const std::string& s) {
        body = std::vector<uint8_t>(s.begin(), s.end());
    }

    void set_json_body(const std::string& json) {
        set_body(json);
        headers["Content-Type"] = "application/json";
    }

    std::string body_string() const {
        return std::string(body.begin(), body.end());
    }
};

/// Connection refused, DNS failure, timeout.
class transport_error : public std::runtime_error {
public:
    explicit transport_error(const std::string& msg) : std::runtime_error(msg) {}
};

class http_client {
public:
    virtual ~http_client() = default;

    // Synchronous request (blocks until complete)
    virtual http_response send(const http_request& request) = 0;
};

// ============================================================================
// Reachability probe
// ============================================================================

class reachability_probe {
public:
    virtual ~reachability_probe() = default;

    // True if the remote answered in time. Must not throw.
    virtual bool probe(std::chrono::milliseconds timeout) = 0;
};

/// HEAD <health_url>; any 2xx is reachable, everything else is not.
class http_reachability_probe : public reachability_probe {
public:
    http_reachability_probe(std::shared_ptr<http_client> client, std::string health_url)
        : client_(std::move(client)), health_url_(std::move(health_url)) {}

    bool probe(std::chrono::milliseconds timeout) override;

private:
    std::shared_ptr<http_client> client_;
    std::string health_url_;
};

// ============================================================================
// Mock implementations for testing
// ============================================================================

/// Replays queued responses in order and records every request. With nothing
/// queued it answers with the fallback (503 unless changed).
class mock_http_client : public http_client {
public:
    http_response send(const http_request& request) override {
        requests_.push_back(request);
        if (unreachable_) {
            throw transport_error("host unreachable");
        }
        if (responses_.empty()) {
            return fallback_;
        }
        auto response = std::move(responses_.front());
        responses_.pop_front();
        return response;
    }

    // Test helpers
    void enqueue_response(http_response response) { responses_.push_back(std::move(response)); }
    void enqueue_response(int status, const std::string& body = "") {
        responses_.push_back(http_response::from_string(status, body));
    }
    void set_fallback(http_response response) { fallback_ = std::move(response); }
    void set_unreachable(bool unreachable) { unreachable_ = unreachable; }

    const std::vector<http_request>& requests() const { return requests_; }
    void clear_requests() { requests_.clear(); }

private:
    std::deque<http_response> responses_;
    std::vector<http_request> requests_;
    http_response fallback_{503, {}, {}};
    bool unreachable_ = false;
};

/// Reachability under test control.
class mock_reachability_probe : public reachability_probe {
public:
    bool probe(std::chrono::milliseconds timeout) override {
        ++probe_count_;
        last_timeout_ = timeout;
        return reachable_;
    }

    void set_reachable(bool reachable) { reachable_ = reachable; }
    size_t probe_count() const { return probe_count_; }
    std::chrono::milliseconds last_timeout() const { return last_timeout_; }

private:
    bool reachable_ = true;
    size_t probe_count_ = 0;
    std::chrono::milliseconds last_timeout_{0};
};

} // namespace pulsesync

#endif // __cplusplus

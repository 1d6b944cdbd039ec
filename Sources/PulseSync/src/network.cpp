#include "pulsesync/network.hpp"
#include "pulsesync/log.hpp"

namespace pulsesync {

bool http_reachability_probe::probe(std::chrono::milliseconds timeout) {
    if (!client_) return false;

    http_request request;
    request.method = "HEAD";
    request.url = health_url_;
    request.timeout = timeout;

    try {
        auto response = client_->send(request);
        if (!response.is_success()) {
            LOG_DEBUG("probe", "%s answered %d", health_url_.c_str(), response.status_code);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        LOG_DEBUG("probe", "%s unreachable: %s", health_url_.c_str(), e.what());
        return false;
    }
}

} // namespace pulsesync

#pragma once

#include <nlohmann/json.hpp>

namespace core {

// Status recorded for a dispatched request that never produced an HTTP
// response (connection refused, reset, malformed response framing).
inline constexpr int kTransportFailureStatus = 0;

struct Response {
    int status{kTransportFailureStatus};
    nlohmann::json body{}; // null when the payload was empty or not JSON

    [[nodiscard]] bool transport_failed() const noexcept { return status == kTransportFailureStatus; }
};

[[nodiscard]] inline Response make_transport_failure() {
    return Response{kTransportFailureStatus, nullptr};
}

} // namespace core

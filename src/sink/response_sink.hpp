#pragma once

#include <nlohmann/json.hpp>

#include "core/response.hpp"

namespace sink {

// Receives every completed response of a run. Calls arrive on the replay's
// io_context thread, so implementations need no locking.
class ResponseSink {
public:
    virtual ~ResponseSink() = default;
    virtual void process(const core::Response& response) = 0;
    virtual nlohmann::json summary() const = 0;
};

} // namespace sink

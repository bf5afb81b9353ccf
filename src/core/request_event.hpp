#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

namespace core {

// Instant as recorded in the capture. Only differences between log times are
// meaningful to the replay; the epoch is whatever the capture used.
using LogTime = std::chrono::system_clock::time_point;

struct RequestEvent {
    LogTime timestamp{};
    std::string method{"POST"};
    std::string path{};
    nlohmann::json body = nlohmann::json::object();
};

} // namespace core

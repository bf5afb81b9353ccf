#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace replay {

// What a dispatched request does when the transport fails (refused, reset,
// unparseable HTTP).
enum class TransportFailurePolicy : std::uint8_t {
    Record, // deliver a core::kTransportFailureStatus response to the sink
    Abort,  // stop dispatching and end the run with RunStatus::TransportError
};

struct RunConfig {
    // 1 replays in real time; 2 replays the capture in half the wall time.
    double speed_multiplier{1.0};

    // Hard wall-clock limit on dispatching.
    std::chrono::duration<double> run_budget{60.0};

    // Cap on in-flight requests; 0 = unbounded.
    std::size_t max_outstanding{0};

    TransportFailurePolicy transport_failure_policy{TransportFailurePolicy::Record};
};

[[nodiscard]] inline RunConfig default_run_config() noexcept {
    return RunConfig{};
}

// Returns false with error set when the config cannot drive a run.
bool validate_run_config(const RunConfig& cfg, std::string& error);

inline const char* to_string(TransportFailurePolicy p) noexcept {
    switch (p) {
    case TransportFailurePolicy::Record: return "record";
    case TransportFailurePolicy::Abort: return "abort";
    }
    return "unknown";
}

inline std::optional<TransportFailurePolicy> transport_failure_policy_from_string(std::string_view s) noexcept {
    if (s == "record") return TransportFailurePolicy::Record;
    if (s == "abort") return TransportFailurePolicy::Abort;
    return std::nullopt;
}

} // namespace replay

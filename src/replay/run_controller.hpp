#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include "core/run_stats.hpp"
#include "core/timeline.hpp"
#include "ingest/request_source.hpp"
#include "replay/dispatcher.hpp"
#include "replay/run_config.hpp"
#include "util/clock.hpp"

namespace replay {

enum class RunState : std::uint8_t { Idle, Running, Draining, Done };

enum class RunStatus : std::uint8_t {
    Ok,
    SourceError,    // malformed event, unreadable or empty capture
    TransportError, // transport failure under TransportFailurePolicy::Abort
};

struct RunOutcome {
    RunStatus status{RunStatus::Ok};
    core::RunStats stats{};
    std::string error;
};

// Paces the source through the Timeline, dispatches each event when it is
// due and, once the budget is spent, drains whatever is still in flight.
class RunController {
public:
    // Throws std::invalid_argument if validate_run_config rejects cfg.
    RunController(boost::asio::io_context& io,
                  ingest::RequestSource& source,
                  Dispatcher& dispatcher,
                  const RunConfig& cfg,
                  const util::SteadyClock& clock = util::default_steady_clock());

    RunController(const RunController&) = delete;
    RunController& operator=(const RunController&) = delete;

    // Runs once (a second call throws std::logic_error); must be co_spawned on
    // the same io_context as the dispatcher.
    boost::asio::awaitable<RunOutcome> run();

    RunState state() const noexcept { return state_; }
    const core::Timeline& timeline() const noexcept { return timeline_; }

private:
    double seconds_since_start() const noexcept;

    boost::asio::io_context& io_;
    ingest::RequestSource& source_;
    Dispatcher& dispatcher_;
    RunConfig cfg_;
    const util::SteadyClock& clock_;
    core::Timeline timeline_;
    util::SteadyClock::time_point start_time_{};
    RunState state_{RunState::Idle};
};

inline const char* to_string(RunStatus status) noexcept {
    switch (status) {
    case RunStatus::Ok: return "ok";
    case RunStatus::SourceError: return "source_error";
    case RunStatus::TransportError: return "transport_error";
    }
    return "unknown";
}

} // namespace replay

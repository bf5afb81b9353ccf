#include "replay/run_controller.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "util/log.hpp"

namespace replay {

namespace asio = boost::asio;

namespace {

const RunConfig& checked(const RunConfig& cfg) {
    std::string error;
    if (!validate_run_config(cfg, error)) {
        throw std::invalid_argument("RunController: " + error);
    }
    return cfg;
}

} // namespace

RunController::RunController(asio::io_context& io,
                             ingest::RequestSource& source,
                             Dispatcher& dispatcher,
                             const RunConfig& cfg,
                             const util::SteadyClock& clock)
    : io_(io),
      source_(source),
      dispatcher_(dispatcher),
      cfg_(checked(cfg)),
      clock_(clock),
      timeline_(cfg_.speed_multiplier, clock_) {}

double RunController::seconds_since_start() const noexcept {
    return util::to_seconds(clock_.now() - start_time_);
}

asio::awaitable<RunOutcome> RunController::run() {
    if (state_ != RunState::Idle) {
        throw std::logic_error("RunController::run called more than once");
    }
    RunOutcome outcome;
    state_ = RunState::Running;
    start_time_ = clock_.now();

    const double budget_s = cfg_.run_budget.count();
    asio::steady_timer pacer(io_);
    std::uint64_t sent = 0;
    double last_sleep_s = 0.0;
    double elapsed_s = 0.0;
    bool cycle_has_events = false;

    while (true) {
        core::RequestEvent event;
        const auto status = source_.next(event);
        if (status == ingest::SourceReadStatus::EndOfCycle) {
            if (!cycle_has_events) {
                outcome.status = RunStatus::SourceError;
                outcome.error = "capture contains no replayable requests";
                break;
            }
            if (!source_.rewind()) {
                outcome.status = RunStatus::SourceError;
                outcome.error = source_.last_error();
                break;
            }
            cycle_has_events = false;
            timeline_.begin_cycle();
            LOG_SLOW_DEBUG("capture wrapped after %llu requests",
                           static_cast<unsigned long long>(sent));
            continue;
        }
        if (status != ingest::SourceReadStatus::Ok) {
            outcome.status = RunStatus::SourceError;
            outcome.error = std::string(ingest::to_string(status)) + ": " + source_.last_error();
            break;
        }
        cycle_has_events = true;

        last_sleep_s = timeline_.next_sleep(event.timestamp).count();
        // Never sleep past the end of the budget.
        const double remaining_s = std::max(budget_s - seconds_since_start(), 0.0);
        const double sleep_s = std::clamp(last_sleep_s, 0.0, remaining_s);
        if (sleep_s > 0.0) {
            pacer.expires_at(util::deadline_after(asio::steady_timer::clock_type::now(), sleep_s));
            co_await pacer.async_wait(asio::use_awaitable);
        }

        elapsed_s = seconds_since_start();
        if (elapsed_s >= budget_s) {
            break;
        }
        if (dispatcher_.failed()) {
            outcome.status = RunStatus::TransportError;
            outcome.error = dispatcher_.failure();
            break;
        }
        const auto slot_deadline = util::deadline_after(asio::steady_timer::clock_type::now(), budget_s - elapsed_s);
        const bool have_slot = co_await dispatcher_.wait_for_slot(slot_deadline);
        if (!have_slot) {
            elapsed_s = seconds_since_start();
            break;
        }
        dispatcher_.dispatch(std::move(event));
        ++sent;
    }

    if (outcome.status != RunStatus::Ok) {
        elapsed_s = seconds_since_start();
        LOG_SLOW_ERROR("replay aborted (%s): %s", to_string(outcome.status), outcome.error.c_str());
    }

    state_ = RunState::Draining;
    const std::size_t outstanding = co_await dispatcher_.drain();
    if (outcome.status == RunStatus::Ok && dispatcher_.failed()) {
        outcome.status = RunStatus::TransportError;
        outcome.error = dispatcher_.failure();
    }
    state_ = RunState::Done;

    outcome.stats = core::assemble_run_stats(std::chrono::duration<double>(elapsed_s),
                                             sent,
                                             outstanding,
                                             last_sleep_s,
                                             timeline_.state().cycles_started);
    co_return outcome;
}

} // namespace replay

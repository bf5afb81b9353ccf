#include "replay/dispatcher.hpp"

#include <exception>
#include <optional>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>

#include "util/log.hpp"

namespace replay {

namespace asio = boost::asio;

namespace {

// Anything other than a system_error escaping a unit is a defect; rethrowing
// here surfaces it from io_context::run().
void rethrow_unit_failure(std::exception_ptr e) {
    if (e) {
        std::rethrow_exception(e);
    }
}

} // namespace

Dispatcher::Dispatcher(asio::io_context& io,
                       net::Transport& transport,
                       sink::ResponseSink& sink,
                       const RunConfig& cfg)
    : io_(io),
      transport_(transport),
      sink_(sink),
      policy_(cfg.transport_failure_policy),
      max_outstanding_(cfg.max_outstanding),
      release_signal_(io, asio::steady_timer::time_point::max()) {}

DispatchId Dispatcher::dispatch(core::RequestEvent event) {
    auto unit = std::make_shared<Unit>();
    unit->id = next_id_++;
    unit->event = std::move(event);
    unit->exchange = transport_.make_exchange();

    const DispatchId id = unit->id;
    outstanding_.emplace(id, unit);
    ++counters_.dispatched;
    asio::co_spawn(io_, run_unit(std::move(unit)), rethrow_unit_failure);
    return id;
}

asio::awaitable<void> Dispatcher::run_unit(std::shared_ptr<Unit> unit) {
    std::optional<core::Response> response;
    std::string transport_error;
    bool cancelled = false;
    try {
        response = co_await unit->exchange->post(unit->event);
    } catch (const boost::system::system_error& e) {
        if (unit->cancel_requested || e.code() == asio::error::operation_aborted) {
            cancelled = true;
        } else {
            transport_error = e.code().message();
        }
    }

    if (response) {
        ++counters_.completed;
        sink_.process(*response);
    } else if (cancelled) {
        ++counters_.cancelled;
    } else {
        on_transport_failure(*unit, transport_error);
    }
    release(unit->id);
}

void Dispatcher::on_transport_failure(const Unit& unit, const std::string& what) {
    ++counters_.transport_failures;
    if (policy_ == TransportFailurePolicy::Record) {
        LOG_SLOW_DEBUG("request %llu %s %s failed: %s",
                       static_cast<unsigned long long>(unit.id),
                       unit.event.method.c_str(),
                       unit.event.path.c_str(),
                       what.c_str());
        sink_.process(core::make_transport_failure());
        return;
    }
    if (failure_.empty()) {
        failure_ = unit.event.method + " " + unit.event.path + ": " + what;
        LOG_SLOW_ERROR("transport failure, aborting run: %s", failure_.c_str());
    }
}

void Dispatcher::release(DispatchId id) {
    outstanding_.erase(id);
    release_signal_.cancel();
}

asio::awaitable<void> Dispatcher::wait_for_release(asio::steady_timer::time_point deadline) {
    release_signal_.expires_at(deadline);
    boost::system::error_code ec;
    // Completes with operation_aborted when release() fires, or on its own
    // once the deadline passes.
    co_await release_signal_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
}

asio::awaitable<bool> Dispatcher::wait_for_slot(asio::steady_timer::time_point deadline) {
    while (max_outstanding_ > 0 && outstanding_.size() >= max_outstanding_) {
        if (asio::steady_timer::clock_type::now() >= deadline) {
            co_return false;
        }
        co_await wait_for_release(deadline);
    }
    co_return true;
}

asio::awaitable<std::size_t> Dispatcher::drain() {
    const std::uint64_t cancelled_before = counters_.cancelled;
    for (auto& [id, unit] : outstanding_) {
        unit->cancel_requested = true;
        unit->exchange->cancel();
    }
    while (!outstanding_.empty()) {
        co_await wait_for_release(asio::steady_timer::time_point::max());
    }
    // A unit whose response was already on its way completes normally and
    // is not counted here.
    const auto cancelled = static_cast<std::size_t>(counters_.cancelled - cancelled_before);
    if (cancelled > 0) {
        LOG_SLOW_DEBUG("cancelled %zu in-flight requests", cancelled);
    }
    co_return cancelled;
}

} // namespace replay

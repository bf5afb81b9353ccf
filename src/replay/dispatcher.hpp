#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "core/request_event.hpp"
#include "net/transport.hpp"
#include "replay/run_config.hpp"
#include "sink/response_sink.hpp"

namespace replay {

using DispatchId = std::uint64_t;

struct DispatcherCounters {
    std::uint64_t dispatched{0};
    std::uint64_t completed{0};
    std::uint64_t cancelled{0};
    std::uint64_t transport_failures{0};
};

// Fires each request as its own coroutine on the io_context and tracks it
// until it completes or is cancelled. All members must be used from the
// io_context thread.
class Dispatcher {
public:
    // Takes the failure policy and the in-flight cap from cfg.
    Dispatcher(boost::asio::io_context& io,
               net::Transport& transport,
               sink::ResponseSink& sink,
               const RunConfig& cfg = default_run_config());

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Starts the request and returns immediately. The response reaches the
    // sink exactly once unless the unit is cancelled first.
    DispatchId dispatch(core::RequestEvent event);

    // Suspends while max_outstanding units are in flight. No-op when unbounded.
    // Returns false if the deadline passed before a slot opened.
    boost::asio::awaitable<bool> wait_for_slot(
        boost::asio::steady_timer::time_point deadline = boost::asio::steady_timer::time_point::max());

    // Cancels every unit still in flight and waits for all of them to exit.
    // Returns how many of them ended cancelled.
    boost::asio::awaitable<std::size_t> drain();

    std::size_t outstanding() const noexcept { return outstanding_.size(); }
    bool is_outstanding(DispatchId id) const noexcept { return outstanding_.count(id) != 0; }

    // Set once a transport failure occurs under TransportFailurePolicy::Abort.
    bool failed() const noexcept { return !failure_.empty(); }
    const std::string& failure() const noexcept { return failure_; }

    const DispatcherCounters& counters() const noexcept { return counters_; }

private:
    struct Unit {
        DispatchId id{0};
        core::RequestEvent event;
        std::unique_ptr<net::Exchange> exchange;
        bool cancel_requested{false};
    };

    boost::asio::awaitable<void> run_unit(std::shared_ptr<Unit> unit);
    boost::asio::awaitable<void> wait_for_release(boost::asio::steady_timer::time_point deadline);
    void on_transport_failure(const Unit& unit, const std::string& what);
    void release(DispatchId id);

    boost::asio::io_context& io_;
    net::Transport& transport_;
    sink::ResponseSink& sink_;
    TransportFailurePolicy policy_;
    std::size_t max_outstanding_;

    std::map<DispatchId, std::shared_ptr<Unit>> outstanding_;
    DispatchId next_id_{1};
    // Parked at the waiter's deadline; cancelled to wake the pacing loop
    // whenever a unit exits.
    boost::asio::steady_timer release_signal_;
    DispatcherCounters counters_{};
    std::string failure_;
};

} // namespace replay

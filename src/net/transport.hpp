#pragma once

#include <memory>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "core/request_event.hpp"
#include "core/response.hpp"

namespace net {

// One request/response round trip. post() completes with the response, or
// throws boost::system::system_error on transport failure. After cancel()
// a pending or future post() fails with asio::error::operation_aborted.
class Exchange {
public:
    virtual ~Exchange() = default;
    virtual boost::asio::awaitable<core::Response> post(const core::RequestEvent& request) = 0;
    virtual void cancel() noexcept = 0;
};

// Shared per-run resource (executor, resolved destination) that hands out
// one Exchange per dispatched request.
class Transport {
public:
    virtual ~Transport() = default;
    virtual std::unique_ptr<Exchange> make_exchange() = 0;
};

} // namespace net

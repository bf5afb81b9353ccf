#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include "net/transport.hpp"

namespace net {

// Beast's 8 MiB default rejects large search hits pages.
inline constexpr std::uint64_t kMaxResponseBodyBytes = std::uint64_t{1} << 30;

class HttpExchange final : public Exchange {
public:
    HttpExchange(boost::asio::io_context::executor_type executor,
                 const boost::asio::ip::tcp::resolver::results_type& endpoints,
                 const std::string& host_header);

    // Connects, sends the event as an HTTP/1.1 request with a JSON body and
    // reads the full response. A body that is not JSON is returned as null.
    boost::asio::awaitable<core::Response> post(const core::RequestEvent& request) override;
    void cancel() noexcept override;

private:
    void throw_if_cancelled() const;

    boost::beast::tcp_stream stream_;
    const boost::asio::ip::tcp::resolver::results_type& endpoints_;
    const std::string& host_header_;
    bool cancelled_{false};
};

// Plain-HTTP transport to one host:port. Every exchange opens its own
// connection; all of them share the io_context and the endpoint list.
class HttpTransport final : public Transport {
public:
    HttpTransport(boost::asio::io_context& io, std::string host, std::string port);

    // Resolves host:port once, before the first exchange is made.
    bool resolve(std::string& error);

    std::unique_ptr<Exchange> make_exchange() override;

    const boost::asio::ip::tcp::resolver::results_type& endpoints() const noexcept { return endpoints_; }

private:
    boost::asio::io_context& io_;
    std::string host_;
    std::string port_;
    std::string host_header_;
    boost::asio::ip::tcp::resolver::results_type endpoints_{};
};

} // namespace net

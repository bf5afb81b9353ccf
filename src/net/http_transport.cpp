#include "net/http_transport.hpp"

#include <utility>

#include <boost/asio/error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/system/system_error.hpp>

namespace net {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

HttpExchange::HttpExchange(asio::io_context::executor_type executor,
                           const tcp::resolver::results_type& endpoints,
                           const std::string& host_header)
    : stream_(executor), endpoints_(endpoints), host_header_(host_header) {}

void HttpExchange::throw_if_cancelled() const {
    if (cancelled_) {
        throw boost::system::system_error(asio::error::operation_aborted);
    }
}

void HttpExchange::cancel() noexcept {
    cancelled_ = true;
    // Closing (not just cancelling) stops a range connect from moving on to
    // the next endpoint.
    stream_.close();
}

asio::awaitable<core::Response> HttpExchange::post(const core::RequestEvent& request) {
    throw_if_cancelled();
    co_await stream_.async_connect(endpoints_, asio::use_awaitable);
    throw_if_cancelled();

    http::request<http::string_body> req{http::verb::post, request.path, 11};
    req.method_string(request.method);
    req.set(http::field::host, host_header_);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.set(http::field::content_type, "application/json");
    req.keep_alive(false);
    req.body() = request.body.dump();
    req.prepare_payload();

    co_await http::async_write(stream_, req, asio::use_awaitable);
    throw_if_cancelled();

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(kMaxResponseBodyBytes);
    co_await http::async_read(stream_, buffer, parser, asio::use_awaitable);
    const auto& res = parser.get();

    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
    // not_connected is routine once the peer has closed; nothing else to do.

    core::Response out;
    out.status = static_cast<int>(res.result_int());
    out.body = nlohmann::json::parse(res.body(), nullptr, false);
    if (out.body.is_discarded()) {
        out.body = nullptr;
    }
    co_return out;
}

HttpTransport::HttpTransport(asio::io_context& io, std::string host, std::string port)
    : io_(io), host_(std::move(host)), port_(std::move(port)) {
    host_header_ = host_ + ":" + port_;
}

bool HttpTransport::resolve(std::string& error) {
    tcp::resolver resolver(io_);
    beast::error_code ec;
    endpoints_ = resolver.resolve(host_, port_, ec);
    if (ec) {
        error = "cannot resolve " + host_header_ + ": " + ec.message();
        return false;
    }
    if (endpoints_.empty()) {
        error = "no endpoints for " + host_header_;
        return false;
    }
    return true;
}

std::unique_ptr<Exchange> HttpTransport::make_exchange() {
    return std::make_unique<HttpExchange>(io_.get_executor(), endpoints_, host_header_);
}

} // namespace net

#include "api/load_test.hpp"

#include <charconv>
#include <chrono>
#include <cmath>
#include <exception>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include "core/run_stats.hpp"
#include "ingest/slowlog_file_source.hpp"
#include "net/http_transport.hpp"
#include "replay/dispatcher.hpp"
#include "replay/run_controller.hpp"
#include "sink/search_response_accumulator.hpp"
#include "util/log.hpp"

namespace api {

namespace {

bool valid_port(const std::string& port) noexcept {
    unsigned value = 0;
    const auto* end = port.data() + port.size();
    const auto res = std::from_chars(port.data(), end, value);
    return res.ec == std::errc{} && res.ptr == end && value > 0 && value <= 65535;
}

bool positive_finite(double v) noexcept {
    return std::isfinite(v) && v > 0.0;
}

} // namespace

bool parse_count(std::string_view text, std::size_t& out) noexcept {
    std::size_t value = 0;
    const auto* end = text.data() + text.size();
    const auto res = std::from_chars(text.data(), end, value);
    if (text.empty() || res.ec != std::errc{} || res.ptr != end) {
        return false;
    }
    out = value;
    return true;
}

bool validate_config(const LoadTestConfig& cfg, std::string& error) {
    if (cfg.log_file.empty()) {
        error = "--log_file is required";
        return false;
    }
    if (cfg.host.empty()) {
        error = "--host is required";
        return false;
    }
    if (!valid_port(cfg.port)) {
        error = "--port must be an integer in [1, 65535]";
        return false;
    }
    if (!positive_finite(cfg.speed_multiplier)) {
        error = "--speed_multiplier must be > 0";
        return false;
    }
    // Checked in seconds too: a huge minute count overflows to inf.
    if (!positive_finite(cfg.run_time_minutes) || !positive_finite(cfg.run_time_minutes * 60.0)) {
        error = "--run_time_minutes must be a finite number > 0";
        return false;
    }
    return true;
}

LoadTestResult run_load_test(const LoadTestConfig& cfg, nlohmann::json& report, std::string& error_msg) {
    if (!validate_config(cfg, error_msg)) {
        return LoadTestResult::ConfigError;
    }

    ingest::SlowlogFileSource source(cfg.log_file);
    if (!source.open()) {
        error_msg = source.last_error();
        return LoadTestResult::SourceError;
    }

    boost::asio::io_context io{1};
    net::HttpTransport transport(io, cfg.host, cfg.port);
    if (!transport.resolve(error_msg)) {
        return LoadTestResult::TransportError;
    }

    replay::RunConfig run_cfg = replay::default_run_config();
    run_cfg.speed_multiplier = cfg.speed_multiplier;
    run_cfg.run_budget = std::chrono::duration<double>(cfg.run_time_minutes * 60.0);
    run_cfg.max_outstanding = cfg.max_outstanding;
    run_cfg.transport_failure_policy = cfg.transport_failure_policy;

    sink::SearchResponseAccumulator accumulator;
    replay::Dispatcher dispatcher(io, transport, accumulator, run_cfg);
    replay::RunController controller(io, source, dispatcher, run_cfg);

    LOG_SLOW_INFO("replaying %s against %s:%s speed=%.3f budget=%.2fmin max_outstanding=%zu on_transport_error=%s",
                  cfg.log_file.string().c_str(),
                  cfg.host.c_str(),
                  cfg.port.c_str(),
                  cfg.speed_multiplier,
                  cfg.run_time_minutes,
                  cfg.max_outstanding,
                  replay::to_string(cfg.transport_failure_policy));

    replay::RunOutcome outcome;
    boost::asio::co_spawn(io, controller.run(), [&outcome](std::exception_ptr e, replay::RunOutcome result) {
        if (e) {
            std::rethrow_exception(e);
        }
        outcome = std::move(result);
    });
    io.run();

    report = nlohmann::json{
        {"run_information", core::to_json(outcome.stats)},
        {"accumulator_information", accumulator.summary()},
    };

    const auto& counters = dispatcher.counters();
    const auto& src_stats = source.stats();
    LOG_SLOW_INFO("replay finished: sent=%llu completed=%llu cancelled=%llu transport_failures=%llu "
                  "lines=%llu skipped=%llu cycles=%llu",
                  static_cast<unsigned long long>(counters.dispatched),
                  static_cast<unsigned long long>(counters.completed),
                  static_cast<unsigned long long>(counters.cancelled),
                  static_cast<unsigned long long>(counters.transport_failures),
                  static_cast<unsigned long long>(src_stats.lines_read),
                  static_cast<unsigned long long>(src_stats.lines_skipped),
                  static_cast<unsigned long long>(outcome.stats.cycles));

    switch (outcome.status) {
    case replay::RunStatus::Ok:
        return LoadTestResult::Success;
    case replay::RunStatus::SourceError:
        error_msg = outcome.error;
        return LoadTestResult::SourceError;
    case replay::RunStatus::TransportError:
        error_msg = outcome.error;
        return LoadTestResult::TransportError;
    }
    error_msg = "unknown run status";
    return LoadTestResult::SourceError;
}

} // namespace api

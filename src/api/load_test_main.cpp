#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "api/load_test.hpp"
#include "util/log.hpp"

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitUsage = 1;
constexpr int kExitSourceError = 3;
constexpr int kExitTransportError = 4;
constexpr int kExitFatal = 5;

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --log_file <path> --host <host> --port <port>"
              << " --speed_multiplier <x> --run_time_minutes <m> [options]\n"
              << "Replays an Elasticsearch search slowlog against a live cluster.\n"
              << "Options:\n"
              << "  --log_file <path>            Slowlog file to replay (cycled until the budget ends)\n"
              << "  --host <host>                Target host\n"
              << "  --port <port>                Target port\n"
              << "  --speed_multiplier <double>  1 is real time, 2 twice as fast, 0.5 half speed\n"
              << "  --run_time_minutes <double>  Wall-clock budget for the run\n"
              << "  --max_outstanding <N>        Cap on in-flight requests (default 0 = unbounded)\n"
              << "  --on_transport_error <mode>  record (default) or abort\n"
              << "  --quiet                      Only log errors\n"
              << "  --verbose                    Enable debug logging\n";
}

bool parse_double(const char* s, double& out) {
    char* end = nullptr;
    out = std::strtod(s, &end);
    return end && end != s && *end == '\0';
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return kExitUsage;
    }

    api::LoadTestConfig cfg;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--log_file" && i + 1 < argc) {
            cfg.log_file = argv[++i];
        } else if (arg == "--host" && i + 1 < argc) {
            cfg.host = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            cfg.port = argv[++i];
        } else if (arg == "--speed_multiplier" && i + 1 < argc) {
            if (!parse_double(argv[++i], cfg.speed_multiplier)) {
                std::cerr << "invalid --speed_multiplier " << argv[i] << "\n";
                return kExitUsage;
            }
        } else if (arg == "--run_time_minutes" && i + 1 < argc) {
            if (!parse_double(argv[++i], cfg.run_time_minutes)) {
                std::cerr << "invalid --run_time_minutes " << argv[i] << "\n";
                return kExitUsage;
            }
        } else if (arg == "--max_outstanding" && i + 1 < argc) {
            if (!api::parse_count(argv[++i], cfg.max_outstanding)) {
                std::cerr << "invalid --max_outstanding " << argv[i] << " (expected a count >= 0)\n";
                return kExitUsage;
            }
        } else if (arg == "--on_transport_error" && i + 1 < argc) {
            const auto policy = replay::transport_failure_policy_from_string(argv[++i]);
            if (!policy) {
                std::cerr << "invalid --on_transport_error " << argv[i] << " (expected record|abort)\n";
                return kExitUsage;
            }
            cfg.transport_failure_policy = *policy;
        } else if (arg == "--quiet") {
            cfg.quiet = true;
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else {
            print_usage(argv[0]);
            return kExitUsage;
        }
    }

    if (cfg.quiet) {
        util::set_log_level(util::LogLevel::Error);
    } else if (cfg.verbose) {
        util::set_log_level(util::LogLevel::Debug);
    }

    nlohmann::json report;
    std::string error;
    api::LoadTestResult result = api::LoadTestResult::Success;
    try {
        result = api::run_load_test(cfg, report, error);
    } catch (const std::exception& e) {
        LOG_SLOW_FATAL("load test failed: %s", e.what());
        return kExitFatal;
    }

    if (!report.is_null()) {
        std::cout << report.dump(4) << std::endl;
    }

    switch (result) {
    case api::LoadTestResult::Success:
        return kExitSuccess;
    case api::LoadTestResult::ConfigError:
        LOG_SLOW_ERROR("%s", error.c_str());
        print_usage(argv[0]);
        return kExitUsage;
    case api::LoadTestResult::SourceError:
        LOG_SLOW_ERROR("source error: %s", error.c_str());
        return kExitSourceError;
    case api::LoadTestResult::TransportError:
        LOG_SLOW_ERROR("transport error: %s", error.c_str());
        return kExitTransportError;
    }
    return kExitFatal;
}

#include "replay/run_config.hpp"

#include <cmath>

namespace replay {

bool validate_run_config(const RunConfig& cfg, std::string& error) {
    if (!std::isfinite(cfg.speed_multiplier) || cfg.speed_multiplier <= 0.0) {
        error = "speed_multiplier must be > 0";
        return false;
    }
    if (!std::isfinite(cfg.run_budget.count()) || cfg.run_budget.count() <= 0.0) {
        error = "run budget must be > 0";
        return false;
    }
    return true;
}

} // namespace replay

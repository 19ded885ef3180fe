#include "engine/engine_config.hpp"
#include "util/env.hpp"

#include <cmath>
#include <stdexcept>

namespace metatot {

namespace {

void checkThreshold(const std::optional<double>& t, const char* name) {
    if (t && (!std::isfinite(*t) || *t < 0.0 || *t > 1.0)) {
        throw std::invalid_argument(std::string(name) + " must lie in [0, 1]");
    }
}

} // namespace

void RunConfig::validate() const {
    search.validate();
    checkThreshold(complexity_threshold, "complexity_threshold");
    checkThreshold(uncertainty_threshold, "uncertainty_threshold");
}

RunConfig EngineConfig::defaultRun() const {
    RunConfig run;
    run.search = search;
    return run;
}

EngineConfig EngineConfig::fromEnv() {
    return fromEnv(EngineConfig{});
}

EngineConfig EngineConfig::fromEnv(EngineConfig base) {
    base.gate = GateConfig::fromEnv(base.gate);
    base.search = SearchConfig::fromEnv(base.search);
    base.generator = GeneratorConfig::fromEnv(base.generator);
    base.adaptive_thresholds = envBool("META_TOT_ADAPTIVE", base.adaptive_thresholds);
    return base;
}

} // namespace metatot

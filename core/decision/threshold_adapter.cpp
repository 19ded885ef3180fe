#include "decision/threshold_adapter.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace metatot {

namespace {

double clampThreshold(double v) {
    return std::clamp(v, ThresholdAdapter::THRESHOLD_MIN, ThresholdAdapter::THRESHOLD_MAX);
}

} // namespace

ThresholdAdapter::ThresholdAdapter(GateThresholds initial) {
    thresholds_.complexity = clampThreshold(initial.complexity);
    thresholds_.uncertainty = clampThreshold(initial.uncertainty);
}

GateThresholds ThresholdAdapter::thresholds() const {
    std::lock_guard<std::mutex> lk(mu_);
    return thresholds_;
}

double ThresholdAdapter::emaUtility() const {
    std::lock_guard<std::mutex> lk(mu_);
    return ema_;
}

int ThresholdAdapter::sampleCount() const {
    std::lock_guard<std::mutex> lk(mu_);
    return samples_;
}

double ThresholdAdapter::utility(double confidence, double duration_seconds, double budget_seconds) {
    if (!(budget_seconds > 0.0)) budget_seconds = 5.0;
    double cost = std::min(std::max(duration_seconds, 0.0) / budget_seconds, 1.0);
    double u = confidence - cost;
    if (!std::isfinite(u)) return 0.0;
    return std::clamp(u, 0.0, 1.0);
}

GateThresholds ThresholdAdapter::update(double confidence, double duration_seconds,
                                        double budget_seconds) {
    double u = utility(confidence, duration_seconds, budget_seconds);

    std::lock_guard<std::mutex> lk(mu_);
    ema_ = EMA_ALPHA * u + (1.0 - EMA_ALPHA) * ema_;
    samples_++;

    if (ema_ > UTILITY_HIGH) {
        thresholds_.complexity -= ADJUST_STEP;
        thresholds_.uncertainty -= ADJUST_STEP;
    } else if (ema_ < UTILITY_LOW) {
        thresholds_.complexity += ADJUST_STEP;
        thresholds_.uncertainty += ADJUST_STEP;
    }
    thresholds_.complexity = clampThreshold(thresholds_.complexity);
    thresholds_.uncertainty = clampThreshold(thresholds_.uncertainty);

    Logger::debug("gate", "Threshold update: utility " + std::to_string(u) +
                          ", ema " + std::to_string(ema_) +
                          ", T_c " + std::to_string(thresholds_.complexity) +
                          ", T_u " + std::to_string(thresholds_.uncertainty));
    return thresholds_;
}

nlohmann::json ThresholdAdapter::snapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    return {
        {"complexity_threshold", thresholds_.complexity},
        {"uncertainty_threshold", thresholds_.uncertainty},
        {"ema_utility", ema_},
        {"sample_count", samples_}
    };
}

void ThresholdAdapter::restore(const nlohmann::json& state) {
    if (!state.is_object()) {
        throw std::invalid_argument("Threshold state must be a JSON object");
    }
    GateThresholds t;
    double ema;
    int samples;
    try {
        t.complexity = state.at("complexity_threshold").get<double>();
        t.uncertainty = state.at("uncertainty_threshold").get<double>();
        ema = state.value("ema_utility", INITIAL_EMA);
        samples = state.value("sample_count", 0);
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Malformed threshold state: ") + e.what());
    }
    if (!std::isfinite(t.complexity) || !std::isfinite(t.uncertainty) || !std::isfinite(ema)) {
        throw std::invalid_argument("Threshold state holds a non-finite value");
    }

    std::lock_guard<std::mutex> lk(mu_);
    thresholds_.complexity = clampThreshold(t.complexity);
    thresholds_.uncertainty = clampThreshold(t.uncertainty);
    ema_ = std::clamp(ema, 0.0, 1.0);
    samples_ = std::max(0, samples);
}

} // namespace metatot

#pragma once

#include "decision/decision_gate.hpp"

#include <nlohmann/json.hpp>

#include <mutex>

namespace metatot {

// ─── ThresholdAdapter ─────────────────────────────────────────
// Moves the gate thresholds with the observed utility of deep-search
// runs. Utility = clamp(confidence - min(duration / budget, 1), 0, 1),
// smoothed by an EMA. A high EMA lowers both thresholds (search more
// often), a low one raises them. Shared across sessions.

class ThresholdAdapter {
public:
    static constexpr double EMA_ALPHA      = 0.1;
    static constexpr double INITIAL_EMA    = 0.5;
    static constexpr double UTILITY_HIGH   = 0.6;
    static constexpr double UTILITY_LOW    = 0.4;
    static constexpr double ADJUST_STEP    = 0.02;
    static constexpr double THRESHOLD_MIN  = 0.3;
    static constexpr double THRESHOLD_MAX  = 0.9;

    explicit ThresholdAdapter(GateThresholds initial = {});

    GateThresholds thresholds() const;
    double emaUtility() const;
    int sampleCount() const;

    static double utility(double confidence, double duration_seconds, double budget_seconds);

    /// Feed one completed deep-search run. A non-positive budget is
    /// treated as 5 seconds. Returns the thresholds after the update.
    GateThresholds update(double confidence, double duration_seconds, double budget_seconds);

    /// {complexity_threshold, uncertainty_threshold, ema_utility, sample_count}
    nlohmann::json snapshot() const;

    /// Replace the state with a snapshot. Thresholds are clamped and the
    /// EMA to [0, 1]. Throws std::invalid_argument when malformed.
    void restore(const nlohmann::json& state);

private:
    mutable std::mutex mu_;
    GateThresholds thresholds_;
    double ema_ = INITIAL_EMA;
    int samples_ = 0;
};

} // namespace metatot

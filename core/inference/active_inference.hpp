#pragma once

#include "inference/belief_distribution.hpp"

#include <optional>
#include <string>
#include <vector>

namespace metatot {

// ─── EFE Breakdown ─────────────────────────────────────────────
// Expected free energy of one node: an epistemic term (uncertainty)
// plus a pragmatic term (goal divergence). Both lie in [0, 1], so the
// total lies in [0, 2]. Search maximizes score = -EFE.

struct EfeBreakdown {
    double uncertainty     = 0.0;
    double goal_divergence = 0.0;

    double total() const { return uncertainty + goal_divergence; }
    double score() const { return -total(); }
};

// ─── Active-Inference State ────────────────────────────────────
// Belief snapshot attached to a node at expansion time. Never
// mutated afterwards; re-scoring attaches a new state.

struct ActiveInferenceState {
    double prediction_error = 0.0;  // precision-weighted belief shift vs parent
    double free_energy      = 0.0;  // == efe.total()
    double surprise         = 0.0;  // normalized entropy of beliefs
    double precision        = 1.0;  // > 0
    BeliefDistribution beliefs = BeliefDistribution::certain("task");
    int reasoning_level = 0;        // 0 = object level
    EfeBreakdown efe;
};

enum class DivergenceMetric {
    TotalVariation,  // L1 distance to the goal normalized to unit mass
    Cosine           // 1 - cosine similarity
};

std::string toString(DivergenceMetric metric);
std::optional<DivergenceMetric> parseDivergenceMetric(const std::string& name);

// ─── EFE Scorer ────────────────────────────────────────────────
// Pure scoring against a fixed goal vector. Shared read-only by all
// generator workers of a session.

class EfeScorer {
public:
    /// Throws std::invalid_argument for an empty goal, a negative or
    /// non-finite weight, or a goal with zero total weight.
    explicit EfeScorer(GoalVector goal,
                       DivergenceMetric metric = DivergenceMetric::TotalVariation);

    /// Normalized entropy of the beliefs, in [0, 1].
    double uncertainty(const BeliefDistribution& beliefs) const;

    /// Distance to the goal clamped to [0, 2] and halved, in [0, 1].
    double goalDivergence(const BeliefDistribution& beliefs) const;

    EfeBreakdown evaluate(const BeliefDistribution& beliefs) const;

    /// Full state for a child whose beliefs were just proposed.
    /// Precision is inherited and the reasoning level deepens by one.
    ActiveInferenceState deriveState(const BeliefDistribution& beliefs,
                                     const ActiveInferenceState& parent) const;

    /// The root is the observed task: certain beliefs, zero EFE.
    static ActiveInferenceState rootState(double precision = 1.0);

    const GoalVector& goal() const { return goal_; }
    std::vector<std::string> goalKeys() const;
    DivergenceMetric metric() const { return metric_; }

private:
    GoalVector goal_;
    GoalVector goal_mass_;  // goal_ scaled to unit L1 mass
    DivergenceMetric metric_;

    double totalVariation(const BeliefDistribution& beliefs) const;
    double cosineDistance(const BeliefDistribution& beliefs) const;
};

} // namespace metatot

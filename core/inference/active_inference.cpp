#include "inference/active_inference.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

namespace metatot {

std::string toString(DivergenceMetric metric) {
    switch (metric) {
        case DivergenceMetric::TotalVariation: return "total_variation";
        case DivergenceMetric::Cosine:         return "cosine";
    }
    return "total_variation";
}

std::optional<DivergenceMetric> parseDivergenceMetric(const std::string& name) {
    if (name == "total_variation" || name == "l1") return DivergenceMetric::TotalVariation;
    if (name == "cosine") return DivergenceMetric::Cosine;
    return std::nullopt;
}

EfeScorer::EfeScorer(GoalVector goal, DivergenceMetric metric)
    : goal_(std::move(goal)), metric_(metric) {
    if (goal_.empty()) {
        throw std::invalid_argument("Goal vector is empty");
    }
    double mass = 0.0;
    for (const auto& [key, w] : goal_) {
        if (!std::isfinite(w) || w < 0.0) {
            throw std::invalid_argument("Goal weight for '" + key + "' must be finite and non-negative");
        }
        mass += w;
    }
    if (mass <= 0.0) {
        throw std::invalid_argument("Goal vector has zero total weight");
    }
    for (const auto& [key, w] : goal_) {
        goal_mass_[key] = w / mass;
    }
}

std::vector<std::string> EfeScorer::goalKeys() const {
    std::vector<std::string> keys;
    keys.reserve(goal_.size());
    for (const auto& [k, _] : goal_) keys.push_back(k);
    return keys;
}

double EfeScorer::uncertainty(const BeliefDistribution& beliefs) const {
    return beliefs.normalizedEntropy();
}

double EfeScorer::goalDivergence(const BeliefDistribution& beliefs) const {
    double distance = (metric_ == DivergenceMetric::Cosine)
        ? cosineDistance(beliefs)
        : totalVariation(beliefs);
    distance = std::min(2.0, std::max(0.0, distance));
    return distance / 2.0;
}

EfeBreakdown EfeScorer::evaluate(const BeliefDistribution& beliefs) const {
    EfeBreakdown efe;
    efe.uncertainty = uncertainty(beliefs);
    efe.goal_divergence = goalDivergence(beliefs);
    return efe;
}

ActiveInferenceState EfeScorer::deriveState(const BeliefDistribution& beliefs,
                                            const ActiveInferenceState& parent) const {
    ActiveInferenceState state;
    state.beliefs = beliefs;
    state.efe = evaluate(beliefs);
    state.precision = parent.precision;
    state.reasoning_level = parent.reasoning_level + 1;
    state.surprise = state.efe.uncertainty;
    state.free_energy = state.efe.total();
    state.prediction_error = state.precision * beliefs.l1Distance(parent.beliefs);
    return state;
}

ActiveInferenceState EfeScorer::rootState(double precision) {
    if (!(precision > 0.0) || !std::isfinite(precision)) {
        throw std::invalid_argument("Precision must be positive");
    }
    ActiveInferenceState state;
    state.precision = precision;
    return state;
}

double EfeScorer::totalVariation(const BeliefDistribution& beliefs) const {
    std::set<std::string> keys;
    for (const auto& [k, _] : beliefs.probabilities()) keys.insert(k);
    for (const auto& [k, _] : goal_mass_) keys.insert(k);

    double d = 0.0;
    for (const auto& k : keys) {
        auto it = goal_mass_.find(k);
        double q = it != goal_mass_.end() ? it->second : 0.0;
        d += std::abs(beliefs.probability(k) - q);
    }
    return d;
}

double EfeScorer::cosineDistance(const BeliefDistribution& beliefs) const {
    double dot = 0.0, norm_b = 0.0, norm_g = 0.0;
    for (const auto& [k, p] : beliefs.probabilities()) {
        norm_b += p * p;
        auto it = goal_.find(k);
        if (it != goal_.end()) dot += p * it->second;
    }
    for (const auto& [_, w] : goal_) norm_g += w * w;

    if (norm_b == 0.0 || norm_g == 0.0) return 1.0;
    return 1.0 - dot / (std::sqrt(norm_b) * std::sqrt(norm_g));
}

} // namespace metatot

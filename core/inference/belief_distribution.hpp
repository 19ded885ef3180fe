#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace metatot {

/// Goal representation supplied by the caller: named hypothesis → weight.
using GoalVector = std::map<std::string, double>;

// ─── Belief Distribution ───────────────────────────────────────
// Probability mass over named hypotheses about the task outcome.
// Validated at construction: non-empty, non-negative, finite,
// sums to 1 within kTolerance. Keys are ordered so every traversal
// (entropy, distance, serialization) is deterministic.

class BeliefDistribution {
public:
    static constexpr double kTolerance = 1e-6;

    /// Takes probabilities that already form a distribution.
    /// Throws std::invalid_argument if the invariant does not hold.
    explicit BeliefDistribution(std::map<std::string, double> probabilities);

    /// Normalizes raw confidence scores into a distribution.
    /// Non-finite and negative scores are dropped; if every remaining
    /// score is zero the mass is spread uniformly over their keys.
    /// Throws std::invalid_argument if no key survives.
    static BeliefDistribution fromScores(const std::map<std::string, double>& scores);

    /// Uniform mass over the given keys. Throws on an empty key list.
    static BeliefDistribution uniform(const std::vector<std::string>& keys);

    /// All mass on a single hypothesis.
    static BeliefDistribution certain(const std::string& key);

    const std::map<std::string, double>& probabilities() const { return probs_; }
    double probability(const std::string& key) const;
    size_t size() const { return probs_.size(); }

    /// Shannon entropy in nats.
    double entropy() const;

    /// Entropy divided by log(size()); 0 for a single hypothesis.
    double normalizedEntropy() const;

    /// Sum of |p_k - q_k| over the union of keys, in [0, 2].
    double l1Distance(const BeliefDistribution& other) const;

private:
    std::map<std::string, double> probs_;
};

} // namespace metatot

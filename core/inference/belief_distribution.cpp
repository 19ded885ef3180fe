#include "inference/belief_distribution.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

namespace metatot {

BeliefDistribution::BeliefDistribution(std::map<std::string, double> probabilities)
    : probs_(std::move(probabilities)) {
    if (probs_.empty()) {
        throw std::invalid_argument("Belief distribution needs at least one hypothesis");
    }
    double sum = 0.0;
    for (const auto& [key, p] : probs_) {
        if (!std::isfinite(p) || p < 0.0) {
            throw std::invalid_argument("Invalid probability for hypothesis '" + key + "'");
        }
        sum += p;
    }
    if (std::abs(sum - 1.0) > kTolerance) {
        throw std::invalid_argument("Belief probabilities sum to " + std::to_string(sum) +
                                    ", expected 1.0");
    }
}

BeliefDistribution BeliefDistribution::fromScores(const std::map<std::string, double>& scores) {
    std::map<std::string, double> kept;
    double total = 0.0;
    for (const auto& [key, score] : scores) {
        if (!std::isfinite(score) || score < 0.0) continue;
        kept.emplace(key, score);
        total += score;
    }
    if (kept.empty()) {
        throw std::invalid_argument("No usable hypothesis scores");
    }

    if (total <= 0.0) {
        double p = 1.0 / static_cast<double>(kept.size());
        for (auto& [_, value] : kept) value = p;
    } else {
        for (auto& [_, value] : kept) value /= total;
    }
    return BeliefDistribution(std::move(kept));
}

BeliefDistribution BeliefDistribution::uniform(const std::vector<std::string>& keys) {
    std::map<std::string, double> probs;
    for (const auto& k : keys) probs[k] = 0.0;
    if (probs.empty()) {
        throw std::invalid_argument("Uniform distribution needs at least one key");
    }
    double p = 1.0 / static_cast<double>(probs.size());
    for (auto& [_, value] : probs) value = p;
    return BeliefDistribution(std::move(probs));
}

BeliefDistribution BeliefDistribution::certain(const std::string& key) {
    return BeliefDistribution(std::map<std::string, double>{{key, 1.0}});
}

double BeliefDistribution::probability(const std::string& key) const {
    auto it = probs_.find(key);
    return it != probs_.end() ? it->second : 0.0;
}

double BeliefDistribution::entropy() const {
    double h = 0.0;
    for (const auto& [_, p] : probs_) {
        if (p > 0.0) h -= p * std::log(p);
    }
    return h;
}

double BeliefDistribution::normalizedEntropy() const {
    if (probs_.size() <= 1) return 0.0;
    double h = entropy() / std::log(static_cast<double>(probs_.size()));
    return std::min(1.0, std::max(0.0, h));
}

double BeliefDistribution::l1Distance(const BeliefDistribution& other) const {
    std::set<std::string> keys;
    for (const auto& [k, _] : probs_) keys.insert(k);
    for (const auto& [k, _] : other.probs_) keys.insert(k);

    double d = 0.0;
    for (const auto& k : keys) {
        d += std::abs(probability(k) - other.probability(k));
    }
    return d;
}

} // namespace metatot

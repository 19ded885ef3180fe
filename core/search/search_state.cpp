#include "search/search_state.hpp"
#include "util/env.hpp"
#include "util/logger.hpp"

#include <cmath>
#include <stdexcept>

namespace metatot {

std::string toString(SearchPhase phase) {
    switch (phase) {
        case SearchPhase::Idle:       return "idle";
        case SearchPhase::Expanding:  return "expanding";
        case SearchPhase::Selecting:  return "selecting";
        case SearchPhase::BackingUp:  return "backing_up";
        case SearchPhase::Finalizing: return "finalizing";
        case SearchPhase::Done:       return "done";
    }
    return "idle";
}

std::string toString(BudgetManager::Stop stop) {
    switch (stop) {
        case BudgetManager::Stop::None:       return "none";
        case BudgetManager::Stop::Iterations: return "iterations";
        case BudgetManager::Stop::Deadline:   return "deadline";
        case BudgetManager::Stop::Cancelled:  return "cancelled";
    }
    return "none";
}

void SearchConfig::validate() const {
    if (max_iterations < 1) {
        throw std::invalid_argument("max_iterations must be at least 1");
    }
    if (max_depth < 1) {
        throw std::invalid_argument("max_depth must be at least 1");
    }
    if (integrate_depth < 0) {
        throw std::invalid_argument("integrate_depth must not be negative");
    }
    if (parallel_expansions < 1) {
        throw std::invalid_argument("parallel_expansions must be at least 1");
    }
    if (!std::isfinite(exploration_constant) || exploration_constant < 0.0) {
        throw std::invalid_argument("exploration_constant must be finite and non-negative");
    }
    if (!std::isfinite(unexplored_malus) || unexplored_malus < 0.0) {
        throw std::invalid_argument("unexplored_malus must be finite and non-negative");
    }
    if (!std::isfinite(root_precision) || root_precision <= 0.0) {
        throw std::invalid_argument("root_precision must be positive");
    }
}

SearchConfig SearchConfig::fromEnv() {
    return fromEnv(SearchConfig{});
}

SearchConfig SearchConfig::fromEnv(SearchConfig base) {
    base.max_iterations = envInt("META_TOT_MAX_ITERATIONS", base.max_iterations);
    base.max_depth = envInt("META_TOT_MAX_DEPTH", base.max_depth);
    base.deadline_ms = envInt("META_TOT_DEADLINE_MS", base.deadline_ms);
    base.exploration_constant = envDouble("META_TOT_EXPLORATION", base.exploration_constant);

    std::string metric = envString("META_TOT_DIVERGENCE", "");
    if (!metric.empty()) {
        if (auto parsed = parseDivergenceMetric(metric)) {
            base.divergence_metric = *parsed;
        } else {
            Logger::warn("config", "Unknown META_TOT_DIVERGENCE=" + metric);
        }
    }
    return base;
}

} // namespace metatot

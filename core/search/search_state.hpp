#pragma once

#include "inference/active_inference.hpp"
#include "search/budget_manager.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace metatot {

/// Search configuration parameters.
struct SearchConfig {
    int max_iterations = 32;            // select/expand/backup cycles
    int max_depth = 4;                  // nodes at this depth are terminal
    int deadline_ms = 5000;             // wall clock for the whole session; <= 0 disables
    double exploration_constant = 2.0;  // c in the UCB term
    int integrate_depth = 0;            // depth whose nodes come from integrate; 0 = max_depth
    int parallel_expansions = 3;        // sibling expansions issued per iteration
    double unexplored_malus = 0.5;      // score penalty for a failed expansion
    double root_precision = 1.0;
    DivergenceMetric divergence_metric = DivergenceMetric::TotalVariation;

    int effectiveIntegrateDepth() const {
        return integrate_depth > 0 ? std::min(integrate_depth, max_depth) : max_depth;
    }

    /// Throws std::invalid_argument for out-of-range values.
    void validate() const;

    /// Overlay META_TOT_MAX_ITERATIONS, META_TOT_MAX_DEPTH, META_TOT_DEADLINE_MS,
    /// META_TOT_EXPLORATION, META_TOT_DIVERGENCE.
    static SearchConfig fromEnv();
    static SearchConfig fromEnv(SearchConfig base);
};

/// Engine state machine.
enum class SearchPhase {
    Idle,
    Expanding,
    Selecting,
    BackingUp,
    Finalizing,
    Done
};

std::string toString(SearchPhase phase);
std::string toString(BudgetManager::Stop stop);

struct SearchStats {
    int iterations = 0;
    int expansions = 0;
    int failed_expansions = 0;
    int branch_count = 0;
    double total_prediction_error = 0.0;
    double total_free_energy = 0.0;
    double elapsed_seconds = 0.0;
    BudgetManager::Stop stop_reason = BudgetManager::Stop::None;
    bool tree_exhausted = false;  // every branch reached a terminal node
};

/// Result of a search run.
struct SearchOutcome {
    bool viable = false;            // root gained at least one child
    std::vector<uint64_t> best_path;
    double path_efe = 0.0;
    SearchStats stats;
};

} // namespace metatot

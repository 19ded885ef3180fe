#pragma once

#include "inference/active_inference.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace metatot {

/// Role an expansion step plays. Leaf marks a node whose expansion
/// failed and which is kept as a terminal dead end.
enum class DomainPhase {
    Explore,
    Challenge,
    Evolve,
    Integrate,
    Leaf
};

std::string toString(DomainPhase phase);
std::optional<DomainPhase> parseDomainPhase(const std::string& name);

// ─── Thought Node ──────────────────────────────────────────────
// One branch in the session tree. Structure (id, parent, depth,
// phase, thought, state) is fixed at creation; the visit statistics
// are updated by backup.

struct ThoughtNode {
    uint64_t id = 0;
    std::optional<uint64_t> parent_id;  // empty for the root
    std::string session_id;
    int depth = 0;
    DomainPhase phase = DomainPhase::Explore;
    std::string thought;
    ActiveInferenceState state;

    double score = 0.0;           // -EFE, minus the malus for failed expansions
    int visit_count = 0;
    double value_estimate = 0.0;  // running mean of backed-up values; prior = score
    bool is_selected = false;

    std::vector<uint64_t> children;
    bool expanded = false;   // an expansion was attempted
    bool terminal = false;   // may not be expanded
    bool exhausted = false;  // terminal, or every child exhausted

    /// UCB1: value_estimate + c * sqrt(ln(N) / n). Unvisited = +inf.
    double ucb(double exploration_constant, int parent_visits) const {
        if (visit_count == 0) return std::numeric_limits<double>::infinity();
        double exploration = exploration_constant *
            std::sqrt(std::log(static_cast<double>(std::max(parent_visits, 1))) / visit_count);
        return value_estimate + exploration;
    }

    void recordVisit(double value) {
        visit_count++;
        value_estimate += (value - value_estimate) / visit_count;
    }

    double efe() const { return state.efe.total(); }
    bool isRoot() const { return !parent_id.has_value(); }
};

} // namespace metatot

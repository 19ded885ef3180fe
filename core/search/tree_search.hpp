#pragma once

#include "search/search_state.hpp"
#include "search/budget_manager.hpp"
#include "generation/candidate_generator.hpp"
#include "tree/thought_tree.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace metatot {

using PhaseObserver = std::function<void(SearchPhase)>;

// ─── Tree Search ───────────────────────────────────────────────
// Monte Carlo style planning over thought trees with:
// - UCB selection over non-exhausted children
// - phase-typed expansion through the candidate generator,
//   with unexpanded siblings expanded concurrently
// - EFE evaluation of every new child
// - single-threaded backup of the best child's score
// One instance drives one session at a time; the tree it is given
// belongs to that session alone.

class TreeSearch {
public:
    TreeSearch(const CandidateGenerator& generator, SearchConfig config);

    /// Called on every state-machine transition.
    void setPhaseObserver(PhaseObserver fn) { observer_ = std::move(fn); }

    /// Run search on an empty tree. The root is created from the task.
    SearchOutcome search(ThoughtTree& tree,
                         const std::string& task,
                         const EfeScorer& scorer,
                         const nlohmann::json& context,
                         const CancellationToken& token = CancellationToken());

    SearchPhase phase() const { return phase_; }

    /// Phase used to expand a node at the given depth: explore,
    /// challenge and evolve cycle until the children would reach
    /// integrate_depth, which is expanded with integrate.
    static DomainPhase phaseForDepth(int depth, int integrate_depth);

private:
    const CandidateGenerator& generator_;
    SearchConfig config_;
    PhaseObserver observer_;
    SearchPhase phase_ = SearchPhase::Idle;

    void enter(SearchPhase phase);

    /// Selection: walk down via UCB until an unexpanded node.
    uint64_t descend(const ThoughtTree& tree) const;

    /// The selected node plus unexpanded siblings, up to parallel_expansions.
    std::vector<uint64_t> expansionBatch(const ThoughtTree& tree, uint64_t selected) const;

    ExpansionJob makeJob(const ThoughtTree& tree, uint64_t node_id,
                         const std::string& task, const EfeScorer& scorer) const;

    /// Insert children (or mark a dead end) and back up the result.
    void commit(ThoughtTree& tree, const ExpansionResult& result, SearchStats& stats);
};

} // namespace metatot

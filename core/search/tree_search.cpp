#include "search/tree_search.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace metatot {

TreeSearch::TreeSearch(const CandidateGenerator& generator, SearchConfig config)
    : generator_(generator), config_(config) {
    config_.validate();
}

void TreeSearch::enter(SearchPhase phase) {
    phase_ = phase;
    if (observer_) observer_(phase);
}

DomainPhase TreeSearch::phaseForDepth(int depth, int integrate_depth) {
    if (depth + 1 >= integrate_depth) return DomainPhase::Integrate;
    switch (depth % 3) {
        case 0:  return DomainPhase::Explore;
        case 1:  return DomainPhase::Challenge;
        default: return DomainPhase::Evolve;
    }
}

uint64_t TreeSearch::descend(const ThoughtTree& tree) const {
    uint64_t current = tree.rootId();

    while (true) {
        const ThoughtNode& node = tree.at(current);
        if (!node.expanded || node.terminal || node.children.empty()) return current;

        // Pick the non-exhausted child with the highest UCB; ids ascend,
        // so strict comparison keeps the lowest id on ties.
        double best_ucb = -std::numeric_limits<double>::infinity();
        bool found = false;
        uint64_t best_child = node.children.front();

        for (uint64_t child_id : node.children) {
            const ThoughtNode& child = tree.at(child_id);
            if (child.exhausted) continue;
            double ucb = child.ucb(config_.exploration_constant, node.visit_count);
            if (!found || ucb > best_ucb) {
                best_ucb = ucb;
                best_child = child_id;
                found = true;
            }
        }
        if (!found) return current;
        current = best_child;
    }
}

std::vector<uint64_t> TreeSearch::expansionBatch(const ThoughtTree& tree, uint64_t selected) const {
    std::vector<uint64_t> batch{selected};
    for (uint64_t sib : tree.siblings(selected)) {
        if (static_cast<int>(batch.size()) >= config_.parallel_expansions) break;
        const ThoughtNode& node = tree.at(sib);
        if (!node.expanded && !node.terminal) batch.push_back(sib);
    }
    return batch;
}

ExpansionJob TreeSearch::makeJob(const ThoughtTree& tree, uint64_t node_id,
                                 const std::string& task, const EfeScorer& scorer) const {
    const ThoughtNode& node = tree.at(node_id);

    ExpansionJob job;
    job.request.node_id = node_id;
    job.request.depth = node.depth;
    job.request.phase = phaseForDepth(node.depth, config_.effectiveIntegrateDepth());
    job.request.task = task;
    job.request.thought = node.thought;
    job.request.hypotheses = scorer.goalKeys();

    for (uint64_t id : tree.pathTo(node_id)) {
        if (id != node_id) job.request.path.push_back(tree.at(id).thought);
    }
    for (uint64_t sib : tree.siblings(node_id)) {
        const ThoughtNode& s = tree.at(sib);
        if (s.phase != DomainPhase::Leaf) job.request.siblings.push_back(s.thought);
    }

    job.parent_state = node.state;
    return job;
}

void TreeSearch::commit(ThoughtTree& tree, const ExpansionResult& result, SearchStats& stats) {
    stats.expansions++;

    if (result.empty()) {
        stats.failed_expansions++;
        tree.markDeadEnd(result.node_id, config_.unexplored_malus);
        enter(SearchPhase::BackingUp);
        tree.backup(result.node_id, tree.at(result.node_id).score);
        return;
    }

    uint64_t best_child = 0;
    double best_score = -std::numeric_limits<double>::infinity();

    for (const auto& proposal : result.children) {
        uint64_t child_id = tree.addChild(result.node_id, result.phase,
                                          proposal.content, proposal.state);
        const ThoughtNode& child = tree.at(child_id);

        stats.branch_count++;
        stats.total_prediction_error += child.state.prediction_error;
        stats.total_free_energy += child.state.free_energy;

        if (child.score > best_score) {
            best_score = child.score;
            best_child = child_id;
        }
        if (result.phase == DomainPhase::Integrate || child.depth >= config_.max_depth) {
            tree.markTerminal(child_id);
        }
    }
    tree.refreshExhaustion(result.node_id);

    enter(SearchPhase::BackingUp);
    tree.backup(best_child, best_score);
}

SearchOutcome TreeSearch::search(ThoughtTree& tree,
                                 const std::string& task,
                                 const EfeScorer& scorer,
                                 const nlohmann::json& context,
                                 const CancellationToken& token) {
    if (!tree.empty()) {
        throw std::logic_error("TreeSearch::search expects an empty tree");
    }

    enter(SearchPhase::Idle);
    tree.createRoot(task, EfeScorer::rootState(config_.root_precision));

    BudgetManager budget(config_.max_iterations, config_.deadline_ms, token);
    budget.start();

    SearchOutcome outcome;
    SearchStats& stats = outcome.stats;

    while (budget.canContinue()) {
        if (tree.at(tree.rootId()).exhausted) {
            stats.tree_exhausted = true;
            break;
        }

        uint64_t selected = tree.rootId();
        if (tree.at(selected).expanded) {
            enter(SearchPhase::Selecting);
            selected = descend(tree);
        }

        std::vector<uint64_t> batch = expansionBatch(tree, selected);
        std::vector<ExpansionJob> jobs;
        jobs.reserve(batch.size());
        for (uint64_t id : batch) jobs.push_back(makeJob(tree, id, task, scorer));

        enter(SearchPhase::Expanding);
        std::vector<ExpansionResult> results = generator_.expandBatch(jobs, scorer, context);

        // Commit in completion order; the tree is only touched here.
        for (const auto& result : results) commit(tree, result, stats);

        budget.recordIteration();
        Logger::debug("search", "Iteration " + std::to_string(budget.iterations()) +
                                ": expanded " + std::to_string(batch.size()) +
                                " node(s), tree size " + std::to_string(tree.size()));
    }

    enter(SearchPhase::Finalizing);
    stats.iterations = budget.iterations();
    stats.elapsed_seconds = budget.elapsedSeconds();
    stats.stop_reason = stats.tree_exhausted ? BudgetManager::Stop::None : budget.stopReason();

    outcome.viable = !tree.at(tree.rootId()).children.empty();
    if (outcome.viable) {
        outcome.best_path = tree.bestPath();
        outcome.path_efe = tree.pathEfe(outcome.best_path);
        tree.markSelected(outcome.best_path);
    }
    tree.validate();

    Logger::info("search", "Search finished: " + std::to_string(stats.iterations) + " iterations, " +
                           std::to_string(tree.size()) + " nodes, stop=" +
                           (stats.tree_exhausted ? std::string("exhausted") : toString(stats.stop_reason)) +
                           (outcome.viable ? "" : ", no viable branches"));

    enter(SearchPhase::Done);
    return outcome;
}

} // namespace metatot

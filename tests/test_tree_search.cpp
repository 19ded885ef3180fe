#include <gtest/gtest.h>
#include "search/tree_search.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

using namespace metatot;

namespace {

GenerationResponse answer(int n, std::map<std::string, double> beliefs = {{"a", 1.0}}) {
    GenerationResponse r;
    for (int i = 0; i < n; i++) {
        r.proposals.push_back({"step " + std::to_string(i), beliefs});
    }
    return r;
}

class TreeSearchTest : public ::testing::Test {
protected:
    EfeScorer scorer{{{"a", 1.0}, {"b", 0.0}}};
    std::shared_ptr<WorkerPool> pool = std::make_shared<WorkerPool>(4);
    nlohmann::json ctx = nlohmann::json::object();

    CandidateGenerator generator(GenerateFn fn, GeneratorConfig config = {}) {
        return CandidateGenerator(std::make_shared<CallbackInferenceClient>(std::move(fn)),
                                  pool, config);
    }
};

} // namespace

TEST(TreeSearchPhaseTest, PhaseCyclesUntilIntegrate) {
    EXPECT_EQ(TreeSearch::phaseForDepth(0, 4), DomainPhase::Explore);
    EXPECT_EQ(TreeSearch::phaseForDepth(1, 4), DomainPhase::Challenge);
    EXPECT_EQ(TreeSearch::phaseForDepth(2, 4), DomainPhase::Evolve);
    EXPECT_EQ(TreeSearch::phaseForDepth(3, 4), DomainPhase::Integrate);
    EXPECT_EQ(TreeSearch::phaseForDepth(3, 7), DomainPhase::Explore);
    EXPECT_EQ(TreeSearch::phaseForDepth(0, 1), DomainPhase::Integrate);
}

TEST(SearchConfigTest, ValidateRejectsBadValues) {
    SearchConfig c;
    EXPECT_NO_THROW(c.validate());
    c.max_depth = 0;
    EXPECT_THROW(c.validate(), std::invalid_argument);

    c = SearchConfig{};
    c.max_iterations = 0;
    EXPECT_THROW(c.validate(), std::invalid_argument);

    c = SearchConfig{};
    c.exploration_constant = -1.0;
    EXPECT_THROW(c.validate(), std::invalid_argument);

    c = SearchConfig{};
    c.integrate_depth = 9;
    EXPECT_EQ(c.effectiveIntegrateDepth(), c.max_depth);
}

TEST(BudgetManagerTest, StopsOnIterationsAndCancellation) {
    CancellationToken token;
    BudgetManager budget(2, 0, token);
    budget.start();
    EXPECT_TRUE(budget.canContinue());
    budget.recordIteration();
    budget.recordIteration();
    EXPECT_EQ(budget.stopReason(), BudgetManager::Stop::Iterations);

    BudgetManager other(10, 0, token);
    other.start();
    token.cancel();
    EXPECT_EQ(other.stopReason(), BudgetManager::Stop::Cancelled);
}

TEST(BudgetManagerTest, DeadlineExpires) {
    BudgetManager budget(100, 10);
    budget.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_TRUE(budget.isTimeExhausted());
    EXPECT_EQ(budget.stopReason(), BudgetManager::Stop::Deadline);
}

TEST_F(TreeSearchTest, ExhaustsSmallTree) {
    auto gen = generator([](const std::string&, const nlohmann::json&) { return answer(2); });
    SearchConfig config;
    config.max_depth = 2;
    config.max_iterations = 50;

    ThoughtTree tree("s");
    TreeSearch search(gen, config);
    SearchOutcome out = search.search(tree, "task", scorer, ctx);

    // root → 2 explore children → 1 integrate child each
    EXPECT_EQ(tree.size(), 5u);
    EXPECT_TRUE(out.stats.tree_exhausted);
    EXPECT_EQ(out.stats.iterations, 2);
    EXPECT_EQ(out.stats.expansions, 3);
    EXPECT_EQ(out.stats.branch_count, 4);
    EXPECT_TRUE(out.viable);
    EXPECT_TRUE(tree.at(0).exhausted);
    EXPECT_EQ(search.phase(), SearchPhase::Done);

    tree.forEachNode([](const ThoughtNode& n) {
        if (n.depth == 2) {
            EXPECT_TRUE(n.terminal);
            EXPECT_EQ(n.phase, DomainPhase::Integrate);
        }
    });
}

TEST_F(TreeSearchTest, BestPathIsSelectedChain) {
    auto gen = generator([](const std::string&, const nlohmann::json& context) {
        // the second explore branch matches the goal, the first is split
        if (context["phase"] == "explore") {
            GenerationResponse r;
            r.proposals.push_back({"split", {{"a", 0.5}, {"b", 0.5}}});
            r.proposals.push_back({"aligned", {{"a", 1.0}}});
            return r;
        }
        // integrate keeps the beliefs of the branch it closes
        if (context["thought"] == "split") return answer(1, {{"a", 0.5}, {"b", 0.5}});
        return answer(1);
    });
    SearchConfig config;
    config.max_depth = 2;

    ThoughtTree tree;
    TreeSearch search(gen, config);
    SearchOutcome out = search.search(tree, "task", scorer, ctx);

    ASSERT_TRUE(out.viable);
    ASSERT_TRUE(tree.isRootToLeafChain(out.best_path));
    EXPECT_EQ(tree.at(out.best_path[1]).thought, "aligned");

    double sum = 0.0;
    for (uint64_t id : out.best_path) sum += tree.at(id).efe();
    EXPECT_NEAR(out.path_efe, sum, 1e-12);

    tree.forEachNode([&](const ThoughtNode& n) {
        bool on_path = std::find(out.best_path.begin(), out.best_path.end(), n.id) != out.best_path.end();
        EXPECT_EQ(n.is_selected, on_path);
    });
    EXPECT_NO_THROW(tree.validate());
}

TEST_F(TreeSearchTest, SiblingsExpandInTheSameIteration) {
    auto gen = generator([](const std::string&, const nlohmann::json&) { return answer(3); });
    SearchConfig config;
    config.max_iterations = 2;
    config.parallel_expansions = 3;

    ThoughtTree tree;
    TreeSearch search(gen, config);
    SearchOutcome out = search.search(tree, "task", scorer, ctx);

    // iteration 1 expands the root, iteration 2 the three children together
    EXPECT_EQ(out.stats.iterations, 2);
    EXPECT_EQ(out.stats.expansions, 4);
    EXPECT_EQ(out.stats.stop_reason, BudgetManager::Stop::Iterations);
    for (uint64_t child : tree.at(0).children) {
        EXPECT_TRUE(tree.at(child).expanded);
        EXPECT_GE(tree.at(child).visit_count, 1);
    }
}

TEST_F(TreeSearchTest, AlwaysFailingGeneratorEndsGracefully) {
    auto gen = generator([](const std::string&, const nlohmann::json&) -> GenerationResponse {
        throw InferenceError("unavailable");
    });

    ThoughtTree tree;
    TreeSearch search(gen, SearchConfig{});
    SearchOutcome out = search.search(tree, "task", scorer, ctx);

    EXPECT_FALSE(out.viable);
    EXPECT_TRUE(out.best_path.empty());
    EXPECT_EQ(tree.size(), 1u);
    EXPECT_EQ(out.stats.failed_expansions, 1);
    EXPECT_EQ(out.stats.iterations, 1);
    EXPECT_TRUE(out.stats.tree_exhausted);
    EXPECT_EQ(tree.at(0).phase, DomainPhase::Leaf);
}

TEST_F(TreeSearchTest, FailedChildrenBecomeDeadEnds) {
    auto gen = generator([](const std::string&, const nlohmann::json& context) -> GenerationResponse {
        if (context["depth"] == 0) return answer(2);
        throw InferenceError("flaky");
    });
    SearchConfig config;
    config.max_depth = 3;
    config.unexplored_malus = 0.5;

    ThoughtTree tree;
    TreeSearch search(gen, config);
    SearchOutcome out = search.search(tree, "task", scorer, ctx);

    EXPECT_EQ(out.stats.failed_expansions, 2);
    EXPECT_TRUE(out.stats.tree_exhausted);
    ASSERT_TRUE(out.viable);
    ASSERT_EQ(out.best_path.size(), 2u);

    const ThoughtNode& leaf = tree.at(out.best_path.back());
    EXPECT_EQ(leaf.phase, DomainPhase::Leaf);
    EXPECT_NEAR(leaf.score, -leaf.efe() - 0.5, 1e-12);
    EXPECT_NEAR(out.path_efe, leaf.efe(), 1e-12);
}

TEST_F(TreeSearchTest, CancelledBeforeStart) {
    auto gen = generator([](const std::string&, const nlohmann::json&) { return answer(2); });
    CancellationToken token;
    token.cancel();

    ThoughtTree tree;
    TreeSearch search(gen, SearchConfig{});
    SearchOutcome out = search.search(tree, "task", scorer, ctx, token);

    EXPECT_EQ(out.stats.iterations, 0);
    EXPECT_EQ(out.stats.stop_reason, BudgetManager::Stop::Cancelled);
    EXPECT_FALSE(out.viable);
    EXPECT_EQ(tree.size(), 1u);
}

TEST_F(TreeSearchTest, DeadlineLetsInFlightExpansionFinish) {
    auto gen = generator([](const std::string&, const nlohmann::json&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        return answer(2);
    });
    SearchConfig config;
    config.deadline_ms = 50;
    config.parallel_expansions = 1;

    ThoughtTree tree;
    TreeSearch search(gen, config);
    SearchOutcome out = search.search(tree, "task", scorer, ctx);

    EXPECT_EQ(out.stats.iterations, 1);
    EXPECT_EQ(out.stats.stop_reason, BudgetManager::Stop::Deadline);
    EXPECT_TRUE(out.viable);
    EXPECT_LT(out.stats.elapsed_seconds, 0.05 + 0.2 + 0.2);
}

TEST_F(TreeSearchTest, StateMachineTransitions) {
    auto gen = generator([](const std::string&, const nlohmann::json&) { return answer(2); });
    SearchConfig config;
    config.max_iterations = 2;

    std::vector<SearchPhase> seen;
    ThoughtTree tree;
    TreeSearch search(gen, config);
    search.setPhaseObserver([&seen](SearchPhase p) { seen.push_back(p); });
    search.search(tree, "task", scorer, ctx);

    ASSERT_GE(seen.size(), 6u);
    EXPECT_EQ(seen.front(), SearchPhase::Idle);
    EXPECT_EQ(seen[1], SearchPhase::Expanding);
    EXPECT_EQ(seen[2], SearchPhase::BackingUp);
    EXPECT_EQ(seen[3], SearchPhase::Selecting);
    EXPECT_EQ(seen[seen.size() - 2], SearchPhase::Finalizing);
    EXPECT_EQ(seen.back(), SearchPhase::Done);
}

TEST_F(TreeSearchTest, RejectsNonEmptyTree) {
    auto gen = generator([](const std::string&, const nlohmann::json&) { return answer(1); });
    ThoughtTree tree;
    tree.createRoot("old", EfeScorer::rootState());
    TreeSearch search(gen, SearchConfig{});
    EXPECT_THROW(search.search(tree, "task", scorer, ctx), std::logic_error);
}

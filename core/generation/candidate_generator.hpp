#pragma once

#include "generation/inference_client.hpp"
#include "generation/prompt_builder.hpp"
#include "generation/worker_pool.hpp"
#include "inference/active_inference.hpp"

#include <memory>
#include <string>
#include <vector>

namespace metatot {

struct GeneratorConfig {
    int branching_factor = 3;   // upper bound on children per expansion
    int call_timeout_ms = 5000; // per inference call, independent of the session deadline
    size_t worker_count = 4;    // concurrent inference calls

    /// Overlay META_TOT_BRANCHES, META_TOT_CALL_TIMEOUT_MS, META_TOT_WORKERS.
    static GeneratorConfig fromEnv();
    static GeneratorConfig fromEnv(GeneratorConfig base);
};

/// A proposal that has been scored and is ready to become a node.
struct ScoredProposal {
    std::string content;
    ActiveInferenceState state;
};

struct ExpansionResult {
    uint64_t node_id = 0;
    DomainPhase phase = DomainPhase::Explore;
    std::vector<ScoredProposal> children;
    std::string failure;  // empty on success; set for errors, timeouts, empty answers
    double latency_seconds = 0.0;

    bool empty() const { return children.empty(); }
};

/// One node to expand together with the state its children inherit from.
struct ExpansionJob {
    ExpansionRequest request;
    ActiveInferenceState parent_state;
};

// ─── Candidate Generator ───────────────────────────────────────
// Turns expansion requests into scored child proposals. Calls to the
// inference client run on the shared worker pool; every failure mode
// (exception, timeout, unusable answer) yields an empty result.

class CandidateGenerator {
public:
    CandidateGenerator(std::shared_ptr<InferenceClient> client,
                       std::shared_ptr<WorkerPool> pool,
                       GeneratorConfig config = {});

    ExpansionResult expand(const ExpansionJob& job,
                           const EfeScorer& scorer,
                           const nlohmann::json& context) const;

    /// Expand several nodes concurrently. Results are returned in the
    /// order the calls completed; timed-out calls come last.
    std::vector<ExpansionResult> expandBatch(const std::vector<ExpansionJob>& jobs,
                                             const EfeScorer& scorer,
                                             const nlohmann::json& context) const;

    /// Proposals kept per phase: explore keeps the branching factor
    /// clamped to [2, 4], challenge keeps the branching factor,
    /// evolve and integrate keep one.
    static size_t proposalCap(DomainPhase phase, int branching_factor);

    const GeneratorConfig& config() const { return config_; }

private:
    std::shared_ptr<InferenceClient> client_;
    std::shared_ptr<WorkerPool> pool_;
    GeneratorConfig config_;

    ExpansionResult score(const ExpansionJob& job,
                          const GenerationResponse& response,
                          const EfeScorer& scorer) const;
};

} // namespace metatot

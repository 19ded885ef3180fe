#pragma once

#include "decision/decision_gate.hpp"
#include "decision/threshold_adapter.hpp"
#include "engine/engine_config.hpp"
#include "engine/session.hpp"
#include "generation/candidate_generator.hpp"
#include "search/tree_search.hpp"
#include "trace/trace_recorder.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

namespace metatot {

enum class RunError {
    NoViableBranches
};

std::string toString(RunError error);

/// Outcome of one run. Everything except the decision is empty when
/// the gate selects direct mode.
struct RunResult {
    Decision decision;
    std::shared_ptr<const Session> session;
    std::optional<std::string> selected_action;
    std::optional<double> path_efe;
    std::optional<double> confidence;
    std::optional<std::string> trace_id;
    std::optional<RunError> error;

    bool ok() const { return !error.has_value(); }
    nlohmann::json toJson() const;
};

// ─── MetaToTEngine ─────────────────────────────────────────────
// Entry point. Gate → tree search → best path → trace.
//
// Shared across sessions: the inference client, the worker pool, the
// trace store and the threshold adapter. Each run owns its tree, so
// run() may be called from several threads at once.

class MetaToTEngine {
public:
    /// Trace-store record holding the adaptive threshold state. Loaded
    /// on construction and rewritten after every update when
    /// adaptive_thresholds is on.
    static constexpr const char* THRESHOLD_STATE_ID = "meta_tot:threshold_state";

    MetaToTEngine(std::shared_ptr<InferenceClient> client,
                  std::shared_ptr<TraceStore> store,
                  EngineConfig config = {});

    /// Throws std::invalid_argument for an empty task, an empty or
    /// non-positive goal vector, or an invalid run configuration.
    RunResult run(const std::string& task,
                  const nlohmann::json& context,
                  const GoalVector& goal,
                  const RunConfig& run_config,
                  const CancellationToken& token = CancellationToken());

    /// run() with the engine's default run configuration.
    RunResult run(const std::string& task,
                  const nlohmann::json& context,
                  const GoalVector& goal);

    std::optional<nlohmann::json> retrieveTrace(const std::string& trace_id);

    /// Thresholds the next run uses when the run config sets none.
    GateThresholds currentThresholds() const;

    /// Observer installed on every search this engine runs.
    void setPhaseObserver(PhaseObserver fn) { observer_ = std::move(fn); }

    const EngineConfig& config() const { return config_; }
    const ThresholdAdapter& adapter() const { return adapter_; }

    /// 1 - path_efe / (2 * scored_nodes), clamped to [0, 1]; 0 with no
    /// scored nodes.
    static double confidence(double path_efe, size_t scored_nodes);

private:
    EngineConfig config_;
    DecisionGate gate_;
    ThresholdAdapter adapter_;
    std::shared_ptr<WorkerPool> pool_;
    CandidateGenerator generator_;
    TraceRecorder recorder_;
    PhaseObserver observer_;

    void loadThresholdState();
    void saveThresholdState();
};

} // namespace metatot

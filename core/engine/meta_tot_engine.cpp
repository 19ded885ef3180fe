#include "engine/meta_tot_engine.hpp"
#include "trace/trace_codec.hpp"
#include "util/ids.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>

namespace metatot {

namespace {

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

std::string stopName(const SearchStats& stats) {
    return stats.tree_exhausted ? "exhausted" : toString(stats.stop_reason);
}

} // namespace

std::string toString(RunError error) {
    switch (error) {
        case RunError::NoViableBranches: return "NoViableBranches";
    }
    return "NoViableBranches";
}

nlohmann::json RunResult::toJson() const {
    nlohmann::json j;
    j["decision"] = decision.toJson();

    if (session) {
        j["session"] = {
            {"id", session->id},
            {"task", session->task},
            {"started_at", formatTimestamp(session->started_at)},
            {"ended_at", formatTimestamp(session->ended_at)},
            {"selected_path", session->selected_path},
            {"node_count", session->tree.size()},
            {"metrics", TraceCodec::encodeMetrics(session->metrics)}
        };
    } else {
        j["session"] = nullptr;
    }

    j["selected_action"] = selected_action ? nlohmann::json(*selected_action) : nlohmann::json(nullptr);
    j["path_efe"] = path_efe ? nlohmann::json(*path_efe) : nlohmann::json(nullptr);
    j["confidence"] = confidence ? nlohmann::json(*confidence) : nlohmann::json(nullptr);
    j["trace_id"] = trace_id ? nlohmann::json(*trace_id) : nlohmann::json(nullptr);
    j["error"] = error ? nlohmann::json(toString(*error)) : nlohmann::json(nullptr);
    return j;
}

MetaToTEngine::MetaToTEngine(std::shared_ptr<InferenceClient> client,
                             std::shared_ptr<TraceStore> store,
                             EngineConfig config)
    : config_(config),
      gate_(config.gate),
      adapter_(config.gate.thresholds),
      pool_(std::make_shared<WorkerPool>(config.generator.worker_count)),
      generator_(std::move(client), pool_, config.generator),
      recorder_(std::move(store), config.trace_fallback_capacity) {
    if (config_.adaptive_thresholds) loadThresholdState();
}

void MetaToTEngine::loadThresholdState() {
    const auto& store = recorder_.store();
    if (!store) return;
    try {
        auto record = store->lookup(THRESHOLD_STATE_ID);
        if (!record) return;
        adapter_.restore(record->payload);
        GateThresholds t = adapter_.thresholds();
        Logger::info("engine", "Restored adaptive thresholds T_c=" + std::to_string(t.complexity) +
                               " T_u=" + std::to_string(t.uncertainty) + " from " + store->name());
    } catch (const std::exception& e) {
        Logger::warn("engine", std::string("Could not restore adaptive thresholds: ") + e.what());
    }
}

void MetaToTEngine::saveThresholdState() {
    const auto& store = recorder_.store();
    if (!store) return;
    TraceRecord record;
    record.trace_id = THRESHOLD_STATE_ID;
    record.created_at = formatTimestamp(std::chrono::system_clock::now());
    record.payload = adapter_.snapshot();
    try {
        store->upsert(record);
    } catch (const std::exception& e) {
        Logger::warn("engine", std::string("Could not persist adaptive thresholds: ") + e.what());
    }
}

double MetaToTEngine::confidence(double path_efe, size_t scored_nodes) {
    if (scored_nodes == 0) return 0.0;
    double c = 1.0 - path_efe / (2.0 * static_cast<double>(scored_nodes));
    return std::clamp(c, 0.0, 1.0);
}

GateThresholds MetaToTEngine::currentThresholds() const {
    return config_.adaptive_thresholds ? adapter_.thresholds() : config_.gate.thresholds;
}

std::optional<nlohmann::json> MetaToTEngine::retrieveTrace(const std::string& trace_id) {
    return recorder_.retrieve(trace_id);
}

RunResult MetaToTEngine::run(const std::string& task,
                             const nlohmann::json& context,
                             const GoalVector& goal) {
    return run(task, context, goal, config_.defaultRun());
}

RunResult MetaToTEngine::run(const std::string& task,
                             const nlohmann::json& context,
                             const GoalVector& goal,
                             const RunConfig& run_config,
                             const CancellationToken& token) {
    // ── Input validation, before any search ──
    if (isBlank(task)) {
        throw std::invalid_argument("task must not be empty");
    }
    if (!context.is_null() && !context.is_object()) {
        throw std::invalid_argument("context must be a JSON object");
    }
    run_config.validate();
    EfeScorer scorer(goal, run_config.search.divergence_metric);

    const nlohmann::json ctx = context.is_null() ? nlohmann::json::object() : context;

    GateThresholds thresholds = currentThresholds();
    if (run_config.complexity_threshold) thresholds.complexity = *run_config.complexity_threshold;
    if (run_config.uncertainty_threshold) thresholds.uncertainty = *run_config.uncertainty_threshold;

    RunResult result;
    result.decision = gate_.decide(task, ctx, thresholds);
    Logger::info("engine", "Gate selected " + toString(result.decision.selected_mode) +
                           ": " + result.decision.rationale);
    if (!result.decision.deepSearch()) return result;

    // ── Search ──
    auto session = std::make_shared<Session>();
    session->id = generateUuid();
    session->task = task;
    session->context_summary = ctx;
    session->goal = goal;
    session->decision = result.decision;
    session->tree = ThoughtTree(session->id);
    session->started_at = std::chrono::system_clock::now();

    TreeSearch search(generator_, run_config.search);
    if (observer_) search.setPhaseObserver(observer_);
    SearchOutcome outcome = search.search(session->tree, task, scorer, ctx, token);

    session->ended_at = std::chrono::system_clock::now();

    const SearchStats& stats = outcome.stats;
    SessionMetrics& m = session->metrics;
    m.total_prediction_error = stats.total_prediction_error;
    m.total_free_energy = stats.total_free_energy;
    m.duration_seconds = stats.elapsed_seconds;
    m.time_budget_seconds = run_config.search.deadline_ms > 0
        ? run_config.search.deadline_ms / 1000.0
        : 0.0;
    m.iterations = stats.iterations;
    m.expansions = stats.expansions;
    m.failed_expansions = stats.failed_expansions;
    m.branch_count = stats.branch_count;
    m.stop_reason = stopName(stats);

    // ── Best path ──
    if (outcome.viable) {
        session->selected_path = outcome.best_path;
        session->selected_action = session->tree.at(outcome.best_path.back()).thought;
        session->path_efe = outcome.path_efe;
        session->confidence = confidence(outcome.path_efe, outcome.best_path.size() - 1);
    }

    // ── Trace ──
    session->trace_id = generateUuid();
    result.trace_id = recorder_.persist(*session);

    if (outcome.viable) {
        result.selected_action = session->selected_action;
        result.path_efe = session->path_efe;
        result.confidence = session->confidence;
        Logger::info("engine", "Session " + session->id + " selected a path of " +
                               std::to_string(session->selected_path.size()) + " nodes, path EFE " +
                               std::to_string(session->path_efe) + ", confidence " +
                               std::to_string(session->confidence));
    } else {
        result.error = RunError::NoViableBranches;
        Logger::warn("engine", "Session " + session->id + " produced no viable branches");
    }

    if (config_.adaptive_thresholds) {
        adapter_.update(session->confidence, m.duration_seconds, m.time_budget_seconds);
        saveThresholdState();
    }

    result.session = std::move(session);
    return result;
}

} // namespace metatot

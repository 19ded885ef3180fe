#pragma once

#include "decision/decision_gate.hpp"
#include "tree/thought_tree.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace metatot {

struct SessionMetrics {
    double total_prediction_error = 0.0;
    double total_free_energy = 0.0;
    double duration_seconds = 0.0;
    double time_budget_seconds = 0.0;
    int iterations = 0;
    int expansions = 0;
    int failed_expansions = 0;
    int branch_count = 0;
    std::string stop_reason = "none";  // none | iterations | deadline | cancelled | exhausted
};

// ─── Session ───────────────────────────────────────────────────
// One deep-search run. Built by the engine while the search runs and
// handed out read-only once the best path is extracted. Owns its tree.

struct Session {
    std::string id;
    std::string task;
    nlohmann::json context_summary = nlohmann::json::object();
    GoalVector goal;

    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point ended_at;

    std::string selected_action;          // thought of the last node on the path
    std::vector<uint64_t> selected_path;  // root-to-leaf, empty when nothing viable
    double path_efe = 0.0;
    double confidence = 0.0;

    SessionMetrics metrics;
    Decision decision;
    std::string trace_id;

    ThoughtTree tree;

    bool viable() const { return !selected_path.empty(); }
};

} // namespace metatot

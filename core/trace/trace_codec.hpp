#pragma once

#include "engine/session.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace metatot {

/// Node as archived in a trace payload.
struct TraceNode {
    uint64_t id = 0;
    std::optional<uint64_t> parent_id;
    int depth = 0;
    std::string phase;
    std::string thought;
    double score = 0.0;
    int visit_count = 0;
    double value_estimate = 0.0;
    double efe = 0.0;
    double uncertainty = 0.0;
    double goal_divergence = 0.0;
    double prediction_error = 0.0;
    double precision = 1.0;
    int reasoning_level = 0;
    std::map<std::string, double> beliefs;
    bool is_selected = false;
};

/// Decoded view of a trace payload, for auditing.
struct TracePayload {
    std::string trace_id;
    std::string session_id;
    std::string task;
    std::string started_at;
    std::string ended_at;
    std::string selected_action;
    std::vector<uint64_t> selected_path;
    double path_efe = 0.0;
    double confidence = 0.0;
    nlohmann::json decision;
    nlohmann::json metrics;
    std::vector<TraceNode> nodes;

    /// Node with the given id, or nullptr.
    const TraceNode* node(uint64_t id) const;
};

// ─── Trace Codec ───────────────────────────────────────────────
// Session <-> JSON payload. The payload carries the session header,
// the decision, the metrics and every node of the tree.

class TraceCodec {
public:
    static constexpr int FORMAT_VERSION = 1;

    static nlohmann::json encode(const Session& session);

    /// Throws std::invalid_argument when required fields are missing
    /// or have the wrong type.
    static TracePayload decode(const nlohmann::json& payload);

    static nlohmann::json encodeNode(const ThoughtNode& node);
    static nlohmann::json encodeMetrics(const SessionMetrics& metrics);
};

} // namespace metatot

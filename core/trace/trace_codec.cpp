#include "trace/trace_codec.hpp"
#include "util/ids.hpp"

#include <stdexcept>

namespace metatot {

const TraceNode* TracePayload::node(uint64_t id) const {
    for (const auto& n : nodes) {
        if (n.id == id) return &n;
    }
    return nullptr;
}

nlohmann::json TraceCodec::encodeNode(const ThoughtNode& node) {
    nlohmann::json beliefs = nlohmann::json::object();
    for (const auto& [name, p] : node.state.beliefs.probabilities()) beliefs[name] = p;

    return {
        {"id", node.id},
        {"parent_id", node.parent_id ? nlohmann::json(*node.parent_id) : nlohmann::json(nullptr)},
        {"depth", node.depth},
        {"phase", toString(node.phase)},
        {"thought", node.thought},
        {"score", node.score},
        {"visit_count", node.visit_count},
        {"value_estimate", node.value_estimate},
        {"is_selected", node.is_selected},
        {"state", {
            {"efe", node.efe()},
            {"uncertainty", node.state.efe.uncertainty},
            {"goal_divergence", node.state.efe.goal_divergence},
            {"prediction_error", node.state.prediction_error},
            {"free_energy", node.state.free_energy},
            {"surprise", node.state.surprise},
            {"precision", node.state.precision},
            {"reasoning_level", node.state.reasoning_level},
            {"beliefs", beliefs}
        }}
    };
}

nlohmann::json TraceCodec::encodeMetrics(const SessionMetrics& m) {
    return {
        {"total_prediction_error", m.total_prediction_error},
        {"total_free_energy", m.total_free_energy},
        {"duration_seconds", m.duration_seconds},
        {"time_budget_seconds", m.time_budget_seconds},
        {"iterations", m.iterations},
        {"expansions", m.expansions},
        {"failed_expansions", m.failed_expansions},
        {"branch_count", m.branch_count},
        {"stop_reason", m.stop_reason}
    };
}

nlohmann::json TraceCodec::encode(const Session& session) {
    nlohmann::json nodes = nlohmann::json::array();
    session.tree.forEachNode([&nodes](const ThoughtNode& node) {
        nodes.push_back(encodeNode(node));
    });

    nlohmann::json goal = nlohmann::json::object();
    for (const auto& [name, w] : session.goal) goal[name] = w;

    return {
        {"format_version", FORMAT_VERSION},
        {"trace_id", session.trace_id},
        {"session", {
            {"id", session.id},
            {"task", session.task},
            {"context_summary", session.context_summary},
            {"goal", goal},
            {"started_at", formatTimestamp(session.started_at)},
            {"ended_at", formatTimestamp(session.ended_at)},
            {"selected_action", session.selected_action},
            {"selected_path", session.selected_path},
            {"path_efe", session.path_efe},
            {"confidence", session.confidence}
        }},
        {"decision", session.decision.toJson()},
        {"metrics", encodeMetrics(session.metrics)},
        {"nodes", nodes}
    };
}

TracePayload TraceCodec::decode(const nlohmann::json& payload) {
    if (!payload.is_object()) {
        throw std::invalid_argument("Trace payload must be a JSON object");
    }

    try {
        TracePayload out;
        out.trace_id = payload.at("trace_id").get<std::string>();

        const auto& session = payload.at("session");
        out.session_id = session.at("id").get<std::string>();
        out.task = session.at("task").get<std::string>();
        out.started_at = session.value("started_at", "");
        out.ended_at = session.value("ended_at", "");
        out.selected_action = session.value("selected_action", "");
        out.selected_path = session.at("selected_path").get<std::vector<uint64_t>>();
        out.path_efe = session.at("path_efe").get<double>();
        out.confidence = session.value("confidence", 0.0);

        out.decision = payload.value("decision", nlohmann::json::object());
        out.metrics = payload.value("metrics", nlohmann::json::object());

        for (const auto& jn : payload.at("nodes")) {
            TraceNode n;
            n.id = jn.at("id").get<uint64_t>();
            if (!jn.at("parent_id").is_null()) n.parent_id = jn.at("parent_id").get<uint64_t>();
            n.depth = jn.at("depth").get<int>();
            n.phase = jn.at("phase").get<std::string>();
            n.thought = jn.at("thought").get<std::string>();
            n.score = jn.at("score").get<double>();
            n.visit_count = jn.at("visit_count").get<int>();
            n.value_estimate = jn.at("value_estimate").get<double>();
            n.is_selected = jn.value("is_selected", false);

            const auto& st = jn.at("state");
            n.efe = st.at("efe").get<double>();
            n.uncertainty = st.value("uncertainty", 0.0);
            n.goal_divergence = st.value("goal_divergence", 0.0);
            n.prediction_error = st.value("prediction_error", 0.0);
            n.precision = st.value("precision", 1.0);
            n.reasoning_level = st.value("reasoning_level", 0);
            n.beliefs = st.at("beliefs").get<std::map<std::string, double>>();
            out.nodes.push_back(std::move(n));
        }
        return out;
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Malformed trace payload: ") + e.what());
    }
}

} // namespace metatot

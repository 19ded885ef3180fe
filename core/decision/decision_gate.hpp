#pragma once

// ─── DecisionGate ─────────────────────────────────────────────
// Stateless policy deciding whether a task warrants deep search.
//
// Scoring:
//   complexity  = 0.5 * length + 0.25 * constraints + 0.15 * domain
//                 + 0.10 * context.complexity_score
//   uncertainty = context.uncertainty_level, or
//                 0.5 * (1 - goal_alignment) + 0.25 * unknowns/5 + 0.25 * '?'/3
//
// deep_search iff complexity >= T_c OR uncertainty >= T_u. Context flags
// disable_meta_tot / force_meta_tot and GateConfig::always_on override
// the rule.

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace metatot {

enum class SelectedMode {
    Direct,
    DeepSearch
};

std::string toString(SelectedMode mode);

struct GateThresholds {
    double complexity  = 0.7;   // T_c
    double uncertainty = 0.6;   // T_u
};

struct Decision {
    std::string task;
    double complexity_score  = 0.0;
    double uncertainty_score = 0.0;
    GateThresholds thresholds;
    SelectedMode selected_mode = SelectedMode::Direct;
    std::string rationale;

    bool deepSearch() const { return selected_mode == SelectedMode::DeepSearch; }
    nlohmann::json toJson() const;
};

struct GateConfig {
    GateThresholds thresholds;
    int min_token_threshold = 160;  // words for a full length score
    bool always_on = false;

    /// Overlay META_TOT_COMPLEXITY_THRESHOLD, META_TOT_UNCERTAINTY_THRESHOLD,
    /// META_TOT_MIN_TOKENS, META_TOT_ALWAYS_ON.
    static GateConfig fromEnv();
    static GateConfig fromEnv(GateConfig base);
};

class DecisionGate {
public:
    static constexpr double DEFAULT_GOAL_ALIGNMENT = 0.5;

    explicit DecisionGate(GateConfig config = {});

    /// Deterministic for a given task, context and thresholds. When
    /// thresholds is empty the configured ones are used.
    Decision decide(const std::string& task,
                    const nlohmann::json& context = nlohmann::json::object(),
                    std::optional<GateThresholds> thresholds = std::nullopt) const;

    /// The pure threshold rule.
    static SelectedMode select(double complexity, double uncertainty,
                               const GateThresholds& thresholds);

    double complexityScore(const std::string& task, const nlohmann::json& context) const;
    double uncertaintyScore(const std::string& task, const nlohmann::json& context) const;

    const GateConfig& config() const { return config_; }

private:
    GateConfig config_;
};

} // namespace metatot

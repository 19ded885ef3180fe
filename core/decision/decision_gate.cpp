#include "decision/decision_gate.hpp"
#include "util/env.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <sstream>

namespace metatot {

namespace {

const std::array<const char*, 5> kConstraintTerms = {"must", "should", "constraint", "tradeoff", "risk"};
const std::array<const char*, 5> kDomainTerms = {"strategy", "plan", "marketing", "evolution", "architecture"};

double clamp01(double v) {
    if (!std::isfinite(v)) return 0.0;
    return std::clamp(v, 0.0, 1.0);
}

std::optional<double> numberAt(const nlohmann::json& ctx, const char* key) {
    if (!ctx.is_object()) return std::nullopt;
    auto it = ctx.find(key);
    if (it == ctx.end() || !it->is_number()) return std::nullopt;
    return it->get<double>();
}

bool flagAt(const nlohmann::json& ctx, const char* key) {
    if (!ctx.is_object()) return false;
    auto it = ctx.find(key);
    if (it == ctx.end()) return false;
    if (it->is_boolean()) return it->get<bool>();
    if (it->is_number()) return it->get<double>() != 0.0;
    return false;
}

std::string lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Number of terms that occur anywhere in the text.
template <size_t N>
int countHits(const std::string& text, const std::array<const char*, N>& terms) {
    int hits = 0;
    for (const char* term : terms) {
        if (text.find(term) != std::string::npos) hits++;
    }
    return hits;
}

int wordCount(const std::string& text) {
    std::istringstream in(text);
    std::string word;
    int n = 0;
    while (in >> word) n++;
    return n;
}

std::string fixed2(double v) {
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out.precision(2);
    out << v;
    return out.str();
}

} // namespace

std::string toString(SelectedMode mode) {
    return mode == SelectedMode::DeepSearch ? "deep_search" : "direct";
}

nlohmann::json Decision::toJson() const {
    return {
        {"task", task},
        {"complexity_score", complexity_score},
        {"uncertainty_score", uncertainty_score},
        {"thresholds", {
            {"complexity", thresholds.complexity},
            {"uncertainty", thresholds.uncertainty}
        }},
        {"selected_mode", toString(selected_mode)},
        {"rationale", rationale}
    };
}

GateConfig GateConfig::fromEnv() {
    return fromEnv(GateConfig{});
}

GateConfig GateConfig::fromEnv(GateConfig base) {
    base.thresholds.complexity = envDouble("META_TOT_COMPLEXITY_THRESHOLD", base.thresholds.complexity);
    base.thresholds.uncertainty = envDouble("META_TOT_UNCERTAINTY_THRESHOLD", base.thresholds.uncertainty);
    base.min_token_threshold = envInt("META_TOT_MIN_TOKENS", base.min_token_threshold);
    base.always_on = envBool("META_TOT_ALWAYS_ON", base.always_on);
    return base;
}

DecisionGate::DecisionGate(GateConfig config) : config_(config) {}

double DecisionGate::complexityScore(const std::string& task, const nlohmann::json& context) const {
    std::string text = lower(task);

    double length = std::min(static_cast<double>(wordCount(task)) /
                             std::max(config_.min_token_threshold, 1), 1.0);
    double constraints = std::min(countHits(text, kConstraintTerms) / 5.0, 1.0);
    double domain = std::min(countHits(text, kDomainTerms) / 5.0, 1.0);
    double ctx = clamp01(numberAt(context, "complexity_score").value_or(0.0));

    return clamp01(0.5 * length + 0.25 * constraints + 0.15 * domain + 0.10 * ctx);
}

double DecisionGate::uncertaintyScore(const std::string& task, const nlohmann::json& context) const {
    if (auto level = numberAt(context, "uncertainty_level")) {
        return clamp01(*level);
    }

    double alignment = clamp01(numberAt(context, "goal_alignment").value_or(DEFAULT_GOAL_ALIGNMENT));

    double unknowns = 0.0;
    if (context.is_object()) {
        auto it = context.find("unknowns");
        if (it != context.end() && it->is_array()) {
            unknowns = std::min(static_cast<double>(it->size()) / 5.0, 1.0);
        }
    }

    double questions = std::min(std::count(task.begin(), task.end(), '?') / 3.0, 1.0);

    return clamp01(0.5 * (1.0 - alignment) + 0.25 * unknowns + 0.25 * questions);
}

SelectedMode DecisionGate::select(double complexity, double uncertainty,
                                  const GateThresholds& thresholds) {
    if (complexity >= thresholds.complexity || uncertainty >= thresholds.uncertainty) {
        return SelectedMode::DeepSearch;
    }
    return SelectedMode::Direct;
}

Decision DecisionGate::decide(const std::string& task,
                              const nlohmann::json& context,
                              std::optional<GateThresholds> thresholds) const {
    Decision d;
    d.task = task;
    d.thresholds = thresholds.value_or(config_.thresholds);

    if (flagAt(context, "disable_meta_tot")) {
        d.selected_mode = SelectedMode::Direct;
        d.rationale = "deep search disabled by context flag";
        return d;
    }

    d.complexity_score = complexityScore(task, context);
    d.uncertainty_score = uncertaintyScore(task, context);
    d.selected_mode = select(d.complexity_score, d.uncertainty_score, d.thresholds);

    std::string cmp = "complexity=" + fixed2(d.complexity_score) +
                      (d.complexity_score >= d.thresholds.complexity ? " >= " : " < ") +
                      "T_c=" + fixed2(d.thresholds.complexity) + ", uncertainty=" +
                      fixed2(d.uncertainty_score) +
                      (d.uncertainty_score >= d.thresholds.uncertainty ? " >= " : " < ") +
                      "T_u=" + fixed2(d.thresholds.uncertainty);

    std::string fired;
    if (d.complexity_score >= d.thresholds.complexity) fired = "complexity threshold";
    if (d.uncertainty_score >= d.thresholds.uncertainty) {
        fired += fired.empty() ? "uncertainty threshold" : " and uncertainty threshold";
    }

    if (fired.empty()) {
        d.rationale = "no threshold fired (" + cmp + ")";
    } else {
        d.rationale = fired + " fired (" + cmp + ")";
    }

    if (d.selected_mode == SelectedMode::Direct) {
        if (flagAt(context, "force_meta_tot")) {
            d.selected_mode = SelectedMode::DeepSearch;
            d.rationale += "; forced by context flag";
        } else if (config_.always_on) {
            d.selected_mode = SelectedMode::DeepSearch;
            d.rationale += "; always on";
        }
    }
    return d;
}

} // namespace metatot

#pragma once

#include "decision/decision_gate.hpp"
#include "generation/candidate_generator.hpp"
#include "search/search_state.hpp"

#include <optional>

namespace metatot {

/// Per-call knobs of MetaToTEngine::run. Thresholds left unset fall
/// back to the adapter (when adaptive) or the gate configuration.
struct RunConfig {
    SearchConfig search;
    std::optional<double> complexity_threshold;   // T_c
    std::optional<double> uncertainty_threshold;  // T_u

    /// Throws std::invalid_argument for an invalid search config or a
    /// threshold outside [0, 1].
    void validate() const;
};

/// Engine-wide configuration, shared by every session.
struct EngineConfig {
    GateConfig gate;
    SearchConfig search;           // defaults for RunConfig::search
    GeneratorConfig generator;
    bool adaptive_thresholds = false;
    size_t trace_fallback_capacity = 128;

    RunConfig defaultRun() const;

    /// Every META_TOT_* overlay of the gate, search and generator configs,
    /// plus META_TOT_ADAPTIVE.
    static EngineConfig fromEnv();
    static EngineConfig fromEnv(EngineConfig base);
};

} // namespace metatot

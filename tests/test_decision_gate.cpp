#include <gtest/gtest.h>
#include "decision/decision_gate.hpp"

#include <cstdlib>

using namespace metatot;

TEST(DecisionGateTest, SelectRule) {
    GateThresholds t{0.5, 0.5};
    EXPECT_EQ(DecisionGate::select(0.1, 0.1, t), SelectedMode::Direct);
    EXPECT_EQ(DecisionGate::select(0.5, 0.1, t), SelectedMode::DeepSearch);
    EXPECT_EQ(DecisionGate::select(0.1, 0.5, t), SelectedMode::DeepSearch);
    EXPECT_EQ(DecisionGate::select(0.49, 0.49, t), SelectedMode::Direct);
}

TEST(DecisionGateTest, ComplexityScore) {
    DecisionGate gate;
    std::string task = "We must plan a strategy that limits risk";
    // length 8/160, constraints {must, risk}, domain {plan, strategy}
    double expected = 0.5 * (8.0 / 160.0) + 0.25 * 0.4 + 0.15 * 0.4;
    EXPECT_NEAR(gate.complexityScore(task, nlohmann::json::object()), expected, 1e-12);
    EXPECT_NEAR(gate.complexityScore(task, {{"complexity_score", 1.0}}), expected + 0.1, 1e-12);
}

TEST(DecisionGateTest, LongTaskSaturatesLengthTerm) {
    GateConfig config;
    config.min_token_threshold = 4;
    DecisionGate gate(config);
    EXPECT_NEAR(gate.complexityScore("one two three four five six", {}), 0.5, 1e-12);
}

TEST(DecisionGateTest, UncertaintyFromContextLevel) {
    DecisionGate gate;
    EXPECT_DOUBLE_EQ(gate.uncertaintyScore("x", {{"uncertainty_level", 0.9}}), 0.9);
    EXPECT_DOUBLE_EQ(gate.uncertaintyScore("x", {{"uncertainty_level", 3.0}}), 1.0);
    EXPECT_DOUBLE_EQ(gate.uncertaintyScore("x", {{"uncertainty_level", -1.0}}), 0.0);
}

TEST(DecisionGateTest, UncertaintyFromSignals) {
    DecisionGate gate;
    EXPECT_NEAR(gate.uncertaintyScore("plain task", nlohmann::json::object()), 0.25, 1e-12);
    EXPECT_NEAR(gate.uncertaintyScore("plain task", {{"goal_alignment", 1.0}}), 0.0, 1e-12);

    nlohmann::json ctx = {{"unknowns", nlohmann::json::array({"a", "b", "c", "d", "e", "f"})}};
    EXPECT_NEAR(gate.uncertaintyScore("Why? How? When?", ctx), 0.25 + 0.25 + 0.25, 1e-12);
}

TEST(DecisionGateTest, ScenarioLowScoresGoDirect) {
    DecisionGate gate;
    Decision d = gate.decide("Say hi", {{"uncertainty_level", 0.1}}, GateThresholds{0.5, 0.5});
    EXPECT_EQ(d.selected_mode, SelectedMode::Direct);
    EXPECT_FALSE(d.deepSearch());
    EXPECT_LT(d.complexity_score, 0.5);
    EXPECT_NE(d.rationale.find("no threshold fired"), std::string::npos);
}

TEST(DecisionGateTest, RationaleNamesTriggeredThresholds) {
    DecisionGate gate;
    Decision d = gate.decide("Say hi", {{"uncertainty_level", 0.9}}, GateThresholds{0.0, 0.6});
    EXPECT_TRUE(d.deepSearch());
    EXPECT_NE(d.rationale.find("complexity threshold and uncertainty threshold fired"), std::string::npos);

    d = gate.decide("Say hi", {{"uncertainty_level", 0.9}}, GateThresholds{0.9, 0.6});
    EXPECT_NE(d.rationale.find("uncertainty threshold fired"), std::string::npos);
    EXPECT_EQ(d.rationale.find("complexity threshold"), std::string::npos);
}

TEST(DecisionGateTest, Deterministic) {
    DecisionGate gate;
    nlohmann::json ctx = {{"goal_alignment", 0.2}, {"unknowns", nlohmann::json::array({"x"})}};
    std::string task = "Should we migrate the architecture? What is the risk?";
    Decision a = gate.decide(task, ctx);
    Decision b = gate.decide(task, ctx);
    EXPECT_EQ(a.toJson(), b.toJson());
}

TEST(DecisionGateTest, MonotonicInUncertainty) {
    DecisionGate gate;
    bool seen_deep = false;
    for (int i = 0; i <= 20; i++) {
        double level = i / 20.0;
        Decision d = gate.decide("Say hi", {{"uncertainty_level", level}});
        if (seen_deep) {
            EXPECT_TRUE(d.deepSearch()) << "dropped back to direct at " << level;
        }
        seen_deep = seen_deep || d.deepSearch();
    }
    EXPECT_TRUE(seen_deep);
}

TEST(DecisionGateTest, ContextFlagsOverride) {
    DecisionGate gate;
    Decision off = gate.decide("Why? How? When?", {{"uncertainty_level", 1.0}, {"disable_meta_tot", true}});
    EXPECT_EQ(off.selected_mode, SelectedMode::Direct);

    Decision forced = gate.decide("Say hi", {{"uncertainty_level", 0.0}, {"force_meta_tot", true}});
    EXPECT_EQ(forced.selected_mode, SelectedMode::DeepSearch);
    EXPECT_NE(forced.rationale.find("forced"), std::string::npos);

    GateConfig config;
    config.always_on = true;
    Decision always = DecisionGate(config).decide("Say hi", {{"uncertainty_level", 0.0}});
    EXPECT_EQ(always.selected_mode, SelectedMode::DeepSearch);
}

TEST(DecisionGateTest, ConfiguredThresholdsAreDefault) {
    DecisionGate gate;
    Decision d = gate.decide("Say hi");
    EXPECT_DOUBLE_EQ(d.thresholds.complexity, 0.7);
    EXPECT_DOUBLE_EQ(d.thresholds.uncertainty, 0.6);
    EXPECT_EQ(d.toJson()["selected_mode"], "direct");
}

TEST(DecisionGateTest, ConfigFromEnv) {
    setenv("META_TOT_COMPLEXITY_THRESHOLD", "0.42", 1);
    setenv("META_TOT_MIN_TOKENS", "not-a-number", 1);
    setenv("META_TOT_ALWAYS_ON", "true", 1);
    GateConfig config = GateConfig::fromEnv();
    unsetenv("META_TOT_COMPLEXITY_THRESHOLD");
    unsetenv("META_TOT_MIN_TOKENS");
    unsetenv("META_TOT_ALWAYS_ON");

    EXPECT_DOUBLE_EQ(config.thresholds.complexity, 0.42);
    EXPECT_DOUBLE_EQ(config.thresholds.uncertainty, 0.6);
    EXPECT_EQ(config.min_token_threshold, 160);
    EXPECT_TRUE(config.always_on);
}

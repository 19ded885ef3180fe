#include <gtest/gtest.h>
#include "generation/completion_client.hpp"
#include "generation/prompt_builder.hpp"
#include "generation/response_parser.hpp"
#include "generation/template_client.hpp"

using namespace metatot;

// ── ResponseParser ──

TEST(ResponseParserTest, ObjectWithProposals) {
    auto r = ResponseParser::parse(R"({"proposals": [
        {"content": "Ship a beta", "belief_hypotheses": {"viable": 0.8, "risky": 0.2}},
        {"content": "Wait a quarter"}
    ]})");
    ASSERT_EQ(r.proposals.size(), 2u);
    EXPECT_EQ(r.proposals[0].content, "Ship a beta");
    EXPECT_DOUBLE_EQ(r.proposals[0].belief_hypotheses.at("viable"), 0.8);
    EXPECT_TRUE(r.proposals[1].belief_hypotheses.empty());
}

TEST(ResponseParserTest, ArrayOfStringsAndAliases) {
    auto r = ResponseParser::parse(R"(["  first  ", {"thought": "second", "beliefs": {"a": 1, "b": "x"}}])");
    ASSERT_EQ(r.proposals.size(), 2u);
    EXPECT_EQ(r.proposals[0].content, "first");
    EXPECT_EQ(r.proposals[1].content, "second");
    EXPECT_EQ(r.proposals[1].belief_hypotheses.size(), 1u);  // non-numeric dropped
}

TEST(ResponseParserTest, FencedJson) {
    auto r = ResponseParser::parse("```json\n[\"inside the fence\"]\n```");
    ASSERT_EQ(r.proposals.size(), 1u);
    EXPECT_EQ(r.proposals[0].content, "inside the fence");
}

TEST(ResponseParserTest, BulletedLinesFallback) {
    auto r = ResponseParser::parse("- first idea\n* second idea\n\n1. third idea\n2) fourth\n- fifth", 4);
    ASSERT_EQ(r.proposals.size(), 4u);
    EXPECT_EQ(r.proposals[0].content, "first idea");
    EXPECT_EQ(r.proposals[1].content, "second idea");
    EXPECT_EQ(r.proposals[2].content, "third idea");
    EXPECT_EQ(r.proposals[3].content, "fourth");
}

TEST(ResponseParserTest, EmptyContentIsSkipped) {
    auto r = ResponseParser::parse(R"({"proposals": [{"content": ""}, {"text": "kept"}]})");
    ASSERT_EQ(r.proposals.size(), 1u);
    EXPECT_EQ(r.proposals[0].content, "kept");
}

TEST(ResponseParserTest, BlankOrMalformedInputThrows) {
    EXPECT_THROW(ResponseParser::parse("   \n  "), InferenceError);
    EXPECT_THROW(ResponseParser::parse(R"({"answer": "no proposals key"})"), InferenceError);
    EXPECT_THROW(ResponseParser::fromJson(nlohmann::json(42)), InferenceError);
}

// ── PromptBuilder ──

TEST(PromptBuilderTest, PhaseSpecificInstructions) {
    ExpansionRequest req;
    req.phase = DomainPhase::Challenge;
    req.depth = 1;
    req.task = "Plan a launch";
    req.thought = "Launch in March";
    req.path = {"Plan a launch"};
    req.siblings = {"Launch in June"};
    req.hypotheses = {"viable", "risky"};

    std::string prompt = PromptBuilder::build(req);
    EXPECT_NE(prompt.find("phase: challenge"), std::string::npos);
    EXPECT_NE(prompt.find("counter-proposal"), std::string::npos);
    EXPECT_NE(prompt.find("Launch in June"), std::string::npos);
    EXPECT_NE(prompt.find("viable;"), std::string::npos);

    req.phase = DomainPhase::Evolve;
    EXPECT_EQ(PromptBuilder::build(req).find("Launch in June"), std::string::npos);
}

TEST(PromptBuilderTest, RequestContextCarriesCallerContext) {
    ExpansionRequest req;
    req.phase = DomainPhase::Integrate;
    req.hypotheses = {"viable"};
    auto ctx = PromptBuilder::requestContext(req, {{"user", "alice"}});
    EXPECT_EQ(ctx["phase"], "integrate");
    EXPECT_EQ(ctx["caller"]["user"], "alice");
    EXPECT_EQ(ctx["hypotheses"].size(), 1u);
}

// ── TemplateInferenceClient ──

TEST(TemplateClientTest, PhaseLabelledAndDeterministic) {
    TemplateInferenceClient client;
    nlohmann::json ctx = {{"phase", "challenge"}, {"thought", "Launch in March"},
                          {"hypotheses", nlohmann::json::array({"viable", "risky"})}};

    auto first = client.generate("prompt", ctx);
    auto second = client.generate("prompt", ctx);
    ASSERT_EQ(first.proposals.size(), 2u);
    EXPECT_EQ(first.proposals[0].content, "Challenge critique: Launch in March");
    EXPECT_EQ(first.proposals[1].content, "Challenge counter-proposal: Launch in March");
    EXPECT_EQ(first.proposals[0].belief_hypotheses, second.proposals[0].belief_hypotheses);

    for (const auto& [_, v] : first.proposals[0].belief_hypotheses) {
        EXPECT_GE(v, 0.05);
        EXPECT_LT(v, 1.05);
    }
}

TEST(TemplateClientTest, DefaultsToExploreAndDefaultHypotheses) {
    TemplateInferenceClient client(4);
    auto r = client.generate("prompt", {{"thought", "abcdefgh"}});
    ASSERT_EQ(r.proposals.size(), 3u);
    EXPECT_EQ(r.proposals[0].content, "Explore branch: abcd");
    EXPECT_EQ(r.proposals[0].belief_hypotheses.count("viable"), 1u);
    EXPECT_EQ(r.proposals[0].belief_hypotheses.count("risky"), 1u);
}

TEST(TemplateClientTest, StableHashIsFnv1a) {
    EXPECT_EQ(TemplateInferenceClient::stableHash(""), 1469598103934665603ULL);
    EXPECT_EQ(TemplateInferenceClient::stableHash("a"), 0xaf63dc4c8601ec8cULL);
}

// ── CompletionInferenceClient ──

TEST(TemplateClientTest, ExcerptNeverSplitsCodePoint) {
    std::string text = std::string(159, 'a') + "\xC3\xA9 plan";  // 'é' spans bytes 159-160
    std::string cut = TemplateInferenceClient::excerpt(text, 160);
    EXPECT_EQ(cut, std::string(159, 'a'));
    EXPECT_EQ(TemplateInferenceClient::excerpt(text, 161), std::string(159, 'a') + "\xC3\xA9");
    EXPECT_EQ(TemplateInferenceClient::excerpt("short", 160), "short");

    // 4-byte sequence: back off to its lead byte
    std::string emoji = "ab\xF0\x9F\x98\x80";
    EXPECT_EQ(TemplateInferenceClient::excerpt(emoji, 4), "ab");
}

TEST(TemplateClientTest, ProposalsStayValidUtf8) {
    TemplateInferenceClient client;
    std::string task = std::string(159, 'a') + "\xC3\xA9 plan";
    auto response = client.generate(task, {{"phase", "integrate"}, {"thought", task}});
    ASSERT_EQ(response.proposals.size(), 1u);
    nlohmann::json j = response.proposals[0].content;
    EXPECT_NO_THROW(j.dump());
}

TEST(CompletionClientTest, ParsesRawCompletion) {
    std::string seen_system;
    CompletionInferenceClient client([&](const std::string& system, const std::string&) {
        seen_system = system;
        return std::string("```\n{\"proposals\": [{\"content\": \"x\", \"belief_hypotheses\": {\"ok\": 1}}]}\n```");
    });

    auto r = client.generate("prompt", {{"hypotheses", nlohmann::json::array({"ok"})}});
    ASSERT_EQ(r.proposals.size(), 1u);
    EXPECT_EQ(r.proposals[0].content, "x");
    EXPECT_NE(seen_system.find("ok;"), std::string::npos);
}

TEST(CompletionClientTest, EmptyCompletionIsInferenceError) {
    CompletionInferenceClient client([](const std::string&, const std::string&) {
        return std::string();
    });
    EXPECT_THROW(client.generate("prompt", nlohmann::json::object()), InferenceError);
}

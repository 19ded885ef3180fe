#include <gtest/gtest.h>
#include "trace/memory_trace_store.hpp"
#include "trace/sqlite_trace_store.hpp"
#include "trace/trace_codec.hpp"
#include "trace/trace_recorder.hpp"

#include <cstdio>
#include <string>

using namespace metatot;

namespace {

TraceRecord record(const std::string& id, int n = 0) {
    return {id, "session-" + id, "2026-01-01T00:00:00Z", {{"trace_id", id}, {"n", n}}};
}

Session smallSession() {
    Session s;
    s.id = "session-1";
    s.task = "decide";
    s.goal = {{"a", 1.0}};
    s.tree = ThoughtTree(s.id);
    s.tree.createRoot("decide", EfeScorer::rootState());
    uint64_t child = s.tree.addChild(0, DomainPhase::Integrate, "answer", EfeScorer::rootState());
    s.selected_path = {0, child};
    s.tree.markSelected(s.selected_path);
    s.selected_action = "answer";
    s.metrics.iterations = 1;
    s.metrics.stop_reason = "exhausted";
    return s;
}

/// Store whose every call fails, to exercise the fallback path.
class BrokenStore : public TraceStore {
public:
    void upsert(const TraceRecord&) override { throw TraceStoreError("disk full"); }
    std::optional<TraceRecord> lookup(const std::string&) override {
        throw TraceStoreError("disk gone");
    }
    std::string name() const override { return "broken"; }
};

} // namespace

// ─── MemoryTraceStore ──────────────────────────────────────────

TEST(MemoryTraceStoreTest, EvictsOldestWhenFull) {
    MemoryTraceStore store(2);
    store.upsert(record("t1"));
    store.upsert(record("t2"));
    store.upsert(record("t3"));

    EXPECT_EQ(store.size(), 2u);
    EXPECT_FALSE(store.lookup("t1").has_value());
    EXPECT_TRUE(store.lookup("t2").has_value());
    EXPECT_TRUE(store.lookup("t3").has_value());
}

TEST(MemoryTraceStoreTest, UpsertReplacesInPlace) {
    MemoryTraceStore store(2);
    store.upsert(record("t1", 1));
    store.upsert(record("t2"));
    store.upsert(record("t1", 2));

    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.lookup("t1")->payload["n"], 2);
    EXPECT_TRUE(store.lookup("t2").has_value());
}

// ─── SqliteTraceStore ──────────────────────────────────────────

TEST(SqliteTraceStoreTest, UpsertAndLookupInMemory) {
    SqliteTraceStore store(":memory:");
    store.upsert(record("t1", 1));

    auto found = store.lookup("t1");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->session_id, "session-t1");
    EXPECT_EQ(found->created_at, "2026-01-01T00:00:00Z");
    EXPECT_EQ(found->payload["n"], 1);

    store.upsert(record("t1", 5));
    EXPECT_EQ(store.lookup("t1")->payload["n"], 5);
    EXPECT_FALSE(store.lookup("missing").has_value());
}

TEST(SqliteTraceStoreTest, SurvivesReopen) {
    std::string path = ::testing::TempDir() + "metatot_traces_test.db";
    std::remove(path.c_str());
    {
        SqliteTraceStore store(path);
        store.upsert(record("persisted", 9));
    }
    {
        SqliteTraceStore store(path);
        auto found = store.lookup("persisted");
        ASSERT_TRUE(found.has_value());
        EXPECT_EQ(found->payload["n"], 9);
    }
    std::remove(path.c_str());
}

TEST(SqliteTraceStoreTest, InvalidUtf8IsStoredReplaced) {
    SqliteTraceStore store(":memory:");
    TraceRecord r = record("bad-utf8");
    r.payload["task"] = std::string("plan \xC3");  // truncated sequence
    ASSERT_NO_THROW(store.upsert(r));

    auto found = store.lookup("bad-utf8");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->payload["task"], "plan \xEF\xBF\xBD");
}

TEST(SqliteTraceStoreTest, UnopenablePathThrows) {
    EXPECT_THROW(SqliteTraceStore("/nonexistent-dir/metatot/traces.db"), TraceStoreError);
}

// ─── TraceCodec ────────────────────────────────────────────────

TEST(TraceCodecTest, EncodesSessionAndNodes) {
    Session s = smallSession();
    s.trace_id = "trace-1";
    nlohmann::json payload = TraceCodec::encode(s);

    EXPECT_EQ(payload["format_version"], TraceCodec::FORMAT_VERSION);
    EXPECT_EQ(payload["session"]["selected_action"], "answer");
    EXPECT_EQ(payload["metrics"]["stop_reason"], "exhausted");
    ASSERT_EQ(payload["nodes"].size(), 2u);
    EXPECT_TRUE(payload["nodes"][0]["parent_id"].is_null());
    EXPECT_EQ(payload["nodes"][1]["phase"], "integrate");

    TracePayload decoded = TraceCodec::decode(payload);
    EXPECT_EQ(decoded.trace_id, "trace-1");
    EXPECT_EQ(decoded.selected_path, s.selected_path);
    ASSERT_NE(decoded.node(1), nullptr);
    EXPECT_TRUE(decoded.node(1)->is_selected);
    EXPECT_EQ(decoded.node(1)->parent_id.value(), 0u);
    EXPECT_EQ(decoded.node(7), nullptr);
}

TEST(TraceCodecTest, DecodeRejectsMalformedPayload) {
    EXPECT_THROW(TraceCodec::decode(nlohmann::json::array()), std::invalid_argument);
    EXPECT_THROW(TraceCodec::decode({{"trace_id", "x"}}), std::invalid_argument);
    EXPECT_THROW(TraceCodec::decode({{"trace_id", 3}, {"session", nlohmann::json::object()}}),
                 std::invalid_argument);
}

// ─── TraceRecorder ─────────────────────────────────────────────

TEST(TraceRecorderTest, PersistsToStore) {
    auto store = std::make_shared<SqliteTraceStore>(":memory:");
    TraceRecorder recorder(store);

    Session s = smallSession();
    s.trace_id = "trace-42";
    EXPECT_EQ(recorder.persist(s), "trace-42");
    EXPECT_EQ(recorder.fallbackSize(), 0u);

    auto payload = recorder.retrieve("trace-42");
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ((*payload)["trace_id"], "trace-42");
    EXPECT_EQ((*payload)["session"]["id"], "session-1");
}

TEST(TraceRecorderTest, GeneratesIdWhenMissing) {
    TraceRecorder recorder(std::make_shared<MemoryTraceStore>());
    std::string id = recorder.persist(smallSession());
    EXPECT_EQ(id.size(), 36u);
    EXPECT_TRUE(recorder.retrieve(id).has_value());
}

TEST(TraceRecorderTest, FallsBackWhenStoreFails) {
    TraceRecorder recorder(std::make_shared<BrokenStore>(), 4);

    Session s = smallSession();
    s.trace_id = "kept-in-memory";
    EXPECT_EQ(recorder.persist(s), "kept-in-memory");
    EXPECT_EQ(recorder.fallbackSize(), 1u);

    auto payload = recorder.retrieve("kept-in-memory");
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ((*payload)["session"]["selected_action"], "answer");
}

TEST(TraceRecorderTest, NullStoreUsesRingBuffer) {
    TraceRecorder recorder(nullptr, 2);
    for (int i = 0; i < 3; i++) {
        Session s = smallSession();
        s.trace_id = "t" + std::to_string(i);
        recorder.persist(s);
    }
    EXPECT_EQ(recorder.fallbackSize(), 2u);
    EXPECT_FALSE(recorder.retrieve("t0").has_value());
    EXPECT_TRUE(recorder.retrieve("t2").has_value());
}

TEST(TraceRecorderTest, UnknownIdIsEmpty) {
    TraceRecorder recorder(std::make_shared<MemoryTraceStore>());
    EXPECT_FALSE(recorder.retrieve("nope").has_value());
}

#pragma once

#include "engine/session.hpp"
#include "trace/memory_trace_store.hpp"
#include "trace/trace_store.hpp"

#include <memory>
#include <optional>
#include <string>

namespace metatot {

// ─── Trace Recorder ────────────────────────────────────────────
// Archives completed sessions. Writes go to the injected store; when
// it fails the record is kept in a bounded in-process ring buffer and
// the trace id is still returned. Trace loss never aborts a run.

class TraceRecorder {
public:
    static constexpr size_t DEFAULT_FALLBACK_CAPACITY = 128;

    /// store may be null, in which case only the ring buffer is used.
    explicit TraceRecorder(std::shared_ptr<TraceStore> store,
                           size_t fallback_capacity = DEFAULT_FALLBACK_CAPACITY);

    /// Persist the session under session.trace_id (a fresh UUID when
    /// empty). Returns the trace id.
    std::string persist(const Session& session);

    /// Store first, then the ring buffer.
    std::optional<nlohmann::json> retrieve(const std::string& trace_id);

    std::optional<TraceRecord> retrieveRecord(const std::string& trace_id);

    /// Records currently held only in the ring buffer.
    size_t fallbackSize() const { return fallback_.size(); }

    const std::shared_ptr<TraceStore>& store() const { return store_; }

private:
    std::shared_ptr<TraceStore> store_;
    MemoryTraceStore fallback_;
};

} // namespace metatot

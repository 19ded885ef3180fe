#pragma once

#include "trace/trace_store.hpp"

#include <deque>
#include <mutex>
#include <unordered_map>

namespace metatot {

/// Bounded in-process store. Once full, the oldest trace is evicted.
/// Used on its own for tests and offline runs, and as the recorder's
/// fallback when the durable store fails.
class MemoryTraceStore : public TraceStore {
public:
    static constexpr size_t DEFAULT_CAPACITY = 256;

    explicit MemoryTraceStore(size_t capacity = DEFAULT_CAPACITY);

    void upsert(const TraceRecord& record) override;
    std::optional<TraceRecord> lookup(const std::string& trace_id) override;
    std::string name() const override { return "memory"; }

    size_t size() const;
    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
    mutable std::mutex mu_;
    std::deque<std::string> order_;  // oldest first
    std::unordered_map<std::string, TraceRecord> records_;
};

} // namespace metatot

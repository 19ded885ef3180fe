#include "trace/memory_trace_store.hpp"

#include <algorithm>

namespace metatot {

MemoryTraceStore::MemoryTraceStore(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)) {}

void MemoryTraceStore::upsert(const TraceRecord& record) {
    std::lock_guard<std::mutex> lk(mu_);

    auto it = records_.find(record.trace_id);
    if (it != records_.end()) {
        it->second = record;
        return;
    }

    while (order_.size() >= capacity_) {
        records_.erase(order_.front());
        order_.pop_front();
    }
    order_.push_back(record.trace_id);
    records_.emplace(record.trace_id, record);
}

std::optional<TraceRecord> MemoryTraceStore::lookup(const std::string& trace_id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = records_.find(trace_id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

size_t MemoryTraceStore::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return records_.size();
}

} // namespace metatot

#include "trace/trace_recorder.hpp"
#include "trace/trace_codec.hpp"
#include "util/ids.hpp"
#include "util/logger.hpp"

#include <chrono>

namespace metatot {

TraceRecorder::TraceRecorder(std::shared_ptr<TraceStore> store, size_t fallback_capacity)
    : store_(std::move(store)), fallback_(fallback_capacity) {}

std::string TraceRecorder::persist(const Session& session) {
    TraceRecord record;
    record.trace_id = session.trace_id.empty() ? generateUuid() : session.trace_id;
    record.session_id = session.id;
    record.created_at = formatTimestamp(std::chrono::system_clock::now());
    record.payload = TraceCodec::encode(session);
    record.payload["trace_id"] = record.trace_id;

    if (store_) {
        try {
            store_->upsert(record);
            Logger::debug("trace", "Persisted trace " + record.trace_id + " to " + store_->name());
            return record.trace_id;
        } catch (const std::exception& e) {
            Logger::warn("trace", "Trace store " + store_->name() + " failed for " +
                                  record.trace_id + ", keeping it in memory: " + e.what());
        }
    }

    fallback_.upsert(record);
    return record.trace_id;
}

std::optional<TraceRecord> TraceRecorder::retrieveRecord(const std::string& trace_id) {
    if (store_) {
        try {
            if (auto record = store_->lookup(trace_id)) return record;
        } catch (const std::exception& e) {
            Logger::warn("trace", "Trace store lookup of " + trace_id + " failed: " + e.what());
        }
    }
    return fallback_.lookup(trace_id);
}

std::optional<nlohmann::json> TraceRecorder::retrieve(const std::string& trace_id) {
    auto record = retrieveRecord(trace_id);
    if (!record) return std::nullopt;
    return record->payload;
}

} // namespace metatot

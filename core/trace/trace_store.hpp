#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>

namespace metatot {

/// One archived session, keyed by trace_id.
struct TraceRecord {
    std::string trace_id;
    std::string session_id;
    std::string created_at;  // ISO-8601 UTC
    nlohmann::json payload;
};

/// Raised by stores on I/O or database failures.
class TraceStoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ─── Trace Store ───────────────────────────────────────────────
// Durable archive boundary. Implementations are shared across
// sessions and must be safe for concurrent use.

class TraceStore {
public:
    virtual ~TraceStore() = default;

    /// Insert, or replace the record with the same trace_id.
    /// Throws TraceStoreError on failure.
    virtual void upsert(const TraceRecord& record) = 0;

    /// Point lookup. Throws TraceStoreError on failure.
    virtual std::optional<TraceRecord> lookup(const std::string& trace_id) = 0;

    virtual std::string name() const = 0;
};

} // namespace metatot

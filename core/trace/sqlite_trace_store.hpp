#pragma once

#include "trace/trace_store.hpp"

#include <mutex>
#include <string>

struct sqlite3;

namespace metatot {

/// Durable store backed by a single SQLite table:
///   traces(trace_id TEXT PRIMARY KEY, session_id, created_at, payload)
/// Upserts use INSERT ... ON CONFLICT(trace_id) DO UPDATE.
class SqliteTraceStore : public TraceStore {
public:
    /// Opens (or creates) the database and the table.
    /// Throws TraceStoreError when either fails. ":memory:" works.
    explicit SqliteTraceStore(const std::string& path);
    ~SqliteTraceStore() override;

    SqliteTraceStore(const SqliteTraceStore&) = delete;
    SqliteTraceStore& operator=(const SqliteTraceStore&) = delete;

    void upsert(const TraceRecord& record) override;
    std::optional<TraceRecord> lookup(const std::string& trace_id) override;
    std::string name() const override { return "sqlite"; }

    const std::string& path() const { return path_; }

private:
    std::string path_;
    sqlite3* db_ = nullptr;
    std::mutex mu_;

    void exec(const char* sql);
};

} // namespace metatot

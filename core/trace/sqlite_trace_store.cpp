#include "trace/sqlite_trace_store.hpp"
#include "util/logger.hpp"

#include <sqlite3.h>

namespace metatot {

namespace {

// Finalizes the statement on every exit path.
struct Statement {
    sqlite3_stmt* stmt = nullptr;
    ~Statement() { if (stmt) sqlite3_finalize(stmt); }
};

std::string columnText(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? std::string(text) : std::string();
}

} // namespace

SqliteTraceStore::SqliteTraceStore(const std::string& path) : path_(path) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw TraceStoreError("Cannot open trace database " + path + ": " + msg);
    }

    try {
        exec("CREATE TABLE IF NOT EXISTS traces ("
             "  trace_id   TEXT PRIMARY KEY,"
             "  session_id TEXT NOT NULL,"
             "  created_at TEXT NOT NULL,"
             "  payload    TEXT NOT NULL)");
        exec("CREATE INDEX IF NOT EXISTS idx_traces_session ON traces(session_id)");
    } catch (const TraceStoreError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    Logger::debug("trace", "Opened trace database " + path);
}

SqliteTraceStore::~SqliteTraceStore() {
    if (db_) sqlite3_close(db_);
}

void SqliteTraceStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        throw TraceStoreError("SQLite error: " + msg);
    }
}

void SqliteTraceStore::upsert(const TraceRecord& record) {
    static const char* sql =
        "INSERT INTO traces (trace_id, session_id, created_at, payload) "
        "VALUES (?1, ?2, ?3, ?4) "
        "ON CONFLICT(trace_id) DO UPDATE SET "
        "  session_id = excluded.session_id,"
        "  created_at = excluded.created_at,"
        "  payload    = excluded.payload";

    // invalid UTF-8 from callers is stored as U+FFFD rather than failing the write
    std::string payload = record.payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    std::lock_guard<std::mutex> lk(mu_);
    Statement st;
    if (sqlite3_prepare_v2(db_, sql, -1, &st.stmt, nullptr) != SQLITE_OK) {
        throw TraceStoreError(std::string("Error preparing trace upsert: ") + sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(st.stmt, 1, record.trace_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st.stmt, 2, record.session_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st.stmt, 3, record.created_at.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st.stmt, 4, payload.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(st.stmt) != SQLITE_DONE) {
        throw TraceStoreError("Error writing trace " + record.trace_id + ": " + sqlite3_errmsg(db_));
    }
}

std::optional<TraceRecord> SqliteTraceStore::lookup(const std::string& trace_id) {
    static const char* sql =
        "SELECT trace_id, session_id, created_at, payload FROM traces WHERE trace_id = ?1";

    std::lock_guard<std::mutex> lk(mu_);
    Statement st;
    if (sqlite3_prepare_v2(db_, sql, -1, &st.stmt, nullptr) != SQLITE_OK) {
        throw TraceStoreError(std::string("Error preparing trace lookup: ") + sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(st.stmt, 1, trace_id.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(st.stmt);
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) {
        throw TraceStoreError("Error reading trace " + trace_id + ": " + sqlite3_errmsg(db_));
    }

    TraceRecord record;
    record.trace_id = columnText(st.stmt, 0);
    record.session_id = columnText(st.stmt, 1);
    record.created_at = columnText(st.stmt, 2);

    auto payload = nlohmann::json::parse(columnText(st.stmt, 3), nullptr, false);
    if (payload.is_discarded()) {
        throw TraceStoreError("Stored payload of trace " + trace_id + " is not valid JSON");
    }
    record.payload = std::move(payload);
    return record;
}

} // namespace metatot

/*
 * execd C++ - Execution History Store Implementation
 */
#include <execd/exec/history_store.hpp>
#include <execd/core/logger.hpp>
#include <execd/core/utils.hpp>

namespace execd {

namespace {

std::string column_text(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? std::string(text) : std::string();
}

ErrorCode parse_error_code(const std::string& name) {
    static const ErrorCode all[] = {
        ErrorCode::ValidationError, ErrorCode::Unauthorized, ErrorCode::NotFound,
        ErrorCode::PermissionDenied, ErrorCode::Timeout, ErrorCode::Cancelled,
        ErrorCode::KernelCrashed, ErrorCode::ExecutionFailed, ErrorCode::Conflict,
        ErrorCode::InternalError
    };
    for (size_t i = 0; i < sizeof(all) / sizeof(all[0]); ++i) {
        if (name == error_code_name(all[i])) return all[i];
    }
    return ErrorCode::None;
}

} // anonymous namespace

HistoryStore::HistoryStore() : db_(nullptr) {}

HistoryStore::~HistoryStore() {
    close();
}

bool HistoryStore::open(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }

    if (db_path != ":memory:" && !create_parent_directory(db_path)) {
        last_error_ = "cannot create parent directory for " + db_path;
        LOG_ERROR("[History] Failed to create parent directory for '%s'", db_path.c_str());
        return false;
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        last_error_ = db_ ? sqlite3_errmsg(db_) : "sqlite3_open failed";
        LOG_ERROR("[History] Failed to open database '%s': %s",
                  db_path.c_str(), last_error_.c_str());
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    exec_sql("PRAGMA journal_mode=WAL");
    exec_sql("PRAGMA synchronous=NORMAL");
    exec_sql("PRAGMA busy_timeout=5000");

    if (!init_tables()) {
        LOG_ERROR("[History] Failed to initialize tables");
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    LOG_INFO("[History] Database opened: %s", db_path.c_str());
    return true;
}

void HistoryStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool HistoryStore::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

std::string HistoryStore::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

bool HistoryStore::exec_sql(const std::string& sql) {
    if (!db_) return false;

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        last_error_ = err_msg ? err_msg : "unknown";
        LOG_ERROR("[History] SQL error: %s\n  Query: %s", last_error_.c_str(), sql.c_str());
        if (err_msg) sqlite3_free(err_msg);
        return false;
    }
    return true;
}

bool HistoryStore::init_tables() {
    bool ok = exec_sql(
        "CREATE TABLE IF NOT EXISTS executions ("
        "  id TEXT PRIMARY KEY,"
        "  sandbox_id TEXT DEFAULT '',"
        "  context_id TEXT DEFAULT '',"
        "  kind TEXT NOT NULL,"
        "  status TEXT NOT NULL,"
        "  has_exit_code INTEGER DEFAULT 0,"
        "  exit_code INTEGER DEFAULT 0,"
        "  execution_count INTEGER DEFAULT 0,"
        "  error_json TEXT DEFAULT '',"
        "  result_json TEXT DEFAULT '',"
        "  stdout_bytes INTEGER DEFAULT 0,"
        "  stderr_bytes INTEGER DEFAULT 0,"
        "  log_count INTEGER DEFAULT 0,"
        "  truncated INTEGER DEFAULT 0,"
        "  created_at INTEGER NOT NULL,"
        "  started_at INTEGER DEFAULT 0,"
        "  finished_at INTEGER NOT NULL"
        ")"
    );
    if (!ok) return false;

    return exec_sql("CREATE INDEX IF NOT EXISTS idx_executions_finished ON executions(finished_at)");
}

bool HistoryStore::record(const ExecutionSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;

    const char* sql =
        "INSERT OR REPLACE INTO executions (id, sandbox_id, context_id, kind, status, "
        "has_exit_code, exit_code, execution_count, error_json, result_json, "
        "stdout_bytes, stderr_bytes, log_count, truncated, created_at, started_at, finished_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        LOG_ERROR("[History] record prepare failed: %s", last_error_.c_str());
        return false;
    }

    std::string error_json = snapshot.error.empty() ? std::string() : json_dump(snapshot.error.to_json());
    std::string result_json = snapshot.result.is_null() ? std::string() : json_dump(snapshot.result);

    sqlite3_bind_text(stmt, 1, snapshot.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, snapshot.sandbox_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, snapshot.context_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, execution_kind_name(snapshot.kind), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, execution_status_name(snapshot.status), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 6, snapshot.has_exit_code ? 1 : 0);
    sqlite3_bind_int(stmt, 7, snapshot.exit_code);
    sqlite3_bind_int64(stmt, 8, snapshot.execution_count);
    sqlite3_bind_text(stmt, 9, error_json.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 10, result_json.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 11, snapshot.stdout_bytes);
    sqlite3_bind_int64(stmt, 12, snapshot.stderr_bytes);
    sqlite3_bind_int64(stmt, 13, snapshot.log_count);
    sqlite3_bind_int(stmt, 14, snapshot.truncated ? 1 : 0);
    sqlite3_bind_int64(stmt, 15, snapshot.created_at);
    sqlite3_bind_int64(stmt, 16, snapshot.started_at);
    sqlite3_bind_int64(stmt, 17, snapshot.finished_at);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        last_error_ = sqlite3_errmsg(db_);
        LOG_ERROR("[History] record step failed: %s", last_error_.c_str());
        return false;
    }
    return true;
}

bool HistoryStore::lookup(const std::string& id, ExecutionSnapshot& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;

    const char* sql =
        "SELECT id, sandbox_id, context_id, kind, status, has_exit_code, exit_code, "
        "execution_count, error_json, result_json, stdout_bytes, stderr_bytes, log_count, "
        "truncated, created_at, started_at, finished_at FROM executions WHERE id = ?";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return false;
    }
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);

    bool found = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        ExecutionSnapshot snap;
        snap.id = column_text(stmt, 0);
        snap.sandbox_id = column_text(stmt, 1);
        snap.context_id = column_text(stmt, 2);
        parse_execution_kind(column_text(stmt, 3), snap.kind);
        if (!parse_execution_status(column_text(stmt, 4), snap.status)) {
            snap.status = ExecutionStatus::Failed;
        }
        snap.has_exit_code = sqlite3_column_int(stmt, 5) != 0;
        snap.exit_code = sqlite3_column_int(stmt, 6);
        snap.execution_count = sqlite3_column_int64(stmt, 7);

        std::string error_json = column_text(stmt, 8);
        if (!error_json.empty()) {
            Json e = Json::parse(error_json, nullptr, false);
            if (e.is_object()) {
                snap.error.code = parse_error_code(e.value("code", std::string()));
                snap.error.ename = e.value("ename", std::string());
                snap.error.evalue = e.value("evalue", std::string());
                if (e.contains("traceback") && e["traceback"].is_array()) {
                    for (size_t i = 0; i < e["traceback"].size(); ++i) {
                        if (e["traceback"][i].is_string()) {
                            snap.error.traceback.push_back(e["traceback"][i].get<std::string>());
                        }
                    }
                }
            }
        }
        std::string result_json = column_text(stmt, 9);
        if (!result_json.empty()) {
            Json r = Json::parse(result_json, nullptr, false);
            if (!r.is_discarded()) snap.result = r;
        }

        snap.stdout_bytes = sqlite3_column_int64(stmt, 10);
        snap.stderr_bytes = sqlite3_column_int64(stmt, 11);
        snap.log_count = sqlite3_column_int64(stmt, 12);
        snap.truncated = sqlite3_column_int(stmt, 13) != 0;
        snap.created_at = sqlite3_column_int64(stmt, 14);
        snap.started_at = sqlite3_column_int64(stmt, 15);
        snap.finished_at = sqlite3_column_int64(stmt, 16);
        snap.archived = true;
        out = snap;
        found = true;
    }
    sqlite3_finalize(stmt);
    return found;
}

int HistoryStore::prune(int64_t cutoff_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return 0;

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, "DELETE FROM executions WHERE finished_at < ?", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        return 0;
    }
    sqlite3_bind_int64(stmt, 1, cutoff_ms);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        last_error_ = sqlite3_errmsg(db_);
        LOG_ERROR("[History] prune failed: %s", last_error_.c_str());
        return 0;
    }
    return sqlite3_changes(db_);
}

int HistoryStore::count() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return 0;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM executions", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    int n = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        n = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return n;
}

} // namespace execd

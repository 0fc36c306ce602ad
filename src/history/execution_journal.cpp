#include "history/execution_journal.hpp"

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace anabox::history {
namespace {

constexpr const char* kSelectColumns =
    "SELECT correlation_id, session_id, status, detail, code, exit_code, duration_ms, "
    "stdout_preview, stderr_preview, block_count, created_at FROM executions ";

// Owns a prepared statement for the duration of one call.
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            const std::string message = sqlite3_errmsg(db);
            sqlite3_finalize(stmt_);
            stmt_ = nullptr;
            throw JournalError("sqlite prepare failed: " + message);
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

}  // namespace

ExecutionJournal::ExecutionJournal(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {
    std::error_code ec;
    if (db_path_.has_parent_path()) {
        std::filesystem::create_directories(db_path_.parent_path(), ec);
    }
    if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
        const std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw JournalError("failed to open sqlite db " + db_path_.string() + ": " + message);
    }
    EnsureSchema();
}

ExecutionJournal::~ExecutionJournal() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void ExecutionJournal::Record(const ExecutionRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_,
        "INSERT INTO executions(correlation_id, session_id, status, detail, code, exit_code, "
        "duration_ms, stdout_preview, stderr_preview, block_count, created_at) "
        "VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    auto* s = stmt.get();
    sqlite3_bind_text(s, 1, record.correlation_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s, 2, record.session_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s, 3, record.status.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s, 4, record.detail.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s, 5, record.code.c_str(), -1, SQLITE_TRANSIENT);
    if (record.exit_code) {
        sqlite3_bind_int(s, 6, *record.exit_code);
    } else {
        sqlite3_bind_null(s, 6);
    }
    sqlite3_bind_int64(s, 7, record.duration_ms);
    sqlite3_bind_text(s, 8, record.stdout_preview.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(s, 9, record.stderr_preview.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(s, 10, record.block_count);
    sqlite3_bind_int64(s, 11, record.created_at_ms > 0 ? record.created_at_ms : utils::NowMs());
    if (sqlite3_step(s) != SQLITE_DONE) {
        throw JournalError(std::string("failed to record execution: ") + sqlite3_errmsg(db_));
    }
}

std::vector<ExecutionRecord> ExecutionJournal::ListRecent(std::size_t limit, const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = kSelectColumns;
    if (!session_id.empty()) {
        sql += "WHERE session_id = ? ";
    }
    sql += "ORDER BY created_at DESC, id DESC LIMIT ?;";
    Statement stmt(db_, sql);
    int index = 1;
    if (!session_id.empty()) {
        sqlite3_bind_text(stmt.get(), index++, session_id.c_str(), -1, SQLITE_TRANSIENT);
    }
    sqlite3_bind_int64(stmt.get(), index, static_cast<sqlite3_int64>(limit));

    std::vector<ExecutionRecord> records;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        auto* s = stmt.get();
        ExecutionRecord record;
        record.correlation_id = SafeText(sqlite3_column_text(s, 0));
        record.session_id = SafeText(sqlite3_column_text(s, 1));
        record.status = SafeText(sqlite3_column_text(s, 2));
        record.detail = SafeText(sqlite3_column_text(s, 3));
        record.code = SafeText(sqlite3_column_text(s, 4));
        if (sqlite3_column_type(s, 5) != SQLITE_NULL) {
            record.exit_code = sqlite3_column_int(s, 5);
        }
        record.duration_ms = sqlite3_column_int64(s, 6);
        record.stdout_preview = SafeText(sqlite3_column_text(s, 7));
        record.stderr_preview = SafeText(sqlite3_column_text(s, 8));
        record.block_count = sqlite3_column_int(s, 9);
        record.created_at_ms = sqlite3_column_int64(s, 10);
        records.push_back(std::move(record));
    }
    return records;
}

std::optional<ExecutionRecord> ExecutionJournal::Latest(const std::string& correlation_id) const {
    for (auto& record : ListRecent(1000)) {
        if (record.correlation_id == correlation_id) {
            return std::move(record);
        }
    }
    return std::nullopt;
}

int ExecutionJournal::CleanupOlderThan(std::chrono::hours age) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto cutoff = utils::NowMs() -
        std::chrono::duration_cast<std::chrono::milliseconds>(age).count();
    Statement stmt(db_, "DELETE FROM executions WHERE created_at < ?;");
    sqlite3_bind_int64(stmt.get(), 1, cutoff);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw JournalError(std::string("cleanup failed: ") + sqlite3_errmsg(db_));
    }
    const int removed = sqlite3_changes(db_);
    utils::LogInfo("journal", "removed " + std::to_string(removed) + " old execution records");
    return removed;
}

void ExecutionJournal::EnsureSchema() {
    Exec("PRAGMA journal_mode=WAL;");
    Exec("CREATE TABLE IF NOT EXISTS executions ("
         "id INTEGER PRIMARY KEY AUTOINCREMENT,"
         "correlation_id TEXT NOT NULL,"
         "session_id TEXT,"
         "status TEXT NOT NULL,"
         "detail TEXT,"
         "code TEXT,"
         "exit_code INTEGER,"
         "duration_ms INTEGER,"
         "stdout_preview TEXT,"
         "stderr_preview TEXT,"
         "block_count INTEGER,"
         "created_at INTEGER NOT NULL"
         ");");
    Exec("CREATE INDEX IF NOT EXISTS idx_executions_session ON executions(session_id);");
    Exec("CREATE INDEX IF NOT EXISTS idx_executions_created ON executions(created_at);");
}

void ExecutionJournal::Exec(const std::string& sql) {
    char* err = nullptr;
    const auto rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err ? err : "unknown error";
        sqlite3_free(err);
        throw JournalError("sqlite exec error: " + message);
    }
}

std::string ExecutionJournal::SafeText(const unsigned char* text) {
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

}  // namespace anabox::history

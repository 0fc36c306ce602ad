#pragma once

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "sqlite3.h"

namespace anabox::history {

class JournalError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ExecutionRecord {
    std::string correlation_id;
    std::string session_id;
    std::string status;
    std::string detail;
    std::string code;
    std::optional<int> exit_code;
    long long duration_ms = 0;
    std::string stdout_preview;
    std::string stderr_preview;
    int block_count = 0;
    long long created_at_ms = 0;
};

// SQLite log of finished executions, one row per submission.
class ExecutionJournal {
public:
    // Throws JournalError when the database cannot be opened.
    explicit ExecutionJournal(std::filesystem::path db_path);
    ~ExecutionJournal();

    ExecutionJournal(const ExecutionJournal&) = delete;
    ExecutionJournal& operator=(const ExecutionJournal&) = delete;

    // created_at_ms of 0 is replaced with the current time.
    void Record(const ExecutionRecord& record);

    // Newest first. An empty session_id lists every session.
    std::vector<ExecutionRecord> ListRecent(std::size_t limit, const std::string& session_id = "") const;
    std::optional<ExecutionRecord> Latest(const std::string& correlation_id) const;

    // Deletes records older than `age`; returns the number removed.
    int CleanupOlderThan(std::chrono::hours age);

    const std::filesystem::path& Path() const { return db_path_; }

private:
    void EnsureSchema();
    void Exec(const std::string& sql);
    static std::string SafeText(const unsigned char* text);

    std::filesystem::path db_path_;
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;
};

}  // namespace anabox::history

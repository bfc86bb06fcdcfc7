#include "database/job_database.hpp"
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "core/json_serialization.hpp"
#include "database/database_write_queue.hpp"
#include "logging/logger.hpp"

using json = nlohmann::json;

namespace
{
    const char *kCreateTablesSql = R"SQL(
        CREATE TABLE IF NOT EXISTS jobs (
            job_id TEXT PRIMARY KEY,
            video_id TEXT NOT NULL,
            user_id TEXT NOT NULL,
            style TEXT NOT NULL,
            status TEXT NOT NULL,
            progress INTEGER NOT NULL DEFAULT 0,
            error_message TEXT,
            retry_count INTEGER NOT NULL DEFAULT 0,
            created_at TEXT NOT NULL,
            updated_at TEXT NOT NULL
        );
        CREATE TABLE IF NOT EXISTS analysis_results (
            job_id TEXT PRIMARY KEY REFERENCES jobs(job_id) ON DELETE CASCADE,
            overall_score REAL NOT NULL,
            difficulty_score REAL NOT NULL,
            stability_score REAL NOT NULL,
            result_json TEXT NOT NULL,
            created_at TEXT NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_jobs_user ON jobs(user_id);
        CREATE INDEX IF NOT EXISTS idx_jobs_status ON jobs(status);
    )SQL";

    std::string columnText(sqlite3_stmt *stmt, int column)
    {
        const unsigned char *text = sqlite3_column_text(stmt, column);
        return text ? reinterpret_cast<const char *>(text) : "";
    }

    // Finalizes the statement when it goes out of scope
    class Statement
    {
    public:
        Statement(sqlite3 *db, const std::string &sql)
        {
            if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK)
            {
                std::string error = "Failed to prepare statement: " + std::string(sqlite3_errmsg(db));
                sqlite3_finalize(stmt_);
                stmt_ = nullptr;
                throw std::runtime_error(error);
            }
        }
        ~Statement() { sqlite3_finalize(stmt_); }
        Statement(const Statement &) = delete;
        Statement &operator=(const Statement &) = delete;

        sqlite3_stmt *get() const { return stmt_; }

    private:
        sqlite3_stmt *stmt_ = nullptr;
    };
}

JobDatabase::JobDatabase(const std::string &db_path) : db_path_(db_path)
{
    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK)
    {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        Logger::error("Failed to open database: " + error);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("failed to open database " + db_path_ + ": " + error);
    }

    DBOpResult wal = execute("PRAGMA journal_mode=WAL;");
    if (!wal.success)
        Logger::warn("Failed to enable WAL mode: " + wal.error_message);
    for (const char *pragma : {"PRAGMA synchronous=NORMAL;", "PRAGMA foreign_keys=ON;", "PRAGMA busy_timeout=5000;"})
    {
        DBOpResult applied = execute(pragma);
        if (!applied.success)
            Logger::warn("Failed to apply " + std::string(pragma) + ": " + applied.error_message);
    }

    initTables();
    write_queue_ = std::make_unique<DatabaseWriteQueue>(*this);
    Logger::info("Job database opened at " + db_path_);
}

JobDatabase::~JobDatabase()
{
    // Stop the writer first so queued writes land before the connection closes
    write_queue_.reset();
    if (db_)
    {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void JobDatabase::initTables()
{
    DBOpResult created = execute(kCreateTablesSql);
    if (!created.success)
        throw std::runtime_error("failed to create tables: " + created.error_message);
}

DBOpResult JobDatabase::execute(const std::string &sql)
{
    std::lock_guard<std::mutex> lock(db_mutex_);
    char *error = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error);
    if (rc != SQLITE_OK)
    {
        std::string message = error ? error : sqlite3_errmsg(db_);
        sqlite3_free(error);
        return DBOpResult(false, message);
    }
    return DBOpResult(true);
}

void JobDatabase::saveJob(const VideoJob &job, int retry_count)
{
    write_queue_->enqueue([job, retry_count](JobDatabase &db)
                          {
        DBOpResult result = db.upsertJob(job, retry_count);
        if (!result.success)
            Logger::error("Failed to persist job " + job.job_id + ": " + result.error_message); });
}

void JobDatabase::saveResult(const AnalysisResult &result)
{
    write_queue_->enqueue([result](JobDatabase &db)
                          {
        DBOpResult stored = db.insertResult(result);
        if (!stored.success)
            Logger::error("Failed to persist result of " + result.job_id + ": " + stored.error_message); });
}

void JobDatabase::waitForWrites()
{
    write_queue_->wait_for_completion();
}

DBOpResult JobDatabase::upsertJob(const VideoJob &job, int retry_count)
{
    const std::string sql =
        "INSERT INTO jobs (job_id, video_id, user_id, style, status, progress, error_message, retry_count, "
        "created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(job_id) DO UPDATE SET status = excluded.status, progress = excluded.progress, "
        "error_message = excluded.error_message, retry_count = excluded.retry_count, "
        "updated_at = excluded.updated_at";

    std::lock_guard<std::mutex> lock(db_mutex_);
    try
    {
        Statement stmt(db_, sql);
        const std::string status = JobStatuses::getStatusName(job.status);
        const std::string created_at = json_time::toIso8601(job.created_at);
        const std::string updated_at = json_time::toIso8601(job.updated_at);

        sqlite3_bind_text(stmt.get(), 1, job.job_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 2, job.video_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 3, job.user_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 4, job.style.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 5, status.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt.get(), 6, job.progress);
        if (job.error_message)
            sqlite3_bind_text(stmt.get(), 7, job.error_message->c_str(), -1, SQLITE_TRANSIENT);
        else
            sqlite3_bind_null(stmt.get(), 7);
        sqlite3_bind_int(stmt.get(), 8, retry_count);
        sqlite3_bind_text(stmt.get(), 9, created_at.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 10, updated_at.c_str(), -1, SQLITE_TRANSIENT);

        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
            return DBOpResult(false, "Failed to upsert job: " + std::string(sqlite3_errmsg(db_)));
    }
    catch (const std::exception &e)
    {
        return DBOpResult(false, e.what());
    }
    return DBOpResult(true);
}

DBOpResult JobDatabase::insertResult(const AnalysisResult &result)
{
    const std::string sql =
        "INSERT OR REPLACE INTO analysis_results (job_id, overall_score, difficulty_score, stability_score, "
        "result_json, created_at) VALUES (?, ?, ?, ?, ?, ?)";

    std::lock_guard<std::mutex> lock(db_mutex_);
    try
    {
        Statement stmt(db_, sql);
        const std::string document = json(result).dump();
        const std::string created_at = json_time::toIso8601(result.created_at);

        sqlite3_bind_text(stmt.get(), 1, result.job_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_double(stmt.get(), 2, result.overall_score);
        sqlite3_bind_double(stmt.get(), 3, result.difficulty_score);
        sqlite3_bind_double(stmt.get(), 4, result.stability_score);
        sqlite3_bind_text(stmt.get(), 5, document.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 6, created_at.c_str(), -1, SQLITE_TRANSIENT);

        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
            return DBOpResult(false, "Failed to insert result: " + std::string(sqlite3_errmsg(db_)));
    }
    catch (const std::exception &e)
    {
        return DBOpResult(false, e.what());
    }
    return DBOpResult(true);
}

std::vector<StoredJob> JobDatabase::loadJobs()
{
    std::vector<StoredJob> jobs;
    std::lock_guard<std::mutex> lock(db_mutex_);
    Statement stmt(db_, "SELECT job_id, video_id, user_id, style, status, progress, error_message, retry_count, "
                        "created_at, updated_at FROM jobs ORDER BY created_at");

    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
    {
        StoredJob stored;
        VideoJob &job = stored.job;
        job.job_id = columnText(stmt.get(), 0);
        job.video_id = columnText(stmt.get(), 1);
        job.user_id = columnText(stmt.get(), 2);
        job.style = columnText(stmt.get(), 3);

        auto status = JobStatuses::fromString(columnText(stmt.get(), 4));
        if (!status)
        {
            Logger::warn("Skipping job " + job.job_id + " with unknown status " + columnText(stmt.get(), 4));
            continue;
        }
        job.status = *status;
        job.progress = sqlite3_column_int(stmt.get(), 5);
        if (sqlite3_column_type(stmt.get(), 6) != SQLITE_NULL)
            job.error_message = columnText(stmt.get(), 6);
        stored.retry_count = sqlite3_column_int(stmt.get(), 7);
        job.created_at = json_time::fromIso8601(columnText(stmt.get(), 8));
        job.updated_at = json_time::fromIso8601(columnText(stmt.get(), 9));
        jobs.push_back(std::move(stored));
    }
    if (rc != SQLITE_DONE)
        throw std::runtime_error("Failed to load jobs: " + std::string(sqlite3_errmsg(db_)));
    return jobs;
}

std::vector<AnalysisResult> JobDatabase::loadResults()
{
    std::vector<AnalysisResult> results;
    std::lock_guard<std::mutex> lock(db_mutex_);
    Statement stmt(db_, "SELECT job_id, result_json FROM analysis_results");

    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
    {
        const std::string job_id = columnText(stmt.get(), 0);
        try
        {
            results.push_back(json::parse(columnText(stmt.get(), 1)).get<AnalysisResult>());
        }
        catch (const std::exception &e)
        {
            Logger::error("Skipping unreadable result of " + job_id + ": " + std::string(e.what()));
        }
    }
    if (rc != SQLITE_DONE)
        throw std::runtime_error("Failed to load results: " + std::string(sqlite3_errmsg(db_)));
    return results;
}

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <sqlite3.h>
#include "core/analysis_types.hpp"

class DatabaseWriteQueue;

/**
 * @brief Result of a database operation
 */
struct DBOpResult
{
    bool success;
    std::string error_message;
    DBOpResult(bool s = true, const std::string &msg = "") : success(s), error_message(msg) {}
};

/**
 * @brief Job row as persisted, with its retry counter
 */
struct StoredJob
{
    VideoJob job;
    int retry_count = 0;
};

/**
 * @brief SQLite persistence of jobs and analysis results
 *
 * Writes are queued and applied by a single background thread; reads run on
 * the caller's thread.
 */
class JobDatabase
{
public:
    /**
     * @brief Open (or create) the database and its schema
     * @throws std::runtime_error when the database cannot be opened
     */
    explicit JobDatabase(const std::string &db_path);
    ~JobDatabase();

    JobDatabase(const JobDatabase &) = delete;
    JobDatabase &operator=(const JobDatabase &) = delete;

    /**
     * @brief Queue an insert-or-update of the job row
     */
    void saveJob(const VideoJob &job, int retry_count);

    /**
     * @brief Queue an insert of a completed job's result
     */
    void saveResult(const AnalysisResult &result);

    /**
     * @brief Block until every queued write has been applied
     */
    void waitForWrites();

    std::vector<StoredJob> loadJobs();
    std::vector<AnalysisResult> loadResults();

    // Synchronous writers used by the write queue
    DBOpResult upsertJob(const VideoJob &job, int retry_count);
    DBOpResult insertResult(const AnalysisResult &result);

    const std::string &path() const { return db_path_; }

private:
    void initTables();
    DBOpResult execute(const std::string &sql);

    std::string db_path_;
    sqlite3 *db_ = nullptr;
    std::mutex db_mutex_;
    std::unique_ptr<DatabaseWriteQueue> write_queue_;
};

/**
 * @file WorkDispatcher.hpp
 * @brief Fixed worker pool that runs document processing jobs in the background.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "domain/JobStatus.hpp"
#include "domain/ProcessingOutcome.hpp"
#include "infrastructure/JobResultStore.hpp"

namespace findoc::application {

/**
 * @class WorkDispatcher
 * @brief Queue of (documentId, filePath) jobs consumed by a fixed set of worker threads.
 *
 * Job state lives in the JobResultStore, so status queries work from any
 * thread while jobs run. A job that throws ends in FAILURE with the
 * exception text; a job that returns ends in SUCCESS with its outcome.
 */
class WorkDispatcher {
public:
    using JobHandler = std::function<domain::ProcessingOutcome(std::int64_t documentId, const std::string& filePath)>;
    using AcceptedCallback = std::function<void(const std::string& jobId)>;

    struct Stats {
        std::size_t workers = 0;
        std::size_t queued = 0;
        std::size_t running = 0;
        std::size_t succeeded = 0;
        std::size_t failed = 0;
    };

    WorkDispatcher(std::size_t workerCount, JobHandler handler, std::shared_ptr<infrastructure::JobResultStore> results);
    ~WorkDispatcher();

    WorkDispatcher(const WorkDispatcher&) = delete;
    WorkDispatcher& operator=(const WorkDispatcher&) = delete;

    /**
     * @brief Accepts a job and returns its id.
     *
     * The job is registered as PENDING, then onAccepted runs on the calling
     * thread, and only then is the job queued. Nothing about the job can
     * complete before onAccepted returns.
     * @throws std::runtime_error after shutdown; whatever onAccepted throws
     * (the job is then forgotten and never runs).
     */
    std::string submit(std::int64_t documentId, const std::string& filePath, AcceptedCallback onAccepted = nullptr);

    /** @brief Current state of a job, std::nullopt for unknown ids. */
    std::optional<domain::JobStatus> getJobStatus(const std::string& jobId) const;

    /** @brief Blocks until no job is queued or running. */
    void waitIdle();

    /** @brief Runs the remaining queued jobs, then joins the workers. */
    void shutdown();

    Stats getStats() const;

private:
    struct Job {
        std::string jobId;
        std::int64_t documentId = 0;
        std::string filePath;
    };

    void workerLoop();
    void runJob(const Job& job);

    JobHandler m_handler;
    std::shared_ptr<infrastructure::JobResultStore> m_results;

    std::vector<std::thread> m_workers;
    std::queue<Job> m_queue;
    mutable std::mutex m_mutex;
    std::condition_variable m_queueCv;
    std::condition_variable m_idleCv;
    std::atomic<bool> m_shutdown{false};

    Stats m_stats;
};

} // namespace findoc::application

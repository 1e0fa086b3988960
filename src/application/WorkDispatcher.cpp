/**
 * @file WorkDispatcher.cpp
 * @brief Implementation of WorkDispatcher.
 */

#include "application/WorkDispatcher.hpp"
#include "infrastructure/IdGenerator.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace findoc::application {

WorkDispatcher::WorkDispatcher(std::size_t workerCount, JobHandler handler,
                               std::shared_ptr<infrastructure::JobResultStore> results)
    : m_handler(std::move(handler)), m_results(std::move(results)) {
    if (!m_handler) {
        throw std::invalid_argument("WorkDispatcher requires a job handler");
    }
    if (!m_results) {
        m_results = std::make_shared<infrastructure::JobResultStore>();
    }
    if (workerCount == 0) workerCount = 1;

    m_stats.workers = workerCount;
    for (std::size_t i = 0; i < workerCount; ++i) {
        m_workers.emplace_back(&WorkDispatcher::workerLoop, this);
    }
    std::cout << "[WorkDispatcher] Started with " << workerCount << " workers" << std::endl;
}

WorkDispatcher::~WorkDispatcher() {
    shutdown();
}

std::string WorkDispatcher::submit(std::int64_t documentId, const std::string& filePath, AcceptedCallback onAccepted) {
    if (m_shutdown) {
        throw std::runtime_error("WorkDispatcher is shut down");
    }

    domain::JobStatus status;
    status.jobId = infrastructure::IdGenerator::NewUuid();
    status.documentId = documentId;
    status.filePath = filePath;
    status.state = domain::JobState::Pending;
    status.submittedAt = std::chrono::system_clock::now();
    m_results->put(status);

    if (onAccepted) {
        try {
            onAccepted(status.jobId);
        } catch (const std::exception& e) {
            std::cerr << "[WorkDispatcher] Job " << status.jobId << " rejected: " << e.what() << std::endl;
            m_results->remove(status.jobId);
            throw;
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        // Checked again under the lock: the workers may have exited meanwhile.
        if (m_shutdown) {
            m_results->remove(status.jobId);
            throw std::runtime_error("WorkDispatcher is shut down");
        }
        m_queue.push(Job{status.jobId, documentId, filePath});
        m_stats.queued = m_queue.size();
    }
    m_queueCv.notify_one();

    std::cout << "[WorkDispatcher] Accepted job " << status.jobId << " for document " << documentId << std::endl;
    return status.jobId;
}

std::optional<domain::JobStatus> WorkDispatcher::getJobStatus(const std::string& jobId) const {
    return m_results->get(jobId);
}

WorkDispatcher::Stats WorkDispatcher::getStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

void WorkDispatcher::waitIdle() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCv.wait(lock, [this] { return m_queue.empty() && m_stats.running == 0; });
}

void WorkDispatcher::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) return;
        m_shutdown = true;
    }
    m_queueCv.notify_all();

    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkDispatcher::workerLoop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_queueCv.wait(lock, [this] { return m_shutdown || !m_queue.empty(); });

            if (m_queue.empty()) {
                // Only reachable on shutdown with nothing left to run.
                return;
            }

            job = std::move(m_queue.front());
            m_queue.pop();
            m_stats.queued = m_queue.size();
            ++m_stats.running;
        }

        runJob(job);

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_stats.running;
        }
        m_idleCv.notify_all();
    }
}

void WorkDispatcher::runJob(const Job& job) {
    auto status = m_results->get(job.jobId).value_or(domain::JobStatus{});
    status.jobId = job.jobId;
    status.documentId = job.documentId;
    status.filePath = job.filePath;
    status.state = domain::JobState::Started;
    m_results->put(status);
    std::cout << "[WorkDispatcher] Job " << job.jobId << " started for document " << job.documentId << std::endl;

    auto start = std::chrono::steady_clock::now();
    bool ok = false;
    try {
        status.result = m_handler(job.documentId, job.filePath);
        status.state = domain::JobState::Success;
        ok = true;
    } catch (const std::exception& e) {
        status.state = domain::JobState::Failure;
        status.errorMessage = e.what();
        std::cerr << "[WorkDispatcher] Job " << job.jobId << " failed: " << e.what() << std::endl;
    } catch (...) {
        status.state = domain::JobState::Failure;
        status.errorMessage = "Unknown error during job execution.";
        std::cerr << "[WorkDispatcher] Job " << job.jobId << " failed with a non-standard exception" << std::endl;
    }
    status.finishedAt = std::chrono::system_clock::now();
    m_results->put(status);

    auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    if (ok) {
        std::cout << "[WorkDispatcher] Job " << job.jobId << " finished ("
                  << domain::OutcomeToString(status.result->kind) << ") in " << elapsedMs << "ms" << std::endl;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (ok) ++m_stats.succeeded;
    else ++m_stats.failed;
}

} // namespace findoc::application

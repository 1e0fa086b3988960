/**
 * @file JobResultStore.hpp
 * @brief Key-value store of background job states and results.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "domain/JobStatus.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace findoc::infrastructure {

/**
 * @class JobResultStore
 * @brief Thread-safe job id -> JobStatus map.
 *
 * The in-memory map is authoritative. With a jobs directory, every change is
 * mirrored to <jobsPath>/<jobId>.json through the background writer, so the
 * disk copy trails the map by at most the queued writes.
 */
class JobResultStore {
public:
    /** @brief Memory-only store. */
    JobResultStore() = default;

    JobResultStore(std::string jobsPath, std::shared_ptr<PersistenceService> persistence);

    void put(const domain::JobStatus& status);
    std::optional<domain::JobStatus> get(const std::string& jobId) const;

    /** @brief Forgets a job. Returns false if it was unknown. */
    bool remove(const std::string& jobId);

    /**
     * @brief Loads job files written by earlier runs.
     * Unreadable files are reported and skipped.
     * @return Number of jobs loaded.
     */
    std::size_t load();

    std::size_t size() const;

private:
    std::string m_jobsPath;
    std::shared_ptr<PersistenceService> m_persistence;
    mutable std::mutex m_mutex;
    std::map<std::string, domain::JobStatus> m_jobs;

    std::string jobFilePath(const std::string& jobId) const;
};

} // namespace findoc::infrastructure

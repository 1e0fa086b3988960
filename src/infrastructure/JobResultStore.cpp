/**
 * @file JobResultStore.cpp
 * @brief Implementation of JobResultStore.
 */

#include "infrastructure/JobResultStore.hpp"
#include "infrastructure/JsonMapping.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

namespace findoc::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

JobResultStore::JobResultStore(std::string jobsPath, std::shared_ptr<PersistenceService> persistence)
    : m_jobsPath(std::move(jobsPath)), m_persistence(std::move(persistence)) {
    if (!fs::exists(m_jobsPath)) {
        fs::create_directories(m_jobsPath);
    }
}

std::string JobResultStore::jobFilePath(const std::string& jobId) const {
    return (fs::path(m_jobsPath) / (jobId + ".json")).string();
}

void JobResultStore::put(const domain::JobStatus& status) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_jobs[status.jobId] = status;
    // Queued under the lock so the file sees changes in map order.
    if (m_persistence && !m_jobsPath.empty()) {
        json j = status;
        m_persistence->saveTextAsync(jobFilePath(status.jobId), j.dump(2));
    }
}

std::optional<domain::JobStatus> JobResultStore::get(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end()) return std::nullopt;
    return it->second;
}

bool JobResultStore::remove(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_jobs.erase(jobId) == 0) return false;
    if (m_persistence && !m_jobsPath.empty()) {
        m_persistence->removeAsync(jobFilePath(jobId));
    }
    return true;
}

std::size_t JobResultStore::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_jobs.size();
}

std::size_t JobResultStore::load() {
    if (m_jobsPath.empty() || !fs::exists(m_jobsPath)) return 0;

    std::lock_guard<std::mutex> lock(m_mutex);
    std::size_t loaded = 0;
    for (const auto& entry : fs::directory_iterator(m_jobsPath)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
        try {
            std::ifstream f(entry.path());
            json j = json::parse(f);
            auto status = j.get<domain::JobStatus>();
            m_jobs[status.jobId] = std::move(status);
            ++loaded;
        } catch (const std::exception& e) {
            std::cerr << "[JobResultStore] Skipping " << entry.path().string() << ": " << e.what() << std::endl;
        }
    }
    return loaded;
}

} // namespace findoc::infrastructure

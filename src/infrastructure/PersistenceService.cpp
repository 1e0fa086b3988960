/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include "domain/DocumentRepository.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <system_error>

namespace findoc::infrastructure {

namespace fs = std::filesystem;

PersistenceService::PersistenceService() : m_running(true) {
    m_worker = std::thread(&PersistenceService::workerLoop, this);
}

PersistenceService::~PersistenceService() {
    stop();
}

void PersistenceService::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void PersistenceService::saveTextAsync(const std::string& filename, const std::string& content) {
    enqueue(SaveTask{SaveTask::Kind::Write, filename, content});
}

void PersistenceService::removeAsync(const std::string& filename) {
    enqueue(SaveTask{SaveTask::Kind::Remove, filename, {}});
}

void PersistenceService::enqueue(SaveTask task) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            std::cerr << "[PersistenceService] Dropping operation after stop: " << task.filename << std::endl;
            return;
        }
        m_queue.push(std::move(task));
    }
    m_cv.notify_one();
}

void PersistenceService::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCv.wait(lock, [this] { return m_queue.empty() && m_inFlight == 0; });
}

void PersistenceService::workerLoop() {
    while (true) {
        SaveTask task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                m_idleCv.notify_all();
                return;
            }

            if (m_queue.empty()) {
                continue; // Spurious wake up
            }

            task = std::move(m_queue.front());
            m_queue.pop();
            ++m_inFlight;
        }

        // Process outside lock
        performTask(task);

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_inFlight;
        }
        m_idleCv.notify_all();
    }
}

void PersistenceService::performTask(const SaveTask& task) {
    try {
        if (task.kind == SaveTask::Kind::Remove) {
            std::error_code ec;
            fs::remove(task.filename, ec);
            if (ec) {
                std::cerr << "[PersistenceService] Remove failed for " << task.filename << ": " << ec.message() << std::endl;
            }
            return;
        }
        writeAtomic(task.filename, task.content);
    } catch (const std::exception& e) {
        // Nobody waits on a queued write; the error is reported here.
        std::cerr << "[PersistenceService] " << e.what() << std::endl;
    }
}

std::string PersistenceService::writeTempFile(const std::string& filename, const std::string& content) {
    fs::path finalPath = filename;

    // Unique per call: filename.<timestamp>.<thread>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto threadTag = std::hash<std::thread::id>{}(std::this_thread::get_id());
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + "." + std::to_string(threadTag) + ".tmp";

    // 1. Ensure directory exists
    std::error_code ec;
    if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path(), ec)) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            throw domain::PersistenceError("Error creating directories for " + filename + ": " + ec.message());
        }
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw domain::PersistenceError("Failed to open temp file: " + tempPath.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            fs::remove(tempPath, ec);
            throw domain::PersistenceError("Write failed during output: " + tempPath.string());
        }
    } // Close happens here automatically

    return tempPath.string();
}

void PersistenceService::writeAtomic(const std::string& filename, const std::string& content) {
    fs::path tempPath = writeTempFile(filename, content);

    // 3. Atomic Rename
    std::error_code ec;
    fs::rename(tempPath, filename, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        throw domain::PersistenceError("Rename failed for " + filename + ": " + ec.message());
    }
}

bool PersistenceService::createExclusive(const std::string& filename, const std::string& content) {
    fs::path tempPath = writeTempFile(filename, content);

    // A hard link never replaces an existing target, unlike rename.
    std::error_code ec;
    fs::create_hard_link(tempPath, filename, ec);
    std::error_code cleanup;
    fs::remove(tempPath, cleanup);

    if (ec == std::errc::file_exists) {
        return false;
    }
    if (ec) {
        throw domain::PersistenceError("Link failed for " + filename + ": " + ec.message());
    }
    return true;
}

} // namespace findoc::infrastructure

/**
 * @file PersistenceService.hpp
 * @brief Centralized service for atomic file I/O, synchronous or serialized in the background.
 */

#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>

namespace findoc::infrastructure {

/**
 * @struct SaveTask
 * @brief Represents a single queued file operation.
 */
struct SaveTask {
    enum class Kind { Write, Remove };

    Kind kind = Kind::Write;
    std::string filename;
    std::string content;
};

/**
 * @class PersistenceService
 * @brief Performs atomic file writes (temp -> rename).
 *
 * Callers that need durability before continuing use writeAtomic(). Callers
 * that only need eventual durability queue work with saveTextAsync() and
 * removeAsync(); queued operations run in submission order on one
 * background thread, so a later write or removal of the same file always wins.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Writes content to filename atomically and returns once it is on disk.
     * @throws domain::PersistenceError if any step fails. The target is left untouched then.
     */
    void writeAtomic(const std::string& filename, const std::string& content);

    /**
     * @brief Creates filename with content only if it does not exist yet.
     * The file appears complete or not at all.
     * @return False when filename already exists; it is left untouched.
     * @throws domain::PersistenceError on any other failure.
     */
    bool createExclusive(const std::string& filename, const std::string& content);

    /**
     * @brief Asynchronously queues a text content to be saved to a file.
     * @param filename Absolute path to the file.
     * @param content The string content to write.
     */
    void saveTextAsync(const std::string& filename, const std::string& content);

    /** @brief Asynchronously queues the removal of a file. */
    void removeAsync(const std::string& filename);

    /** @brief Blocks until every queued operation has been performed. */
    void flush();

    /**
     * @brief Stops the worker thread and ensures all pending tasks are processed.
     */
    void stop();

private:
    void workerLoop();
    void performTask(const SaveTask& task);
    void enqueue(SaveTask task);
    std::string writeTempFile(const std::string& filename, const std::string& content);

    std::queue<SaveTask> m_queue;
    std::size_t m_inFlight = 0;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;

    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace findoc::infrastructure

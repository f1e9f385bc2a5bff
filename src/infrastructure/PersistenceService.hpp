/**
 * @file PersistenceService.hpp
 * @brief Centralized service for serialized, atomic file I/O operations.
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <future>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace deskpal::infrastructure {

/**
 * @struct SaveTask
 * @brief Represents a single file write operation.
 */
struct SaveTask {
    std::filesystem::path filename;
    std::string content;
    std::promise<void> done; ///< Fulfilled once the file is in place, or carries the StorageError.
};

/**
 * @class PersistenceService
 * @brief Manages a background thread that performs atomic file writes sequentially.
 *
 * All document writes pass through a single serialized queue, so two writers
 * never race on the same file. Each write goes to a temporary sibling file
 * which is then renamed over the target: readers see the old document or the
 * new one, never a partial one.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Queues a text content to be saved to a file.
     * @param filename Absolute path to the file.
     * @param content The string content to write.
     * @return Future that becomes ready when the write is committed; get() rethrows StorageError.
     */
    std::future<void> saveTextAsync(const std::filesystem::path& filename, std::string content);

    /**
     * @brief Saves and waits for the commit.
     * @throws domain::StorageError if the file could not be written.
     */
    void saveText(const std::filesystem::path& filename, std::string content);

    /**
     * @brief Stops the worker thread and ensures all pending tasks are processed.
     */
    void stop();

    /**
     * @brief Performs the actual atomic write (temp -> rename) on the calling thread.
     * @throws domain::StorageError on any failure; the target is left untouched.
     */
    static void WriteAtomically(const std::filesystem::path& filename, const std::string& content);

private:
    /**
     * @brief The main loop running in the background thread.
     */
    void workerLoop();

    // Thread Safety
    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;

    // Worker Control
    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace deskpal::infrastructure

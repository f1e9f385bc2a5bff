/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include "domain/AssistantErrors.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <system_error>

namespace deskpal::infrastructure {

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

std::future<void> PersistenceService::saveTextAsync(const fs::path& filename, std::string content) {
    SaveTask task;
    task.filename = filename;
    task.content = std::move(content);
    std::future<void> result = task.done.get_future();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            task.done.set_exception(std::make_exception_ptr(
                domain::StorageError("Persistence stopped; cannot write " + filename.string())));
            return result;
        }
        m_queue.push(std::move(task));
    }
    m_cv.notify_one();
    return result;
}

void PersistenceService::saveText(const fs::path& filename, std::string content) {
    saveTextAsync(filename, std::move(content)).get();
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
                return; // Exit point
            }

            if (m_queue.empty()) {
                continue; // Spurious wake up
            }

            task = std::move(m_queue.front());
            m_queue.pop();
        }

        // Process outside lock
        try {
            WriteAtomically(task.filename, task.content);
            task.done.set_value();
        } catch (const std::exception&) {
            task.done.set_exception(std::current_exception());
        }
    }
}

void PersistenceService::WriteAtomically(const fs::path& filename, const std::string& content) {
    const fs::path& finalPath = filename;

    // Create unique temp path: filename.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    // 1. Ensure directory exists
    std::error_code ec;
    if (finalPath.has_parent_path()) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            std::cerr << "[PersistenceService] Error creating directories: " << ec.message() << std::endl;
            throw domain::StorageError("Cannot create directory for " + finalPath.string() + ": " + ec.message());
        }
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            std::cerr << "[PersistenceService] Failed to open temp file: " << tempPath << std::endl;
            throw domain::StorageError("Cannot open temporary file " + tempPath.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[PersistenceService] Write failed during output: " << tempPath << std::endl;
            ofs.close();
            fs::remove(tempPath, ec);
            throw domain::StorageError("Write failed for " + tempPath.string());
        }
    } // Close happens here automatically

    // 3. Atomic Rename
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[PersistenceService] Rename failed: " << ec.message() << std::endl;
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        throw domain::StorageError("Cannot replace " + finalPath.string() + ": " + ec.message());
    }
}

} // namespace deskpal::infrastructure

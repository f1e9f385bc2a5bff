/**
 * @file RecordStore.cpp
 * @brief Implementation of RecordStore.
 */

#include "infrastructure/RecordStore.hpp"
#include "domain/AssistantErrors.hpp"
#include <exception>
#include <system_error>

namespace deskpal::infrastructure {

RecordStore::RecordStore(const std::filesystem::path& dataDir, std::shared_ptr<PersistenceService> persistence)
    : m_dataDir(dataDir),
      m_persistence(persistence ? std::move(persistence) : std::make_shared<PersistenceService>()) {
    m_tasks = makeCollection<domain::Task>();
    m_habits = makeCollection<domain::Habit>();
    m_notes = makeCollection<domain::Note>();
    m_reminders = makeCollection<domain::Reminder>();
}

void RecordStore::load() {
    std::error_code ec;
    std::filesystem::create_directories(m_dataDir, ec);
    if (ec) {
        throw domain::StorageError("Cannot create data directory " + m_dataDir.string() + ": " + ec.message());
    }

    // Every collection gets its load attempt so none is left unread; the first failure is reported.
    std::exception_ptr firstFailure;
    auto attempt = [&firstFailure](auto& collection) {
        try {
            collection->load();
        } catch (const std::exception&) {
            if (!firstFailure) {
                firstFailure = std::current_exception();
            }
        }
    };
    attempt(m_tasks);
    attempt(m_habits);
    attempt(m_notes);
    attempt(m_reminders);

    if (firstFailure) {
        std::rethrow_exception(firstFailure);
    }
}

domain::RecordRepositories RecordStore::repositories() const {
    domain::RecordRepositories repos;
    repos.tasks = m_tasks;
    repos.habits = m_habits;
    repos.notes = m_notes;
    repos.reminders = m_reminders;
    return repos;
}

} // namespace deskpal::infrastructure

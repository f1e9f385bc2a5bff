/**
 * @file RecordStore.hpp
 * @brief Opens the four record collections of a data directory.
 */

#pragma once

#include <filesystem>
#include <memory>
#include "domain/RecordRepository.hpp"
#include "infrastructure/JsonRecordCollection.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace deskpal::infrastructure {

/**
 * @class RecordStore
 * @brief Owner of every persisted record: tasks, habits, notes and reminders.
 *
 * Each kind is an independent JSON document in the data directory, written
 * through one shared PersistenceService.
 */
class RecordStore {
public:
    /**
     * @param dataDir Directory holding tasks.json, habits.json, notes.json and reminders.json.
     * @param persistence Writer to use; a private one is created when null.
     */
    explicit RecordStore(const std::filesystem::path& dataDir,
                         std::shared_ptr<PersistenceService> persistence = nullptr);

    /**
     * @brief Creates the data directory if needed and loads every collection.
     * @throws domain::CorruptStoreError naming the first malformed document. Collections that
     *         loaded stay usable; the failed ones refuse changes until they load.
     */
    void load();

    /** @brief Shared handles on the collections, for the application services. */
    domain::RecordRepositories repositories() const;

    const std::filesystem::path& dataDir() const { return m_dataDir; }

    JsonRecordCollection<domain::Task>& tasks() { return *m_tasks; }
    JsonRecordCollection<domain::Habit>& habits() { return *m_habits; }
    JsonRecordCollection<domain::Note>& notes() { return *m_notes; }
    JsonRecordCollection<domain::Reminder>& reminders() { return *m_reminders; }

private:
    template <typename Record>
    std::shared_ptr<JsonRecordCollection<Record>> makeCollection() const {
        return std::make_shared<JsonRecordCollection<Record>>(
            m_dataDir / RecordTraits<Record>::DocumentName, m_persistence);
    }

    std::filesystem::path m_dataDir;
    std::shared_ptr<PersistenceService> m_persistence;
    std::shared_ptr<JsonRecordCollection<domain::Task>> m_tasks;
    std::shared_ptr<JsonRecordCollection<domain::Habit>> m_habits;
    std::shared_ptr<JsonRecordCollection<domain::Note>> m_notes;
    std::shared_ptr<JsonRecordCollection<domain::Reminder>> m_reminders;
};

} // namespace deskpal::infrastructure

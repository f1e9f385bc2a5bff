/**
 * @file RecordSerialization.hpp
 * @brief JSON mapping of the persisted record kinds.
 */

#pragma once

#include <nlohmann/json.hpp>
#include "domain/Habit.hpp"
#include "domain/Note.hpp"
#include "domain/Reminder.hpp"
#include "domain/Task.hpp"

namespace deskpal::infrastructure {

/**
 * @struct RecordTraits
 * @brief Per-kind document name and JSON codec used by JsonRecordCollection.
 *
 * `decode` throws (nlohmann::json::exception or std::invalid_argument) on a
 * missing or mistyped field; the collection reports that as a corrupt store.
 */
template <typename Record>
struct RecordTraits;

template <>
struct RecordTraits<domain::Task> {
    static constexpr const char* Kind = "Task";
    static constexpr const char* DocumentName = "tasks.json";
    static nlohmann::json encode(const domain::Task& task);
    static domain::Task decode(const nlohmann::json& j);
};

template <>
struct RecordTraits<domain::Habit> {
    static constexpr const char* Kind = "Habit";
    static constexpr const char* DocumentName = "habits.json";
    static nlohmann::json encode(const domain::Habit& habit);
    static domain::Habit decode(const nlohmann::json& j);
};

template <>
struct RecordTraits<domain::Note> {
    static constexpr const char* Kind = "Note";
    static constexpr const char* DocumentName = "notes.json";
    static nlohmann::json encode(const domain::Note& note);
    static domain::Note decode(const nlohmann::json& j);
};

template <>
struct RecordTraits<domain::Reminder> {
    static constexpr const char* Kind = "Reminder";
    static constexpr const char* DocumentName = "reminders.json";
    static nlohmann::json encode(const domain::Reminder& reminder);
    static domain::Reminder decode(const nlohmann::json& j);
};

} // namespace deskpal::infrastructure

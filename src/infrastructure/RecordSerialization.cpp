/**
 * @file RecordSerialization.cpp
 * @brief Implementation of the RecordTraits codecs.
 */

#include "infrastructure/RecordSerialization.hpp"
#include <cstdint>
#include <limits>
#include <string>
#include <stdexcept>

namespace deskpal::infrastructure {

using json = nlohmann::json;
using namespace deskpal::domain;

namespace {

// Since we don't have reflection, manual JSON mapping here.

RecordId ReadId(const json& j) {
    if (!j.at("id").is_number_unsigned()) {
        throw std::invalid_argument("id is not an unsigned integer");
    }
    return j.at("id").get<RecordId>();
}

Timestamp ToTimestamp(const json& value, const char* key) {
    if (!value.is_number_integer()) {
        throw std::invalid_argument(std::string(key) + " is not an integer");
    }
    if (value.is_number_unsigned() &&
        value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        throw std::invalid_argument(std::string(key) + " is out of range");
    }
    return FromEpochMillis(value.get<std::int64_t>());
}

Timestamp ReadTimestamp(const json& j, const char* key) {
    return ToTimestamp(j.at(key), key);
}

void RequireObject(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("record is not an object");
    }
}

} // namespace

json RecordTraits<Task>::encode(const Task& task) {
    json j = {
        {"id", task.id},
        {"title", task.title},
        {"done", task.done},
        {"created_at", ToEpochMillis(task.createdAt)},
        {"due_at", nullptr}
    };
    if (task.dueAt) {
        j["due_at"] = ToEpochMillis(*task.dueAt);
    }
    return j;
}

Task RecordTraits<Task>::decode(const json& j) {
    RequireObject(j);
    Task task;
    task.id = ReadId(j);
    task.title = j.at("title").get<std::string>();
    task.done = j.at("done").get<bool>();
    task.createdAt = ReadTimestamp(j, "created_at");
    auto due = j.find("due_at");
    if (due != j.end() && !due->is_null()) {
        task.dueAt = ToTimestamp(*due, "due_at");
    }
    return task;
}

json RecordTraits<Habit>::encode(const Habit& habit) {
    json completions = json::array();
    for (const auto& date : habit.completions) {
        completions.push_back(date.toString());
    }
    return {
        {"id", habit.id},
        {"name", habit.name},
        {"created_at", ToEpochMillis(habit.createdAt)},
        {"completions", completions}
    };
}

Habit RecordTraits<Habit>::decode(const json& j) {
    RequireObject(j);
    Habit habit;
    habit.id = ReadId(j);
    habit.name = j.at("name").get<std::string>();
    habit.createdAt = ReadTimestamp(j, "created_at");
    const json& completions = j.at("completions");
    if (!completions.is_array()) {
        throw std::invalid_argument("completions is not an array");
    }
    for (const auto& entry : completions) {
        if (!habit.completions.insert(CalendarDate::Parse(entry.get<std::string>())).second) {
            throw std::invalid_argument("duplicate completion date " + entry.get<std::string>());
        }
    }
    return habit;
}

json RecordTraits<Note>::encode(const Note& note) {
    return {
        {"id", note.id},
        {"text", note.text},
        {"created_at", ToEpochMillis(note.createdAt)},
        {"updated_at", ToEpochMillis(note.updatedAt)}
    };
}

Note RecordTraits<Note>::decode(const json& j) {
    RequireObject(j);
    Note note;
    note.id = ReadId(j);
    note.text = j.at("text").get<std::string>();
    note.createdAt = ReadTimestamp(j, "created_at");
    note.updatedAt = ReadTimestamp(j, "updated_at");
    return note;
}

json RecordTraits<Reminder>::encode(const Reminder& reminder) {
    return {
        {"id", reminder.id},
        {"message", reminder.message},
        {"fire_at", ToEpochMillis(reminder.fireAt)},
        {"fired", reminder.fired}
    };
}

Reminder RecordTraits<Reminder>::decode(const json& j) {
    RequireObject(j);
    Reminder reminder;
    reminder.id = ReadId(j);
    reminder.message = j.at("message").get<std::string>();
    reminder.fireAt = ReadTimestamp(j, "fire_at");
    reminder.fired = j.at("fired").get<bool>();
    return reminder;
}

} // namespace deskpal::infrastructure

/**
 * @file Task.hpp
 * @brief Domain entity representing a to-do item.
 */

#pragma once

#include <optional>
#include <string>
#include "RecordId.hpp"
#include "Timestamp.hpp"

namespace deskpal::domain {

/**
 * @struct Task
 * @brief A to-do item. `done` may be toggled any number of times.
 */
struct Task {
    RecordId id = 0;                ///< Assigned by the store.
    std::string title;              ///< Never blank.
    bool done = false;
    Timestamp createdAt{};
    std::optional<Timestamp> dueAt; ///< Absent when the task has no deadline.
};

/**
 * @struct TaskUpdate
 * @brief Partial update of a task; unset fields are left untouched.
 */
struct TaskUpdate {
    std::optional<std::string> title;
    std::optional<bool> done;
    std::optional<Timestamp> dueAt;
    bool clearDueAt = false; ///< Removes the deadline; wins over `dueAt`.
};

} // namespace deskpal::domain

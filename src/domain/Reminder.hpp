/**
 * @file Reminder.hpp
 * @brief Domain entity for a one-shot timed reminder.
 */

#pragma once

#include <string>
#include "RecordId.hpp"
#include "Timestamp.hpp"

namespace deskpal::domain {

/**
 * @struct Reminder
 * @brief Delivered at most once: after `fired` is set it is only re-armed by a reschedule.
 */
struct Reminder {
    RecordId id = 0;
    std::string message;
    Timestamp fireAt{};
    bool fired = false;

    /** @brief True when the reminder is due for delivery at `now`. */
    bool isDue(Timestamp now) const { return !fired && fireAt <= now; }
};

} // namespace deskpal::domain

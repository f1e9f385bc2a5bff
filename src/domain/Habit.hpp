/**
 * @file Habit.hpp
 * @brief Domain entity for a daily habit and its completion history.
 */

#pragma once

#include <set>
#include <string>
#include "CalendarDate.hpp"
#include "RecordId.hpp"
#include "Timestamp.hpp"

namespace deskpal::domain {

/**
 * @struct Habit
 * @brief A habit with the set of days on which it was done.
 */
struct Habit {
    RecordId id = 0;
    std::string name;
    Timestamp createdAt{};
    std::set<CalendarDate> completions; ///< Each day at most once, ascending.
};

/**
 * @brief Counts consecutive completed days ending at `today`.
 *
 * Walks backwards from `today` and stops at the first missing day, so the
 * result is 0 when `today` itself is not completed. Completions after
 * `today` are ignored.
 */
int ComputeStreak(const Habit& habit, CalendarDate today);

} // namespace deskpal::domain

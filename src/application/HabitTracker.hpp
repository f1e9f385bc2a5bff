/**
 * @file HabitTracker.hpp
 * @brief Application Service for habit completions and streaks.
 */

#pragma once

#include <memory>
#include "domain/Habit.hpp"
#include "domain/RecordRepository.hpp"

namespace deskpal::application {

/**
 * @class HabitTracker
 * @brief Marks habits done per calendar day and derives streaks.
 *
 * "Today" is always supplied by the caller; nothing here reads the clock.
 * Dates in the future are accepted.
 */
class HabitTracker {
public:
    explicit HabitTracker(std::shared_ptr<domain::RecordRepository<domain::Habit>> habits);

    /**
     * @brief Records a completion. Marking the same day twice is a no-op.
     * @throws domain::NotFoundError for an unknown habit.
     */
    domain::Habit markDone(domain::RecordId habitId, domain::CalendarDate date);

    /** @brief Removes a completion; a day that was not marked is left alone. */
    domain::Habit unmark(domain::RecordId habitId, domain::CalendarDate date);

    /** @brief Consecutive completed days ending at `today`; 0 if today is not done. */
    int streak(domain::RecordId habitId, domain::CalendarDate today) const;

    bool completedOn(domain::RecordId habitId, domain::CalendarDate date) const;

private:
    std::shared_ptr<domain::RecordRepository<domain::Habit>> m_habits;
};

} // namespace deskpal::application

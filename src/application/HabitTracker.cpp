#include "application/HabitTracker.hpp"

namespace deskpal::application {

using namespace deskpal::domain;

HabitTracker::HabitTracker(std::shared_ptr<RecordRepository<Habit>> habits)
    : m_habits(std::move(habits)) {}

Habit HabitTracker::markDone(RecordId habitId, CalendarDate date) {
    auto current = m_habits->get(habitId);
    if (current.completions.count(date) != 0) {
        return current;
    }
    return m_habits->update(habitId, [date](Habit& habit) {
        habit.completions.insert(date);
    });
}

Habit HabitTracker::unmark(RecordId habitId, CalendarDate date) {
    auto current = m_habits->get(habitId);
    if (current.completions.count(date) == 0) {
        return current;
    }
    return m_habits->update(habitId, [date](Habit& habit) {
        habit.completions.erase(date);
    });
}

int HabitTracker::streak(RecordId habitId, CalendarDate today) const {
    return ComputeStreak(m_habits->get(habitId), today);
}

bool HabitTracker::completedOn(RecordId habitId, CalendarDate date) const {
    return m_habits->get(habitId).completions.count(date) != 0;
}

} // namespace deskpal::application

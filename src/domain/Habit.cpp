#include "domain/Habit.hpp"

namespace deskpal::domain {

int ComputeStreak(const Habit& habit, CalendarDate today) {
    int streak = 0;
    CalendarDate cursor = today;
    while (habit.completions.count(cursor) != 0) {
        ++streak;
        if (cursor == CalendarDate::Min()) {
            break;
        }
        cursor = cursor.addDays(-1);
    }
    return streak;
}

} // namespace deskpal::domain

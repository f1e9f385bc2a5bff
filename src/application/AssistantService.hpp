/**
 * @file AssistantService.hpp
 * @brief Facade exposing one operation per user-facing assistant action.
 */

#pragma once

#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/HabitTracker.hpp"
#include "application/ReminderScheduler.hpp"
#include "domain/RecordRepository.hpp"
#include "domain/TimerEngine.hpp"

namespace deskpal::application {

/**
 * @struct AssistantOptions
 * @brief Tunables supplied by configuration.
 */
struct AssistantOptions {
    std::chrono::seconds defaultTimerDuration{std::chrono::minutes(25)};
};

/**
 * @class AssistantService
 * @brief Entry point for the presentation layer.
 *
 * Validates input (non-blank text, positive durations) before anything
 * reaches the store or the timer; rejected input raises
 * domain::ValidationError. Errors from the store and the timer propagate
 * unchanged, CorruptStore included.
 */
class AssistantService {
public:
    AssistantService(domain::RecordRepositories repositories,
                     std::shared_ptr<domain::TimerEngine> timer,
                     AssistantOptions options = AssistantOptions());

    // --- Tasks ---
    domain::Task createTask(const std::string& title,
                            std::optional<domain::Timestamp> dueAt = std::nullopt,
                            domain::Timestamp now = domain::Now());
    domain::Task getTask(domain::RecordId id) const;
    std::vector<domain::Task> listTasks() const;
    domain::Task updateTask(domain::RecordId id, const domain::TaskUpdate& update);
    /** @brief Flips done. */
    domain::Task toggleTask(domain::RecordId id);
    void deleteTask(domain::RecordId id);

    // --- Habits ---
    domain::Habit createHabit(const std::string& name, domain::Timestamp now = domain::Now());
    domain::Habit getHabit(domain::RecordId id) const;
    std::vector<domain::Habit> listHabits() const;
    void deleteHabit(domain::RecordId id);
    domain::Habit markHabitDone(domain::RecordId id, domain::CalendarDate date);
    domain::Habit unmarkHabit(domain::RecordId id, domain::CalendarDate date);
    int habitStreak(domain::RecordId id, domain::CalendarDate today) const;

    // --- Notes ---
    domain::Note addNote(const std::string& text, domain::Timestamp now = domain::Now());
    domain::Note getNote(domain::RecordId id) const;
    std::vector<domain::Note> listNotes() const;
    domain::Note replaceNoteText(domain::RecordId id, const std::string& text,
                                 domain::Timestamp now = domain::Now());
    void deleteNote(domain::RecordId id);

    // --- Reminders ---
    domain::Reminder addReminder(const std::string& message, domain::Timestamp fireAt);
    std::vector<domain::Reminder> listReminders() const;
    domain::Reminder rescheduleReminder(domain::RecordId id, domain::Timestamp fireAt);
    void deleteReminder(domain::RecordId id);
    /** @brief Reminders due at `now`, each returned only once ever. */
    std::vector<domain::Reminder> pollReminders(domain::Timestamp now = domain::Now());
    void setReminderListener(ReminderScheduler::DeliveryListener listener);

    // --- Timer ---
    domain::TimerSession startTimer(std::chrono::seconds duration, domain::Timestamp now = domain::Now());
    /** @brief Starts a session of the configured default length. */
    domain::TimerSession startDefaultTimer(domain::Timestamp now = domain::Now());
    domain::TimerSession pauseTimer(domain::Timestamp now = domain::Now());
    domain::TimerSession resumeTimer(domain::Timestamp now = domain::Now());
    domain::TimerSession resetTimer();
    domain::TimerSession tickTimer(domain::Timestamp now = domain::Now());
    domain::TimerSession timerSnapshot() const;

private:
    domain::RecordRepositories m_repositories;
    std::shared_ptr<domain::TimerEngine> m_timer;
    HabitTracker m_habitTracker;
    ReminderScheduler m_reminderScheduler;
    AssistantOptions m_options;
};

/**
 * @brief Short user-facing message for a failure raised by the assistant.
 *
 * CorruptStore is worded so the user knows data may be at risk.
 */
std::string DescribeError(const std::exception& error);

} // namespace deskpal::application

/**
 * @file AssistantService.cpp
 * @brief Implementation of AssistantService.
 */

#include "application/AssistantService.hpp"
#include "domain/AssistantErrors.hpp"
#include <algorithm>
#include <cctype>

namespace deskpal::application {

using namespace deskpal::domain;

namespace {

bool IsBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

void RequireText(const std::string& value, const char* field) {
    if (IsBlank(value)) {
        throw ValidationError(std::string(field) + " must not be empty");
    }
}

} // namespace

AssistantService::AssistantService(RecordRepositories repositories,
                                   std::shared_ptr<TimerEngine> timer,
                                   AssistantOptions options)
    : m_repositories(std::move(repositories)),
      m_timer(timer ? std::move(timer) : std::make_shared<TimerEngine>()),
      m_habitTracker(m_repositories.habits),
      m_reminderScheduler(m_repositories.reminders),
      m_options(options) {}

// --- Tasks ---

Task AssistantService::createTask(const std::string& title, std::optional<Timestamp> dueAt, Timestamp now) {
    RequireText(title, "Task title");
    Task draft;
    draft.title = title;
    draft.createdAt = now;
    draft.dueAt = dueAt;
    return m_repositories.tasks->create(draft);
}

Task AssistantService::getTask(RecordId id) const {
    return m_repositories.tasks->get(id);
}

std::vector<Task> AssistantService::listTasks() const {
    return m_repositories.tasks->list();
}

Task AssistantService::updateTask(RecordId id, const TaskUpdate& update) {
    if (update.title) {
        RequireText(*update.title, "Task title");
    }
    return m_repositories.tasks->update(id, [&update](Task& task) {
        if (update.title) task.title = *update.title;
        if (update.done) task.done = *update.done;
        if (update.clearDueAt) {
            task.dueAt.reset();
        } else if (update.dueAt) {
            task.dueAt = update.dueAt;
        }
    });
}

Task AssistantService::toggleTask(RecordId id) {
    return m_repositories.tasks->update(id, [](Task& task) { task.done = !task.done; });
}

void AssistantService::deleteTask(RecordId id) {
    m_repositories.tasks->remove(id);
}

// --- Habits ---

Habit AssistantService::createHabit(const std::string& name, Timestamp now) {
    RequireText(name, "Habit name");
    Habit draft;
    draft.name = name;
    draft.createdAt = now;
    return m_repositories.habits->create(draft);
}

Habit AssistantService::getHabit(RecordId id) const {
    return m_repositories.habits->get(id);
}

std::vector<Habit> AssistantService::listHabits() const {
    return m_repositories.habits->list();
}

void AssistantService::deleteHabit(RecordId id) {
    m_repositories.habits->remove(id);
}

Habit AssistantService::markHabitDone(RecordId id, CalendarDate date) {
    return m_habitTracker.markDone(id, date);
}

Habit AssistantService::unmarkHabit(RecordId id, CalendarDate date) {
    return m_habitTracker.unmark(id, date);
}

int AssistantService::habitStreak(RecordId id, CalendarDate today) const {
    return m_habitTracker.streak(id, today);
}

// --- Notes ---

Note AssistantService::addNote(const std::string& text, Timestamp now) {
    RequireText(text, "Note text");
    Note draft;
    draft.text = text;
    draft.createdAt = now;
    draft.updatedAt = now;
    return m_repositories.notes->create(draft);
}

Note AssistantService::getNote(RecordId id) const {
    return m_repositories.notes->get(id);
}

std::vector<Note> AssistantService::listNotes() const {
    return m_repositories.notes->list();
}

Note AssistantService::replaceNoteText(RecordId id, const std::string& text, Timestamp now) {
    RequireText(text, "Note text");
    return m_repositories.notes->update(id, [&text, now](Note& note) {
        note.text = text;
        note.updatedAt = now;
    });
}

void AssistantService::deleteNote(RecordId id) {
    m_repositories.notes->remove(id);
}

// --- Reminders ---

Reminder AssistantService::addReminder(const std::string& message, Timestamp fireAt) {
    RequireText(message, "Reminder message");
    Reminder draft;
    draft.message = message;
    draft.fireAt = fireAt;
    return m_repositories.reminders->create(draft);
}

std::vector<Reminder> AssistantService::listReminders() const {
    return m_repositories.reminders->list();
}

Reminder AssistantService::rescheduleReminder(RecordId id, Timestamp fireAt) {
    return m_reminderScheduler.reschedule(id, fireAt);
}

void AssistantService::deleteReminder(RecordId id) {
    m_repositories.reminders->remove(id);
}

std::vector<Reminder> AssistantService::pollReminders(Timestamp now) {
    return m_reminderScheduler.checkDue(now);
}

void AssistantService::setReminderListener(ReminderScheduler::DeliveryListener listener) {
    m_reminderScheduler.setDeliveryListener(std::move(listener));
}

// --- Timer ---

TimerSession AssistantService::startTimer(std::chrono::seconds duration, Timestamp now) {
    if (duration.count() <= 0 || duration > kMaxTimerDuration) {
        throw ValidationError("Timer duration must be between 1 second and " +
                              std::to_string(kMaxTimerDuration.count()) + " hours");
    }
    m_timer->start(duration, now);
    return m_timer->snapshot();
}

TimerSession AssistantService::startDefaultTimer(Timestamp now) {
    return startTimer(m_options.defaultTimerDuration, now);
}

TimerSession AssistantService::pauseTimer(Timestamp now) {
    m_timer->pause(now);
    return m_timer->snapshot();
}

TimerSession AssistantService::resumeTimer(Timestamp now) {
    m_timer->resume(now);
    return m_timer->snapshot();
}

TimerSession AssistantService::resetTimer() {
    m_timer->reset();
    return m_timer->snapshot();
}

TimerSession AssistantService::tickTimer(Timestamp now) {
    m_timer->tick(now);
    return m_timer->snapshot();
}

TimerSession AssistantService::timerSnapshot() const {
    return m_timer->snapshot();
}

std::string DescribeError(const std::exception& error) {
    const auto* assistantError = dynamic_cast<const AssistantError*>(&error);
    if (!assistantError) {
        return std::string("Unexpected error: ") + error.what();
    }
    switch (assistantError->kind()) {
        case ErrorKind::NotFound:
            return "That item no longer exists.";
        case ErrorKind::Validation:
            return std::string("Please check your input: ") + error.what();
        case ErrorKind::CorruptStore:
            return std::string("Saved data could not be read and may be damaged. "
                               "Nothing was changed on disk. ") + error.what();
        case ErrorKind::InvalidTransition:
            return std::string("The timer cannot do that right now: ") + error.what();
        case ErrorKind::Storage:
            return std::string("Your change could not be saved: ") + error.what();
        default:
            return error.what();
    }
}

} // namespace deskpal::application

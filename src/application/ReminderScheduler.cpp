/**
 * @file ReminderScheduler.cpp
 * @brief Implementation of ReminderScheduler.
 */

#include "application/ReminderScheduler.hpp"
#include <algorithm>
#include <iostream>

namespace deskpal::application {

using namespace deskpal::domain;

ReminderScheduler::ReminderScheduler(std::shared_ptr<RecordRepository<Reminder>> reminders)
    : m_reminders(std::move(reminders)) {}

void ReminderScheduler::setDeliveryListener(DeliveryListener listener) {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    m_listener = std::move(listener);
}

std::vector<Reminder> ReminderScheduler::checkDue(Timestamp now) {
    auto due = m_reminders->claim(
        [now](const Reminder& r) { return r.isDue(now); },
        [](Reminder& r) { r.fired = true; });

    std::stable_sort(due.begin(), due.end(), [](const Reminder& a, const Reminder& b) {
        if (a.fireAt != b.fireAt) return a.fireAt < b.fireAt;
        return a.id < b.id;
    });

    DeliveryListener listener;
    {
        std::lock_guard<std::mutex> lock(m_listenerMutex);
        listener = m_listener;
    }
    if (listener) {
        for (const auto& reminder : due) {
            try {
                listener(reminder);
            } catch (const std::exception& e) {
                // Already marked fired; the caller still receives it in the return value.
                std::cerr << "[ReminderScheduler] Listener failed for reminder " << reminder.id
                          << ": " << e.what() << std::endl;
            }
        }
    }
    return due;
}

Reminder ReminderScheduler::reschedule(RecordId reminderId, Timestamp fireAt) {
    return m_reminders->update(reminderId, [fireAt](Reminder& r) {
        r.fireAt = fireAt;
        r.fired = false;
    });
}

} // namespace deskpal::application

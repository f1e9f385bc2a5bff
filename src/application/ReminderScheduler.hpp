/**
 * @file ReminderScheduler.hpp
 * @brief Application Service delivering due reminders at most once.
 */

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include "domain/RecordRepository.hpp"
#include "domain/Reminder.hpp"

namespace deskpal::application {

/**
 * @class ReminderScheduler
 * @brief Finds reminders whose time has come and marks them fired.
 *
 * Selection, marking and persisting happen in a single claim on the
 * reminder collection, so concurrent or back-to-back polls can never
 * deliver the same reminder twice. The polling cadence belongs to the
 * caller.
 */
class ReminderScheduler {
public:
    /// Called once per delivered reminder, after the fired flag is on disk.
    using DeliveryListener = std::function<void(const domain::Reminder&)>;

    explicit ReminderScheduler(std::shared_ptr<domain::RecordRepository<domain::Reminder>> reminders);

    void setDeliveryListener(DeliveryListener listener);

    /**
     * @brief Claims every unfired reminder with fire_at <= now.
     * @return The delivered reminders (fired = true), ordered by fire_at then id.
     */
    std::vector<domain::Reminder> checkDue(domain::Timestamp now);

    /**
     * @brief Moves a reminder to a new time and re-arms it.
     * @throws domain::NotFoundError for an unknown reminder.
     */
    domain::Reminder reschedule(domain::RecordId reminderId, domain::Timestamp fireAt);

private:
    std::shared_ptr<domain::RecordRepository<domain::Reminder>> m_reminders;
    std::mutex m_listenerMutex;
    DeliveryListener m_listener;
};

} // namespace deskpal::application

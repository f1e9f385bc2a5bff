/**
 * @file CalendarDate.hpp
 * @brief Value Object for a proleptic Gregorian calendar day (UTC).
 */

#pragma once

#include <cstdint>
#include <string>
#include "Timestamp.hpp"

namespace deskpal::domain {

/**
 * @class CalendarDate
 * @brief A day on the calendar, stored as days since 1970-01-01.
 *
 * Day boundaries are always computed in UTC. Only years 0000 to 9999 are
 * representable, so every date has a four-digit ISO form that Parse() accepts.
 */
class CalendarDate {
public:
    CalendarDate() = default;

    static constexpr int kMinYear = 0;
    static constexpr int kMaxYear = 9999;

    /**
     * @brief Builds a date from its components.
     * @throws std::invalid_argument if the day does not exist (e.g. 2023-02-29) or the year is out of range.
     */
    CalendarDate(int year, unsigned month, unsigned day);

    /** @throws std::invalid_argument if the day falls outside years 0000 to 9999. */
    static CalendarDate FromDaysSinceEpoch(std::int64_t days);

    /** @brief First and last representable days. */
    static CalendarDate Min();
    static CalendarDate Max();

    /** @brief UTC calendar day containing the given instant. */
    static CalendarDate FromTimestamp(Timestamp ts);

    /**
     * @brief Parses the ISO form "YYYY-MM-DD".
     * @throws std::invalid_argument on any other shape or a non-existent day.
     */
    static CalendarDate Parse(const std::string& text);

    /** @brief ISO form "YYYY-MM-DD". */
    std::string toString() const;

    int year() const;
    unsigned month() const;
    unsigned day() const;

    std::int64_t daysSinceEpoch() const { return m_days; }

    /** @throws std::invalid_argument if the result leaves the representable range. */
    CalendarDate addDays(std::int64_t delta) const;

    bool operator==(const CalendarDate& other) const { return m_days == other.m_days; }
    bool operator!=(const CalendarDate& other) const { return m_days != other.m_days; }
    bool operator<(const CalendarDate& other) const { return m_days < other.m_days; }
    bool operator>(const CalendarDate& other) const { return m_days > other.m_days; }
    bool operator<=(const CalendarDate& other) const { return m_days <= other.m_days; }
    bool operator>=(const CalendarDate& other) const { return m_days >= other.m_days; }

private:
    std::int64_t m_days = 0;
};

} // namespace deskpal::domain

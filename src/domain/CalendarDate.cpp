/**
 * @file CalendarDate.cpp
 * @brief Implementation of CalendarDate.
 */

#include "domain/CalendarDate.hpp"
#include <cctype>
#include <cstdio>
#include <stdexcept>
#include <string>

namespace deskpal::domain {

namespace {

struct Civil {
    std::int64_t year;
    unsigned month;
    unsigned day;
};

// Howard Hinnant's days_from_civil / civil_from_days.
std::int64_t DaysFromCivil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const std::int64_t yoe = y - era * 400;
    const std::int64_t doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

Civil CivilFromDays(std::int64_t z) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const std::int64_t doe = z - era * 146097;
    const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const std::int64_t mp = (5 * doy + 2) / 153;
    const unsigned d = static_cast<unsigned>(doy - (153 * mp + 2) / 5 + 1);
    const unsigned m = static_cast<unsigned>(mp < 10 ? mp + 3 : mp - 9);
    return Civil{yoe + era * 400 + (m <= 2 ? 1 : 0), m, d};
}

bool IsLeapYear(std::int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned DaysInMonth(std::int64_t y, unsigned m) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && IsLeapYear(y)) return 29;
    return kDays[m - 1];
}

int ParseDigits(const std::string& text, size_t pos, size_t count) {
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            throw std::invalid_argument("Invalid date: " + text);
        }
        value = value * 10 + (text[i] - '0');
    }
    return value;
}

} // namespace

CalendarDate::CalendarDate(int year, unsigned month, unsigned day) {
    if (year < kMinYear || year > kMaxYear ||
        month < 1 || month > 12 || day < 1 || day > DaysInMonth(year, month)) {
        throw std::invalid_argument("Invalid date: " + std::to_string(year) + "-" +
                                    std::to_string(month) + "-" + std::to_string(day));
    }
    m_days = DaysFromCivil(year, month, day);
}

CalendarDate CalendarDate::FromDaysSinceEpoch(std::int64_t days) {
    if (days < Min().m_days || days > Max().m_days) {
        throw std::invalid_argument("Date out of range: " + std::to_string(days) + " days from 1970-01-01");
    }
    CalendarDate date;
    date.m_days = days;
    return date;
}

CalendarDate CalendarDate::Min() {
    CalendarDate date;
    date.m_days = DaysFromCivil(kMinYear, 1, 1);
    return date;
}

CalendarDate CalendarDate::Max() {
    CalendarDate date;
    date.m_days = DaysFromCivil(kMaxYear, 12, 31);
    return date;
}

CalendarDate CalendarDate::addDays(std::int64_t delta) const {
    // Checked against the bounds before adding so a huge delta cannot overflow.
    if (delta > Max().m_days - m_days || delta < Min().m_days - m_days) {
        throw std::invalid_argument("Date out of range: " + toString() + " + " + std::to_string(delta) + " days");
    }
    return FromDaysSinceEpoch(m_days + delta);
}

CalendarDate CalendarDate::FromTimestamp(Timestamp ts) {
    constexpr std::int64_t kMillisPerDay = 86400000;
    std::int64_t millis = ToEpochMillis(ts);
    std::int64_t days = millis / kMillisPerDay;
    if (millis % kMillisPerDay < 0) {
        --days; // floor for instants before the epoch
    }
    return FromDaysSinceEpoch(days);
}

CalendarDate CalendarDate::Parse(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        throw std::invalid_argument("Invalid date: " + text);
    }
    int year = ParseDigits(text, 0, 4);
    int month = ParseDigits(text, 5, 2);
    int day = ParseDigits(text, 8, 2);
    return CalendarDate(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
}

std::string CalendarDate::toString() const {
    Civil c = CivilFromDays(m_days);
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02u",
                  static_cast<long long>(c.year), c.month, c.day);
    return buffer;
}

int CalendarDate::year() const {
    return static_cast<int>(CivilFromDays(m_days).year);
}

unsigned CalendarDate::month() const {
    return CivilFromDays(m_days).month;
}

unsigned CalendarDate::day() const {
    return CivilFromDays(m_days).day;
}

} // namespace deskpal::domain

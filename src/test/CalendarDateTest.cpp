#include <cassert>
#include <iostream>
#include <stdexcept>

#include "domain/CalendarDate.hpp"
#include "test/TestSupport.hpp"

using namespace deskpal::domain;

int main() {
    std::cout << "[Test] Starting CalendarDate Test..." << std::endl;

    // Epoch and text form
    CalendarDate epoch = CalendarDate::FromDaysSinceEpoch(0);
    assert(epoch.toString() == "1970-01-01");
    assert(CalendarDate(1970, 1, 1) == epoch);

    CalendarDate leap = CalendarDate::Parse("2024-02-29");
    assert(leap.year() == 2024 && leap.month() == 2 && leap.day() == 29);
    assert(leap.addDays(1).toString() == "2024-03-01");
    assert(leap.addDays(-59).toString() == "2024-01-01");
    assert(CalendarDate(2000, 1, 1).daysSinceEpoch() == 10957);

    // Year boundary
    assert(CalendarDate(2023, 12, 31).addDays(1) == CalendarDate(2024, 1, 1));

    // Rejected shapes and days
    assert(Throws<std::invalid_argument>([] { CalendarDate::Parse("2023-02-29"); }));
    assert(Throws<std::invalid_argument>([] { CalendarDate::Parse("2023-2-01"); }));
    assert(Throws<std::invalid_argument>([] { CalendarDate::Parse("2023-13-01"); }));
    assert(Throws<std::invalid_argument>([] { CalendarDate::Parse("abcd-01-01"); }));
    assert(Throws<std::invalid_argument>([] { CalendarDate(2023, 4, 31); }));

    // UTC day boundaries, including before the epoch
    assert(CalendarDate::FromTimestamp(FromEpochMillis(86400000LL - 1)) == epoch);
    assert(CalendarDate::FromTimestamp(FromEpochMillis(86400000LL)) == epoch.addDays(1));
    assert(CalendarDate::FromTimestamp(FromEpochMillis(-1)).toString() == "1969-12-31");
    assert(CalendarDate::FromTimestamp(FromEpochMillis(1700000000000LL)).toString() == "2023-11-14");

    assert(CalendarDate(2024, 5, 1) < CalendarDate(2024, 5, 2));

    // Representable range: every date prints as four-digit ISO text that parses back.
    CalendarDate last = CalendarDate::Max();
    assert(last.toString() == "9999-12-31");
    assert(CalendarDate::Parse(last.toString()) == last);
    assert(CalendarDate::Min().toString() == "0000-01-01");
    assert(CalendarDate::Parse("0000-01-01") == CalendarDate::Min());
    assert(Throws<std::invalid_argument>([&] { last.addDays(1); }));
    assert(Throws<std::invalid_argument>([] { CalendarDate::Min().addDays(-1); }));
    assert(Throws<std::invalid_argument>([] { CalendarDate(2024, 1, 1).addDays(3000000); }));
    assert(Throws<std::invalid_argument>([] { CalendarDate(10000, 1, 1); }));
    assert(Throws<std::invalid_argument>([] { CalendarDate(-1, 12, 31); }));
    assert(Throws<std::invalid_argument>([&] { CalendarDate::FromDaysSinceEpoch(last.daysSinceEpoch() + 1); }));
    assert(CalendarDate(2024, 1, 1).addDays(2900000).addDays(-2900000) == CalendarDate(2024, 1, 1));

    std::cout << "[PASS] CalendarDate Test." << std::endl;
    return 0;
}

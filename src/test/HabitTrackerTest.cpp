#include <cassert>
#include <filesystem>
#include <iostream>
#include <stdexcept>

#include "application/HabitTracker.hpp"
#include "domain/AssistantErrors.hpp"
#include "infrastructure/RecordStore.hpp"
#include "test/TestSupport.hpp"

using namespace deskpal::domain;
using namespace deskpal::application;
using namespace deskpal::infrastructure;
namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] Starting HabitTracker Test..." << std::endl;

    fs::path testRoot = "test_project_root_habits";
    fs::remove_all(testRoot);

    RecordStore store(testRoot);
    store.load();
    HabitTracker tracker(store.repositories().habits);

    Habit draft;
    draft.name = "Read";
    RecordId id = store.habits().create(draft).id;

    const CalendarDate today(2024, 3, 10);

    // Pure streak computation
    Habit sample;
    sample.completions = {today, today.addDays(-1), today.addDays(-2), today.addDays(-4)};
    assert(ComputeStreak(sample, today) == 3);
    assert(ComputeStreak(sample, today.addDays(-4)) == 1);
    assert(ComputeStreak(sample, today.addDays(-3)) == 0);
    assert(ComputeStreak(sample, today.addDays(1)) == 0);

    assert(tracker.streak(id, today) == 0);

    // {today, today-1, today-2} with a gap at today-3
    tracker.markDone(id, today);
    tracker.markDone(id, today.addDays(-1));
    tracker.markDone(id, today.addDays(-2));
    tracker.markDone(id, today.addDays(-4));
    assert(tracker.streak(id, today) == 3);

    // Marking twice is a no-op
    Habit again = tracker.markDone(id, today);
    assert(again.completions.size() == 4);
    assert(tracker.streak(id, today) == 3);

    // Today absent -> 0, even with yesterday done
    assert(tracker.streak(id, today.addDays(1)) == 0);

    // Future dates are accepted
    tracker.markDone(id, today.addDays(30));
    assert(tracker.completedOn(id, today.addDays(30)));
    assert(tracker.streak(id, today) == 3);

    // Unmark breaks the chain; unmarking an absent day is harmless
    tracker.unmark(id, today.addDays(-1));
    assert(tracker.streak(id, today) == 1);
    tracker.unmark(id, today.addDays(-100));
    assert(!tracker.completedOn(id, today.addDays(-1)));

    // Persisted
    RecordStore reopened(testRoot);
    reopened.load();
    HabitTracker reopenedTracker(reopened.repositories().habits);
    assert(reopenedTracker.streak(id, today) == 1);
    assert(reopenedTracker.completedOn(id, today.addDays(-2)));

    // The last representable day survives a reload; later days cannot be built at all.
    tracker.markDone(id, CalendarDate::Max());
    assert(Throws<std::invalid_argument>([&] { tracker.markDone(id, today.addDays(3000000)); }));
    {
        RecordStore farFuture(testRoot);
        farFuture.load();
        assert(farFuture.habits().get(id).completions.count(CalendarDate::Max()) == 1);
    }

    // A streak reaching the first representable day stops there.
    Habit earliest;
    earliest.completions = {CalendarDate::Min(), CalendarDate::Min().addDays(1)};
    assert(ComputeStreak(earliest, CalendarDate::Min().addDays(1)) == 2);

    // Unknown habit
    assert(Throws<NotFoundError>([&] { tracker.markDone(42, today); }));
    assert(Throws<NotFoundError>([&] { tracker.streak(42, today); }));

    fs::remove_all(testRoot);
    std::cout << "[PASS] HabitTracker Test." << std::endl;
    return 0;
}

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "application/ReminderScheduler.hpp"
#include "domain/AssistantErrors.hpp"
#include "infrastructure/RecordStore.hpp"

using namespace deskpal::domain;
using namespace deskpal::application;
using namespace deskpal::infrastructure;
namespace fs = std::filesystem;
using std::chrono::seconds;

static RecordId addReminder(RecordStore& store, const std::string& message, Timestamp fireAt) {
    Reminder r;
    r.message = message;
    r.fireAt = fireAt;
    return store.reminders().create(r).id;
}

static void testDeliveredOnce(const fs::path& root) {
    std::cout << "[Test] At-most-once delivery..." << std::endl;
    const Timestamp t0 = FromEpochMillis(1700000000000LL);
    fs::path dir = root / "once";
    RecordStore store(dir);
    store.load();
    ReminderScheduler scheduler(store.repositories().reminders);

    addReminder(store, "later", t0 + seconds(30));
    addReminder(store, "first", t0 + seconds(10));
    addReminder(store, "exact", t0 + seconds(20));

    assert(scheduler.checkDue(t0).empty());

    auto due = scheduler.checkDue(t0 + seconds(20));
    assert(due.size() == 2);
    assert(due[0].message == "first");   // ordered by fire time
    assert(due[1].message == "exact");   // fire_at == now is due
    assert(due[0].fired && due[1].fired);

    assert(scheduler.checkDue(t0 + seconds(20)).empty());
    auto rest = scheduler.checkDue(t0 + seconds(1000));
    assert(rest.size() == 1 && rest[0].message == "later");
    assert(scheduler.checkDue(t0 + seconds(2000)).empty());

    // The fired flag survives a restart.
    RecordStore reopened(dir);
    reopened.load();
    ReminderScheduler after(reopened.repositories().reminders);
    assert(after.checkDue(t0 + seconds(5000)).empty());
}

static void testRescheduleRearms(const fs::path& root) {
    std::cout << "[Test] Reschedule..." << std::endl;
    const Timestamp t0 = FromEpochMillis(1700000000000LL);
    RecordStore store(root / "reschedule");
    store.load();
    ReminderScheduler scheduler(store.repositories().reminders);

    RecordId id = addReminder(store, "water", t0);
    assert(scheduler.checkDue(t0).size() == 1);

    Reminder moved = scheduler.reschedule(id, t0 + seconds(60));
    assert(!moved.fired);
    assert(scheduler.checkDue(t0 + seconds(59)).empty());
    assert(scheduler.checkDue(t0 + seconds(60)).size() == 1);
    assert(scheduler.checkDue(t0 + seconds(61)).empty());

    bool threw = false;
    try {
        scheduler.reschedule(999, t0);
    } catch (const NotFoundError&) {
        threw = true;
    }
    assert(threw);
}

static void testListener(const fs::path& root) {
    std::cout << "[Test] Delivery listener..." << std::endl;
    const Timestamp t0 = FromEpochMillis(1700000000000LL);
    RecordStore store(root / "listener");
    store.load();
    ReminderScheduler scheduler(store.repositories().reminders);

    std::vector<std::string> heard;
    scheduler.setDeliveryListener([&](const Reminder& r) {
        // Delivery happens only after the fired flag is stored.
        assert(store.reminders().get(r.id).fired);
        heard.push_back(r.message);
    });
    addReminder(store, "a", t0);
    addReminder(store, "b", t0);
    scheduler.checkDue(t0);
    scheduler.checkDue(t0);
    assert(heard.size() == 2);
    assert(heard[0] == "a" && heard[1] == "b");
}

static void testConcurrentPolling(const fs::path& root) {
    std::cout << "[Test] Concurrent polling..." << std::endl;
    const Timestamp t0 = FromEpochMillis(1700000000000LL);
    RecordStore store(root / "concurrent");
    store.load();
    ReminderScheduler scheduler(store.repositories().reminders);

    const int NUM_REMINDERS = 40;
    for (int i = 0; i < NUM_REMINDERS; ++i) {
        addReminder(store, "r" + std::to_string(i), t0 + seconds(i));
    }

    const int NUM_THREADS = 8;
    std::mutex resultsMutex;
    std::vector<RecordId> delivered;
    std::vector<std::thread> threads;
    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&, t]() {
            for (int step = 0; step <= NUM_REMINDERS; ++step) {
                auto due = scheduler.checkDue(t0 + seconds(step + (t % 2)));
                std::lock_guard<std::mutex> lock(resultsMutex);
                for (const auto& r : due) delivered.push_back(r.id);
            }
        });
    }
    for (auto& th : threads) {
        if (th.joinable()) th.join();
    }

    std::set<RecordId> unique(delivered.begin(), delivered.end());
    assert(delivered.size() == static_cast<size_t>(NUM_REMINDERS));
    assert(unique.size() == static_cast<size_t>(NUM_REMINDERS));
}

int main() {
    std::cout << "[Test] Starting ReminderScheduler Test..." << std::endl;

    fs::path testRoot = "test_project_root_reminders";
    fs::remove_all(testRoot);

    testDeliveredOnce(testRoot);
    testRescheduleRearms(testRoot);
    testListener(testRoot);
    testConcurrentPolling(testRoot);

    fs::remove_all(testRoot);
    std::cout << "[PASS] ReminderScheduler Test." << std::endl;
    return 0;
}

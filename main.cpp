#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

#include "application/AssistantService.hpp"
#include "domain/AssistantErrors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/RecordStore.hpp"

using namespace deskpal;

namespace {

std::atomic<bool> g_running{true};

void HandleSignal(int) {
    g_running = false;
}

} // namespace

int main() {
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    infrastructure::AppConfig config = infrastructure::ConfigLoader::LoadDefault();

    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    infrastructure::RecordStore store(config.dataDir, persistence);
    try {
        store.load();
    } catch (const domain::AssistantError& e) {
        // CorruptStore must reach the user: refuse to run on top of damaged data.
        std::cerr << "[DeskPal] " << application::DescribeError(e) << std::endl;
        return 1;
    }

    application::AssistantOptions options;
    options.defaultTimerDuration = config.defaultTimerDuration;
    application::AssistantService assistant(store.repositories(), std::make_shared<domain::TimerEngine>(), options);

    assistant.setReminderListener([](const domain::Reminder& reminder) {
        std::cout << "[Reminder] " << reminder.message << std::endl;
    });

    std::cout << "DeskPal started. Data in " << config.dataDir << ": "
              << assistant.listTasks().size() << " tasks, "
              << assistant.listHabits().size() << " habits, "
              << assistant.listNotes().size() << " notes, "
              << assistant.listReminders().size() << " reminders." << std::endl;

    while (g_running) {
        try {
            assistant.pollReminders();
            auto before = assistant.timerSnapshot().state;
            auto session = assistant.tickTimer();
            if (before == domain::TimerState::Running && session.state == domain::TimerState::Completed) {
                std::cout << "[Timer] Session complete." << std::endl;
            }
        } catch (const domain::StorageError& e) {
            // The fired flags were not saved; the same reminders are retried next poll.
            std::cerr << "[DeskPal] " << application::DescribeError(e) << std::endl;
        }
        std::this_thread::sleep_for(config.pollInterval);
    }

    persistence->stop();
    std::cout << "DeskPal stopped." << std::endl;
    return 0;
}

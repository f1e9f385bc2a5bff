/**
 * @file TimerEngine.hpp
 * @brief State machine for the single pomodoro-style countdown.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include "Timestamp.hpp"

namespace deskpal::domain {

/**
 * @enum TimerState
 * @brief Lifecycle of the countdown session.
 */
enum class TimerState {
    Idle,       ///< Nothing started, or reset.
    Running,    ///< Counting down.
    Paused,     ///< Remaining time frozen.
    Completed   ///< Reached zero; left via reset() or start().
};

inline std::string TimerStateToString(TimerState state) {
    switch (state) {
        case TimerState::Idle: return "Idle";
        case TimerState::Running: return "Running";
        case TimerState::Paused: return "Paused";
        case TimerState::Completed: return "Completed";
        default: return "Unknown";
    }
}

/// Longest countdown start() accepts.
constexpr std::chrono::hours kMaxTimerDuration{24};

/**
 * @struct TimerSession
 * @brief Point-in-time copy of the engine state.
 */
struct TimerSession {
    TimerState state = TimerState::Idle;
    std::chrono::seconds duration{0};
    std::chrono::milliseconds remaining{0};
    unsigned completedSessions = 0; ///< Sessions that reached zero during this process.

    /** @brief Remaining time rounded up to whole seconds, as a countdown display shows it. */
    std::int64_t remainingSeconds() const {
        return (remaining.count() + 999) / 1000;
    }
};

/**
 * @class TimerEngine
 * @brief Single countdown driven by explicit wall clock readings.
 *
 * Remaining time is derived from the elapsed time since the last start or
 * resume, never from counting ticks, so the engine may be polled at any
 * cadence and polling twice with the same `now` changes nothing.
 * All methods are thread-safe.
 */
class TimerEngine {
public:
    /**
     * @brief Starts a new countdown. Valid from Idle or Completed.
     * @throws ValidationError if duration is not positive or exceeds kMaxTimerDuration.
     * @throws InvalidTransitionError from Running or Paused.
     */
    void start(std::chrono::seconds duration, Timestamp now);

    /**
     * @brief Freezes the remaining time as of `now`. Valid from Running.
     *
     * If the countdown already ran out by `now` the session settles as
     * Completed instead of Paused.
     */
    void pause(Timestamp now);

    /** @brief Continues a paused countdown from its frozen remainder. Valid from Paused. */
    void resume(Timestamp now);

    /** @brief Updates remaining time; completes the session at zero. No-op unless Running. */
    void tick(Timestamp now);

    /** @brief Returns to Idle from any state. */
    void reset();

    TimerSession snapshot() const;

private:
    void settle(Timestamp now);
    void requireState(TimerState expected, const char* operation) const;

    mutable std::mutex m_mutex;
    TimerState m_state = TimerState::Idle;
    std::chrono::seconds m_duration{0};
    std::chrono::milliseconds m_remaining{0};
    std::chrono::milliseconds m_remainingAtReference{0}; ///< Remainder when m_reference was taken.
    Timestamp m_reference{};                              ///< Last start or resume.
    unsigned m_completedSessions = 0;
};

} // namespace deskpal::domain

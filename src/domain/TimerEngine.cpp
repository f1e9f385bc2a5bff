/**
 * @file TimerEngine.cpp
 * @brief Implementation of TimerEngine.
 */

#include "domain/TimerEngine.hpp"
#include "domain/AssistantErrors.hpp"
#include <algorithm>

namespace deskpal::domain {

void TimerEngine::start(std::chrono::seconds duration, Timestamp now) {
    if (duration.count() <= 0) {
        throw ValidationError("Timer duration must be positive");
    }
    if (duration > kMaxTimerDuration) {
        throw ValidationError("Timer duration must not exceed " + std::to_string(kMaxTimerDuration.count()) + " hours");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state != TimerState::Idle && m_state != TimerState::Completed) {
        throw InvalidTransitionError("Cannot start timer while " + TimerStateToString(m_state));
    }

    m_duration = duration;
    m_remaining = duration;
    m_remainingAtReference = duration;
    m_reference = now;
    m_state = TimerState::Running;
}

void TimerEngine::pause(Timestamp now) {
    std::lock_guard<std::mutex> lock(m_mutex);
    requireState(TimerState::Running, "pause");

    settle(now);
    if (m_state == TimerState::Completed) {
        return;
    }
    m_remainingAtReference = m_remaining;
    m_state = TimerState::Paused;
}

void TimerEngine::resume(Timestamp now) {
    std::lock_guard<std::mutex> lock(m_mutex);
    requireState(TimerState::Paused, "resume");

    m_reference = now;
    m_state = TimerState::Running;
}

void TimerEngine::tick(Timestamp now) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state != TimerState::Running) {
        return;
    }
    settle(now);
}

void TimerEngine::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_state = TimerState::Idle;
    m_duration = std::chrono::seconds(0);
    m_remaining = std::chrono::milliseconds(0);
    m_remainingAtReference = std::chrono::milliseconds(0);
    m_reference = Timestamp{};
}

TimerSession TimerEngine::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    TimerSession session;
    session.state = m_state;
    session.duration = m_duration;
    session.remaining = m_remaining;
    session.completedSessions = m_completedSessions;
    return session;
}

// Caller holds m_mutex and the state is Running.
void TimerEngine::settle(Timestamp now) {
    // A clock reading older than the reference counts as no elapsed time.
    auto elapsed = std::max(now - m_reference, std::chrono::milliseconds(0));
    auto computed = m_remainingAtReference - elapsed;

    // Never let remaining grow back if an earlier `now` arrives after a later one.
    m_remaining = std::min(m_remaining, computed);

    if (m_remaining.count() <= 0) {
        m_remaining = std::chrono::milliseconds(0);
        m_state = TimerState::Completed;
        ++m_completedSessions;
    }
}

void TimerEngine::requireState(TimerState expected, const char* operation) const {
    if (m_state != expected) {
        throw InvalidTransitionError(std::string("Cannot ") + operation + " timer while " +
                                     TimerStateToString(m_state));
    }
}

} // namespace deskpal::domain

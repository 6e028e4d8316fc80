#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <string>

#include "common.hpp"

// Single Pomodoro block and its trailing cooldown. Not thread-safe; callers hold the
// SharedState mutex.
class BlockTimer {
  public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    enum Transition {
        TRANSITION_NONE = 0,
        TRANSITION_BLOCK_FINISHED = 1,
        TRANSITION_COOLDOWN_FINISHED = 2
    };

    explicit BlockTimer(ClockFn clock = Clock::now);

    // Control operations. On rejection they return false, fill `error` and arm a flash.
    bool Start(std::chrono::seconds duration, std::string &error);
    bool TogglePause(std::string &error);
    bool Cancel(std::string &error);

    // Applies the overdue transition, if any.
    Transition Tick();

    BlockStatus Snapshot() const;
    BlockState State() const {
        return m_State;
    }

    // Returns the flash to draw on this frame and advances the countdown.
    FlashLevel ConsumeFlash();
    void SetFlashFrames(unsigned warnFrames, unsigned errorFrames);

    // Events since the last accepted Start, newest last, at most kJournalLines of them.
    std::string Journal() const;

    static constexpr std::size_t kJournalLines = 64;

  private:
    void Reject(FlashLevel level, const std::string &reason, std::string &error);
    void Log(const std::string &what);
    Clock::duration ActiveElapsed(Clock::time_point now) const;
    void EnterIdle();

  private:
    ClockFn m_Clock;
    BlockState m_State{IDLE};

    std::chrono::seconds m_BlockDuration{0};
    Clock::time_point m_BlockStart{};
    Clock::time_point m_PauseStart{};
    Clock::duration m_PauseAccumulator{0};
    Clock::time_point m_CooldownStart{};

    unsigned m_WarnFrames = 5;
    unsigned m_ErrorFrames = 7;
    unsigned m_FlashWarn = 0;
    unsigned m_FlashError = 0;

    std::deque<std::string> m_Journal;
};

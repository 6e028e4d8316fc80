#include "block_timer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>
#include <utility>

// ─────────────────────────────────────
BlockTimer::BlockTimer(ClockFn clock) : m_Clock(std::move(clock)) {}

// ─────────────────────────────────────
void BlockTimer::SetFlashFrames(unsigned warnFrames, unsigned errorFrames) {
    m_WarnFrames = warnFrames;
    m_ErrorFrames = errorFrames;
}

// ─────────────────────────────────────
void BlockTimer::Log(const std::string &what) {
    const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    char date[64];
    if (std::strftime(date, sizeof(date), "%F %T%z", &tm) == 0) {
        date[0] = '\0';
    }
    m_Journal.push_back(std::string(date) + ": " + what + "\n");
    if (m_Journal.size() > kJournalLines) {
        m_Journal.pop_front();
    }
}

// ─────────────────────────────────────
std::string BlockTimer::Journal() const {
    std::string out;
    for (const auto &line : m_Journal) {
        out += line;
    }
    return out;
}

// ─────────────────────────────────────
void BlockTimer::Reject(FlashLevel level, const std::string &reason, std::string &error) {
    error = reason;
    if (level == FLASH_ERROR) {
        m_FlashError = m_ErrorFrames;
    } else {
        m_FlashWarn = m_WarnFrames;
    }
    Log("rejected: " + reason);
    spdlog::info("BlockTimer: rejected in state {}: {}", BlockStateName(m_State), reason);
}

// ─────────────────────────────────────
void BlockTimer::EnterIdle() {
    m_State = IDLE;
    m_BlockDuration = std::chrono::seconds(0);
    m_BlockStart = Clock::time_point{};
    m_PauseStart = Clock::time_point{};
    m_PauseAccumulator = Clock::duration(0);
    m_CooldownStart = Clock::time_point{};
}

// ─────────────────────────────────────
bool BlockTimer::Start(std::chrono::seconds duration, std::string &error) {
    switch (m_State) {
    case IDLE:
        break;
    case RUNNING:
    case PAUSED:
        // an in-progress block must be cancelled explicitly first
        Reject(FLASH_WARN, "a block is already in progress", error);
        return false;
    case COOLDOWN:
        Reject(FLASH_ERROR, "cannot start during cooldown", error);
        return false;
    }

    if (duration.count() <= 0) {
        Reject(FLASH_WARN, "block duration must be positive", error);
        return false;
    }

    m_Journal.clear();
    m_State = RUNNING;
    m_BlockDuration = duration;
    m_BlockStart = m_Clock();
    m_PauseAccumulator = Clock::duration(0);
    Log("started block");
    spdlog::info("BlockTimer: started {}s block", duration.count());
    return true;
}

// ─────────────────────────────────────
bool BlockTimer::TogglePause(std::string &error) {
    switch (m_State) {
    case RUNNING:
        m_PauseStart = m_Clock();
        m_State = PAUSED;
        Log("paused block");
        spdlog::info("BlockTimer: paused");
        return true;
    case PAUSED:
        m_PauseAccumulator += m_Clock() - m_PauseStart;
        m_PauseStart = Clock::time_point{};
        m_State = RUNNING;
        Log("unpaused block");
        spdlog::info("BlockTimer: resumed");
        return true;
    case COOLDOWN:
        Reject(FLASH_ERROR, "cannot pause during cooldown", error);
        return false;
    case IDLE:
        break;
    }
    Reject(FLASH_WARN, "no block to pause", error);
    return false;
}

// ─────────────────────────────────────
bool BlockTimer::Cancel(std::string &error) {
    switch (m_State) {
    case RUNNING:
    case PAUSED:
        EnterIdle();
        Log("canceled block");
        spdlog::info("BlockTimer: canceled");
        return true;
    case COOLDOWN:
        Reject(FLASH_ERROR, "cooldown cannot be cancelled", error);
        return false;
    case IDLE:
        break;
    }
    Reject(FLASH_WARN, "no block to cancel", error);
    return false;
}

// ─────────────────────────────────────
BlockTimer::Clock::duration BlockTimer::ActiveElapsed(Clock::time_point now) const {
    const Clock::time_point until = m_State == PAUSED ? m_PauseStart : now;
    const Clock::duration elapsed = until - m_BlockStart - m_PauseAccumulator;
    return std::max(elapsed, Clock::duration(0));
}

// ─────────────────────────────────────
BlockTimer::Transition BlockTimer::Tick() {
    const Clock::time_point now = m_Clock();

    if (m_State == RUNNING && ActiveElapsed(now) >= m_BlockDuration) {
        m_State = COOLDOWN;
        m_CooldownStart = now;
        Log("end block; start cooldown");
        spdlog::info("BlockTimer: block finished, cooldown for {}s", kCooldownDuration.count());
        return TRANSITION_BLOCK_FINISHED;
    }

    if (m_State == COOLDOWN && now - m_CooldownStart >= kCooldownDuration) {
        EnterIdle();
        Log("end cooldown");
        spdlog::info("BlockTimer: cooldown finished");
        return TRANSITION_COOLDOWN_FINISHED;
    }

    return TRANSITION_NONE;
}

// ─────────────────────────────────────
BlockStatus BlockTimer::Snapshot() const {
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;

    BlockStatus status;
    status.state = m_State;
    status.block_duration = m_BlockDuration;

    const Clock::time_point now = m_Clock();
    Clock::duration total{0};
    Clock::duration elapsed{0};

    switch (m_State) {
    case IDLE:
        return status;
    case RUNNING:
    case PAUSED:
        total = m_BlockDuration;
        elapsed = ActiveElapsed(now);
        break;
    case COOLDOWN:
        total = kCooldownDuration;
        elapsed = std::max(now - m_CooldownStart, Clock::duration(0));
        break;
    }

    elapsed = std::min(elapsed, total);
    status.duration = duration_cast<milliseconds>(total);
    status.elapsed = duration_cast<milliseconds>(elapsed);
    status.remaining = status.duration - status.elapsed;
    return status;
}

// ─────────────────────────────────────
FlashLevel BlockTimer::ConsumeFlash() {
    FlashLevel level = FLASH_NONE;
    if (m_FlashWarn > 0) {
        if (m_FlashWarn % 2 == 1) {
            level = FLASH_WARN;
        }
        m_FlashWarn--;
    }
    // error flash wins over a concurrent warning
    if (m_FlashError > 0) {
        if (m_FlashError % 2 == 1) {
            level = FLASH_ERROR;
        }
        m_FlashError--;
    }
    return level;
}

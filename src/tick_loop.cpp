#include "tick_loop.hpp"

#include <spdlog/spdlog.h>

#include <optional>

// ─────────────────────────────────────
TickLoop::TickLoop(SharedState &state, Sampler &sampler, ShellRunner &shell,
                   const StatusRenderer &renderer, std::ostream &out,
                   std::chrono::milliseconds interval, BlockTimer::ClockFn clock)
    : m_State(state), m_Sampler(sampler), m_Shell(shell), m_Renderer(renderer), m_Out(out),
      m_Interval(interval), m_Clock(std::move(clock)) {}

// ─────────────────────────────────────
void TickLoop::RunOnce() {
    BlockTimer::Transition transition = BlockTimer::TRANSITION_NONE;
    BlockState state = IDLE;
    bool logEnabled = false;
    {
        std::lock_guard<std::mutex> lock(m_State.mutex);
        transition = m_State.timer.Tick();
        state = m_State.timer.State();
        logEnabled = m_State.log.IsEnabled();
    }

    if (transition == BlockTimer::TRANSITION_BLOCK_FINISHED && !m_OnBlockEnd.empty()) {
        try {
            m_Shell.Run(m_OnBlockEnd);
        } catch (const std::exception &e) {
            spdlog::error("TickLoop: block-end command failed: {}", e.what());
        }
    }

    SampleActivity(state, logEnabled);
    EmitStatus();
}

// ─────────────────────────────────────
void TickLoop::SampleActivity(BlockState state, bool logEnabled) {
    if (state != RUNNING || !logEnabled) {
        // breaks the sampling baseline so paused/idle time is never credited
        std::lock_guard<std::mutex> lock(m_State.mutex);
        m_State.log.Sample(state, {}, m_Clock());
        return;
    }

    // The OS query runs outside the lock; it is bounded by the sampler's own timeout.
    std::optional<std::string> title;
    try {
        title = m_Sampler.CurrentFocusedWindowTitle();
    } catch (const std::exception &e) {
        spdlog::debug("TickLoop: sampler failed: {}", e.what());
    }

    if (!title || title->empty()) {
        spdlog::debug("TickLoop: no focused window, sample dropped");
        return;
    }

    std::lock_guard<std::mutex> lock(m_State.mutex);
    // the state may have changed while sampling
    m_State.log.Sample(m_State.timer.State(), *title, m_Clock());
}

// ─────────────────────────────────────
void TickLoop::EmitStatus() {
    BlockStatus status;
    FlashLevel flash = FLASH_NONE;
    {
        std::lock_guard<std::mutex> lock(m_State.mutex);
        status = m_State.timer.Snapshot();
        flash = m_State.timer.ConsumeFlash();
    }

    try {
        m_Out << m_Renderer.Render(status, flash) << '\n' << std::flush;
    } catch (const std::exception &e) {
        spdlog::error("TickLoop: failed to render status line: {}", e.what());
    }
}

// ─────────────────────────────────────
void TickLoop::Run() {
    spdlog::info("TickLoop: running every {} ms", m_Interval.count());
    auto next = std::chrono::steady_clock::now();

    while (!m_StopRequested.load()) {
        RunOnce();

        next += m_Interval;
        const auto now = std::chrono::steady_clock::now();
        // after a stall (suspend, heavy load) resume the cadence instead of bursting
        if (next < now) {
            next = now;
        }

        std::unique_lock<std::mutex> lk(m_WaitMutex);
        m_WaitCv.wait_until(lk, next, [this] { return m_StopRequested.load(); });
    }
    spdlog::info("TickLoop: stopped");
}

// ─────────────────────────────────────
void TickLoop::Stop() {
    {
        std::lock_guard<std::mutex> lk(m_WaitMutex);
        m_StopRequested.store(true);
    }
    m_WaitCv.notify_all();
}

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <ostream>
#include <string>
#include <utility>

#include "sampler.hpp"
#include "shared_state.hpp"
#include "shell_runner.hpp"
#include "status_renderer.hpp"

// Periodic driver: applies due transitions, feeds the activity log while a block runs and
// writes one status line per tick.
class TickLoop {
  public:
    TickLoop(SharedState &state, Sampler &sampler, ShellRunner &shell,
             const StatusRenderer &renderer, std::ostream &out,
             std::chrono::milliseconds interval = std::chrono::seconds(1),
             BlockTimer::ClockFn clock = BlockTimer::Clock::now);

    // Command run once on each block -> cooldown transition; empty disables it.
    void SetOnBlockEnd(std::string command) {
        m_OnBlockEnd = std::move(command);
    }

    void RunOnce();

    // Blocks until Stop() is called from another thread.
    void Run();
    void Stop();

  private:
    void SampleActivity(BlockState state, bool logEnabled);
    void EmitStatus();

  private:
    SharedState &m_State;
    Sampler &m_Sampler;
    ShellRunner &m_Shell;
    const StatusRenderer &m_Renderer;
    std::ostream &m_Out;
    const std::chrono::milliseconds m_Interval;
    BlockTimer::ClockFn m_Clock;
    std::string m_OnBlockEnd;

    std::mutex m_WaitMutex;
    std::condition_variable m_WaitCv;
    std::atomic<bool> m_StopRequested{false};
};

#include "command_dispatcher.hpp"

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
CommandDispatcher::CommandDispatcher(SharedState &state) : m_State(state) {}

// ─────────────────────────────────────
CommandResult CommandDispatcher::StartBlock(unsigned durationSeconds) {
    spdlog::debug("[COMMAND] StartBlock({})", durationSeconds);
    CommandResult result;
    std::lock_guard<std::mutex> lock(m_State.mutex);
    result.accepted = m_State.timer.Start(std::chrono::seconds(durationSeconds), result.message);
    return result;
}

// ─────────────────────────────────────
CommandResult CommandDispatcher::PauseBlock() {
    spdlog::debug("[COMMAND] PauseBlock");
    CommandResult result;
    std::lock_guard<std::mutex> lock(m_State.mutex);
    result.accepted = m_State.timer.TogglePause(result.message);
    return result;
}

// ─────────────────────────────────────
CommandResult CommandDispatcher::CancelBlock() {
    spdlog::debug("[COMMAND] CancelBlock");
    CommandResult result;
    std::lock_guard<std::mutex> lock(m_State.mutex);
    result.accepted = m_State.timer.Cancel(result.message);
    return result;
}

// ─────────────────────────────────────
CommandResult CommandDispatcher::TaskLogAdd(const std::string &label) {
    spdlog::debug("[COMMAND] TaskLogAdd('{}')", label);
    std::lock_guard<std::mutex> lock(m_State.mutex);
    m_State.log.Enable(label);
    return CommandResult{true, {}};
}

// ─────────────────────────────────────
CommandResult CommandDispatcher::TaskLogRemove() {
    spdlog::debug("[COMMAND] TaskLogRemove");
    std::lock_guard<std::mutex> lock(m_State.mutex);
    m_State.log.Disable();
    return CommandResult{true, {}};
}

// ─────────────────────────────────────
CommandResult CommandDispatcher::TaskLogOutput(bool reset) {
    spdlog::debug("[COMMAND] TaskLogOutput(reset={})", reset);
    std::lock_guard<std::mutex> lock(m_State.mutex);
    return CommandResult{true, m_State.timer.Journal() + m_State.log.Dump(reset)};
}

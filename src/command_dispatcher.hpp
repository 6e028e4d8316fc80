#pragma once

#include <string>

#include "shared_state.hpp"

struct CommandResult {
    bool accepted = false;
    // Rejection reason, or the payload of a query
    std::string message;
};

// Inbound control surface. Transports (D-Bus, tests) call into this and never touch the
// timer directly.
class CommandHandler {
  public:
    virtual ~CommandHandler() = default;

    virtual CommandResult StartBlock(unsigned durationSeconds) = 0;
    virtual CommandResult PauseBlock() = 0;
    virtual CommandResult CancelBlock() = 0;
    virtual CommandResult TaskLogAdd(const std::string &label) = 0;
    virtual CommandResult TaskLogRemove() = 0;
    virtual CommandResult TaskLogOutput(bool reset) = 0;
};

class CommandDispatcher : public CommandHandler {
  public:
    explicit CommandDispatcher(SharedState &state);

    CommandResult StartBlock(unsigned durationSeconds) override;
    CommandResult PauseBlock() override;
    CommandResult CancelBlock() override;
    CommandResult TaskLogAdd(const std::string &label) override;
    CommandResult TaskLogRemove() override;
    CommandResult TaskLogOutput(bool reset) override;

  private:
    SharedState &m_State;
};

#pragma once

#include <string>

// Fire-and-forget execution of a user command.
class ShellRunner {
  public:
    virtual ~ShellRunner() = default;
    virtual void Run(const std::string &command) = 0;
};

// Runs the command through /bin/sh -c in a detached grandchild with stdout on /dev/null;
// never waits on it.
class ProcessShellRunner : public ShellRunner {
  public:
    void Run(const std::string &command) override;
};

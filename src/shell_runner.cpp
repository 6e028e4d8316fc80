#include "shell_runner.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

// ─────────────────────────────────────
void ProcessShellRunner::Run(const std::string &command) {
    if (command.empty()) {
        return;
    }

    const pid_t pid = fork();
    if (pid < 0) {
        spdlog::error("ShellRunner: fork failed: {}", std::strerror(errno));
        return;
    }

    if (pid == 0) {
        // Intermediate child: only async-signal-safe calls from here on.
        setsid();
        const pid_t grandchild = fork();
        if (grandchild == 0) {
            // empty signal mask, stdout off the status line
            sigset_t none;
            sigemptyset(&none);
            sigprocmask(SIG_SETMASK, &none, nullptr);
            const int devnull = open("/dev/null", O_WRONLY);
            if (devnull >= 0) {
                dup2(devnull, STDOUT_FILENO);
                close(devnull);
            }
            execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char *>(nullptr));
            _exit(127);
        }
        _exit(grandchild < 0 ? 1 : 0);
    }

    // The intermediate child exits right away; reap it so no zombie is left behind.
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            spdlog::warn("ShellRunner: waitpid failed: {}", std::strerror(errno));
            return;
        }
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        spdlog::error("ShellRunner: could not spawn '{}'", command);
        return;
    }
    spdlog::info("ShellRunner: launched '{}'", command);
}

#include "leedopt/leed/runner.hpp"

#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

    // waitpid that retries when interrupted by a signal
    pid_t WaitChild(pid_t pid, int* status, int options)
    {
        pid_t rc;
        do {
            rc = waitpid(pid, status, options);
        } while (rc < 0 && errno == EINTR);
        return rc;
    }

    void DecodeStatus(int status, leedopt::leed::ProcessResult& result)
    {
        if (WIFEXITED(status)) {
            result.exitCode = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.signal = WTERMSIG(status);
        }
    }

} // namespace

namespace leedopt::leed {

    const char* ToString(SolverRunStatus::Code code)
    {
        switch (code) {
            case SolverRunStatus::Code::Success:           return "success";
            case SolverRunStatus::Code::FirstStageFailed:  return "first stage failed";
            case SolverRunStatus::Code::SecondStageFailed: return "second stage failed";
            case SolverRunStatus::Code::TimedOut:          return "timed out";
        }
        return "unknown";
    }

    ProcessResult RunExecutable(const fs::path& exe, const fs::path& workDir, int timeout)
    {
        ProcessResult result;

        // everything the child touches is prepared before fork
        const std::string exePath = exe.string();
        const std::string dirPath = workDir.string();
        const std::string logPath = (workDir / "stdout").string();

        pid_t pid = fork();
        if (pid < 0) {
            result.message = std::format("fork failed: {}", std::strerror(errno));
            return result;
        }

        if (pid == 0) {
            // child: only async-signal-safe calls from here on
            // own process group, so a timeout reaches every descendant
            setpgid(0, 0);
            if (chdir(dirPath.c_str()) != 0) _exit(126);

            int fd = open(logPath.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
            if (fd >= 0) {
                dup2(fd, STDOUT_FILENO);
                dup2(fd, STDERR_FILENO);
                close(fd);
            }

            execl(exePath.c_str(), exePath.c_str(), static_cast<char*>(nullptr));
            _exit(127);
        }

        // set in the parent too, so kill(-pid) cannot race the child's setpgid
        setpgid(pid, pid);
        result.launched = true;
        int status = 0;

        if (timeout <= 0) {
            if (WaitChild(pid, &status, 0) < 0) {
                result.launched = false;
                result.message = std::format("waitpid failed: {}", std::strerror(errno));
                return result;
            }
            DecodeStatus(status, result);
            return result;
        }

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout);
        while (true) {
            pid_t rc = WaitChild(pid, &status, WNOHANG);
            if (rc == pid) {
                DecodeStatus(status, result);
                return result;
            }
            if (rc < 0) {
                result.launched = false;
                result.message = std::format("waitpid failed: {}", std::strerror(errno));
                return result;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                kill(-pid, SIGKILL);
                WaitChild(pid, &status, 0);
                result.timedOut = true;
                result.signal = SIGKILL;
                return result;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }

    SolverRunStatus RunSolvers(const fs::path& first, const fs::path& second, const fs::path& workDir, int timeout)
    {
        SolverRunStatus status;
        const fs::path stages[] = {first, second};

        for (int stage = 1; stage <= 2; stage++) {
            const fs::path& exe = stages[stage - 1];
            const ProcessResult result = RunExecutable(exe, workDir, timeout);
            if (result.ok()) continue;

            status.stage = stage;
            status.exitCode = result.exitCode;
            if (result.timedOut) {
                status.code = SolverRunStatus::Code::TimedOut;
                status.message = std::format("{} exceeded {} s and was killed", exe.string(), timeout);
            }
            else {
                status.code = (stage == 1) ? SolverRunStatus::Code::FirstStageFailed
                                           : SolverRunStatus::Code::SecondStageFailed;
                if (!result.launched)
                    status.message = std::format("{}: {}", exe.string(), result.message);
                else if (result.signal != 0)
                    status.message = std::format("{} terminated by signal {}", exe.string(), result.signal);
                else
                    status.message = std::format("{} returned non-zero exit status {}", exe.string(), result.exitCode);
            }
            return status;
        }
        return status;
    }

} // namespace leedopt::leed

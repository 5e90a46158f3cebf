#pragma once

#include "leedopt/core/common.hpp"

namespace leedopt::leed {

    //--------------------------------------------------------------------------
    // Struct: ProcessResult
    // Description: how one external process ended
    //--------------------------------------------------------------------------
    struct ProcessResult
    {
        bool launched = false;      // fork/exec succeeded
        bool timedOut = false;      // killed after the timeout
        int exitCode = -1;          // exit status when the process exited normally
        int signal = 0;             // terminating signal, 0 if none
        std::string message;        // launch error description

        bool ok() const { return launched && !timedOut && signal == 0 && exitCode == 0; }
    };

    //--------------------------------------------------------------------------
    // Struct: SolverRunStatus
    // Description: outcome of the two-stage solver run of one evaluation
    //--------------------------------------------------------------------------
    struct SolverRunStatus
    {
        enum class Code { Success, FirstStageFailed, SecondStageFailed, TimedOut };

        Code code = Code::Success;
        int stage = 0;              // 1 or 2 for the failing stage, 0 on success
        int exitCode = 0;
        std::string message;

        bool ok() const { return code == Code::Success; }
    };

    // Name of a status code for log lines
    const char* ToString(SolverRunStatus::Code code);

    /**
     * Method: RunExecutable
     * Description: run exe without arguments inside workDir and wait for it.
     * stdout and stderr go to the file "stdout" of workDir. With timeout > 0
     * the process is killed (SIGKILL) after timeout seconds.
     * The caller's working directory is never changed.
     */
    ProcessResult RunExecutable(const fs::path& exe, const fs::path& workDir, int timeout);

    /**
     * Method: RunSolvers
     * Description: run the first stage, then the second one if the first
     * succeeded, both inside workDir
     */
    SolverRunStatus RunSolvers(const fs::path& first, const fs::path& second, const fs::path& workDir, int timeout);

} // namespace leedopt::leed

#pragma once

#include <string>
#include <vector>

/**
 * Outcome of running an external program.
 */
struct ProcessResult
{
    enum class Status
    {
        Exited,      // Normal exit, see exitCode
        Signaled,    // Killed by a signal it did not expect
        TimedOut,    // Exceeded the timeout and was terminated
        SpawnFailed  // Program missing or not executable
    };

    Status status = Status::SpawnFailed;
    int exitCode = -1;
    std::string error; // Description for anything but a clean exit

    bool succeeded() const { return status == Status::Exited && exitCode == 0; }
};

/**
 * Runs a program found on PATH with an argument vector (no shell), waits
 * for it with a timeout, and terminates it when the timeout expires.
 */
class ProcessRunner
{
public:
    /**
     * @param program Executable name or path (looked up on PATH)
     * @param args Arguments, not including argv[0]
     * @param timeoutSeconds Wall-clock limit; <= 0 waits forever
     */
    static ProcessResult run(const std::string &program,
                             const std::vector<std::string> &args,
                             int timeoutSeconds);
};

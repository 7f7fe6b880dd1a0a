#include "process_runner.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>

#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

extern char **environ;

namespace
{
    constexpr auto POLL_INTERVAL = std::chrono::milliseconds(100);
    constexpr auto TERMINATE_GRACE = std::chrono::seconds(5);

    // Reap the child within the grace period, SIGKILL it otherwise
    void terminate(pid_t pid)
    {
        ::kill(pid, SIGTERM);

        auto deadline = std::chrono::steady_clock::now() + TERMINATE_GRACE;
        int status = 0;
        while (::waitpid(pid, &status, WNOHANG) == 0)
        {
            if (std::chrono::steady_clock::now() >= deadline)
            {
                ::kill(pid, SIGKILL);
                ::waitpid(pid, &status, 0);
                return;
            }
            std::this_thread::sleep_for(POLL_INTERVAL);
        }
    }
}

ProcessResult ProcessRunner::run(const std::string &program,
                                 const std::vector<std::string> &args,
                                 int timeoutSeconds)
{
    ProcessResult result;

    std::vector<char *> argv;
    argv.push_back(const_cast<char *>(program.c_str()));
    for (const auto &arg : args)
    {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = 0;
    int spawnError = ::posix_spawnp(&pid, program.c_str(), nullptr, nullptr, argv.data(), environ);
    if (spawnError != 0)
    {
        result.status = ProcessResult::Status::SpawnFailed;
        result.error = fmt::format("Cannot start '{}': {}", program, std::strerror(spawnError));
        return result;
    }

    auto started = std::chrono::steady_clock::now();
    int status = 0;

    while (true)
    {
        pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid)
        {
            break;
        }
        if (waited < 0 && errno != EINTR)
        {
            result.status = ProcessResult::Status::Signaled;
            result.error = fmt::format("Lost track of '{}': {}", program, std::strerror(errno));
            return result;
        }

        if (timeoutSeconds > 0 &&
            std::chrono::steady_clock::now() - started >= std::chrono::seconds(timeoutSeconds))
        {
            terminate(pid);
            result.status = ProcessResult::Status::TimedOut;
            result.error = fmt::format("'{}' timed out after {}s", program, timeoutSeconds);
            return result;
        }

        std::this_thread::sleep_for(POLL_INTERVAL);
    }

    if (WIFEXITED(status))
    {
        result.status = ProcessResult::Status::Exited;
        result.exitCode = WEXITSTATUS(status);
        // posix_spawnp reports a failed exec in the child as exit code 127
        if (result.exitCode == 127)
        {
            result.error = fmt::format("'{}' exited with status 127 (not found?)", program);
        }
        else if (result.exitCode != 0)
        {
            result.error = fmt::format("'{}' exited with status {}", program, result.exitCode);
        }
        return result;
    }

    result.status = ProcessResult::Status::Signaled;
    result.error = WIFSIGNALED(status)
                       ? fmt::format("'{}' was killed by signal {}", program, WTERMSIG(status))
                       : fmt::format("'{}' ended abnormally", program);
    return result;
}

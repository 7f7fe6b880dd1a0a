#pragma once

#include <string>
#include <utility>

#include <fmt/core.h>

/**
 * Diagnostics sink handed to every component.
 * Components never configure logging themselves; the caller decides where
 * messages go (console, nowhere, a test recorder).
 */
class Diagnostics
{
public:
    enum class Level
    {
        Debug,
        Info,
        Warning,
        Error
    };

    virtual ~Diagnostics() = default;

    /**
     * Receive one already formatted message.
     */
    virtual void log(Level level, const std::string &message) = 0;

    void debug(const std::string &message) { log(Level::Debug, message); }
    void info(const std::string &message) { log(Level::Info, message); }
    void warn(const std::string &message) { log(Level::Warning, message); }
    void error(const std::string &message) { log(Level::Error, message); }

    // fmt-style convenience overloads
    template <typename... Args>
    void debug(fmt::format_string<Args...> format, Args &&...args)
    {
        log(Level::Debug, fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void info(fmt::format_string<Args...> format, Args &&...args)
    {
        log(Level::Info, fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void warn(fmt::format_string<Args...> format, Args &&...args)
    {
        log(Level::Warning, fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void error(fmt::format_string<Args...> format, Args &&...args)
    {
        log(Level::Error, fmt::format(format, std::forward<Args>(args)...));
    }
};

/**
 * Console sink: "2024-01-31 12:00:00 - INFO - message".
 * Info and debug go to stdout, warnings and errors to stderr.
 */
class ConsoleDiagnostics : public Diagnostics
{
public:
    explicit ConsoleDiagnostics(bool verbose = false) : verbose_(verbose) {}

    void log(Level level, const std::string &message) override;

private:
    bool verbose_;
};

/**
 * Sink that drops everything.
 */
class NullDiagnostics : public Diagnostics
{
public:
    void log(Level, const std::string &) override {}
};

const char *levelName(Diagnostics::Level level);

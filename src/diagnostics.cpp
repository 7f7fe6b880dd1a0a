#include "diagnostics.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>

const char *levelName(Diagnostics::Level level)
{
    switch (level)
    {
    case Diagnostics::Level::Debug:
        return "DEBUG";
    case Diagnostics::Level::Info:
        return "INFO";
    case Diagnostics::Level::Warning:
        return "WARNING";
    case Diagnostics::Level::Error:
        return "ERROR";
    }
    return "UNKNOWN";
}

void ConsoleDiagnostics::log(Level level, const std::string &message)
{
    if (level == Level::Debug && !verbose_)
    {
        return;
    }

    // Local wall-clock timestamp, second resolution
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);

    std::FILE *stream = (level == Level::Warning || level == Level::Error) ? stderr : stdout;
    fmt::print(stream, "{} - {} - {}\n", stamp, levelName(level), message);
    std::fflush(stream);
}

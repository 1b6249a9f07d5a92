#include "log.hpp"

#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>

namespace iopatch {

namespace
{
    std::mutex gLogMutex;
    std::ofstream gLogFile;
    LogOptions gOptions;

    // ------------------------------------------------------------
    // Timestamp helper
    // ------------------------------------------------------------
    std::string CurrentTimestamp()
    {
        std::time_t now = std::time(nullptr);
        std::tm local{};
        localtime_r(&now, &local);

        char buffer[64];
        std::strftime(buffer, sizeof(buffer), "[%Y-%m-%d %H:%M:%S] ", &local);
        return std::string(buffer);
    }

    const char* LevelName(LogLevel level)
    {
        switch (level) {
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info:  return "INFO";
            case LogLevel::Warn:  return "WARN";
            case LogLevel::Error: return "ERROR";
        }
        return "?";
    }

    void write_console(LogLevel level, const char* text)
    {
        if (!gOptions.console) return;
        if (level == LogLevel::Debug && !gOptions.verbose) return;

        std::ostream& out = level >= LogLevel::Warn ? std::cerr : std::cout;
        out << LevelName(level) << " - " << text << std::endl;
    }
}

bool log_init(const LogOptions& options)
{
    std::lock_guard<std::mutex> lock(gLogMutex);

    gOptions = options;
    if (gLogFile.is_open()) {
        gLogFile.close();
    }
    if (options.filePath.empty()) {
        return true;
    }

    gLogFile.open(options.filePath, std::ios::out | std::ios::app);
    if (!gLogFile.is_open()) {
        return false;
    }
    gLogFile << CurrentTimestamp() << "=== iopatch log started ===" << std::endl;
    return true;
}

void log_shutdown()
{
    std::lock_guard<std::mutex> lock(gLogMutex);
    if (gLogFile.is_open()) {
        gLogFile.close();
    }
}

// ------------------------------------------------------------
// Standard formatted log with timestamp
// ------------------------------------------------------------
void log_message(LogLevel level, const char* fmt, ...)
{
    char buf[1024];

    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);

    std::lock_guard<std::mutex> lock(gLogMutex);
    write_console(level, buf);

    if (gLogFile.is_open()) {
        gLogFile << CurrentTimestamp() << LevelName(level) << " - " << buf << std::endl;
        gLogFile.flush();
    }
}

// ------------------------------------------------------------
// Progress bar logging with timestamp
// ------------------------------------------------------------
void log_progress(const std::string& stage, int current, int total)
{
    std::lock_guard<std::mutex> lock(gLogMutex);
    if (!gLogFile.is_open()) return;

    constexpr int barWidth = 20;
    int filled = (total > 0) ? (current * barWidth / total) : 0;

    gLogFile << CurrentTimestamp() << stage << " [";
    for (int i = 0; i < barWidth; ++i) {
        gLogFile << (i < filled ? '#' : '.');
    }
    gLogFile << "] " << current << "/" << total << std::endl;

    gLogFile.flush();
}

} // namespace iopatch

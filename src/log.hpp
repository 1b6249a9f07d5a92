#pragma once

#include <string>

namespace iopatch {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

struct LogOptions {
    std::string filePath;       // Empty disables the log file
    bool console = true;
    bool verbose = false;       // Echo Debug lines to the console
};

// Configure sinks. The file is opened in append mode with a start banner.
// Returns false if the log file could not be opened; console logging still works.
bool log_init(const LogOptions& options);

// Close the log file, if any
void log_shutdown();

// printf-style formatted log line
void log_message(LogLevel level, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

// Progress line for the log file, e.g. "Patching [####....] 3/8"
void log_progress(const std::string& stage, int current, int total);

} // namespace iopatch

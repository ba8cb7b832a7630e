#pragma once
// Progress logging for validation runs.

#include <iosfwd>
#include <optional>
#include <string>

namespace posecheck {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Accepts debug, info, warn/warning and error in any case.
std::optional<LogLevel> parseLogLevel(const std::string& value);

// Upper-case tag used in log lines, e.g. "WARN".
const char* logLevelTag(LogLevel level);

// Process-wide logger. Lines look like "[WARN] message" and go to stdout
// unless another stream is installed with setOutput.
class Logger {
public:
    static void log(LogLevel level, const std::string& message);
    static bool enabled(LogLevel level);

    static void setMinLevel(LogLevel level);
    static LogLevel minLevel();

    // The stream must outlive every later log call; resetOutput restores stdout.
    static void setOutput(std::ostream& out);
    static void resetOutput();

private:
    static LogLevel min_level_;
    static std::ostream* out_;
};

} // namespace posecheck

#include "posecheck/Logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <iostream>
#include <mutex>

namespace posecheck {

LogLevel Logger::min_level_ = LogLevel::Info;
std::ostream* Logger::out_ = &std::cout;

namespace {

constexpr std::array<const char*, 4> kLevelTags = {"DEBUG", "INFO", "WARN", "ERROR"};

// Guards out_ and every write through it.
std::mutex& outputMutex() {
    static std::mutex mutex;
    return mutex;
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return text;
}

} // namespace

std::optional<LogLevel> parseLogLevel(const std::string& value) {
    const std::string lower = toLower(value);
    if (lower == "warning") {
        return LogLevel::Warn;
    }
    for (std::size_t i = 0; i < kLevelTags.size(); ++i) {
        if (lower == toLower(kLevelTags[i])) {
            return static_cast<LogLevel>(i);
        }
    }
    return std::nullopt;
}

const char* logLevelTag(LogLevel level) {
    const auto index = static_cast<std::size_t>(level);
    return index < kLevelTags.size() ? kLevelTags[index] : "INFO";
}

bool Logger::enabled(LogLevel level) {
    return level >= min_level_;
}

void Logger::setMinLevel(LogLevel level) {
    min_level_ = level;
}

LogLevel Logger::minLevel() {
    return min_level_;
}

void Logger::setOutput(std::ostream& out) {
    std::lock_guard<std::mutex> lock(outputMutex());
    out_ = &out;
}

void Logger::resetOutput() {
    setOutput(std::cout);
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!enabled(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(outputMutex());
    *out_ << '[' << logLevelTag(level) << "] " << message << '\n';
    out_->flush();
}

} // namespace posecheck

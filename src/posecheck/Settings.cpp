#include "posecheck/Settings.hpp"

#include <fstream>
#include <stdexcept>

namespace posecheck {
namespace {

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

double parseThreshold(const std::string& key, const std::string& value) {
    std::size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + key + ": " + value);
    }
    if (consumed != value.size()) {
        throw std::invalid_argument("Invalid value for " + key + ": " + value);
    }
    return parsed;
}

std::size_t parseCount(const std::string& key, const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("Invalid value for " + key + ": " + value);
    }
    try {
        return static_cast<std::size_t>(std::stoull(value));
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + key + ": " + value);
    }
}

LogLevel parseLevel(const std::string& value) {
    const auto level = parseLogLevel(trim(value));
    if (!level.has_value()) {
        throw std::invalid_argument("Unknown log level: " + value);
    }
    return *level;
}

bool startsWith(const std::string& arg, const std::string& prefix) {
    return arg.rfind(prefix, 0) == 0;
}

} // namespace

ValidatorSettings ValidatorSettings::fromFile(const std::string& path) {
    ValidatorSettings settings;

    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open settings file: " + path);
    }

    std::string line;
    while (std::getline(in, line)) {
        const auto trimmed = trim(line);
        if (trimmed.empty() || trimmed.rfind("#", 0) == 0) {
            continue;
        }
        const auto eq = trimmed.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        const auto key = trim(trimmed.substr(0, eq));
        const auto value = trim(trimmed.substr(eq + 1));

        if (key == "overlap_threshold") {
            settings.overlap_threshold = parseThreshold(key, value);
        } else if (key == "report_limit") {
            settings.report_limit = parseCount(key, value);
        } else if (key == "missing_example_limit") {
            settings.missing_example_limit = parseCount(key, value);
        } else if (key == "config_filename") {
            settings.config_filename = value;
        } else if (key == "log_level") {
            settings.log_level = parseLevel(value);
        }
    }

    return settings;
}

SettingsOverrides SettingsOverrides::fromArgs(int argc, char** argv) {
    SettingsOverrides overrides;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--settings" && i + 1 < argc) {
            overrides.settings_path = argv[++i];
        } else if (startsWith(arg, "--settings=")) {
            overrides.settings_path = arg.substr(std::string("--settings=").size());
        } else if (startsWith(arg, "--overlap-threshold=")) {
            overrides.overlap_threshold = parseThreshold(
                "--overlap-threshold", arg.substr(std::string("--overlap-threshold=").size()));
        } else if (startsWith(arg, "--report-limit=")) {
            overrides.report_limit =
                parseCount("--report-limit", arg.substr(std::string("--report-limit=").size()));
        } else if (startsWith(arg, "--examples=")) {
            overrides.missing_example_limit =
                parseCount("--examples", arg.substr(std::string("--examples=").size()));
        } else if (startsWith(arg, "--config-name=")) {
            overrides.config_filename = arg.substr(std::string("--config-name=").size());
        } else if (startsWith(arg, "--log-level=")) {
            overrides.log_level = parseLevel(arg.substr(std::string("--log-level=").size()));
        } else if (arg == "--quiet") {
            overrides.log_level = LogLevel::Error;
        } else if (startsWith(arg, "--")) {
            throw std::invalid_argument("Unknown option: " + arg);
        } else {
            ++overrides.positional_count;
            if (!overrides.dataset_root.has_value()) {
                overrides.dataset_root = arg;
            }
        }
    }

    return overrides;
}

void ValidatorSettings::applyOverrides(const SettingsOverrides& overrides) {
    if (overrides.overlap_threshold.has_value()) {
        overlap_threshold = *overrides.overlap_threshold;
    }
    if (overrides.report_limit.has_value()) {
        report_limit = *overrides.report_limit;
    }
    if (overrides.missing_example_limit.has_value()) {
        missing_example_limit = *overrides.missing_example_limit;
    }
    if (overrides.config_filename.has_value()) {
        config_filename = *overrides.config_filename;
    }
    if (overrides.log_level.has_value()) {
        log_level = *overrides.log_level;
    }
}

void ValidatorSettings::check() const {
    if (!(overlap_threshold >= 0.0 && overlap_threshold <= 1.0)) {
        throw std::invalid_argument("overlap_threshold must be within [0, 1]");
    }
    if (report_limit == 0) {
        throw std::invalid_argument("report_limit must be >= 1");
    }
    if (config_filename.empty()) {
        throw std::invalid_argument("config_filename must not be empty");
    }
}

} // namespace posecheck

#pragma once
// Tunables of the validator itself (not the dataset's data.yaml).

#include <cstddef>
#include <optional>
#include <string>

#include "posecheck/Logger.hpp"

namespace posecheck {

struct SettingsOverrides {
    std::optional<std::string> settings_path;
    std::optional<std::string> dataset_root;

    std::optional<double> overlap_threshold;
    std::optional<std::size_t> report_limit;
    std::optional<std::size_t> missing_example_limit;
    std::optional<std::string> config_filename;
    std::optional<LogLevel> log_level;

    // Counts positional arguments so the CLI can reject more than one root.
    int positional_count = 0;

    static SettingsOverrides fromArgs(int argc, char** argv);
};

struct ValidatorSettings {
    double overlap_threshold = 0.5;
    std::size_t report_limit = 20;
    std::size_t missing_example_limit = 5;
    std::string config_filename = "data.yaml";
    LogLevel log_level = LogLevel::Info;

    static ValidatorSettings fromFile(const std::string& path);

    void applyOverrides(const SettingsOverrides& overrides);

    // Throws std::invalid_argument naming the offending key.
    void check() const;
};

} // namespace posecheck

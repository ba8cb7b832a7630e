#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "posecheck/Diagnostic.hpp"

namespace posecheck {

// The only keypoint layout the validator accepts: four corners, x/y/visibility.
constexpr std::pair<int, int> kExpectedKeypointShape{4, 3};

// Parsed data.yaml. Fields that were missing or malformed stay empty so the
// later stages can still run on whatever was usable.
struct DatasetConfig {
    std::optional<std::string> train_path;
    std::optional<std::string> val_path;
    std::optional<int> num_classes;
    std::optional<std::vector<std::string>> class_names;
    std::optional<std::pair<int, int>> keypoint_shape;

    // Class count used for label checks; single-class when nc is unusable.
    int effectiveClassCount() const { return num_classes.value_or(1); }
};

struct ConfigResult {
    // Empty when the file is absent or cannot be parsed (soft gate).
    std::optional<DatasetConfig> config;
    DiagnosticBatch diagnostics;
};

// Loads <root>/<filename> and checks it field by field. Missing or malformed
// fields add errors but still return the parsed structure.
ConfigResult loadDatasetConfig(const std::filesystem::path& root,
                               const std::string& filename = "data.yaml");

} // namespace posecheck

#pragma once
// Pairs images with label files for one split and validates every label.

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "posecheck/DatasetConfig.hpp"
#include "posecheck/Diagnostic.hpp"

namespace posecheck {

struct SplitSummary {
    std::string split;
    std::size_t image_count = 0;
    std::size_t label_count = 0;
    std::size_t valid_labels = 0;

    // Totals over labels that passed without issues.
    std::size_t instance_count = 0;
    std::size_t pose_count = 0;

    std::size_t missing_labels = 0;
    std::size_t orphaned_labels = 0;
    std::vector<std::string> missing_examples;  // sorted, capped

    double poseCoveragePercent() const;
};

struct SplitResult {
    SplitSummary summary;
    DiagnosticBatch diagnostics;
};

struct SplitOptions {
    double overlap_threshold = 0.5;
    std::size_t missing_example_limit = 5;
};

bool isImageFile(const std::filesystem::path& path);

// Never aborts: absent directories simply contribute no files.
SplitResult validateSplit(const std::filesystem::path& root,
                          const std::string& split,
                          const DatasetConfig& config,
                          const SplitOptions& options = {});

} // namespace posecheck

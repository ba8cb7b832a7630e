#pragma once
// Per-line and per-file checks of YOLO pose label files.
//
// A line holds either 5 fields (class cx cy w h) or 17 fields (the same five
// plus x/y/visibility for the TL, TR, BR, BL corners). Each line is checked
// independently and every applicable issue is recorded before moving on.

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include "posecheck/Diagnostic.hpp"
#include "posecheck/Geometry.hpp"

namespace posecheck {

constexpr std::size_t kBoxFieldCount = 5;
constexpr std::size_t kPoseFieldCount = 17;

struct LabelLocation {
    std::string split;
    std::string file;
    std::size_t line = 0;  // 1-based physical line
};

struct LineResult {
    std::size_t field_count = 0;
    IssueSet issues;
    DiagnosticBatch diagnostics;

    // Present whenever the four box fields parsed, range problems included.
    std::optional<BoundingBox> box;
    std::optional<Keypoints> keypoints;

    bool isPose() const { return field_count == kPoseFieldCount; }
};

LineResult validateLabelLine(const std::string& line, int num_classes, const LabelLocation& where);

struct LabelFileResult {
    // Categories of every error and warning in the file, overlaps included.
    IssueSet issues;
    DiagnosticBatch diagnostics;
    std::size_t instance_count = 0;
    std::size_t pose_count = 0;

    bool valid() const { return issues.empty(); }
};

// An unreadable file yields only {read_error}. Files with more than one
// instance are also scanned for overlapping boxes.
LabelFileResult validateLabelFile(const std::filesystem::path& path,
                                  int num_classes,
                                  const std::string& split,
                                  double overlap_threshold = 0.5);

} // namespace posecheck

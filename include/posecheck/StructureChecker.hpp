#pragma once
// Hard gate: the four split directories must exist before anything else runs.

#include <array>
#include <filesystem>

#include "posecheck/Diagnostic.hpp"

namespace posecheck {

constexpr std::array<const char*, 4> kRequiredDirectories = {
    "images/train",
    "images/val",
    "labels/train",
    "labels/val",
};

struct StructureResult {
    bool ok = false;
    DiagnosticBatch diagnostics;
};

// One `structure` error per missing (or non-directory) path; ok only when
// all four are present.
StructureResult checkStructure(const std::filesystem::path& root);

} // namespace posecheck

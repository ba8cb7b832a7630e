#pragma once
// Runs the validation stages in order over one dataset root and keeps the
// merged findings for reporting.

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "posecheck/DatasetConfig.hpp"
#include "posecheck/Diagnostic.hpp"
#include "posecheck/Geometry.hpp"
#include "posecheck/Settings.hpp"
#include "posecheck/SplitValidator.hpp"

namespace posecheck {

constexpr const char* kSplits[] = {"train", "val"};

struct ValidationReport {
    std::filesystem::path dataset_root;
    DiagnosticBatch diagnostics;
    std::vector<SplitSummary> splits;

    bool passed() const { return !diagnostics.hasErrors(); }
};

class DatasetValidator {
public:
    explicit DatasetValidator(std::filesystem::path dataset_root, ValidatorSettings settings = {});

    // Stage entry points. Each appends its findings to this validator.
    bool checkStructure();
    std::optional<DatasetConfig> loadConfig();
    SplitSummary validateSplit(const std::string& split, const DatasetConfig& config);
    IssueSet validateLabelFile(const std::filesystem::path& path, int num_classes, const std::string& split);

    static double calculateIou(const BoundingBox& a, const BoundingBox& b);

    // Structure gate, config gate, then both splits. True when no errors.
    bool validate();

    const std::vector<Diagnostic>& errors() const { return report_.diagnostics.errors; }
    const std::vector<Diagnostic>& warnings() const { return report_.diagnostics.warnings; }
    const ValidationReport& report() const { return report_; }

private:
    ValidatorSettings settings_;
    ValidationReport report_;
};

} // namespace posecheck

#include "posecheck/DatasetValidator.hpp"

#include <utility>

#include "posecheck/LabelValidator.hpp"
#include "posecheck/Logger.hpp"
#include "posecheck/StructureChecker.hpp"

namespace posecheck {

DatasetValidator::DatasetValidator(std::filesystem::path dataset_root, ValidatorSettings settings)
    : settings_(std::move(settings)) {
    report_.dataset_root = std::move(dataset_root);
}

bool DatasetValidator::checkStructure() {
    StructureResult result = posecheck::checkStructure(report_.dataset_root);
    report_.diagnostics.append(result.diagnostics);
    return result.ok;
}

std::optional<DatasetConfig> DatasetValidator::loadConfig() {
    ConfigResult result = loadDatasetConfig(report_.dataset_root, settings_.config_filename);
    report_.diagnostics.append(result.diagnostics);
    return result.config;
}

SplitSummary DatasetValidator::validateSplit(const std::string& split, const DatasetConfig& config) {
    SplitOptions options;
    options.overlap_threshold = settings_.overlap_threshold;
    options.missing_example_limit = settings_.missing_example_limit;

    SplitResult result = posecheck::validateSplit(report_.dataset_root, split, config, options);
    report_.diagnostics.append(result.diagnostics);
    report_.splits.push_back(result.summary);
    return result.summary;
}

IssueSet DatasetValidator::validateLabelFile(const std::filesystem::path& path,
                                             int num_classes,
                                             const std::string& split) {
    LabelFileResult result = posecheck::validateLabelFile(path, num_classes, split, settings_.overlap_threshold);
    report_.diagnostics.append(result.diagnostics);
    return result.issues;
}

double DatasetValidator::calculateIou(const BoundingBox& a, const BoundingBox& b) {
    return posecheck::calculateIou(a, b);
}

bool DatasetValidator::validate() {
    Logger::log(LogLevel::Info, "Validating YOLO-pose dataset: " + report_.dataset_root.string());

    if (!checkStructure()) {
        return false;
    }

    const auto config = loadConfig();
    if (!config.has_value()) {
        return false;
    }

    for (const char* split : kSplits) {
        validateSplit(split, *config);
    }

    return report_.passed();
}

} // namespace posecheck

#include "posecheck/SplitValidator.hpp"

#include <algorithm>
#include <iomanip>
#include <map>
#include <sstream>
#include <system_error>

#include "posecheck/LabelValidator.hpp"
#include "posecheck/Logger.hpp"

namespace posecheck {
namespace {

using StemMap = std::map<std::string, std::filesystem::path>;

template <typename Predicate>
StemMap collectByStem(const std::filesystem::path& dir, Predicate accept) {
    StemMap files;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return files;
    }

    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& path = it->path();
        if (accept(path)) {
            files.emplace(path.stem().string(), path);
        }
    }
    if (ec) {
        Logger::log(LogLevel::Warn, "Failed to list " + dir.string() + ": " + ec.message());
    }
    return files;
}

bool isLabelFile(const std::filesystem::path& path) {
    return path.extension() == ".txt";
}

std::vector<std::string> difference(const StemMap& left, const StemMap& right) {
    std::vector<std::string> stems;
    for (const auto& entry : left) {
        if (right.find(entry.first) == right.end()) {
            stems.push_back(entry.first);
        }
    }
    return stems;
}

} // namespace

double SplitSummary::poseCoveragePercent() const {
    return static_cast<double>(pose_count) / static_cast<double>(std::max<std::size_t>(instance_count, 1)) *
           100.0;
}

bool isImageFile(const std::filesystem::path& path) {
    const auto ext = path.extension();
    return ext == ".jpg" || ext == ".jpeg" || ext == ".png";
}

SplitResult validateSplit(const std::filesystem::path& root,
                          const std::string& split,
                          const DatasetConfig& config,
                          const SplitOptions& options) {
    Logger::log(LogLevel::Info, "Validating " + split + " split...");

    SplitResult result;
    SplitSummary& summary = result.summary;
    summary.split = split;

    const StemMap images = collectByStem(root / "images" / split, isImageFile);
    const StemMap labels = collectByStem(root / "labels" / split, isLabelFile);
    summary.image_count = images.size();
    summary.label_count = labels.size();
    Logger::log(LogLevel::Info, "Images: " + std::to_string(images.size()));
    Logger::log(LogLevel::Info, "Labels: " + std::to_string(labels.size()));

    const auto missing = difference(images, labels);
    summary.missing_labels = missing.size();
    if (!missing.empty()) {
        const std::size_t shown = std::min(missing.size(), options.missing_example_limit);
        summary.missing_examples.assign(missing.begin(), missing.begin() + static_cast<std::ptrdiff_t>(shown));

        std::ostringstream oss;
        oss << split << ": " << missing.size() << " images without labels";
        if (!summary.missing_examples.empty()) {
            oss << " (e.g. ";
            for (std::size_t i = 0; i < summary.missing_examples.size(); ++i) {
                oss << (i > 0 ? ", " : "") << summary.missing_examples[i];
            }
            oss << ")";
        }
        result.diagnostics.error(IssueKind::MissingLabel, oss.str());
        for (const auto& stem : summary.missing_examples) {
            Logger::log(LogLevel::Info, "  missing label: " + stem);
        }
    }

    const auto orphaned = difference(labels, images);
    summary.orphaned_labels = orphaned.size();
    if (!orphaned.empty()) {
        result.diagnostics.warning(IssueKind::OrphanLabel,
                                   split + ": " + std::to_string(orphaned.size()) + " labels without images");
    }

    const int num_classes = config.effectiveClassCount();
    for (const auto& entry : labels) {
        const LabelFileResult file = validateLabelFile(entry.second, num_classes, split, options.overlap_threshold);
        result.diagnostics.append(file.diagnostics);
        if (file.valid()) {
            ++summary.valid_labels;
            summary.instance_count += file.instance_count;
            summary.pose_count += file.pose_count;
        }
    }

    std::ostringstream coverage;
    coverage << "Instances with pose: " << summary.pose_count << " (" << std::fixed << std::setprecision(1)
             << summary.poseCoveragePercent() << "%)";
    Logger::log(LogLevel::Info, "Valid labels: " + std::to_string(summary.valid_labels) + "/" +
                                    std::to_string(summary.label_count));
    Logger::log(LogLevel::Info, "Total instances: " + std::to_string(summary.instance_count));
    Logger::log(LogLevel::Info, coverage.str());

    if (summary.valid_labels == summary.label_count && summary.missing_labels == 0) {
        Logger::log(LogLevel::Info, split + " split OK");
    }
    return result;
}

} // namespace posecheck

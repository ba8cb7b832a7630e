#include "posecheck/DatasetConfig.hpp"

#include <cmath>
#include <limits>
#include <map>
#include <sstream>
#include <system_error>

#include <yaml-cpp/yaml.h>

#include "posecheck/Logger.hpp"

namespace posecheck {
namespace {

constexpr const char* kRequiredFields[] = {"train", "val", "nc", "names", "kpt_shape"};

std::string describe(const YAML::Node& node) {
    YAML::Emitter out;
    out << YAML::Flow << node;
    return out.c_str();
}

// Plain integer scalars, or floats with no fractional part. Quoted scalars
// carry the "!" tag and are strings, whatever their text.
std::optional<int> readInt(const YAML::Node& node) {
    if (!node.IsScalar() || node.Tag() == "!") {
        return std::nullopt;
    }

    int value = 0;
    if (YAML::convert<int>::decode(node, value)) {
        return value;
    }

    double real = 0.0;
    if (YAML::convert<double>::decode(node, real) && std::isfinite(real) && std::trunc(real) == real &&
        real >= static_cast<double>(std::numeric_limits<int>::min()) &&
        real <= static_cast<double>(std::numeric_limits<int>::max())) {
        return static_cast<int>(real);
    }
    return std::nullopt;
}

std::optional<std::string> readPath(const YAML::Node& node, const char* key) {
    if (node.IsScalar()) {
        return node.as<std::string>();
    }
    Logger::log(LogLevel::Warn, std::string(key) + " is not a single path; left unchecked");
    return std::nullopt;
}

std::optional<int> readClassCount(const YAML::Node& node, DiagnosticBatch& diagnostics) {
    const auto value = readInt(node);
    if (!value.has_value() || *value < 0) {
        diagnostics.error(IssueKind::ConfigFormat,
                          "Invalid nc: " + describe(node) + " (expected a non-negative integer)");
        return std::nullopt;
    }
    return value;
}

std::optional<std::vector<std::string>> readClassNames(const YAML::Node& node,
                                                       DiagnosticBatch& diagnostics) {
    try {
        if (node.IsSequence()) {
            std::vector<std::string> names;
            names.reserve(node.size());
            for (const auto& item : node) {
                names.push_back(item.as<std::string>());
            }
            return names;
        }
        if (node.IsMap()) {
            std::map<int, std::string> indexed;
            for (const auto& item : node) {
                indexed[item.first.as<int>()] = item.second.as<std::string>();
            }
            std::vector<std::string> names;
            names.reserve(indexed.size());
            for (const auto& entry : indexed) {
                names.push_back(entry.second);
            }
            return names;
        }
    } catch (const YAML::BadConversion&) {
        // Falls through to the format error below.
    }

    diagnostics.error(IssueKind::ConfigFormat,
                      "Invalid names: " + describe(node) + " (expected a list of class names)");
    return std::nullopt;
}

std::optional<std::pair<int, int>> readKeypointShape(const YAML::Node& node,
                                                     DiagnosticBatch& diagnostics) {
    if (!node.IsSequence() || node.size() != 2) {
        diagnostics.error(IssueKind::ConfigFormat,
                          "Invalid kpt_shape format: " + describe(node) +
                              " (expected [n_kpts, n_values])");
        return std::nullopt;
    }

    const auto count = readInt(node[0]);
    const auto values = readInt(node[1]);
    if (!count.has_value() || !values.has_value() ||
        std::make_pair(*count, *values) != kExpectedKeypointShape) {
        std::ostringstream oss;
        oss << "Invalid kpt_shape: " << describe(node) << " (expected [" << kExpectedKeypointShape.first
            << ", " << kExpectedKeypointShape.second << "] for base corners)";
        diagnostics.error(IssueKind::KptShape, oss.str());
        if (count.has_value() && values.has_value()) {
            return std::make_pair(*count, *values);
        }
        return std::nullopt;
    }

    Logger::log(LogLevel::Info, "kpt_shape: [4, 3] (4 keypoints, 3 values each)");
    return std::make_pair(*count, *values);
}

std::string joinNames(const std::vector<std::string>& names) {
    std::string joined;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            joined += ", ";
        }
        joined += names[i];
    }
    return joined;
}

} // namespace

ConfigResult loadDatasetConfig(const std::filesystem::path& root, const std::string& filename) {
    Logger::log(LogLevel::Info, "Validating " + filename + "...");

    ConfigResult result;
    const auto path = root / filename;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        result.diagnostics.error(IssueKind::ConfigMissing, "Missing " + filename);
        return result;
    }

    YAML::Node doc;
    try {
        doc = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        result.diagnostics.error(IssueKind::ConfigParse, "Failed to parse " + filename + ": cannot open file");
        return result;
    } catch (const YAML::Exception& e) {
        result.diagnostics.error(IssueKind::ConfigParse, "Failed to parse " + filename + ": " + e.what());
        return result;
    }

    if (!doc.IsMap()) {
        result.diagnostics.error(IssueKind::ConfigParse,
                                 "Failed to parse " + filename + ": top level must be a mapping");
        return result;
    }

    for (const char* field : kRequiredFields) {
        if (!doc[field]) {
            result.diagnostics.error(IssueKind::ConfigField, filename + " missing field: " + field);
        }
    }

    DatasetConfig config;
    if (doc["train"]) {
        config.train_path = readPath(doc["train"], "train");
    }
    if (doc["val"]) {
        config.val_path = readPath(doc["val"], "val");
    }
    if (doc["nc"]) {
        config.num_classes = readClassCount(doc["nc"], result.diagnostics);
    }
    if (doc["names"]) {
        config.class_names = readClassNames(doc["names"], result.diagnostics);
    }
    if (doc["kpt_shape"]) {
        config.keypoint_shape = readKeypointShape(doc["kpt_shape"], result.diagnostics);
    }

    if (config.num_classes.has_value() && config.class_names.has_value()) {
        const auto name_count = config.class_names->size();
        if (static_cast<std::size_t>(*config.num_classes) != name_count) {
            std::ostringstream oss;
            oss << "Class count mismatch: nc=" << *config.num_classes << " but " << name_count
                << " names provided";
            result.diagnostics.error(IssueKind::Mismatch, oss.str());
        } else {
            Logger::log(LogLevel::Info, "Classes: " + std::to_string(*config.num_classes) + " (" +
                                            joinNames(*config.class_names) + ")");
        }
    }

    if (config.num_classes.has_value() && *config.num_classes != 1) {
        result.diagnostics.warning(IssueKind::ClassCount,
                                   "Unexpected class count: nc=" + std::to_string(*config.num_classes) +
                                       " (expected 1 for single-class pose data)");
    }

    if (!result.diagnostics.hasErrors()) {
        Logger::log(LogLevel::Info, filename + " OK");
    }

    result.config = config;
    return result;
}

} // namespace posecheck

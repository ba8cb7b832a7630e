#include "posecheck/LabelValidator.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>
#include <vector>

#include "posecheck/Logger.hpp"

namespace posecheck {
namespace {

std::vector<std::string> splitFields(const std::string& line) {
    std::istringstream in(line);
    std::vector<std::string> fields;
    std::string field;
    while (in >> field) {
        fields.push_back(field);
    }
    return fields;
}

std::optional<long> parseInteger(const std::string& token) {
    errno = 0;
    char* end = nullptr;
    const long value = std::strtol(token.c_str(), &end, 10);
    if (end == token.c_str() || *end != '\0' || errno == ERANGE) {
        return std::nullopt;
    }
    return value;
}

// Decimal text only; strtod would also take C hex floats such as 0x1p-1.
// nan, inf and out-of-range magnitudes parse and are left to the range checks.
std::optional<double> parseNumber(const std::string& token) {
    if (token.find_first_of("xX") != std::string::npos) {
        return std::nullopt;
    }
    char* end = nullptr;
    const double value = std::strtod(token.c_str(), &end);
    if (end == token.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return value;
}

// False for NaN, so non-finite values fail every range check.
bool inUnitRange(double value) {
    return value >= 0.0 && value <= 1.0;
}

std::string fixed3(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << value;
    return oss.str();
}

std::string prefix(const LabelLocation& where) {
    std::ostringstream oss;
    oss << where.split << "/" << where.file;
    if (where.line > 0) {
        oss << ":" << where.line;
    }
    oss << " - ";
    return oss.str();
}

class LineChecker {
public:
    LineChecker(LineResult& result, const LabelLocation& where) : result_(result), where_(where) {}

    void error(IssueKind kind, const std::string& message) { record(Severity::Error, kind, message); }
    void warning(IssueKind kind, const std::string& message) { record(Severity::Warning, kind, message); }

private:
    void record(Severity severity, IssueKind kind, const std::string& message) {
        Diagnostic diagnostic;
        diagnostic.severity = severity;
        diagnostic.kind = kind;
        diagnostic.message = prefix(where_) + message;
        diagnostic.split = where_.split;
        diagnostic.file = where_.file;
        diagnostic.line = where_.line;
        result_.diagnostics.add(std::move(diagnostic));
        result_.issues.insert(kind);
    }

    LineResult& result_;
    const LabelLocation& where_;
};

std::optional<BoundingBox> parseBox(const std::vector<std::string>& fields, std::string* failed_token) {
    double values[4] = {0.0, 0.0, 0.0, 0.0};
    for (std::size_t i = 0; i < 4; ++i) {
        const auto value = parseNumber(fields[i + 1]);
        if (!value.has_value()) {
            if (failed_token != nullptr) {
                *failed_token = fields[i + 1];
            }
            return std::nullopt;
        }
        values[i] = *value;
    }
    return BoundingBox(values[0], values[1], values[2], values[3]);
}

void checkClassId(const std::string& token, int num_classes, LineChecker& checker) {
    const auto class_id = parseInteger(token);
    if (!class_id.has_value()) {
        checker.error(IssueKind::Class, "Class ID must be integer, got: " + token);
        return;
    }
    if (*class_id < 0 || *class_id >= num_classes) {
        std::ostringstream oss;
        oss << "Invalid class ID: " << *class_id;
        if (num_classes > 0) {
            oss << " (must be 0-" << (num_classes - 1) << ")";
        } else {
            oss << " (no classes declared)";
        }
        checker.error(IssueKind::Class, oss.str());
    }
}

void checkBox(const std::vector<std::string>& fields, LineResult& result, LineChecker& checker) {
    std::string failed_token;
    result.box = parseBox(fields, &failed_token);
    if (!result.box.has_value()) {
        checker.error(IssueKind::BboxParse,
                      "Invalid bbox coordinates: could not parse '" + failed_token + "' as a number");
        return;
    }

    const BoundingBox& box = *result.box;
    if (!inUnitRange(box.center.x()) || !inUnitRange(box.center.y())) {
        checker.error(IssueKind::BboxCenter,
                      "Bbox center out of range: x=" + fixed3(box.center.x()) +
                          ", y=" + fixed3(box.center.y()) + " (must be 0-1)");
    }

    const double w = box.size.x();
    const double h = box.size.y();
    if (!(w > 0.0 && w <= 1.0) || !(h > 0.0 && h <= 1.0)) {
        checker.error(IssueKind::BboxSize,
                      "Bbox size invalid: w=" + fixed3(w) + ", h=" + fixed3(h) + " (must be 0-1, >0)");
    }
}

void checkKeypoints(const std::vector<std::string>& fields, LineResult& result, LineChecker& checker) {
    const std::size_t value_count = fields.size() - kBoxFieldCount;
    if (value_count != static_cast<std::size_t>(kKeypointCount * kKeypointValues)) {
        checker.error(IssueKind::KptCount,
                      "Invalid keypoint count: " + std::to_string(value_count) + " values (expected 12)");
        return;
    }

    Keypoints keypoints;
    for (std::size_t i = 0; i < value_count; ++i) {
        const auto value = parseNumber(fields[kBoxFieldCount + i]);
        if (!value.has_value()) {
            checker.error(IssueKind::KptParse, "Invalid keypoint data: could not parse '" +
                                                   fields[kBoxFieldCount + i] + "' as a number");
            return;
        }
        keypoints(static_cast<Eigen::Index>(i / kKeypointValues),
                  static_cast<Eigen::Index>(i % kKeypointValues)) = *value;
    }

    for (int k = 0; k < kKeypointCount; ++k) {
        const double x = keypoints(k, 0);
        const double y = keypoints(k, 1);
        const double v = keypoints(k, 2);

        if (!inUnitRange(x) || !inUnitRange(y)) {
            checker.error(IssueKind::KptCoords, "Keypoint " + std::to_string(k) + " out of range: (" +
                                                    fixed3(x) + ", " + fixed3(y) + ")");
        }
        if (v != 0.0 && v != 1.0) {
            std::ostringstream oss;
            oss << "Keypoint " << k << " invalid visibility: " << v << " (must be 0 or 1)";
            checker.error(IssueKind::KptVisibility, oss.str());
        }
    }

    // Weak heuristic: only compares the top edge.
    if (keypoints(1, 0) < keypoints(0, 0)) {
        checker.warning(IssueKind::KptOrder, "Keypoint order suspicious: TR not right of TL");
    }

    result.keypoints = keypoints;
}

} // namespace

LineResult validateLabelLine(const std::string& line, int num_classes, const LabelLocation& where) {
    LineResult result;
    LineChecker checker(result, where);

    const auto fields = splitFields(line);
    result.field_count = fields.size();

    if (fields.size() != kBoxFieldCount && fields.size() != kPoseFieldCount) {
        checker.error(IssueKind::Format, "Invalid format: expected 5 (bbox) or 17 (bbox+pose) values, got " +
                                             std::to_string(fields.size()));
        // The box still takes part in the overlap scan when it is readable.
        if (fields.size() >= kBoxFieldCount) {
            result.box = parseBox(fields, nullptr);
        }
        return result;
    }

    checkClassId(fields[0], num_classes, checker);
    checkBox(fields, result, checker);
    if (fields.size() == kPoseFieldCount) {
        checkKeypoints(fields, result, checker);
    }
    return result;
}

LabelFileResult validateLabelFile(const std::filesystem::path& path,
                                  int num_classes,
                                  const std::string& split,
                                  double overlap_threshold) {
    LabelFileResult result;
    const std::string file = path.filename().string();

    errno = 0;
    std::ifstream in(path);
    int read_errno = in.is_open() ? 0 : errno;

    std::vector<std::pair<std::size_t, std::string>> lines;
    if (in.is_open()) {
        std::string text;
        std::size_t line_number = 0;
        while (std::getline(in, text)) {
            ++line_number;
            if (text.find_first_not_of(" \t\r\n\v\f") != std::string::npos) {
                lines.emplace_back(line_number, text);
            }
        }
        if (in.bad()) {
            read_errno = errno;
        }
    }

    if (!in.is_open() || in.bad()) {
        Diagnostic diagnostic;
        diagnostic.severity = Severity::Error;
        diagnostic.kind = IssueKind::ReadError;
        diagnostic.message = split + "/" + file + ": Failed to read file: " +
                             (read_errno != 0 ? std::strerror(read_errno) : "I/O error");
        diagnostic.split = split;
        diagnostic.file = file;
        result.diagnostics.add(std::move(diagnostic));
        result.issues.insert(IssueKind::ReadError);
        return result;
    }

    std::vector<BoundingBox> boxes;
    for (const auto& entry : lines) {
        const LabelLocation where{split, file, entry.first};
        LineResult line = validateLabelLine(entry.second, num_classes, where);

        result.diagnostics.append(line.diagnostics);
        result.issues.insert(line.issues.begin(), line.issues.end());
        ++result.instance_count;
        if (line.isPose()) {
            ++result.pose_count;
        }
        if (line.box.has_value()) {
            boxes.push_back(*line.box);
        }
    }

    if (lines.size() > 1) {
        for (const auto& overlap : findOverlaps(boxes, overlap_threshold)) {
            std::ostringstream oss;
            oss << split << "/" << file << " - High overlap (" << std::fixed << std::setprecision(0)
                << overlap.iou * 100.0 << "%) between instances " << overlap.first + 1 << " and "
                << overlap.second + 1 << " - verify not duplicate";

            Diagnostic diagnostic;
            diagnostic.severity = Severity::Warning;
            diagnostic.kind = IssueKind::Overlap;
            diagnostic.message = oss.str();
            diagnostic.split = split;
            diagnostic.file = file;
            result.diagnostics.add(std::move(diagnostic));
            result.issues.insert(IssueKind::Overlap);
        }
    }

    if (Logger::enabled(LogLevel::Debug)) {
        Logger::log(LogLevel::Debug, split + "/" + file + ": " + std::to_string(result.instance_count) +
                                         " instances, " + std::to_string(result.issues.size()) + " issue kinds");
    }
    return result;
}

} // namespace posecheck

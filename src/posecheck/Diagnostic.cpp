#include "posecheck/Diagnostic.hpp"

#include <algorithm>
#include <utility>

namespace posecheck {

const char* issueKindName(IssueKind kind) {
    switch (kind) {
        case IssueKind::Structure:
            return "structure";
        case IssueKind::ConfigMissing:
            return "config_missing";
        case IssueKind::ConfigParse:
            return "config_parse";
        case IssueKind::ConfigField:
            return "config_field";
        case IssueKind::ConfigFormat:
            return "config_format";
        case IssueKind::KptShape:
            return "kpt_shape";
        case IssueKind::Mismatch:
            return "mismatch";
        case IssueKind::ClassCount:
            return "class_count";
        case IssueKind::MissingLabel:
            return "missing_label";
        case IssueKind::OrphanLabel:
            return "orphan_label";
        case IssueKind::ReadError:
            return "read_error";
        case IssueKind::Format:
            return "format";
        case IssueKind::Class:
            return "class";
        case IssueKind::BboxParse:
            return "bbox_parse";
        case IssueKind::BboxCenter:
            return "bbox_center";
        case IssueKind::BboxSize:
            return "bbox_size";
        case IssueKind::KptParse:
            return "kpt_parse";
        case IssueKind::KptCount:
            return "kpt_count";
        case IssueKind::KptCoords:
            return "kpt_coords";
        case IssueKind::KptVisibility:
            return "kpt_visibility";
        case IssueKind::KptOrder:
            return "kpt_order";
        case IssueKind::Overlap:
            return "overlap";
    }
    return "unknown";
}

void DiagnosticBatch::add(Diagnostic diagnostic) {
    if (diagnostic.severity == Severity::Error) {
        errors.push_back(std::move(diagnostic));
    } else {
        warnings.push_back(std::move(diagnostic));
    }
}

void DiagnosticBatch::error(IssueKind kind, std::string message) {
    Diagnostic diagnostic;
    diagnostic.severity = Severity::Error;
    diagnostic.kind = kind;
    diagnostic.message = std::move(message);
    errors.push_back(std::move(diagnostic));
}

void DiagnosticBatch::warning(IssueKind kind, std::string message) {
    Diagnostic diagnostic;
    diagnostic.severity = Severity::Warning;
    diagnostic.kind = kind;
    diagnostic.message = std::move(message);
    warnings.push_back(std::move(diagnostic));
}

void DiagnosticBatch::append(const DiagnosticBatch& other) {
    errors.insert(errors.end(), other.errors.begin(), other.errors.end());
    warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
}

std::size_t DiagnosticBatch::count(IssueKind kind) const {
    return count(Severity::Error, kind) + count(Severity::Warning, kind);
}

std::size_t DiagnosticBatch::count(Severity severity, IssueKind kind) const {
    const auto& list = severity == Severity::Error ? errors : warnings;
    return static_cast<std::size_t>(std::count_if(list.begin(), list.end(), [kind](const Diagnostic& d) {
        return d.kind == kind;
    }));
}

} // namespace posecheck

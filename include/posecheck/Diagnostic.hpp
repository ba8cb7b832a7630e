#pragma once
// Errors and warnings produced by the validation stages.

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace posecheck {

enum class Severity {
    Error,
    Warning
};

enum class IssueKind {
    Structure,
    ConfigMissing,
    ConfigParse,
    ConfigField,
    ConfigFormat,
    KptShape,
    Mismatch,
    ClassCount,
    MissingLabel,
    OrphanLabel,
    ReadError,
    Format,
    Class,
    BboxParse,
    BboxCenter,
    BboxSize,
    KptParse,
    KptCount,
    KptCoords,
    KptVisibility,
    KptOrder,
    Overlap
};

// Stable lower-case tag, e.g. "bbox_center".
const char* issueKindName(IssueKind kind);

using IssueSet = std::set<IssueKind>;

struct Diagnostic {
    Severity severity = Severity::Error;
    IssueKind kind = IssueKind::Format;
    std::string message;

    // Location, empty/0 when the finding is not tied to a label line.
    std::string split;
    std::string file;
    std::size_t line = 0;
};

// Ordered findings of one stage. Stages return a batch; the orchestrator
// appends batches in stage order, so insertion order is preserved end to end.
struct DiagnosticBatch {
    std::vector<Diagnostic> errors;
    std::vector<Diagnostic> warnings;

    void add(Diagnostic diagnostic);
    void error(IssueKind kind, std::string message);
    void warning(IssueKind kind, std::string message);
    void append(const DiagnosticBatch& other);

    bool hasErrors() const { return !errors.empty(); }
    bool empty() const { return errors.empty() && warnings.empty(); }

    std::size_t count(IssueKind kind) const;
    std::size_t count(Severity severity, IssueKind kind) const;
};

} // namespace posecheck

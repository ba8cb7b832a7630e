#include "posecheck/ReportPrinter.hpp"

#include <iomanip>
#include <string>
#include <vector>

namespace posecheck {
namespace {

const std::string kRule(60, '=');

void printSection(std::ostream& out,
                  const std::vector<Diagnostic>& items,
                  const char* title,
                  const char* noun,
                  std::size_t limit) {
    if (items.empty()) {
        return;
    }

    out << "\n" << items.size() << " " << title << ":\n";
    const std::size_t shown = items.size() < limit ? items.size() : limit;
    for (std::size_t i = 0; i < shown; ++i) {
        out << "  " << (i + 1) << ". [" << issueKindName(items[i].kind) << "] " << items[i].message << "\n";
    }
    if (items.size() > limit) {
        out << "  ... and " << (items.size() - limit) << " more " << noun << "\n";
    }
}

} // namespace

Verdict verdictOf(const ValidationReport& report) {
    if (report.diagnostics.hasErrors()) {
        return Verdict::Failed;
    }
    if (!report.diagnostics.warnings.empty()) {
        return Verdict::PassedWithWarnings;
    }
    return Verdict::Clean;
}

void printReport(std::ostream& out, const ValidationReport& report, std::size_t limit) {
    out << "\n" << kRule << "\n";
    out << "VALIDATION REPORT\n";
    out << kRule << "\n";

    printSection(out, report.diagnostics.errors, "ERRORS", "errors", limit);
    printSection(out, report.diagnostics.warnings, "WARNINGS", "warnings", limit);

    if (!report.splits.empty()) {
        out << "\n";
        for (const auto& split : report.splits) {
            out << "  " << split.split << ": " << split.valid_labels << "/" << split.label_count
                << " valid labels, " << split.image_count << " images, " << split.instance_count
                << " instances, " << std::fixed << std::setprecision(1) << split.poseCoveragePercent()
                << "% with pose\n";
        }
    }

    switch (verdictOf(report)) {
        case Verdict::Clean:
            out << "\nDataset validation passed!\n";
            out << "   No errors or warnings found.\n";
            out << "   Dataset is ready for training!\n";
            break;
        case Verdict::PassedWithWarnings:
            out << "\nNo errors found!\n";
            out << "   Warnings can usually be ignored or are informational.\n";
            out << "   Dataset is ready for training.\n";
            break;
        case Verdict::Failed:
            out << "\nValidation failed!\n";
            out << "   Fix errors before training.\n";
            out << "   Training on invalid data will fail or produce poor results.\n";
            break;
    }

    out << kRule << "\n";
}

} // namespace posecheck

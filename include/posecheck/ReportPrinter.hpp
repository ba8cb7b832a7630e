#pragma once
// Terminal rendering of a ValidationReport.

#include <cstddef>
#include <ostream>

#include "posecheck/DatasetValidator.hpp"

namespace posecheck {

enum class Verdict {
    Clean,
    PassedWithWarnings,
    Failed
};

Verdict verdictOf(const ValidationReport& report);

// Errors, then warnings (each capped at `limit` with a remainder line), then
// one summary line per split and the verdict.
void printReport(std::ostream& out, const ValidationReport& report, std::size_t limit = 20);

} // namespace posecheck

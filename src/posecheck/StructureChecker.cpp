#include "posecheck/StructureChecker.hpp"

#include <iterator>
#include <sstream>
#include <string>
#include <system_error>

#include "posecheck/Logger.hpp"

namespace posecheck {
namespace {

std::size_t countEntries(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return 0;
    }
    return static_cast<std::size_t>(std::distance(it, std::filesystem::directory_iterator{}));
}

} // namespace

StructureResult checkStructure(const std::filesystem::path& root) {
    Logger::log(LogLevel::Info, "Checking directory structure...");

    StructureResult result;
    for (const char* relative : kRequiredDirectories) {
        const auto full_path = root / relative;
        std::error_code ec;
        if (!std::filesystem::is_directory(full_path, ec)) {
            result.diagnostics.error(IssueKind::Structure, std::string("Missing directory: ") + relative);
            Logger::log(LogLevel::Warn, std::string("Missing: ") + relative);
            continue;
        }

        std::ostringstream oss;
        oss << relative << ": " << countEntries(full_path) << " files";
        Logger::log(LogLevel::Info, oss.str());
    }

    result.ok = !result.diagnostics.hasErrors();
    if (result.ok) {
        Logger::log(LogLevel::Info, "Directory structure OK");
    }
    return result;
}

} // namespace posecheck

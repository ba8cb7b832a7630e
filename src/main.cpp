#include <exception>
#include <iostream>
#include <string>

#include "posecheck/DatasetValidator.hpp"
#include "posecheck/Logger.hpp"
#include "posecheck/ReportPrinter.hpp"
#include "posecheck/Settings.hpp"

namespace posecheck {
namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <dataset_path>\n"
              << "Options:\n"
              << "  --settings <file>          key=value validator settings\n"
              << "  --overlap-threshold=<x>    IoU above which instances are flagged (default 0.5)\n"
              << "  --report-limit=<n>         findings shown per section (default 20)\n"
              << "  --examples=<n>             missing-label stems listed per split (default 5)\n"
              << "  --config-name=<file>       dataset schema file (default data.yaml)\n"
              << "  --log-level=<level>        debug, info, warn or error\n"
              << "  --quiet                    same as --log-level=error\n";
}

int run(int argc, char** argv) {
    const SettingsOverrides overrides = SettingsOverrides::fromArgs(argc, argv);
    if (!overrides.dataset_root.has_value() || overrides.positional_count != 1) {
        printUsage(argv[0]);
        return 1;
    }

    ValidatorSettings settings;
    if (overrides.settings_path.has_value()) {
        settings = ValidatorSettings::fromFile(*overrides.settings_path);
    }
    settings.applyOverrides(overrides);
    settings.check();
    Logger::setMinLevel(settings.log_level);

    DatasetValidator validator(*overrides.dataset_root, settings);
    const bool passed = validator.validate();
    printReport(std::cout, validator.report(), settings.report_limit);

    return passed ? 0 : 1;
}

} // namespace
} // namespace posecheck

int main(int argc, char** argv) {
    try {
        return posecheck::run(argc, argv);
    } catch (const std::exception& e) {
        posecheck::Logger::log(posecheck::LogLevel::Error, e.what());
        return 1;
    }
}

/// @file main.cpp
/// @brief tre_rate entry point.
///
/// Reads the match CSVs, fits ratings on the fit window, scores pre-match
/// predictions on the held-out years and writes the run's reports.

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

#include <kcenon/common/interfaces/global_logger_registry.h>

#include "tre/app/cli_options.hpp"
#include "tre/app/stderr_logger.hpp"
#include "tre/feed/csv_match_feed.hpp"
#include "tre/foundation/config_manager.hpp"
#include "tre/foundation/engine_logger.hpp"
#include "tre/rating/rating_engine.hpp"
#include "tre/report/report_writer.hpp"
#include "tre/version.hpp"

namespace {

void flushLogs() {
    if (auto flushed = tre::foundation::EngineLogger::instance().flush(); !flushed) {
        std::cerr << "tre_rate: log flush failed: " << flushed.error().message() << "\n";
    }
}

int fail(std::string_view what, const tre::foundation::EngineError& error) {
    std::cerr << "tre_rate: " << what << ": " << error.message() << " ["
              << error.subsystem() << "]\n";
    flushLogs();
    return EXIT_FAILURE;
}

} // namespace

int main(int argc, char* argv[]) {
    kcenon::common::interfaces::GlobalLoggerRegistry::instance().set_default_logger(
        std::make_shared<tre::app::StderrLogger>());

    auto options = tre::app::parseCliOptions(argc, argv);
    if (!options) {
        std::cerr << "tre_rate: " << options.error().message() << "\n\n" << tre::app::usage();
        return EXIT_FAILURE;
    }
    const auto& opts = options.value();
    if (opts.showHelp) {
        std::cout << "tre_rate " << tre::Version::string << "\n\n" << tre::app::usage();
        return EXIT_SUCCESS;
    }

    tre::foundation::ConfigManager config;
    if (auto loaded = tre::app::loadConfig(config, opts.configPath); !loaded) {
        return fail("failed to load config", loaded.error());
    }
    if (auto level = tre::app::applyLogLevel(config); !level) {
        return fail("invalid logging configuration", level.error());
    }

    auto engineConfig = tre::rating::buildEngineConfig(config, opts.split);
    if (!engineConfig) {
        return fail("invalid configuration", engineConfig.error());
    }
    if (auto valid = engineConfig.value().validate(); !valid) {
        return fail("invalid configuration", valid.error());
    }

    auto sources = tre::app::collectSources(config, opts.sources);
    if (!sources) {
        return fail("invalid sources", sources.error());
    }
    if (sources.value().empty()) {
        std::cerr << "tre_rate: no match sources; pass --source <tier>=<csv> "
                     "or set feed.sources.<tier>\n";
        return EXIT_FAILURE;
    }

    tre::feed::PlayerDirectory directory;
    tre::feed::CsvMatchFeed feed(directory);
    for (const auto& source : sources.value()) {
        if (auto read = feed.readFile(source); !read) {
            return fail("failed to read " + source.path.string(), read.error());
        }
    }

    tre::rating::RatingEngine engine(engineConfig.value());
    tre::rating::RatingStore store(engine.config().rating.defaultBaseline,
                                   engine.config().rating.blend.epsilon);
    auto run = engine.run(feed.takeMatches(), store);
    if (!run) {
        return fail("run aborted", run.error());
    }
    auto& report = run.value();
    report.warnings.insert(report.warnings.begin(), feed.warnings().begin(),
                           feed.warnings().end());

    tre::report::ReportWriter writer(opts.outputRoot, directory);
    auto written = writer.write(report);
    if (!written) {
        return fail("failed to write report", written.error());
    }

    const auto& summary = report.summary;
    std::cout << report.runLabel << ": " << report.fitMatches << " fit matches, "
              << summary.matches << " evaluated\n"
              << "  accuracy       " << summary.accuracy << "\n"
              << "  brier score    " << summary.brierScore << "\n"
              << "  log-likelihood " << summary.logLikelihood << "\n"
              << "  warnings       " << report.warnings.size() << "\n"
              << "report: " << written.value().string() << "\n";

    flushLogs();
    return EXIT_SUCCESS;
}

#pragma once

/// @file cli_options.hpp
/// @brief Command-line and configuration plumbing for the tre_rate tool.

#include <filesystem>
#include <string>
#include <vector>

#include "tre/feed/csv_match_feed.hpp"
#include "tre/foundation/config_manager.hpp"
#include "tre/foundation/engine_result.hpp"
#include "tre/rating/rating_config.hpp"

namespace tre::app {

using foundation::EngineResult;

/// Environment variable that overrides the --config path.
inline constexpr const char* kConfigPathEnv = "TRE_CONFIG_PATH";

struct CliOptions {
    rating::SplitConfig split;
    std::filesystem::path configPath;          ///< Empty: built-in defaults.
    std::vector<feed::MatchSource> sources;    ///< From --source, in order given.
    std::filesystem::path outputRoot = "output";
    bool showHelp = false;
};

/// Parse `--yf <year> --yt <year> --ts <years> [--config <yaml>]
/// [--source <tier>=<csv>]... [--out <dir>]`.
///
/// @return InvalidArgument for unknown flags, missing values or missing
///         required years; UnknownTier for a bad --source tier.
[[nodiscard]] EngineResult<CliOptions> parseCliOptions(const std::vector<std::string>& args);

/// argv overload; argv[0] is skipped.
[[nodiscard]] EngineResult<CliOptions> parseCliOptions(int argc, char* argv[]);

/// Usage text printed for --help and argument errors.
[[nodiscard]] std::string usage();

/// Load a YAML configuration file into @p config.
///
/// The config file path is resolved in order:
///   1. TRE_CONFIG_PATH environment variable (if set)
///   2. @p defaultPath parameter
///
/// When both are empty nothing is loaded and the built-in defaults apply.
[[nodiscard]] EngineResult<void> loadConfig(foundation::ConfigManager& config,
                                            const std::filesystem::path& defaultPath);

/// Apply `logging.level` (if present) to every log category.
/// @return ConfigTypeMismatch or InvalidParameter for an unusable value.
[[nodiscard]] EngineResult<void> applyLogLevel(const foundation::ConfigManager& config);

/// Sources from `feed.sources.<tier>` merged with @p cliSources. A tier
/// given on the command line replaces the configured file for that tier.
[[nodiscard]] EngineResult<std::vector<feed::MatchSource>> collectSources(
    const foundation::ConfigManager& config, const std::vector<feed::MatchSource>& cliSources);

} // namespace tre::app

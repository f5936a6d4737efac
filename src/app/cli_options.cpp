/// @file cli_options.cpp
/// @brief Argument parsing and config loading for tre_rate.

#include "tre/app/cli_options.hpp"

#include <charconv>
#include <cstdlib>
#include <optional>
#include <string_view>
#include <utility>

#include "tre/foundation/engine_logger.hpp"

namespace tre::app {

using foundation::EngineError;
using foundation::EngineLogger;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

EngineError argumentError(std::string message) {
    return EngineError(ErrorCode::InvalidArgument, std::move(message));
}

std::optional<int> parseInt(std::string_view text) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

EngineResult<feed::MatchSource> parseSource(std::string_view arg) {
    auto eq = arg.find('=');
    if (eq == std::string_view::npos || eq == 0 || eq + 1 == arg.size()) {
        return EngineResult<feed::MatchSource>::err(
            argumentError("--source expects <tier>=<csv>, got '" + std::string(arg) + "'"));
    }
    auto tierText = arg.substr(0, eq);
    auto tier = rating::parseTier(tierText);
    if (!tier) {
        return EngineResult<feed::MatchSource>::err(EngineError(
            ErrorCode::UnknownTier, "unknown tier '" + std::string(tierText) + "' in --source"));
    }
    return EngineResult<feed::MatchSource>::ok(
        feed::MatchSource{*tier, std::filesystem::path(arg.substr(eq + 1))});
}

} // namespace

std::string usage() {
    return "usage: tre_rate --yf <year> --yt <year> --ts <years>\n"
           "                [--config <yaml>] [--source <tier>=<csv>]... [--out <dir>]\n"
           "\n"
           "  --yf       first year of the fit window\n"
           "  --yt       last year of the evaluation window (inclusive)\n"
           "  --ts       number of trailing years held out for evaluation\n"
           "  --config   YAML configuration (overridden by $TRE_CONFIG_PATH)\n"
           "  --source   match CSV and the tier its rows default to; repeatable\n"
           "  --out      output root directory (default: output)\n";
}

EngineResult<CliOptions> parseCliOptions(const std::vector<std::string>& args) {
    CliOptions options;
    std::optional<int> yearFrom;
    std::optional<int> yearTo;
    std::optional<int> testSize;

    for (std::size_t i = 0; i < args.size(); ++i) {
        std::string_view flag = args[i];
        if (flag == "--help" || flag == "-h") {
            options.showHelp = true;
            return EngineResult<CliOptions>::ok(std::move(options));
        }
        if (i + 1 >= args.size()) {
            return EngineResult<CliOptions>::err(
                argumentError("missing value for " + std::string(flag)));
        }
        const std::string& value = args[++i];

        if (flag == "--yf" || flag == "--yt" || flag == "--ts") {
            auto number = parseInt(value);
            if (!number) {
                return EngineResult<CliOptions>::err(argumentError(
                    std::string(flag) + " expects an integer, got '" + value + "'"));
            }
            if (flag == "--yf") {
                yearFrom = *number;
            } else if (flag == "--yt") {
                yearTo = *number;
            } else {
                testSize = *number;
            }
        } else if (flag == "--config") {
            options.configPath = value;
        } else if (flag == "--out") {
            options.outputRoot = value;
        } else if (flag == "--source") {
            auto source = parseSource(value);
            if (!source) {
                return EngineResult<CliOptions>::err(source.error());
            }
            options.sources.push_back(std::move(source).value());
        } else {
            return EngineResult<CliOptions>::err(
                argumentError("unknown option " + std::string(flag)));
        }
    }

    if (!yearFrom || !yearTo || !testSize) {
        return EngineResult<CliOptions>::err(argumentError("--yf, --yt and --ts are required"));
    }
    options.split = rating::SplitConfig{*yearFrom, *yearTo, *testSize};
    return EngineResult<CliOptions>::ok(std::move(options));
}

EngineResult<CliOptions> parseCliOptions(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }
    return parseCliOptions(args);
}

EngineResult<void> loadConfig(foundation::ConfigManager& config,
                              const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv(kConfigPathEnv);
    if (envPath != nullptr && *envPath != '\0') {
        configPath = envPath;
    }

    if (configPath.empty()) {
        TRE_LOG_INFO(LogCategory::Config, "no configuration file given; using defaults");
        return EngineResult<void>::ok();
    }
    auto loaded = config.load(configPath);
    if (loaded) {
        TRE_LOG_INFO(LogCategory::Config, "loaded " + configPath.string());
    }
    return loaded;
}

EngineResult<void> applyLogLevel(const foundation::ConfigManager& config) {
    if (!config.hasKey("logging.level")) {
        return EngineResult<void>::ok();
    }
    auto name = config.get<std::string>("logging.level");
    if (!name) {
        return EngineResult<void>::err(name.error());
    }
    auto level = foundation::parseLogLevel(name.value());
    if (!level) {
        return EngineResult<void>::err(EngineError(
            ErrorCode::InvalidParameter, "unknown logging.level '" + name.value() + "'"));
    }
    EngineLogger::instance().setAllLevels(*level);
    return EngineResult<void>::ok();
}

EngineResult<std::vector<feed::MatchSource>> collectSources(
    const foundation::ConfigManager& config, const std::vector<feed::MatchSource>& cliSources) {
    std::vector<feed::MatchSource> sources;
    for (const auto& key : config.keysWithPrefix("feed.sources")) {
        auto tier = rating::parseTier(key);
        if (!tier) {
            return EngineResult<std::vector<feed::MatchSource>>::err(EngineError(
                ErrorCode::UnknownTier, "unknown tier 'feed.sources." + key + "'"));
        }
        auto path = config.get<std::string>("feed.sources." + key);
        if (!path) {
            return EngineResult<std::vector<feed::MatchSource>>::err(path.error());
        }
        bool overridden = false;
        for (const auto& cli : cliSources) {
            overridden = overridden || cli.defaultTier == *tier;
        }
        if (!overridden) {
            sources.push_back(feed::MatchSource{*tier, path.value()});
        }
    }
    sources.insert(sources.end(), cliSources.begin(), cliSources.end());
    return EngineResult<std::vector<feed::MatchSource>>::ok(std::move(sources));
}

} // namespace tre::app

#include "config.hpp"
#include "config_helper.hpp"
#include "utils/logger/logger.hpp"

#include <filesystem>

namespace IDLX::Core {

using namespace IDLX::Utils;         // For 'Logger'
using namespace IDLX::Core::ConfigHelpers; // For 'ExtractValue'

static void ReadSettings(const toml::table& tbl, Config& config)
{
    auto& loggingConfig = config.loggingConfig;
    auto& checkConfig   = config.checkConfig;

    ExtractValue(tbl, "Logging", "level",      loggingConfig.level);
    ExtractValue(tbl, "Logging", "timestamps", loggingConfig.timestamps);

    ExtractValue(tbl, "Check", "report_conflicts",    checkConfig.reportConflicts);
    ExtractValue(tbl, "Check", "conflicts_as_errors", checkConfig.conflictsAsErrors);
    ExtractValue(tbl, "Check", "max_diagnostics",     checkConfig.maxDiagnostics);

    if(checkConfig.maxDiagnostics < 0) {
        Logger::GetInstance().Warn(
            "[Config]: [Check] max_diagnostics must not be negative, got ", checkConfig.maxDiagnostics,
            ". Using 0 (unlimited)"
        );
        checkConfig.maxDiagnostics = 0;
    }
}

Config& Config::GetInstance()
{
    static Config config;
    return config;
}

void Config::LoadSettings(std::string_view path)
{
    Logger& logger = Logger::GetInstance();

    std::error_code ec;
    if(!std::filesystem::exists(std::filesystem::path{path}, ec)) {
        logger.Info("[Config]: '", path, "' not found, using default settings");
        return;
    }

    try {
        auto tbl = toml::parse_file(path);
        ReadSettings(tbl, *this);
    }
    catch(const toml::parse_error& err) {
        logger.Fatal("[Config]: '", path, "' ", err.description(),
                     " (line ", err.source().begin.line, ", column ", err.source().begin.column, ')');
    }
}

bool Config::LoadSettingsFromString(std::string_view document, std::string_view sourceName)
{
    try {
        auto tbl = toml::parse(document, sourceName);
        ReadSettings(tbl, *this);
        return true;
    }
    catch(const toml::parse_error& err) {
        Logger::GetInstance().Error("[Config]: '", sourceName, "' ", err.description());
        return false;
    }
}

void Config::ApplyLoggingSettings() const
{
    Logger& logger = Logger::GetInstance();
    Logger::Level level;

    if(Logger::LevelFromName(loggingConfig.level, level))
        logger.SetMinimumLevel(level);
    else
        logger.Warn("[Config]: Unknown log level '", loggingConfig.level, "'. Keeping current level");

    logger.EnableTimestamps(loggingConfig.timestamps);
}

void Config::Reset()
{
    loggingConfig = LoggingConfig{};
    checkConfig   = CheckConfig{};
}

} // namespace IDLX::Core

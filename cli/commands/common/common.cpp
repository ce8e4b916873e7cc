#include "common.hpp"

#include "config/config.hpp"
#include "utils/logger/logger.hpp"

namespace IDLX::CLI {

using namespace IDLX::Utils; // For 'Logger'
using namespace IDLX::Core;  // For 'Config'

// vvv Common Stuff vvv
void LoadCliSettings(std::string_view configPath)
{
    auto& config = Config::GetInstance();

    config.LoadSettings(configPath);
    config.ApplyLoggingSettings();

    Logger::GetInstance().Debug(
        "[IDLX]: Settings: log level '", config.loggingConfig.level,
        "', report_conflicts ", config.checkConfig.reportConflicts,
        ", conflicts_as_errors ", config.checkConfig.conflictsAsErrors,
        ", max_diagnostics ", config.checkConfig.maxDiagnostics
    );
}

void ReportPatternError(std::string_view what, const Model::PatternError& error)
{
    Logger::GetInstance().Error(
        "[IDLX]: Invalid ", what, " `", error.source, "` (",
        Model::PatternErrorKindToString(error.kind), "): ", error.message
    );
}

} // namespace IDLX::CLI

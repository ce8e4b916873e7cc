#include "check.hpp"

#include "config/config.hpp"
#include "manifest/manifest.hpp"
#include "utils/logger/logger.hpp"

namespace IDLX::CLI {

using namespace IDLX::Utils; // For 'Logger'
using namespace IDLX::Core;  // For 'Config', 'Manifest'

DiagnosticLimit LimitDiagnostics(std::size_t total, std::int64_t maxDiagnostics)
{
    if(maxDiagnostics <= 0 || static_cast<std::uint64_t>(maxDiagnostics) >= total)
        return DiagnosticLimit{ total, 0 };

    std::size_t shown = static_cast<std::size_t>(maxDiagnostics);
    return DiagnosticLimit{ shown, total - shown };
}

int CheckManifest(const std::string& manifestPath)
{
    auto& logger      = Logger::GetInstance();
    auto& checkConfig = Config::GetInstance().checkConfig;

    Manifest manifest = Manifest::LoadFile(manifestPath, checkConfig);

    const auto&     diagnostics = manifest.GetDiagnostics();
    DiagnosticLimit limit       = LimitDiagnostics(diagnostics.size(), checkConfig.maxDiagnostics);

    for(std::size_t i = 0; i < limit.shown; ++i) {
        const Diagnostic& diagnostic = diagnostics[i];

        if(diagnostic.severity == Severity::ERR)
            logger.Error(FormatDiagnostic(diagnostic));
        else
            logger.Warn(FormatDiagnostic(diagnostic));
    }

    if(limit.hidden > 0)
        logger.Warn("[IDLX]: ", limit.hidden, " more diagnostic(s) not shown (max_diagnostics = ",
                    checkConfig.maxDiagnostics, ')');

    logger.Info(
        "[IDLX]: '", manifestPath, "': ", manifest.GetOperations().size(), " operation(s), ",
        manifest.ErrorCount(), " error(s), ", manifest.WarningCount(), " warning(s)"
    );

    return manifest.IsValid() ? 0 : 1;
}

} // namespace IDLX::CLI

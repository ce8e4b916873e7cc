#ifndef IDLX_CLI_COMMANDS_CHECK_HPP
#define IDLX_CLI_COMMANDS_CHECK_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace IDLX::CLI {

// How many of 'total' diagnostics get printed and how many are summarized
struct DiagnosticLimit {
    std::size_t shown  = 0;
    std::size_t hidden = 0;
};

// 'maxDiagnostics' <= 0 means unlimited
DiagnosticLimit LimitDiagnostics(std::size_t total, std::int64_t maxDiagnostics);

// 0 when the manifest is valid, 1 otherwise
int CheckManifest(const std::string& manifestPath);

}  // namespace IDLX::CLI

#endif  // IDLX_CLI_COMMANDS_CHECK_HPP

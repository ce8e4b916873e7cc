#ifndef IDLX_CLI_COMMANDS_INSPECT_HPP
#define IDLX_CLI_COMMANDS_INSPECT_HPP

#include <string>

namespace IDLX::CLI {

// 'dialect' is one of: uri, host, publish, subscribe
int InspectTemplate(const std::string& dialect, const std::string& text);

}  // namespace IDLX::CLI

#endif  // IDLX_CLI_COMMANDS_INSPECT_HPP

#ifndef IDLX_CLI_COMMANDS_COMMON_HPP
#define IDLX_CLI_COMMANDS_COMMON_HPP

#include "model/pattern/pattern_error.hpp"

#include <string_view>

namespace IDLX::CLI {

// vvv Common Stuff vvv
void LoadCliSettings(std::string_view configPath);
void ReportPatternError(std::string_view what, const Model::PatternError& error);

} // namespace IDLX::CLI

#endif // IDLX_CLI_COMMANDS_COMMON_HPP

#ifndef IDLX_CLI_HPP
#define IDLX_CLI_HPP

namespace IDLX::CLI {

// Parses the command line and runs the command. Exit codes:
// 0 success, 1 invalid manifest or template, 2 usage error
int RunCli(int argc, const char* const argv[]);

} // namespace IDLX::CLI

#endif // IDLX_CLI_HPP

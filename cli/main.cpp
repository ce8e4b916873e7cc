#include "cli/cli.hpp"

int main(int argc, char* argv[])
{
    return IDLX::CLI::RunCli(argc, argv);
}

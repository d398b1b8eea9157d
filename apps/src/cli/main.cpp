#include "CliRunner.h"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
    const std::vector<std::string> args(argv, argv + argc);
    return RNodeClient::Cli::runCli(
        args, std::cout, std::cerr, RNodeClient::Cli::realServices());
}

#include "cli/cli_runner.h"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char **argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  return csvhash::runCli(argc > 0 ? argv[0] : "csvhash", args, std::cout,
                         std::cerr);
}

#pragma once
#ifndef CSVHASH_CLI_RUNNER_H
#define CSVHASH_CLI_RUNNER_H

#include <ostream>
#include <string>
#include <vector>

namespace csvhash {

/**
 * @brief Run the command-line tool.
 *
 * Parses @p args (program name excluded), merges the optional YAML
 * configuration, initialises the logger, runs the digest self test and
 * transcodes the file.
 *
 * @param program Name shown in the usage line.
 * @param out     Receives the success message and --help output.
 * @param err     Receives "Error: ..." messages.
 * @return 0 on success, 1 on any failure.
 */
int runCli(const std::string &program, const std::vector<std::string> &args,
           std::ostream &out, std::ostream &err);

} // namespace csvhash

#endif // CSVHASH_CLI_RUNNER_H

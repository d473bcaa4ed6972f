#pragma once
#ifndef CSVHASH_CLI_OPTIONS_H
#define CSVHASH_CLI_OPTIONS_H

#include "utilities/digest.hpp"

#include <optional>
#include <string>
#include <vector>

namespace csvhash {

/// Parsed command line. Unset optionals fall back to the config file.
struct CliOptions {
  std::string inputFile;
  std::string outputFile;
  std::string column;
  std::optional<HashAlgorithm> algorithm;
  std::optional<std::string> configFile;
  std::optional<std::string> logFile;
  std::optional<std::string> logLevel;
  bool showHelp = false;
};

/**
 * @brief Parse arguments (program name excluded).
 *
 * Accepts "-a NAME", "--algorithm NAME" and "--algorithm=NAME" forms;
 * "--" ends option processing.
 *
 * @throws UsageError for unknown options, missing values or a wrong number
 *         of positional arguments.
 * @throws UnsupportedAlgorithmError for an algorithm outside the closed set.
 */
CliOptions parseCommandLine(const std::vector<std::string> &args);

std::string usageText(const std::string &program);

} // namespace csvhash

#endif // CSVHASH_CLI_OPTIONS_H

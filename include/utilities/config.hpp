#ifndef CSVHASH_CONFIG_HPP
#define CSVHASH_CONFIG_HPP

#include "utilities/csv.hpp"
#include "utilities/digest.hpp"
#include "utilities/logger.h"

#include <string>

namespace csvhash {

/// Settings that may come from a YAML file and/or the command line.
struct RuntimeOptions {
  HashAlgorithm algorithm = DEFAULT_ALGORITHM;
  LogLevel logLevel = LogLevel::WARN;
  std::string logFile; // empty: console
  long long logMaxSize = 10 * 1024 * 1024;
  int logMaxBackups = 5;
  LineTerminator lineTerminator = LineTerminator::CRLF;
  bool hashEmptyValues = false;
};

/**
 * @brief Load options from a YAML file on top of the defaults.
 *
 * Recognised keys: algorithm, log_level, log_file, log_max_size,
 * log_max_backups, line_terminator (crlf|lf), hash_empty_values.
 * Unknown keys are ignored.
 *
 * @throws ConfigError if the file cannot be read or a value is invalid.
 * @throws UnsupportedAlgorithmError for an unknown algorithm name.
 */
RuntimeOptions loadRuntimeOptions(const std::string &path);

/// Same as loadRuntimeOptions() but reads YAML from a string.
RuntimeOptions parseRuntimeOptions(const std::string &yamlText);

} // namespace csvhash

#endif // CSVHASH_CONFIG_HPP

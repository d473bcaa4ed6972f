#include "utilities/config.hpp"
#include "utilities/errors.h"

#include <algorithm>
#include <cctype>
#include <yaml-cpp/yaml.h>

namespace csvhash {

namespace {

template <typename T> T readValue(const YAML::Node &node, const char *key) {
  try {
    return node[key].as<T>();
  } catch (const YAML::Exception &e) {
    throw ConfigError(std::string("Invalid value for '") + key +
                      "': " + e.what());
  }
}

LineTerminator parseLineTerminator(const std::string &name) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lowered == "crlf")
    return LineTerminator::CRLF;
  if (lowered == "lf")
    return LineTerminator::LF;
  throw ConfigError("Invalid value for 'line_terminator': " + name +
                    " (expected crlf or lf)");
}

RuntimeOptions fromNode(const YAML::Node &node) {
  RuntimeOptions opts;
  if (!node || node.IsNull())
    return opts;
  if (!node.IsMap())
    throw ConfigError("Configuration must be a YAML mapping");

  if (node["algorithm"])
    opts.algorithm =
        parseHashAlgorithm(readValue<std::string>(node, "algorithm"));
  if (node["log_level"]) {
    const auto level = readValue<std::string>(node, "log_level");
    try {
      opts.logLevel = logLevelFromString(level);
    } catch (const std::invalid_argument &e) {
      throw ConfigError(e.what());
    }
  }
  if (node["log_file"])
    opts.logFile = readValue<std::string>(node, "log_file");
  if (node["log_max_size"]) {
    opts.logMaxSize = readValue<long long>(node, "log_max_size");
    if (opts.logMaxSize < 0)
      throw ConfigError("'log_max_size' must not be negative");
  }
  if (node["log_max_backups"]) {
    opts.logMaxBackups = readValue<int>(node, "log_max_backups");
    if (opts.logMaxBackups < 0)
      throw ConfigError("'log_max_backups' must not be negative");
  }
  if (node["line_terminator"])
    opts.lineTerminator =
        parseLineTerminator(readValue<std::string>(node, "line_terminator"));
  if (node["hash_empty_values"])
    opts.hashEmptyValues = readValue<bool>(node, "hash_empty_values");
  return opts;
}

} // namespace

RuntimeOptions loadRuntimeOptions(const std::string &path) {
  YAML::Node node;
  try {
    node = YAML::LoadFile(path);
  } catch (const YAML::BadFile &) {
    throw ConfigError("Cannot read configuration file '" + path + "'");
  } catch (const YAML::Exception &e) {
    throw ConfigError("Malformed configuration file '" + path +
                      "': " + e.what());
  }
  return fromNode(node);
}

RuntimeOptions parseRuntimeOptions(const std::string &yamlText) {
  YAML::Node node;
  try {
    node = YAML::Load(yamlText);
  } catch (const YAML::Exception &e) {
    throw ConfigError(std::string("Malformed configuration: ") + e.what());
  }
  return fromNode(node);
}

} // namespace csvhash

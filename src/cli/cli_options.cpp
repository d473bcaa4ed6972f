#include "cli/cli_options.h"
#include "utilities/errors.h"

#include <sstream>

namespace csvhash {

namespace {

// Splits "--name=value" into its parts; value is empty when absent.
bool splitInlineValue(const std::string &arg, std::string &name,
                      std::string &value) {
  auto eq = arg.find('=');
  if (arg.rfind("--", 0) != 0 || eq == std::string::npos) {
    name = arg;
    return false;
  }
  name = arg.substr(0, eq);
  value = arg.substr(eq + 1);
  return true;
}

} // namespace

CliOptions parseCommandLine(const std::vector<std::string> &args) {
  CliOptions opts;
  std::vector<std::string> positional;
  bool optionsDone = false;

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];
    if (optionsDone || arg.size() < 2 || arg[0] != '-') {
      positional.push_back(arg);
      continue;
    }
    if (arg == "--") {
      optionsDone = true;
      continue;
    }
    if (arg == "-h" || arg == "--help") {
      opts.showHelp = true;
      continue;
    }

    std::string name, value;
    bool hasInline = splitInlineValue(arg, name, value);
    auto takeValue = [&]() -> std::string {
      if (hasInline)
        return value;
      if (i + 1 >= args.size())
        throw UsageError("Option " + name + " expects a value");
      return args[++i];
    };

    if (name == "-a" || name == "--algorithm") {
      opts.algorithm = parseHashAlgorithm(takeValue());
    } else if (name == "-c" || name == "--config") {
      opts.configFile = takeValue();
    } else if (name == "--log-file") {
      opts.logFile = takeValue();
    } else if (name == "--log-level") {
      opts.logLevel = takeValue();
    } else {
      throw UsageError("Unrecognized option: " + arg);
    }
  }

  if (opts.showHelp)
    return opts;

  if (positional.size() != 3) {
    std::ostringstream msg;
    msg << "Expected 3 positional arguments (input_file output_file "
           "column_name), got "
        << positional.size();
    throw UsageError(msg.str());
  }
  opts.inputFile = positional[0];
  opts.outputFile = positional[1];
  opts.column = positional[2];
  return opts;
}

std::string usageText(const std::string &program) {
  std::ostringstream out;
  out << "Usage: " << program
      << " [options] <input_file> <output_file> <column_name>\n"
      << "Hash a specified column in a CSV file\n\n"
      << "Options:\n"
      << "  -a, --algorithm NAME   md5|sha1|sha256|sha512|blake2b|blake2s "
         "(default: sha256)\n"
      << "  -c, --config FILE      YAML configuration file\n"
      << "      --log-file FILE    write log records to FILE\n"
      << "      --log-level LEVEL  trace|debug|info|warn|error|fatal\n"
      << "  -h, --help             show this help and exit\n";
  return out.str();
}

} // namespace csvhash

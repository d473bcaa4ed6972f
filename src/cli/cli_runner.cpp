#include "cli/cli_runner.h"
#include "cli/cli_options.h"
#include "transcoder/column_hasher.h"
#include "utilities/config.hpp"
#include "utilities/errors.h"
#include "utilities/logger.h"

#include <algorithm>
#include <cctype>

namespace csvhash {

namespace {

void reportFailure(std::ostream &err, const std::string &message) {
  Logger &logger = Logger::getInstance();
  // Console logging would duplicate the stderr message.
  if (!logger.isConsoleOnly()) {
    logger.log(LogLevel::ERROR, message);
  }
  err << "Error: " << message << std::endl;
}

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

} // namespace

int runCli(const std::string &program, const std::vector<std::string> &args,
           std::ostream &out, std::ostream &err) {
  CliOptions cli;
  try {
    cli = parseCommandLine(args);
  } catch (const UsageError &e) {
    err << "Error: " << e.what() << "\n" << usageText(program);
    return 1;
  } catch (const UnsupportedAlgorithmError &e) {
    err << "Error: " << e.what() << "\n" << usageText(program);
    return 1;
  }

  if (cli.showHelp) {
    out << usageText(program);
    return 0;
  }

  RuntimeOptions runtime;
  try {
    if (cli.configFile)
      runtime = loadRuntimeOptions(*cli.configFile);
    if (cli.algorithm)
      runtime.algorithm = *cli.algorithm;
    if (cli.logFile)
      runtime.logFile = *cli.logFile;
    if (cli.logLevel) {
      try {
        runtime.logLevel = logLevelFromString(*cli.logLevel);
      } catch (const std::invalid_argument &e) {
        throw UsageError(e.what());
      }
    }
  } catch (const CsvHashError &e) {
    err << "Error: " << e.what() << std::endl;
    return 1;
  }

  Logger::init(runtime.logFile.empty() ? Logger::CONSOLE_ONLY_OUTPUT
                                       : runtime.logFile,
               runtime.logLevel, runtime.logMaxSize, runtime.logMaxBackups);

  if (!digestSelfTest()) {
    reportFailure(err, "Digest self test failed; refusing to run");
    return 1;
  }

  TranscodeOptions options;
  options.inputPath = cli.inputFile;
  options.outputPath = cli.outputFile;
  options.column = cli.column;
  options.algorithm = runtime.algorithm;
  options.hashEmptyValues = runtime.hashEmptyValues;
  options.lineTerminator = runtime.lineTerminator;

  try {
    hashCsvColumn(options);
  } catch (const CsvHashError &e) {
    reportFailure(err, e.what());
    return 1;
  } catch (const std::exception &e) {
    reportFailure(err, std::string("Unexpected failure: ") + e.what());
    return 1;
  }

  out << "Successfully hashed column '" << options.column << "' using "
      << upper(algorithmName(options.algorithm)) << " and saved to '"
      << options.outputPath << "'" << std::endl;
  return 0;
}

} // namespace csvhash

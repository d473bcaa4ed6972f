#pragma once
#ifndef CSVHASH_LOGGER_H
#define CSVHASH_LOGGER_H
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <string>

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Parse a level name such as "warn" (case-insensitive).
 * @throws std::invalid_argument for an unknown name.
 */
LogLevel logLevelFromString(const std::string &name);

class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  // Special destination: records go to stderr instead of a file.
  static const std::string CONSOLE_ONLY_OUTPUT;

  /**
   * @brief (Re)initialise the process-wide logger.
   *
   * @param logFile        Destination path or CONSOLE_ONLY_OUTPUT.
   * @param level          Records below this level are dropped.
   * @param maxFileSize    Rotate once the file reaches this many bytes
   *                       (0 disables rotation).
   * @param maxBackupFiles Number of numbered backups (.1, .2, ...) kept.
   */
  static void init(const std::string &logFile, LogLevel level = LogLevel::WARN,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);
  static Logger &getInstance();

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;
  bool isConsoleOnly() const { return logFilePath == CONSOLE_ONLY_OUTPUT; }
  const std::string &getLogFilePath() const { return logFilePath; }

  void log(LogLevel level, const std::string &message);

  static std::string levelToString(LogLevel level);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

  std::string getTimestamp();
  void rotateIfNeeded();

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::mutex s_mutex;
};

#endif // CSVHASH_LOGGER_H

#pragma once
#ifndef CSVHASH_ERRORS_H
#define CSVHASH_ERRORS_H

#include <stdexcept>
#include <string>
#include <vector>

namespace csvhash {

/// Categories of terminal failures reported by the tool.
enum class ErrorKind {
  FileNotFound,
  ColumnNotFound,
  UnsupportedAlgorithm,
  IOFailure,
  Usage,
  Config
};

/// Human readable name of an ErrorKind ("FileNotFound", ...).
std::string errorKindToString(ErrorKind kind);

/**
 * @brief Base class for every error raised by csvhash.
 *
 * All errors are terminal for a run; the command-line front end turns them
 * into a message on stderr and exit status 1.
 */
class CsvHashError : public std::runtime_error {
public:
  CsvHashError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

class FileNotFoundError : public CsvHashError {
public:
  explicit FileNotFoundError(const std::string &path,
                             const std::string &reason = "does not exist");

  const std::string &path() const { return path_; }

private:
  std::string path_;
};

/**
 * @brief Requested column is not part of the header.
 *
 * The message enumerates the available columns in header order.
 */
class ColumnNotFoundError : public CsvHashError {
public:
  ColumnNotFoundError(const std::string &column,
                      const std::vector<std::string> &available);

  const std::string &column() const { return column_; }
  const std::vector<std::string> &availableColumns() const {
    return available_;
  }

private:
  std::string column_;
  std::vector<std::string> available_;
};

class UnsupportedAlgorithmError : public CsvHashError {
public:
  explicit UnsupportedAlgorithmError(const std::string &name);
};

/// Read/write failure, malformed CSV, invalid UTF-8 or crypto failure.
class IOFailureError : public CsvHashError {
public:
  explicit IOFailureError(const std::string &message)
      : CsvHashError(ErrorKind::IOFailure, message) {}
};

/// Raised when a line of input cannot be decoded or parsed.
class MalformedInputError : public IOFailureError {
public:
  MalformedInputError(const std::string &what, long long line);

  long long line() const { return line_; }

private:
  long long line_;
};

class UsageError : public CsvHashError {
public:
  explicit UsageError(const std::string &message)
      : CsvHashError(ErrorKind::Usage, message) {}
};

class ConfigError : public CsvHashError {
public:
  explicit ConfigError(const std::string &message)
      : CsvHashError(ErrorKind::Config, message) {}
};

} // namespace csvhash

#endif // CSVHASH_ERRORS_H

#include "utilities/errors.h"
#include "utilities/digest.hpp"

#include <string>

namespace csvhash {

namespace {

std::string joinNames(const std::vector<std::string> &names) {
  std::string out;
  for (size_t i = 0; i < names.size(); ++i) {
    if (i > 0)
      out += ", ";
    out += names[i];
  }
  return out;
}

} // namespace

std::string errorKindToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::FileNotFound:
    return "FileNotFound";
  case ErrorKind::ColumnNotFound:
    return "ColumnNotFound";
  case ErrorKind::UnsupportedAlgorithm:
    return "UnsupportedAlgorithm";
  case ErrorKind::IOFailure:
    return "IOFailure";
  case ErrorKind::Usage:
    return "Usage";
  case ErrorKind::Config:
    return "Config";
  default:
    return "Unknown";
  }
}

FileNotFoundError::FileNotFoundError(const std::string &path,
                                     const std::string &reason)
    : CsvHashError(ErrorKind::FileNotFound,
                   "Input file '" + path + "' " + reason),
      path_(path) {}

ColumnNotFoundError::ColumnNotFoundError(
    const std::string &column, const std::vector<std::string> &available)
    : CsvHashError(ErrorKind::ColumnNotFound,
                   "Column '" + column +
                       "' not found in CSV. Available columns: " +
                       joinNames(available)),
      column_(column), available_(available) {}

UnsupportedAlgorithmError::UnsupportedAlgorithmError(const std::string &name)
    : CsvHashError(ErrorKind::UnsupportedAlgorithm,
                   "Unsupported algorithm: " + name +
                       ". Supported: " + joinNames(supportedAlgorithms())) {}

MalformedInputError::MalformedInputError(const std::string &what,
                                         long long line)
    : IOFailureError(what + " (line " + std::to_string(line) + ")"),
      line_(line) {}

} // namespace csvhash

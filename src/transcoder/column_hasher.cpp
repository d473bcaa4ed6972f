#include "transcoder/column_hasher.h"
#include "utilities/errors.h"
#include "utilities/logger.h"

#include <filesystem>
#include <fstream>
#include <functional>
#include <system_error>
#include <utility>

namespace csvhash {

namespace {

void requireUtf8(const CsvRecord &record, long long line) {
  for (size_t i = 0; i < record.size(); ++i) {
    if (!isValidUtf8(record[i])) {
      throw MalformedInputError("Invalid UTF-8 in field " +
                                    std::to_string(i + 1),
                                line);
    }
  }
}

TranscodeStats
transcode(std::istream &in, const TranscodeOptions &options,
          const std::function<std::ostream &()> &openOutput) {
  CsvReader reader(in);
  CsvRecord header;
  if (!reader.readRecord(header)) {
    // No header at all: nothing can match.
    throw ColumnNotFoundError(options.column, {});
  }
  requireUtf8(header, reader.recordLine());

  ColumnHasher hasher(options.column, options.algorithm,
                      options.hashEmptyValues);
  size_t index = hasher.bindHeader(header);
  Logger::getInstance().log(LogLevel::DEBUG,
                            "Target column '" + options.column +
                                "' found at index " + std::to_string(index) +
                                " of " + std::to_string(header.size()));

  std::ostream &out = openOutput();
  CsvWriter writer(out, options.lineTerminator);
  writer.writeRecord(header);

  CsvRecord row;
  while (reader.readRecord(row)) {
    requireUtf8(row, reader.recordLine());
    hasher.transformRow(row, reader.recordLine());
    writer.writeRecord(row);
  }

  out.flush();
  if (!out) {
    throw IOFailureError("Failed to flush output");
  }
  return hasher.stats();
}

} // namespace

ColumnHasher::ColumnHasher(std::string column, HashAlgorithm algorithm,
                           bool hashEmptyValues)
    : column_(std::move(column)), algorithm_(algorithm),
      hashEmptyValues_(hashEmptyValues) {}

size_t ColumnHasher::bindHeader(const CsvRecord &header) {
  for (size_t i = 0; i < header.size(); ++i) {
    if (header[i] == column_) {
      columnIndex_ = i;
      width_ = header.size();
      bound_ = true;
      return i;
    }
  }
  throw ColumnNotFoundError(column_, header);
}

void ColumnHasher::transformRow(CsvRecord &row, long long line) {
  if (!bound_) {
    throw std::logic_error("ColumnHasher::bindHeader() was not called");
  }
  if (row.size() > width_) {
    throw MalformedInputError("Row has " + std::to_string(row.size()) +
                                  " fields but the header has " +
                                  std::to_string(width_),
                              line);
  }
  if (row.size() < width_) {
    Logger::getInstance().log(LogLevel::WARN,
                              "Line " + std::to_string(line) + " has " +
                                  std::to_string(row.size()) +
                                  " fields; padding to " +
                                  std::to_string(width_));
    row.resize(width_);
    ++stats_.rowsPadded;
  }

  std::string &value = row[columnIndex_];
  if (value.empty() && !hashEmptyValues_) {
    // Empty stays empty rather than becoming the digest of "".
    ++stats_.emptyValuesSkipped;
  } else {
    value = hexDigest(algorithm_, value);
    ++stats_.valuesHashed;
  }
  ++stats_.rowsWritten;
}

TranscodeStats hashCsvStream(std::istream &in, std::ostream &out,
                             const TranscodeOptions &options) {
  return transcode(in, options,
                   [&out]() -> std::ostream & { return out; });
}

TranscodeStats hashCsvColumn(const TranscodeOptions &options) {
  namespace fs = std::filesystem;
  std::error_code ec;
  if (!fs::exists(options.inputPath, ec) ||
      fs::is_directory(options.inputPath, ec)) {
    throw FileNotFoundError(options.inputPath);
  }

  std::ifstream in(options.inputPath, std::ios::in | std::ios::binary);
  if (!in.is_open()) {
    throw FileNotFoundError(options.inputPath, "cannot be opened for reading");
  }

  if (fs::exists(options.outputPath, ec) &&
      fs::equivalent(options.inputPath, options.outputPath, ec)) {
    throw IOFailureError("Output file '" + options.outputPath +
                         "' is the same file as the input");
  }

  Logger::getInstance().log(LogLevel::INFO,
                            "Hashing column '" + options.column + "' of '" +
                                options.inputPath + "' with " +
                                algorithmName(options.algorithm));

  std::ofstream out;
  TranscodeStats stats =
      transcode(in, options, [&out, &options]() -> std::ostream & {
        out.open(options.outputPath,
                 std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
          throw IOFailureError("Cannot open output file '" +
                               options.outputPath + "' for writing");
        }
        return out;
      });

  out.close();
  if (out.fail()) {
    throw IOFailureError("Failed to close output file '" +
                         options.outputPath + "'");
  }

  Logger::getInstance().log(
      LogLevel::INFO,
      "Wrote " + std::to_string(stats.rowsWritten) + " rows to '" +
          options.outputPath + "' (" + std::to_string(stats.valuesHashed) +
          " hashed, " + std::to_string(stats.emptyValuesSkipped) +
          " empty, " + std::to_string(stats.rowsPadded) + " padded)");
  return stats;
}

} // namespace csvhash

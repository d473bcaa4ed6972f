#pragma once
#ifndef CSVHASH_COLUMN_HASHER_H
#define CSVHASH_COLUMN_HASHER_H

#include "utilities/csv.hpp"
#include "utilities/digest.hpp"

#include <istream>
#include <ostream>
#include <string>

namespace csvhash {

/// Settings for one transcoding run.
struct TranscodeOptions {
  std::string inputPath;
  std::string outputPath;
  std::string column;
  HashAlgorithm algorithm = DEFAULT_ALGORITHM;
  bool hashEmptyValues = false; ///< Hash "" instead of leaving it empty.
  LineTerminator lineTerminator = LineTerminator::CRLF;
};

struct TranscodeStats {
  long long rowsWritten{0};        ///< Data rows, header excluded.
  long long valuesHashed{0};
  long long emptyValuesSkipped{0};
  long long rowsPadded{0};         ///< Rows shorter than the header.
};

/**
 * @brief Replaces the value of one column with its digest, row by row.
 *
 * bindHeader() must be called with the header record before any row is
 * transformed.
 */
class ColumnHasher {
public:
  ColumnHasher(std::string column, HashAlgorithm algorithm,
               bool hashEmptyValues = false);

  /**
   * @brief Locate the target column in the header.
   * @return Zero-based index of the column.
   * @throws ColumnNotFoundError if the column is absent (exact match).
   */
  size_t bindHeader(const CsvRecord &header);

  /**
   * @brief Transform one data row in place.
   *
   * Short rows are padded with empty fields to header width.
   *
   * @param row  Fields of the row.
   * @param line Line number of the row, used in error messages.
   * @throws MalformedInputError if the row has more fields than the header.
   */
  void transformRow(CsvRecord &row, long long line);

  const TranscodeStats &stats() const { return stats_; }
  HashAlgorithm algorithm() const { return algorithm_; }

private:
  std::string column_;
  HashAlgorithm algorithm_;
  bool hashEmptyValues_;
  size_t columnIndex_{0};
  size_t width_{0};
  bool bound_{false};
  TranscodeStats stats_;
};

/**
 * @brief Transcode CSV from one stream to another.
 *
 * Nothing is written to @p out unless the header contains @p column.
 */
TranscodeStats hashCsvStream(std::istream &in, std::ostream &out,
                             const TranscodeOptions &options);

/**
 * @brief Transcode the file named in @p options.
 *
 * The output file is created (or truncated) only after the header has been
 * validated.
 *
 * @throws FileNotFoundError   input missing or unreadable.
 * @throws ColumnNotFoundError column absent from header.
 * @throws IOFailureError      any other read, write or decoding failure.
 */
TranscodeStats hashCsvColumn(const TranscodeOptions &options);

} // namespace csvhash

#endif // CSVHASH_COLUMN_HASHER_H

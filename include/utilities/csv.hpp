#ifndef CSVHASH_CSV_HPP
#define CSVHASH_CSV_HPP

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace csvhash {

using CsvRecord = std::vector<std::string>;

/**
 * @brief Streaming RFC-4180 record reader.
 *
 * Records are read one at a time from the underlying stream so memory use
 * is bounded by the largest record. Accepts LF, CRLF and lone CR record
 * terminators. Quoted fields may contain delimiters, doubled quotes and
 * line breaks. Lines with no characters are skipped.
 */
class CsvReader {
public:
  explicit CsvReader(std::istream &in, char delimiter = ',',
                     char quote = '"');

  /**
   * @brief Read the next record.
   * @param record Receives the fields; cleared first.
   * @return false once the input is exhausted.
   * @throws MalformedInputError for a quoted field left open at end of input.
   * @throws IOFailureError if the stream reports a read error.
   */
  bool readRecord(CsvRecord &record);

  /// Physical line (1-based) on which the last returned record started.
  long long recordLine() const { return recordLine_; }

  /// Number of records returned so far.
  long long recordsRead() const { return recordsRead_; }

private:
  int next();
  int peek();

  std::istream &in_;
  char delimiter_;
  char quote_;
  long long line_ = 1;
  long long recordLine_ = 0;
  long long recordsRead_ = 0;
};

enum class LineTerminator { CRLF, LF };

/**
 * @brief Record writer using minimal quoting.
 *
 * A field is quoted only when it contains the delimiter, the quote
 * character, CR or LF.
 */
class CsvWriter {
public:
  explicit CsvWriter(std::ostream &out,
                     LineTerminator terminator = LineTerminator::CRLF,
                     char delimiter = ',', char quote = '"');

  /// @throws IOFailureError when the stream enters a failed state.
  void writeRecord(const CsvRecord &record);

  long long recordsWritten() const { return recordsWritten_; }

private:
  void writeField(const std::string &field);
  bool needsQuoting(const std::string &field) const;

  std::ostream &out_;
  const char *terminator_;
  char delimiter_;
  char quote_;
  long long recordsWritten_ = 0;
};

/// True if @p text is well-formed UTF-8 (no overlongs, no surrogates).
bool isValidUtf8(const std::string &text);

} // namespace csvhash

#endif // CSVHASH_CSV_HPP

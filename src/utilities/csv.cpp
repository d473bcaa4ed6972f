#include "utilities/csv.hpp"
#include "utilities/errors.h"

#include <utility>

namespace csvhash {

namespace {

enum class ParseState { StartField, InField, InQuoted, QuoteInQuoted };

constexpr int END_OF_INPUT = std::char_traits<char>::eof();

} // namespace

CsvReader::CsvReader(std::istream &in, char delimiter, char quote)
    : in_(in), delimiter_(delimiter), quote_(quote) {}

int CsvReader::next() {
  int c = in_.get();
  if (c == END_OF_INPUT && in_.bad()) {
    throw IOFailureError("Read error on input stream after line " +
                         std::to_string(line_));
  }
  return c;
}

int CsvReader::peek() {
  int c = in_.peek();
  if (c == END_OF_INPUT && in_.bad()) {
    throw IOFailureError("Read error on input stream after line " +
                         std::to_string(line_));
  }
  return c;
}

bool CsvReader::readRecord(CsvRecord &record) {
  record.clear();

  // Skip blank lines between records.
  int c = next();
  while (c == '\n' || c == '\r') {
    if (c == '\r' && peek() == '\n')
      next();
    ++line_;
    c = next();
  }
  if (c == END_OF_INPUT)
    return false;

  recordLine_ = line_;
  std::string field;
  ParseState state = ParseState::StartField;

  for (;; c = next()) {
    if (c == END_OF_INPUT) {
      if (state == ParseState::InQuoted) {
        throw MalformedInputError("unexpected end of data inside quoted field",
                                  recordLine_);
      }
      record.push_back(std::move(field));
      break;
    }

    const char ch = static_cast<char>(c);
    const bool newline = (ch == '\n' || ch == '\r');

    if (state == ParseState::InQuoted) {
      if (ch == quote_) {
        state = ParseState::QuoteInQuoted;
      } else {
        field.push_back(ch);
        if (ch == '\n' || (ch == '\r' && peek() != '\n'))
          ++line_;
      }
      continue;
    }

    if (newline) {
      if (ch == '\r' && peek() == '\n')
        next();
      ++line_;
      record.push_back(std::move(field));
      break;
    }

    if (ch == delimiter_) {
      record.push_back(std::move(field));
      field.clear();
      state = ParseState::StartField;
      continue;
    }

    switch (state) {
    case ParseState::StartField:
      if (ch == quote_) {
        state = ParseState::InQuoted;
      } else {
        field.push_back(ch);
        state = ParseState::InField;
      }
      break;
    case ParseState::QuoteInQuoted:
      field.push_back(ch);
      // A doubled quote is a literal quote; anything else after the
      // closing quote is kept as unquoted text.
      state = (ch == quote_) ? ParseState::InQuoted : ParseState::InField;
      break;
    default:
      field.push_back(ch);
      break;
    }
  }

  ++recordsRead_;
  return true;
}

CsvWriter::CsvWriter(std::ostream &out, LineTerminator terminator,
                     char delimiter, char quote)
    : out_(out), terminator_(terminator == LineTerminator::CRLF ? "\r\n" : "\n"),
      delimiter_(delimiter), quote_(quote) {}

bool CsvWriter::needsQuoting(const std::string &field) const {
  for (char ch : field) {
    if (ch == delimiter_ || ch == quote_ || ch == '\r' || ch == '\n')
      return true;
  }
  return false;
}

void CsvWriter::writeField(const std::string &field) {
  if (!needsQuoting(field)) {
    out_ << field;
    return;
  }
  out_ << quote_;
  for (char ch : field) {
    if (ch == quote_)
      out_ << quote_;
    out_ << ch;
  }
  out_ << quote_;
}

void CsvWriter::writeRecord(const CsvRecord &record) {
  if (record.size() == 1 && record[0].empty()) {
    // Otherwise indistinguishable from a blank line.
    out_ << quote_ << quote_;
  } else {
    for (size_t i = 0; i < record.size(); ++i) {
      if (i > 0)
        out_ << delimiter_;
      writeField(record[i]);
    }
  }
  out_ << terminator_;
  if (!out_) {
    throw IOFailureError("Write error on output stream at record " +
                         std::to_string(recordsWritten_ + 1));
  }
  ++recordsWritten_;
}

bool isValidUtf8(const std::string &text) {
  const auto *s = reinterpret_cast<const unsigned char *>(text.data());
  const size_t n = text.size();
  size_t i = 0;
  while (i < n) {
    unsigned char c = s[i];
    if (c < 0x80) {
      ++i;
      continue;
    }
    size_t len;
    unsigned int cp;
    if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp = c & 0x07;
    } else {
      return false;
    }
    if (i + len > n)
      return false;
    for (size_t k = 1; k < len; ++k) {
      if ((s[i + k] & 0xC0) != 0x80)
        return false;
      cp = (cp << 6) | (s[i + k] & 0x3F);
    }
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
        (len == 4 && cp < 0x10000) || cp > 0x10FFFF ||
        (cp >= 0xD800 && cp <= 0xDFFF)) {
      return false;
    }
    i += len;
  }
  return true;
}

} // namespace csvhash

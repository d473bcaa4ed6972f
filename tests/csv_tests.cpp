#include "utilities/csv.hpp"
#include "utilities/errors.h"
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

using namespace csvhash;

static std::vector<CsvRecord> readAll(const std::string &text) {
  std::istringstream in(text);
  CsvReader reader(in);
  std::vector<CsvRecord> records;
  CsvRecord record;
  while (reader.readRecord(record))
    records.push_back(record);
  return records;
}

static std::string writeAll(const std::vector<CsvRecord> &records,
                            LineTerminator terminator = LineTerminator::CRLF) {
  std::ostringstream out;
  CsvWriter writer(out, terminator);
  for (const auto &r : records)
    writer.writeRecord(r);
  return out.str();
}

TEST(CsvReaderTest, ReadsSimpleRecords) {
  auto records = readAll("id,email\n1,alice@example.com\n2,\n");
  ASSERT_EQ(records.size(), 3u);
  EXPECT_EQ(records[0], (CsvRecord{"id", "email"}));
  EXPECT_EQ(records[1], (CsvRecord{"1", "alice@example.com"}));
  EXPECT_EQ(records[2], (CsvRecord{"2", ""}));
}

TEST(CsvReaderTest, AcceptsCrlfCrAndMissingFinalNewline) {
  auto records = readAll("a,b\r\n1,2\r3,4");
  ASSERT_EQ(records.size(), 3u);
  EXPECT_EQ(records[1], (CsvRecord{"1", "2"}));
  EXPECT_EQ(records[2], (CsvRecord{"3", "4"}));
}

TEST(CsvReaderTest, QuotedFieldsKeepDelimitersQuotesAndNewlines) {
  auto records = readAll("name,note\n\"Smith, J\",\"said \"\"hi\"\"\nthen left\"\n");
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[1][0], "Smith, J");
  EXPECT_EQ(records[1][1], "said \"hi\"\nthen left");
}

TEST(CsvReaderTest, SkipsBlankLines) {
  auto records = readAll("a\n\n1\r\n\r\n2\n\n");
  ASSERT_EQ(records.size(), 3u);
  EXPECT_EQ(records[1], (CsvRecord{"1"}));
  EXPECT_EQ(records[2], (CsvRecord{"2"}));
}

TEST(CsvReaderTest, QuotedEmptyFieldIsNotBlankLine) {
  auto records = readAll("a\n\"\"\n");
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[1], (CsvRecord{""}));
}

TEST(CsvReaderTest, LenientAboutStrayQuotes) {
  auto records = readAll("ab\"c,\"x\"y\n");
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0], (CsvRecord{"ab\"c", "xy"}));
}

TEST(CsvReaderTest, TrailingDelimiterYieldsEmptyField) {
  auto records = readAll("a,b,\n");
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0], (CsvRecord{"a", "b", ""}));
}

TEST(CsvReaderTest, TracksRecordLineNumbers) {
  std::istringstream in("h\n\"multi\nline\"\n\nlast\n");
  CsvReader reader(in);
  CsvRecord record;
  ASSERT_TRUE(reader.readRecord(record));
  EXPECT_EQ(reader.recordLine(), 1);
  ASSERT_TRUE(reader.readRecord(record));
  EXPECT_EQ(reader.recordLine(), 2);
  ASSERT_TRUE(reader.readRecord(record));
  EXPECT_EQ(reader.recordLine(), 5);
  EXPECT_EQ(record, (CsvRecord{"last"}));
  EXPECT_FALSE(reader.readRecord(record));
  EXPECT_EQ(reader.recordsRead(), 3);
}

TEST(CsvReaderTest, UnterminatedQuoteIsMalformed) {
  std::istringstream in("a\n\"open field\n");
  CsvReader reader(in);
  CsvRecord record;
  ASSERT_TRUE(reader.readRecord(record));
  try {
    reader.readRecord(record);
    FAIL() << "expected MalformedInputError";
  } catch (const MalformedInputError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::IOFailure);
    EXPECT_EQ(e.line(), 2);
  }
}

TEST(CsvReaderTest, EmptyInputHasNoRecords) {
  EXPECT_TRUE(readAll("").empty());
  EXPECT_TRUE(readAll("\n\r\n").empty());
}

TEST(CsvWriterTest, QuotesOnlyWhenNeeded) {
  std::string out = writeAll({{"plain", "with,comma", "with\"quote",
                               "line\nbreak", "cr\rhere", " spaced "}});
  EXPECT_EQ(out, "plain,\"with,comma\",\"with\"\"quote\",\"line\nbreak\","
                 "\"cr\rhere\", spaced \r\n");
}

TEST(CsvWriterTest, SingleEmptyFieldIsQuoted) {
  EXPECT_EQ(writeAll({{""}}, LineTerminator::LF), "\"\"\n");
  EXPECT_EQ(writeAll({{"", ""}}, LineTerminator::LF), ",\n");
}

TEST(CsvWriterTest, LineTerminatorIsConfigurable) {
  EXPECT_EQ(writeAll({{"a", "b"}, {"1", "2"}}), "a,b\r\n1,2\r\n");
  EXPECT_EQ(writeAll({{"a", "b"}, {"1", "2"}}, LineTerminator::LF),
            "a,b\n1,2\n");
}

TEST(CsvWriterTest, OutputReadsBackIdentically) {
  std::vector<CsvRecord> records = {
      {"id", "comment"}, {"1", "a \"quoted\", multi\r\nline value"}, {"2", ""}};
  EXPECT_EQ(readAll(writeAll(records)), records);
}

TEST(CsvWriterTest, FailedStreamRaisesIOFailure) {
  std::ostringstream out;
  out.setstate(std::ios::badbit);
  CsvWriter writer(out);
  EXPECT_THROW(writer.writeRecord({"a"}), IOFailureError);
  EXPECT_EQ(writer.recordsWritten(), 0);
}

TEST(Utf8Validation, AcceptsWellFormedText) {
  EXPECT_TRUE(isValidUtf8(""));
  EXPECT_TRUE(isValidUtf8("ascii"));
  EXPECT_TRUE(isValidUtf8("h\xc3\xa9llo"));         // é
  EXPECT_TRUE(isValidUtf8("\xe2\x82\xac"));         // €
  EXPECT_TRUE(isValidUtf8("\xf0\x9f\x98\x80"));     // emoji
}

TEST(Utf8Validation, RejectsMalformedSequences) {
  EXPECT_FALSE(isValidUtf8("\xff"));
  EXPECT_FALSE(isValidUtf8("\xc3"));             // truncated
  EXPECT_FALSE(isValidUtf8("\xc0\xaf"));         // overlong
  EXPECT_FALSE(isValidUtf8("\xed\xa0\x80"));     // surrogate
  EXPECT_FALSE(isValidUtf8("\xf4\x90\x80\x80")); // above U+10FFFF
  EXPECT_FALSE(isValidUtf8("caf\xe9"));          // latin-1
}

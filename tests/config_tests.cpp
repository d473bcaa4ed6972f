#include <gtest/gtest.h>
#include "utilities/config.hpp"
#include "utilities/errors.h"
#include <cstdio>
#include <fstream>

using namespace csvhash;

TEST(RuntimeOptionsTest, DefaultsWhenEmpty) {
    RuntimeOptions opts = parseRuntimeOptions("");
    EXPECT_EQ(opts.algorithm, HashAlgorithm::SHA256);
    EXPECT_EQ(opts.logLevel, LogLevel::WARN);
    EXPECT_TRUE(opts.logFile.empty());
    EXPECT_EQ(opts.logMaxSize, 10 * 1024 * 1024);
    EXPECT_EQ(opts.logMaxBackups, 5);
    EXPECT_EQ(opts.lineTerminator, LineTerminator::CRLF);
    EXPECT_FALSE(opts.hashEmptyValues);
}

TEST(RuntimeOptionsTest, ReadsEveryKey) {
    RuntimeOptions opts = parseRuntimeOptions(
        "algorithm: BLAKE2s\n"
        "log_level: debug\n"
        "log_file: /tmp/csvhash.log\n"
        "log_max_size: 2048\n"
        "log_max_backups: 1\n"
        "line_terminator: lf\n"
        "hash_empty_values: true\n"
        "unrelated: ignored\n");
    EXPECT_EQ(opts.algorithm, HashAlgorithm::BLAKE2S);
    EXPECT_EQ(opts.logLevel, LogLevel::DEBUG);
    EXPECT_EQ(opts.logFile, "/tmp/csvhash.log");
    EXPECT_EQ(opts.logMaxSize, 2048);
    EXPECT_EQ(opts.logMaxBackups, 1);
    EXPECT_EQ(opts.lineTerminator, LineTerminator::LF);
    EXPECT_TRUE(opts.hashEmptyValues);
}

TEST(RuntimeOptionsTest, RejectsInvalidValues) {
    EXPECT_THROW(parseRuntimeOptions("algorithm: sha3\n"), UnsupportedAlgorithmError);
    EXPECT_THROW(parseRuntimeOptions("log_level: loud\n"), ConfigError);
    EXPECT_THROW(parseRuntimeOptions("line_terminator: cr\n"), ConfigError);
    EXPECT_THROW(parseRuntimeOptions("hash_empty_values: maybe\n"), ConfigError);
    EXPECT_THROW(parseRuntimeOptions("log_max_size: -1\n"), ConfigError);
    EXPECT_THROW(parseRuntimeOptions("log_max_backups: lots\n"), ConfigError);
    EXPECT_THROW(parseRuntimeOptions("- just\n- a list\n"), ConfigError);
    EXPECT_THROW(parseRuntimeOptions("algorithm: [unterminated\n"), ConfigError);
}

TEST(RuntimeOptionsTest, LoadFromFile) {
    const std::string path = "csvhash_config_test.yaml";
    {
        std::ofstream out(path);
        out << "algorithm: md5\nline_terminator: LF\n";
    }
    RuntimeOptions opts = loadRuntimeOptions(path);
    EXPECT_EQ(opts.algorithm, HashAlgorithm::MD5);
    EXPECT_EQ(opts.lineTerminator, LineTerminator::LF);
    std::remove(path.c_str());
}

TEST(RuntimeOptionsTest, MissingFileIsConfigError) {
    try {
        loadRuntimeOptions("nonexistent_csvhash.yaml");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::Config);
        EXPECT_NE(std::string(e.what()).find("nonexistent_csvhash.yaml"), std::string::npos);
    }
}

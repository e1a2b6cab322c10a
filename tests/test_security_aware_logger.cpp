#include <gtest/gtest.h>
#include "security/CryptoHasher.hpp"
#include "security/SecurityAwareLogger.hpp"
#include "support/TempDir.hpp"

#include <fstream>
#include <regex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using security::CryptoHasher;
using security::Level;
using security::SecurityAwareLogger;

namespace {
    guard::LoggingConfig config_in(const std::filesystem::path& dir) {
        guard::LoggingConfig cfg;
        cfg.dir = dir.string();
        cfg.file_name_format = "test.log";
        cfg.console = false;
        return cfg;
    }

    std::vector<std::string> read_lines(const std::filesystem::path& p) {
        std::ifstream in(p);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(in, line)) lines.push_back(line);
        return lines;
    }
}

TEST(SecurityAwareLoggerTest, OpenWritesStartupRecord) {
    TempDir tmp;
    SecurityAwareLogger logger(config_in(tmp.path()));
    logger.open();
    logger.flush();

    auto lines = read_lines(tmp.path() / "test.log");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("[Logger Started]"), std::string::npos);
    EXPECT_EQ(logger.failures(), 0u);
}

TEST(SecurityAwareLoggerTest, LineFormatHasTimestampLevelSequenceAndHash) {
    TempDir tmp;
    SecurityAwareLogger logger(config_in(tmp.path()));
    logger.open();
    logger.record(Level::Error, "[Request Rejected] kind=LengthExceeded");
    logger.flush();

    auto lines = read_lines(tmp.path() / "test.log");
    ASSERT_EQ(lines.size(), 2u);
    std::regex shape(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2},\d{3} \| ERROR    \| \[Request Rejected\] kind=LengthExceeded seq=1 hash=[0-9a-f]{64})");
    EXPECT_TRUE(std::regex_match(lines[1], shape)) << lines[1];
}

TEST(SecurityAwareLoggerTest, HashesFormAVerifiableChain) {
    TempDir tmp;
    SecurityAwareLogger logger(config_in(tmp.path()));
    logger.open();
    logger.record(Level::Info, "alpha");
    logger.record(Level::Warn, "beta");
    logger.flush();

    auto lines = read_lines(tmp.path() / "test.log");
    ASSERT_EQ(lines.size(), 3u);

    std::string prev = SecurityAwareLogger::kGenesisHash;
    std::string startup = "[Logger Started] file=" + logger.file_path().string();
    std::vector<std::pair<Level, std::string>> expected = {
        {Level::Info, startup}, {Level::Info, "alpha"}, {Level::Warn, "beta"}};

    for (std::size_t i = 0; i < expected.size(); ++i) {
        std::string hash = CryptoHasher::sha256(
            SecurityAwareLogger::chain_input(prev, i, expected[i].first, expected[i].second));
        EXPECT_NE(lines[i].find("hash=" + hash), std::string::npos) << "line " << i;
        prev = hash;
    }
    EXPECT_EQ(logger.last_hash(), prev);
}

TEST(SecurityAwareLoggerTest, RecordsBelowMinimumLevelAreDropped) {
    TempDir tmp;
    SecurityAwareLogger logger(config_in(tmp.path()));
    logger.open();
    logger.record(Level::Debug, "hidden");
    logger.flush();

    EXPECT_EQ(read_lines(tmp.path() / "test.log").size(), 1u);
    EXPECT_EQ(logger.sequence(), 1u);
}

TEST(SecurityAwareLoggerTest, DebugLevelLetsDebugThrough) {
    TempDir tmp;
    auto cfg = config_in(tmp.path());
    cfg.level = Level::Debug;
    SecurityAwareLogger logger(cfg);
    logger.open();
    logger.record(Level::Debug, "visible");
    logger.flush();

    auto lines = read_lines(tmp.path() / "test.log");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[1].find("DEBUG    | visible"), std::string::npos);
}

TEST(SecurityAwareLoggerTest, ControlCharactersCannotForgeLines) {
    TempDir tmp;
    SecurityAwareLogger logger(config_in(tmp.path()));
    logger.open();
    logger.record(Level::Info, "value='a\nFAKE | ERROR | forged'\r\x01");
    logger.flush();

    auto lines = read_lines(tmp.path() / "test.log");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[1].find("a\\nFAKE"), std::string::npos);
    EXPECT_NE(lines[1].find("\\r\\x01"), std::string::npos);
}

TEST(SecurityAwareLoggerTest, EchoesToConsoleWhenEnabled) {
    TempDir tmp;
    auto cfg = config_in(tmp.path());
    cfg.console = true;
    std::ostringstream console;
    SecurityAwareLogger logger(cfg, &console);
    logger.open();
    logger.log(Level::Info, "[Startup] max_input_length=", 25);

    EXPECT_NE(console.str().find("[Startup] max_input_length=25"), std::string::npos);
}

TEST(SecurityAwareLoggerTest, RecordBeforeOpenIsCountedNotThrown) {
    TempDir tmp;
    SecurityAwareLogger logger(config_in(tmp.path()));
    EXPECT_NO_THROW(logger.record(Level::Error, "nowhere to go"));
    EXPECT_EQ(logger.failures(), 1u);
}

TEST(SecurityAwareLoggerTest, FailedRecordDoesNotAdvanceChain) {
    TempDir tmp;
    SecurityAwareLogger logger(config_in(tmp.path()));
    logger.record(Level::Error, "lost");
    EXPECT_EQ(logger.failures(), 1u);
    EXPECT_EQ(logger.sequence(), 0u);
    EXPECT_EQ(logger.last_hash(), SecurityAwareLogger::kGenesisHash);

    logger.open();
    logger.flush();

    auto lines = read_lines(tmp.path() / "test.log");
    ASSERT_EQ(lines.size(), 1u);
    std::string startup = "[Logger Started] file=" + logger.file_path().string();
    std::string hash = CryptoHasher::sha256(
        SecurityAwareLogger::chain_input(SecurityAwareLogger::kGenesisHash, 0, Level::Info, startup));
    EXPECT_NE(lines[0].find(" seq=0 hash=" + hash), std::string::npos) << lines[0];
    EXPECT_EQ(logger.last_hash(), hash);
}

TEST(SecurityAwareLoggerTest, OpenFailsWhenDirectoryIsAFile) {
    TempDir tmp;
    std::ofstream(tmp.path() / "blocked") << "x";
    SecurityAwareLogger logger(config_in(tmp.path() / "blocked"));
    EXPECT_THROW(logger.open(), std::runtime_error);
}

TEST(SecurityAwareLoggerTest, ConcurrentWritersProduceWholeLines) {
    TempDir tmp;
    SecurityAwareLogger logger(config_in(tmp.path()));
    logger.open();

    constexpr int kThreads = 8;
    constexpr int kPerThread = 200;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t] {
            for (int i = 0; i < kPerThread; ++i) logger.log(Level::Info, "thread=", t, " i=", i);
        });
    }
    for (auto& th : threads) th.join();
    logger.flush();

    auto lines = read_lines(tmp.path() / "test.log");
    ASSERT_EQ(lines.size(), static_cast<std::size_t>(kThreads * kPerThread + 1));
    for (const auto& line : lines) {
        EXPECT_NE(line.find(" hash="), std::string::npos);
    }
    EXPECT_EQ(logger.failures(), 0u);
}

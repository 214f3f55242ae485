/**
 * Logger hierarchy: level filtering, file output and rotation, async delivery
 */

#include <gtest/gtest.h>
#include "flotilla/logger/AsyncLogger.hpp"
#include "flotilla/logger/ConsoleLogger.hpp"
#include "flotilla/logger/FileLogger.hpp"
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace flotilla;
namespace fs = std::filesystem;

namespace {
class CapturingLogger : public Logger {
public:
    void write(LogLevel level, std::string_view msg) override {
        lines.emplace_back(std::string(logLevelName(level)) + " " + std::string(msg));
    }
    std::vector<std::string> lines;
};
}

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() /
                    ("flotilla_logger_test_" + std::to_string(::getpid()));
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    std::string readFile(const fs::path& path) {
        std::ifstream file(path);
        return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }

    static size_t countOccurrences(const std::string& haystack, const std::string& needle) {
        size_t count = 0;
        for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
            ++count;
        }
        return count;
    }

    fs::path test_dir_;
};

// ============================================================================
// Levels
// ============================================================================

TEST_F(LoggerTest, DefaultLevelDropsDebug) {
    CapturingLogger logger;
    logger.logDebug("hidden");
    logger.logMessage("shown");
    logger.logWarning("careful");

    ASSERT_EQ(logger.lines.size(), 2u);
    EXPECT_EQ(logger.lines[0], "INFO shown");
    EXPECT_EQ(logger.lines[1], "WARN careful");
}

TEST_F(LoggerTest, RaisingLevelFiltersInfo) {
    CapturingLogger logger;
    logger.setLevel(LogLevel::ERROR);
    logger.logMessage("dropped");
    logger.logWarning("dropped too");
    logger.logError("kept");

    ASSERT_EQ(logger.lines.size(), 1u);
    EXPECT_EQ(logger.lines[0], "ERROR kept");
    EXPECT_FALSE(logger.enabled(LogLevel::WARNING));
}

TEST_F(LoggerTest, ParseLogLevelAcceptsNamesCaseInsensitively) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("INFO"), LogLevel::INFO);
    EXPECT_EQ(parseLogLevel("Warn"), LogLevel::WARNING);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::WARNING);
    EXPECT_EQ(parseLogLevel("error"), LogLevel::ERROR);
    EXPECT_THROW(parseLogLevel("verbose"), std::invalid_argument);
}

TEST_F(LoggerTest, LogCurrentErrorIncludesExceptionText) {
    CapturingLogger logger;
    try {
        throw std::runtime_error("disk on fire");
    } catch (const std::exception&) {
        logger.logCurrentError("PoolManager: dispose failed");
    }

    ASSERT_EQ(logger.lines.size(), 1u);
    EXPECT_EQ(logger.lines[0], "ERROR PoolManager: dispose failed: disk on fire");
}

// ============================================================================
// FileLogger
// ============================================================================

TEST_F(LoggerTest, FileLoggerWritesTimestampedLevelLines) {
    fs::path log_path = test_dir_ / "levels.log";
    {
        FileLogger logger(log_path.string(), true);
        ASSERT_TRUE(logger.isOpen());
        logger.logMessage("Info message");
        logger.logError("Error message");
    }

    std::string content = readFile(log_path);
    EXPECT_NE(content.find("[INFO] Info message"), std::string::npos);
    EXPECT_NE(content.find("[ERROR] Error message"), std::string::npos);
    // "YYYY-mm-dd HH:MM:SS.mmm " prefix
    ASSERT_GE(content.size(), 24u);
    EXPECT_EQ(content[4], '-');
    EXPECT_EQ(content[19], '.');
}

TEST_F(LoggerTest, FileLoggerAppendsAcrossInstances) {
    fs::path log_path = test_dir_ / "append.log";
    {
        FileLogger logger(log_path.string(), true);
        logger.logMessage("First message");
    }
    {
        FileLogger logger(log_path.string(), false);
        logger.logMessage("Second message");
        logger.flush();
    }

    std::string content = readFile(log_path);
    EXPECT_NE(content.find("First message"), std::string::npos);
    EXPECT_NE(content.find("Second message"), std::string::npos);
}

TEST_F(LoggerTest, FileLoggerReopenFollowsRotation) {
    fs::path log_path = test_dir_ / "rotate.log";
    fs::path rotated_path = test_dir_ / "rotate.log.1";

    FileLogger logger(log_path.string(), true);
    logger.logMessage("Before rotation");
    fs::rename(log_path, rotated_path);
    logger.reopen();
    logger.logMessage("After rotation");
    logger.flush();

    std::string old_content = readFile(rotated_path);
    std::string new_content = readFile(log_path);
    EXPECT_NE(old_content.find("Before rotation"), std::string::npos);
    EXPECT_EQ(old_content.find("After rotation"), std::string::npos);
    EXPECT_NE(new_content.find("Log file reopened"), std::string::npos);
    EXPECT_NE(new_content.find("After rotation"), std::string::npos);
}

// ============================================================================
// AsyncLogger
// ============================================================================

TEST_F(LoggerTest, AsyncLoggerDeliversEveryMessageBeforeDestruction) {
    fs::path log_path = test_dir_ / "async.log";
    constexpr int kThreads = 8;
    constexpr int kPerThread = 200;

    {
        AsyncLogger async_logger(std::make_unique<FileLogger>(log_path.string(), false));
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&async_logger, t] {
                for (int i = 0; i < kPerThread; ++i) {
                    async_logger.logMessage("worker " + std::to_string(t) + " line " + std::to_string(i));
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }

    EXPECT_EQ(countOccurrences(readFile(log_path), "[INFO]"), static_cast<size_t>(kThreads * kPerThread));
}

TEST_F(LoggerTest, AsyncLoggerRespectsDelegateLevel) {
    fs::path log_path = test_dir_ / "async_levels.log";
    {
        auto file_logger = std::make_unique<FileLogger>(log_path.string(), true);
        file_logger->setLevel(LogLevel::WARNING);
        AsyncLogger async_logger(std::move(file_logger));
        async_logger.logDebug("debug line");
        async_logger.logMessage("info line");
        async_logger.logWarning("warning line");
    }

    std::string content = readFile(log_path);
    EXPECT_EQ(content.find("debug line"), std::string::npos);
    EXPECT_EQ(content.find("info line"), std::string::npos);
    EXPECT_NE(content.find("[WARN] warning line"), std::string::npos);
}

TEST_F(LoggerTest, AsyncLoggerTruncatesOversizedMessages) {
    fs::path log_path = test_dir_ / "async_long.log";
    {
        AsyncLogger async_logger(std::make_unique<FileLogger>(log_path.string(), true));
        async_logger.logMessage(std::string(5000, 'x'));
    }

    std::string content = readFile(log_path);
    EXPECT_EQ(countOccurrences(content, "[INFO]"), 1u);
    EXPECT_EQ(countOccurrences(content, "x"), 1023u);
}

// DELAYPAY - Logging Tests
// Copyright (c) 2024 DELAYPAY Developers
// MIT License

#include <gtest/gtest.h>

#include "delaypay/util/logging.h"

#include <filesystem>
#include <fstream>
#include <regex>

namespace delaypay {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger& logger = Logger::Instance();
        logger.ClearSinks();
        logger.EnableAllCategories();
        logger.SetLevel(LogLevel::Trace);
        sink_ = std::make_shared<CallbackSink>(
            [this](const LogEntry& entry) { entries_.push_back(entry); },
            LogLevel::Trace);
        logger.AddSink(sink_);
    }

    void TearDown() override {
        Logger& logger = Logger::Instance();
        logger.ClearSinks();
        logger.EnableAllCategories();
        logger.SetLevel(LogLevel::Info);
    }

    std::shared_ptr<CallbackSink> sink_;
    std::vector<LogEntry> entries_;
};

// ============================================================================
// Levels
// ============================================================================

TEST(LogLevelTest, StringConversion) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_EQ(LogLevelFromString("debug"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("ERROR"), LogLevel::Error);
    EXPECT_EQ(LogLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("off"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("bogus"), LogLevel::Info);
}

TEST_F(LoggingTest, StreamMacroCapturesEntry) {
    LOG_INFO(LogCategory::LEDGER) << "spent " << 3 << " leaves";

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Info);
    EXPECT_EQ(entries_[0].category, LogCategory::LEDGER);
    EXPECT_EQ(entries_[0].message, "spent 3 leaves");
    EXPECT_EQ(GetBasename(entries_[0].file), "test_logging.cpp");
    EXPECT_GT(entries_[0].line, 0);
}

TEST_F(LoggingTest, PrintfMacro) {
    LogInfoF(LogCategory::PAYOUT, "issued %d payouts worth %s", 2, "150");
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "issued 2 payouts worth 150");
}

TEST_F(LoggingTest, LoggerLevelFilters) {
    Logger::Instance().SetLevel(LogLevel::Warn);
    LOG_DEBUG(LogCategory::DEFAULT) << "hidden";
    LOG_INFO(LogCategory::DEFAULT) << "hidden";
    LOG_WARN(LogCategory::DEFAULT) << "shown";
    LOG_ERROR(LogCategory::DEFAULT) << "shown";
    EXPECT_EQ(entries_.size(), 2u);

    Logger::Instance().SetLevel(LogLevel::Off);
    LOG_FATAL(LogCategory::DEFAULT) << "hidden";
    EXPECT_EQ(entries_.size(), 2u);
}

TEST_F(LoggingTest, SinkLevelFilters) {
    sink_->SetLevel(LogLevel::Error);
    LOG_WARN(LogCategory::DEFAULT) << "hidden";
    LOG_ERROR(LogCategory::DEFAULT) << "shown";
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "shown");
}

TEST_F(LoggingTest, StreamArgumentsNotEvaluatedWhenFiltered) {
    Logger::Instance().SetLevel(LogLevel::Error);
    int evaluated = 0;
    auto count = [&]() { return ++evaluated; };
    LOG_DEBUG(LogCategory::DEFAULT) << count();
    EXPECT_EQ(evaluated, 0);
}

TEST_F(LoggingTest, Categories) {
    Logger& logger = Logger::Instance();
    logger.DisableAllCategories();
    logger.EnableCategory(LogCategory::LEDGER);

    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::LEDGER));
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::MERKLE));

    LOG_INFO(LogCategory::MERKLE) << "hidden";
    LOG_INFO(LogCategory::LEDGER) << "shown";
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].category, LogCategory::LEDGER);

    logger.DisableCategory(LogCategory::LEDGER);
    LOG_INFO(LogCategory::LEDGER) << "hidden";
    EXPECT_EQ(entries_.size(), 1u);
}

TEST_F(LoggingTest, SinkManagement) {
    Logger& logger = Logger::Instance();
    EXPECT_EQ(logger.SinkCount(), 1u);
    auto second = std::make_shared<CallbackSink>([](const LogEntry&) {});
    logger.AddSink(second);
    EXPECT_EQ(logger.SinkCount(), 2u);
    logger.RemoveSink(second);
    EXPECT_EQ(logger.SinkCount(), 1u);
    logger.AddSink(nullptr);
    EXPECT_EQ(logger.SinkCount(), 1u);
}

TEST_F(LoggingTest, FileSinkWritesLines) {
    std::filesystem::path dir = std::filesystem::temp_directory_path() / "delaypay_logging_test";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    FileSink::Config config;
    config.path = (dir / "delaypay.log").string();
    config.autoFlush = true;
    auto fileSink = std::make_shared<FileSink>(config);
    ASSERT_TRUE(fileSink->IsOpen());
    Logger::Instance().AddSink(fileSink);

    LOG_INFO(LogCategory::DB) << "opened ledger";
    LOG_TRACE(LogCategory::DB) << "below file level";
    Logger::Instance().RemoveSink(fileSink);
    EXPECT_GT(fileSink->GetCurrentSize(), 0u);
    fileSink.reset();

    std::ifstream in(config.path);
    std::string line;
    std::vector<std::string> lines;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("opened ledger"), std::string::npos);
    EXPECT_NE(lines[0].find("[INFO ]"), std::string::npos);
    EXPECT_NE(lines[0].find("test_logging.cpp"), std::string::npos);

    std::filesystem::remove_all(dir);
}

// ============================================================================
// Utilities
// ============================================================================

TEST(LogUtilTest, TimestampFormat) {
    std::string ts = FormatLogTimestamp(std::chrono::system_clock::time_point());
    EXPECT_EQ(ts, "1970-01-01T00:00:00.000Z");

    std::regex iso(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z)");
    EXPECT_TRUE(std::regex_match(FormatLogTimestamp(std::chrono::system_clock::now()), iso));
}

TEST(LogUtilTest, FixedWidthAndBasename) {
    EXPECT_EQ(FixedWidth("INFO", 5), "INFO ");
    EXPECT_EQ(FixedWidth("LEDGERS", 4), "LEDG");
    EXPECT_EQ(GetBasename("/a/b/c.cpp"), "c.cpp");
    EXPECT_EQ(GetBasename("c.cpp"), "c.cpp");
}

} // namespace test
} // namespace util
} // namespace delaypay

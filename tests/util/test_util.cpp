// TALLY - Util Module Tests
// Copyright (c) 2024 TALLY Developers
// MIT License

#include <gtest/gtest.h>

#include <tally/util/logging.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

namespace tally {
namespace util {
namespace {

// ============================================================================
// Level Tests
// ============================================================================

TEST(LogLevelTest, Names) {
    EXPECT_STREQ(LogLevelName(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelName(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelName(LogLevel::Off), "OFF");
}

TEST(LogLevelTest, Parse) {
    EXPECT_TRUE(ParseLogLevel("debug") == LogLevel::Debug);
    EXPECT_TRUE(ParseLogLevel("Info") == LogLevel::Info);
    EXPECT_TRUE(ParseLogLevel("WARN") == LogLevel::Warn);
    EXPECT_TRUE(ParseLogLevel("warning") == LogLevel::Warn);
    EXPECT_TRUE(ParseLogLevel("off") == LogLevel::Off);
    EXPECT_FALSE(ParseLogLevel("verbose").has_value());
    EXPECT_FALSE(ParseLogLevel("").has_value());
}

TEST(LogLevelTest, FormatRecord) {
    LogRecord record;
    record.level = LogLevel::Warn;
    record.category = LogCategory::WALLET;
    record.message = "overflow";
    EXPECT_EQ(FormatLogRecord(record, false), "WARN  [wallet] overflow");

    record.level = LogLevel::Error;
    record.category = LogCategory::DEFAULT;
    EXPECT_EQ(FormatLogRecord(record, false), "ERROR overflow");

    std::string timed = FormatLogRecord(record, true);
    // 2024-01-31T12:00:00.000 ERROR overflow
    ASSERT_GT(timed.size(), 24u);
    EXPECT_EQ(timed[10], 'T');
    EXPECT_EQ(timed.substr(24), "ERROR overflow");
}

// ============================================================================
// Logger Tests
// ============================================================================

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override { Reset(); }
    void TearDown() override { Reset(); }

    static void Reset() {
        auto& logger = Logger::Instance();
        logger.ClearSinks();
        logger.SetLevel(LogLevel::Info);
        logger.ResetCategories();
    }

    void Capture(LogLevel minLevel = LogLevel::Trace) {
        Logger::Instance().AddSink(std::make_shared<CallbackSink>(
            [this](const LogRecord& record) { records_.push_back(record); }, minLevel));
    }

    std::vector<LogRecord> records_;
};

TEST_F(LoggerTest, SinkManagement) {
    auto& logger = Logger::Instance();
    EXPECT_EQ(logger.SinkCount(), 0u);

    std::ostringstream out;
    auto sink = std::make_shared<ConsoleSink>(out);
    logger.AddSink(sink);
    logger.AddSink(nullptr);
    EXPECT_EQ(logger.SinkCount(), 1u);

    logger.RemoveSink(sink);
    EXPECT_EQ(logger.SinkCount(), 0u);
}

TEST_F(LoggerTest, LevelThreshold) {
    auto& logger = Logger::Instance();
    EXPECT_FALSE(logger.ShouldLog(LogLevel::Debug, LogCategory::DEFAULT));
    EXPECT_TRUE(logger.ShouldLog(LogLevel::Info, LogCategory::DEFAULT));

    logger.SetLevel(LogLevel::Error);
    EXPECT_EQ(logger.GetLevel(), LogLevel::Error);
    EXPECT_FALSE(logger.ShouldLog(LogLevel::Warn, LogCategory::DEFAULT));
    EXPECT_TRUE(logger.ShouldLog(LogLevel::Fatal, LogCategory::DEFAULT));
}

TEST_F(LoggerTest, OffSilencesEverything) {
    Logger::Instance().SetLevel(LogLevel::Off);
    Capture();

    LOG_FATAL(LogCategory::DEFAULT) << "dropped";
    EXPECT_FALSE(Logger::Instance().ShouldLog(LogLevel::Off, LogCategory::DEFAULT));
    EXPECT_TRUE(records_.empty());
}

TEST_F(LoggerTest, CategorySwitches) {
    auto& logger = Logger::Instance();
    Capture();

    logger.SetCategoryEnabled(LogCategory::CONFIG, false);
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::CONFIG));
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::WALLET));

    LOG_ERROR(LogCategory::CONFIG) << "hidden";
    LOG_ERROR(LogCategory::WALLET) << "shown";
    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].message, "shown");

    logger.SetCategoryEnabled(LogCategory::CONFIG, true);
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::CONFIG));

    logger.SetCategoryEnabled(LogCategory::WALLET, false);
    logger.ResetCategories();
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::WALLET));
}

TEST_F(LoggerTest, SinkMinimumLevel) {
    Logger::Instance().SetLevel(LogLevel::Trace);
    Capture(LogLevel::Warn);

    LOG_INFO(LogCategory::DEFAULT) << "below";
    LOG_WARN(LogCategory::DEFAULT) << "at";
    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].message, "at");
}

TEST_F(LoggerTest, StreamMacroFillsRecord) {
    Logger::Instance().SetLevel(LogLevel::Debug);
    Capture();

    LOG_DEBUG(LogCategory::WALLET) << "balance " << 75 << " for " << std::string("alice");

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].level, LogLevel::Debug);
    EXPECT_EQ(records_[0].category, LogCategory::WALLET);
    EXPECT_EQ(records_[0].message, "balance 75 for alice");
    ASSERT_NE(records_[0].file, nullptr);
    EXPECT_NE(std::string(records_[0].file).find("test_util.cpp"), std::string::npos);
    EXPECT_GT(records_[0].line, 0);
}

TEST_F(LoggerTest, DisabledMacroSkipsOperands) {
    Capture();
    int evaluated = 0;
    auto count = [&evaluated]() { return ++evaluated; };

    LOG_DEBUG(LogCategory::DEFAULT) << count();
    EXPECT_EQ(evaluated, 0);

    LOG_INFO(LogCategory::DEFAULT) << count();
    EXPECT_EQ(evaluated, 1);
    EXPECT_EQ(records_.size(), 1u);
}

TEST_F(LoggerTest, MacroInsideIfElse) {
    Capture();
    bool elseTaken = false;

    if (false)
        LOG_INFO(LogCategory::DEFAULT) << "not reached";
    else
        elseTaken = true;
    EXPECT_TRUE(elseTaken);
    EXPECT_TRUE(records_.empty());

    elseTaken = false;
    if (true)
        LOG_DEBUG(LogCategory::DEFAULT) << "below threshold";
    else
        elseTaken = true;
    EXPECT_FALSE(elseTaken);
    EXPECT_TRUE(records_.empty());
}

TEST_F(LoggerTest, LongMessageKeptWhole) {
    Capture();
    std::string big(10000, 'x');
    LOG_INFO(LogCategory::DEFAULT) << big;
    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].message.size(), 10000u);
}

TEST_F(LoggerTest, ConcurrentWriters) {
    Capture();
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([t]() {
            for (int i = 0; i < 100; ++i) {
                LOG_INFO(LogCategory::DEFAULT) << "thread " << t << " message " << i;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(records_.size(), 400u);
}

TEST_F(LoggerTest, ConsoleSinkWritesLines) {
    std::ostringstream out;
    Logger::Instance().AddSink(std::make_shared<ConsoleSink>(out, LogLevel::Info, false));

    LOG_INFO(LogCategory::WALLET) << "first";
    LOG_WARN(LogCategory::DEFAULT) << "second";
    Logger::Instance().Flush();

    EXPECT_EQ(out.str(), "INFO  [wallet] first\nWARN  second\n");
}

// ============================================================================
// File Sink Tests
// ============================================================================

class FileSinkTest : public LoggerTest {
protected:
    void SetUp() override {
        LoggerTest::SetUp();
        char name[] = "/tmp/tally_log_XXXXXX";
        int fd = mkstemp(name);
        ASSERT_NE(fd, -1);
        close(fd);
        path_ = name;
    }

    void TearDown() override {
        LoggerTest::TearDown();
        std::remove(path_.c_str());
    }

    std::string Contents() const {
        std::ifstream in(path_);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::string path_;
};

TEST_F(FileSinkTest, AppendsWithLocation) {
    {
        std::ofstream existing(path_);
        existing << "previous run\n";
    }

    auto sink = std::make_shared<FileSink>(path_);
    ASSERT_TRUE(sink->IsOpen());
    EXPECT_EQ(sink->GetPath(), path_);

    Logger::Instance().AddSink(sink);
    LOG_INFO(LogCategory::WALLET) << "written";
    Logger::Instance().Flush();

    std::string text = Contents();
    EXPECT_EQ(text.find("previous run\n"), 0u);
    EXPECT_NE(text.find("INFO  [wallet] written (test_util.cpp:"), std::string::npos);
}

TEST_F(FileSinkTest, RespectsMinimumLevel) {
    auto sink = std::make_shared<FileSink>(path_, LogLevel::Error);
    Logger::Instance().AddSink(sink);

    LOG_WARN(LogCategory::DEFAULT) << "too quiet";
    LOG_ERROR(LogCategory::DEFAULT) << "loud enough";
    Logger::Instance().Flush();

    std::string text = Contents();
    EXPECT_EQ(text.find("too quiet"), std::string::npos);
    EXPECT_NE(text.find("loud enough"), std::string::npos);
}

TEST_F(FileSinkTest, UnopenableFileIsHarmless) {
    auto sink = std::make_shared<FileSink>("/nonexistent-dir/tally/debug.log");
    EXPECT_FALSE(sink->IsOpen());

    Logger::Instance().AddSink(sink);
    LOG_ERROR(LogCategory::DEFAULT) << "dropped";
    Logger::Instance().Flush();
}

} // namespace
} // namespace util
} // namespace tally

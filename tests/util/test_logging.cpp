// ANCHORZK - Logging Tests
// Copyright (c) 2024 AnchorZK Developers
// MIT License

#include <gtest/gtest.h>

#include "anchorzk/util/logging.h"

#include <algorithm>
#include <memory>
#include <mutex>
#include <vector>

namespace anchorzk {
namespace util {
namespace test {

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = Logger::Instance();
        savedLevel_ = logger.GetLevel();
        logger.ClearSinks();
        logger.ResetCategoryLevels();
        logger.SetLevel(LogLevel::Trace);
        sink_ = std::make_shared<CallbackSink>([this](const LogEntry& entry) {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.push_back(entry);
        });
        logger.AddSink(sink_);
    }

    void TearDown() override {
        auto& logger = Logger::Instance();
        logger.ClearSinks();
        logger.ResetCategoryLevels();
        logger.SetLevel(savedLevel_);
    }

    std::vector<LogEntry> Captured() {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    std::shared_ptr<CallbackSink> sink_;
    std::vector<LogEntry> entries_;
    std::mutex mutex_;
    LogLevel savedLevel_{LogLevel::Info};
};

// ============================================================================
// Level Tests
// ============================================================================

TEST_F(LoggingTest, LevelNames) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Off), "OFF");

    LogLevel level = LogLevel::Info;
    EXPECT_TRUE(ParseLogLevel("debug", level));
    EXPECT_EQ(level, LogLevel::Debug);
    EXPECT_TRUE(ParseLogLevel("Warning", level));
    EXPECT_EQ(level, LogLevel::Warn);
    EXPECT_FALSE(ParseLogLevel("loud", level));
    EXPECT_EQ(level, LogLevel::Warn);
}

TEST_F(LoggingTest, StreamMacroCapturesMessage) {
    LOG_INFO(LogCategory::PROVER) << "leaf " << 42;
    auto entries = Captured();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, LogLevel::Info);
    EXPECT_EQ(entries[0].category, LogCategory::PROVER);
    EXPECT_EQ(entries[0].message, "leaf 42");
    EXPECT_GT(entries[0].line, 0);
    ASSERT_NE(entries[0].file, nullptr);
}

TEST_F(LoggingTest, LoggerLevelFilters) {
    Logger::Instance().SetLevel(LogLevel::Warn);
    LOG_DEBUG(LogCategory::TREE) << "hidden";
    LOG_INFO(LogCategory::TREE) << "hidden";
    LOG_WARN(LogCategory::TREE) << "shown";
    LOG_ERROR(LogCategory::TREE) << "shown";
    EXPECT_EQ(Captured().size(), 2u);
}

TEST_F(LoggingTest, FilteredStreamIsNotEvaluated) {
    Logger::Instance().SetLevel(LogLevel::Error);
    int evaluations = 0;
    auto count = [&evaluations]() { return ++evaluations; };
    LOG_DEBUG(LogCategory::DEFAULT) << count();
    EXPECT_EQ(evaluations, 0);
    LOG_ERROR(LogCategory::DEFAULT) << count();
    EXPECT_EQ(evaluations, 1);
}

TEST_F(LoggingTest, OffIsNeverLogged) {
    EXPECT_FALSE(Logger::Instance().WillLog(LogLevel::Off, LogCategory::DEFAULT));
    Logger::Instance().Log(LogLevel::Off, LogCategory::DEFAULT, "never");
    EXPECT_TRUE(Captured().empty());
}

TEST_F(LoggingTest, SinkLevelFilters) {
    sink_->SetLevel(LogLevel::Error);
    LOG_WARN(LogCategory::VERIFIER) << "dropped by sink";
    LOG_ERROR(LogCategory::VERIFIER) << "kept";
    auto entries = Captured();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "kept");
}

// ============================================================================
// Category Tests
// ============================================================================

TEST_F(LoggingTest, CategoryThresholds) {
    auto& logger = Logger::Instance();
    logger.SetLevel(LogLevel::Info);
    logger.SetCategoryLevel(LogCategory::TREE, LogLevel::Off);
    logger.SetCategoryLevel(LogCategory::VERIFIER, LogLevel::Debug);

    EXPECT_EQ(logger.EffectiveLevel(LogCategory::TREE), LogLevel::Off);
    EXPECT_EQ(logger.EffectiveLevel(LogCategory::VERIFIER), LogLevel::Debug);
    EXPECT_EQ(logger.EffectiveLevel(LogCategory::PROVER), LogLevel::Info);

    LOG_ERROR(LogCategory::TREE) << "silenced";
    LOG_DEBUG(LogCategory::VERIFIER) << "kept";
    LOG_DEBUG(LogCategory::PROVER) << "below global";
    auto entries = Captured();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].category, LogCategory::VERIFIER);

    logger.ResetCategoryLevels();
    EXPECT_EQ(logger.EffectiveLevel(LogCategory::TREE), LogLevel::Info);
}

TEST_F(LoggingTest, KnownCategories) {
    const auto& known = KnownLogCategories();
    EXPECT_EQ(known.size(), 6u);
    EXPECT_NE(std::find(known.begin(), known.end(), "tree"), known.end());
    EXPECT_EQ(std::find(known.begin(), known.end(), "net"), known.end());
}

// ============================================================================
// Sink Management
// ============================================================================

TEST_F(LoggingTest, AddRemoveSinks) {
    auto& logger = Logger::Instance();
    EXPECT_EQ(logger.SinkCount(), 1u);

    logger.Initialize();
    EXPECT_EQ(logger.SinkCount(), 1u);

    int extra = 0;
    auto second = std::make_shared<CallbackSink>([&extra](const LogEntry&) { ++extra; });
    logger.AddSink(second);
    LOG_INFO(LogCategory::DEFAULT) << "twice";
    EXPECT_EQ(extra, 1);
    EXPECT_EQ(Captured().size(), 1u);

    logger.RemoveSink(second);
    LOG_INFO(LogCategory::DEFAULT) << "once";
    EXPECT_EQ(extra, 1);
    EXPECT_EQ(logger.SinkCount(), 1u);

    logger.ClearSinks();
    logger.Initialize();
    EXPECT_EQ(logger.SinkCount(), 1u);
}

TEST_F(LoggingTest, SinkMayLogFromWrite) {
    auto& logger = Logger::Instance();
    int nested = 0;
    auto echo = std::make_shared<CallbackSink>([&](const LogEntry& entry) {
        if (entry.category == LogCategory::PROVER) {
            ++nested;
            LOG_INFO(LogCategory::CONFIG) << "echo " << entry.message;
        }
    });
    logger.AddSink(echo);

    LOG_INFO(LogCategory::PROVER) << "original";
    EXPECT_EQ(nested, 1);
    auto entries = Captured();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[1].message, "echo original");
    logger.RemoveSink(echo);
}

TEST_F(LoggingTest, PrintfVariant) {
    LogWarnF(LogCategory::CONFIG, "range %d outside [1, %d]", 30, 24);
    auto entries = Captured();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "range 30 outside [1, 24]");
    EXPECT_EQ(entries[0].level, LogLevel::Warn);
}

// ============================================================================
// Formatting
// ============================================================================

TEST_F(LoggingTest, ConsoleFormat) {
    ConsoleSink::Options options;
    options.colors = false;
    options.timestamps = false;
    ConsoleSink console(options);

    LogEntry entry;
    entry.level = LogLevel::Info;
    entry.category = LogCategory::SETUP;
    entry.message = "Generators ready";
    EXPECT_EQ(console.Format(entry), "[INFO ] [setup] Generators ready");

    entry.category = LogCategory::DEFAULT;
    EXPECT_EQ(console.Format(entry), "[INFO ] Generators ready");

    options.categories = false;
    ConsoleSink bare(options);
    entry.level = LogLevel::Error;
    entry.category = LogCategory::SETUP;
    EXPECT_EQ(bare.Format(entry), "[ERROR] Generators ready");
}

TEST_F(LoggingTest, TimestampFormat) {
    std::string ts = FormatLogTimestamp(std::chrono::system_clock::now());
    ASSERT_EQ(ts.size(), 23u);
    EXPECT_EQ(ts[4], '-');
    EXPECT_EQ(ts[10], ' ');
    EXPECT_EQ(ts[19], '.');
}

TEST_F(LoggingTest, ScopedTimerLogsStartAndEnd) {
    {
        ScopedLogTimer timer(LogCategory::TREE, "build");
        EXPECT_GE(timer.ElapsedMs(), 0);
    }
    auto entries = Captured();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].level, LogLevel::Debug);
    EXPECT_EQ(entries[0].message, "build started");
    EXPECT_EQ(entries[1].message.rfind("build finished in ", 0), 0u);
}

} // namespace test
} // namespace util
} // namespace anchorzk

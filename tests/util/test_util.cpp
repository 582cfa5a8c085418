// STRATA - Util Module Tests
// Copyright (c) 2024 STRATA Developers
// MIT License

#include <gtest/gtest.h>

#include <strata/util/logging.h>
#include <strata/util/threadpool.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace strata {
namespace util {
namespace {

// ============================================================================
// Logging Tests
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Trace);
        Logger::Instance().SetCategories({});
        sink_ = std::make_shared<CallbackSink>([this](const LogEntry& entry) {
            entries_.push_back(entry);
        });
        Logger::Instance().AddSink(sink_);
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Info);
        Logger::Instance().SetCategories({});
    }

    std::shared_ptr<CallbackSink> sink_;
    std::vector<LogEntry> entries_;
};

TEST_F(LoggingTest, LevelNames) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_EQ(LogLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("ERROR"), LogLevel::Error);
    EXPECT_EQ(LogLevelFromString("none"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("bogus"), LogLevel::Info);
}

TEST_F(LoggingTest, StreamMacroReachesSinks) {
    LOG_INFO(LogCategory::CHAIN) << "height " << 42;

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Info);
    EXPECT_EQ(entries_[0].category, LogCategory::CHAIN);
    EXPECT_EQ(entries_[0].message, "height 42");
    EXPECT_GT(entries_[0].line, 0);
}

TEST_F(LoggingTest, PrintfHelpers) {
    LogWarnF(LogCategory::MEMPOOL, "%d entries, %s", 3, "full");
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "3 entries, full");
}

TEST_F(LoggingTest, LevelFilters) {
    Logger::Instance().SetLevel(LogLevel::Warn);
    LOG_INFO(LogCategory::CHAIN) << "hidden";
    LOG_WARN(LogCategory::CHAIN) << "shown";
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "shown");
}

TEST_F(LoggingTest, SkippedMessagesAreNotFormatted) {
    Logger::Instance().SetLevel(LogLevel::Error);
    int evaluated = 0;
    auto touch = [&evaluated] { return ++evaluated; };
    LOG_DEBUG(LogCategory::DB) << touch();
    EXPECT_EQ(evaluated, 0);
}

TEST_F(LoggingTest, CategoryFilterSparesErrors) {
    Logger::Instance().SetCategories({LogCategory::UTXO});
    EXPECT_TRUE(Logger::Instance().IsCategoryEnabled(LogCategory::UTXO));
    EXPECT_FALSE(Logger::Instance().IsCategoryEnabled(LogCategory::CHAIN));

    LOG_INFO(LogCategory::CHAIN) << "filtered";
    LOG_INFO(LogCategory::UTXO) << "kept";
    LOG_ERROR(LogCategory::CHAIN) << "failure";

    ASSERT_EQ(entries_.size(), 2u);
    EXPECT_EQ(entries_[0].message, "kept");
    EXPECT_EQ(entries_[1].message, "failure");
}

TEST_F(LoggingTest, SinkLevelAppliesPerSink) {
    sink_->SetLevel(LogLevel::Error);
    LOG_WARN(LogCategory::DEFAULT) << "below sink level";
    EXPECT_TRUE(entries_.empty());
    LOG_ERROR(LogCategory::DEFAULT) << "at sink level";
    EXPECT_EQ(entries_.size(), 1u);
}

TEST_F(LoggingTest, AddRemoveSink) {
    EXPECT_EQ(Logger::Instance().SinkCount(), 1u);
    Logger::Instance().RemoveSink(sink_);
    EXPECT_EQ(Logger::Instance().SinkCount(), 0u);
    LOG_ERROR(LogCategory::DEFAULT) << "nobody listens";
    EXPECT_TRUE(entries_.empty());
}

TEST_F(LoggingTest, FileSinkWritesLines) {
    const std::string path = ::testing::TempDir() + "strata_log_test.txt";
    std::remove(path.c_str());
    {
        auto file = std::make_shared<FileSink>(path, LogLevel::Debug, true);
        ASSERT_TRUE(file->IsOpen());
        Logger::Instance().AddSink(file);
        LOG_INFO(LogCategory::VALIDATION) << "written to disk";
        Logger::Instance().RemoveSink(file);
    }

    std::ifstream in(path);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(contents.find("written to disk"), std::string::npos);
    std::remove(path.c_str());
}

TEST_F(LoggingTest, ScopedTimerReportsAtDebug) {
    {
        STRATA_LOG_TIMER(LogCategory::BENCH, "connect");
    }
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Debug);
    EXPECT_NE(entries_[0].message.find("connect"), std::string::npos);
}

// ============================================================================
// ThreadPool Tests
// ============================================================================

class ThreadPoolTest : public ::testing::Test {
protected:
    ThreadPool pool_{4};
};

TEST_F(ThreadPoolTest, Construction) {
    EXPECT_TRUE(pool_.IsRunning());
    EXPECT_EQ(pool_.ThreadCount(), 4u);
}

TEST_F(ThreadPoolTest, DefaultUsesHardwareThreads) {
    ThreadPool pool;
    EXPECT_GE(pool.ThreadCount(), 1u);
}

TEST_F(ThreadPoolTest, SubmitReturnsResult) {
    auto future = pool_.Submit([](int a, int b) { return a * b; }, 6, 7);
    EXPECT_EQ(future.get(), 42);
}

TEST_F(ThreadPoolTest, ManyTasksAllRun) {
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 200; ++i) {
        futures.push_back(pool_.Submit([&counter] { ++counter; }));
    }
    for (auto& f : futures) {
        f.get();
    }
    EXPECT_EQ(counter.load(), 200);
}

TEST_F(ThreadPoolTest, WaitAllDrainsQueue) {
    std::atomic<int> counter{0};
    for (int i = 0; i < 50; ++i) {
        pool_.Submit([&counter] {
            std::this_thread::sleep_for(std::chrono::microseconds(100));
            ++counter;
        });
    }
    pool_.WaitAll();
    EXPECT_EQ(counter.load(), 50);
    EXPECT_EQ(pool_.PendingTasks(), 0u);
    EXPECT_EQ(pool_.ActiveTasks(), 0u);
}

TEST_F(ThreadPoolTest, TaskExceptionReachesFuture) {
    auto future = pool_.Submit([]() -> int { throw std::runtime_error("task failed"); });
    EXPECT_THROW(future.get(), std::runtime_error);

    // The worker survives
    EXPECT_EQ(pool_.Submit([] { return 1; }).get(), 1);
}

TEST_F(ThreadPoolTest, SubmitAfterShutdownThrows) {
    pool_.Shutdown();
    EXPECT_FALSE(pool_.IsRunning());
    EXPECT_THROW(pool_.Submit([] {}), std::runtime_error);
    pool_.Shutdown();
}

TEST_F(ThreadPoolTest, BoundedQueueRejects) {
    ThreadPool::Config config;
    config.numThreads = 1;
    config.maxQueueSize = 1;
    config.name = "bounded";
    ThreadPool pool(config);
    EXPECT_EQ(pool.Name(), "bounded");

    std::promise<void> gate;
    std::shared_future<void> open = gate.get_future().share();
    std::atomic<bool> started{false};
    auto blocker = pool.Submit([open, &started] {
        started = true;
        open.wait();
    });
    while (!started.load()) {
        std::this_thread::yield();
    }

    auto queued = pool.Submit([] {});
    EXPECT_THROW(pool.Submit([] {}), std::runtime_error);

    gate.set_value();
    blocker.get();
    queued.get();
}

} // namespace
} // namespace util
} // namespace strata

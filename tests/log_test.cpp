// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#include "docpress/log.hpp"
#include "async_writer.hpp"
#include "utils.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace docpress {
namespace {

class LogTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    (std::string("docpress_test_log_") + info->name());
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        Log::shutdown();
    }

    void TearDown() override {
        Log::shutdown();
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    LogConfig make_config(WriteMode mode, LogLevel level = LogLevel::Verbose) {
        LogConfig cfg;
        cfg.log_dir = test_dir_;
        cfg.name = "unit";
        cfg.mode = mode;
        cfg.min_level = level;
        cfg.console_output = false;
        return cfg;
    }

    std::string read_log() {
        auto path = Log::current_path();
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(LogTest, DisabledUntilInitialized) {
    EXPECT_FALSE(Log::is_initialized());
    EXPECT_FALSE(Log::is_enabled(LogLevel::Error));
    EXPECT_TRUE(Log::current_path().empty());

    // No-op, must not crash
    DOCPRESS_LOG_E("Test", "dropped {}", 1);
    Log::flush();
}

TEST_F(LogTest, FileNameCarriesDate) {
    Log::init(make_config(WriteMode::Sync));
    ASSERT_TRUE(Log::is_initialized());

    auto expected = "unit_" + format_date_compact(Timestamp::now()) + ".log";
    EXPECT_EQ(Log::current_path().filename().string(), expected);
    EXPECT_EQ(Log::current_path().parent_path(), test_dir_);
}

// ============================================================================
// Output
// ============================================================================

TEST_F(LogTest, SyncWriteFormat) {
    Log::init(make_config(WriteMode::Sync));
    DOCPRESS_LOG_I("Queue", "enqueued job {} for {}", 7, "doc-a");
    Log::flush();

    auto content = read_log();
    std::regex line(R"(\[I\]\[\d{4}-\d{2}-\d{2} [+-]\d+(\.\d+)? \d{2}:\d{2}:\d{2}\.\d{3}\]\[\d+,\d+\]\[Queue\] enqueued job 7 for doc-a\n)");
    EXPECT_TRUE(std::regex_search(content, line)) << content;
}

TEST_F(LogTest, LevelFilter) {
    Log::init(make_config(WriteMode::Sync, LogLevel::Warn));
    DOCPRESS_LOG_D("T", "debug line");
    DOCPRESS_LOG_I("T", "info line");
    DOCPRESS_LOG_W("T", "warn line");
    DOCPRESS_LOG_E("T", "error line");
    Log::flush();

    auto content = read_log();
    EXPECT_EQ(content.find("debug line"), std::string::npos);
    EXPECT_EQ(content.find("info line"), std::string::npos);
    EXPECT_NE(content.find("[W]"), std::string::npos);
    EXPECT_NE(content.find("error line"), std::string::npos);

    Log::set_level(LogLevel::Debug);
    EXPECT_EQ(Log::level(), LogLevel::Debug);
    DOCPRESS_LOG_D("T", "debug now");
    Log::flush();
    EXPECT_NE(read_log().find("debug now"), std::string::npos);
}

TEST_F(LogTest, AsyncFlushDeliversEverything) {
    Log::init(make_config(WriteMode::Async));

    constexpr int kThreads = 4;
    constexpr int kPerThread = 250;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([t] {
            for (int i = 0; i < kPerThread; ++i) {
                DOCPRESS_LOG_I("Worker", "thread {} message {}", t, i);
            }
        });
    }
    for (auto& th : threads) th.join();
    Log::flush();

    auto content = read_log();
    std::size_t lines = 0;
    for (char c : content) {
        if (c == '\n') ++lines;
    }
    EXPECT_EQ(lines, static_cast<std::size_t>(kThreads * kPerThread));
    EXPECT_NE(content.find("thread 3 message 249"), std::string::npos);
}

TEST_F(LogTest, ShutdownFlushesPendingRecords) {
    Log::init(make_config(WriteMode::Async));
    auto path = Log::current_path();
    for (int i = 0; i < 100; ++i) {
        DOCPRESS_LOG_I("T", "line {}", i);
    }
    Log::shutdown();
    EXPECT_FALSE(Log::is_initialized());

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_NE(ss.str().find("line 99"), std::string::npos);
}

TEST_F(LogTest, ReinitReplacesSinks) {
    Log::init(make_config(WriteMode::Sync));
    DOCPRESS_LOG_I("T", "first");

    auto cfg = make_config(WriteMode::Sync);
    cfg.name = "second";
    Log::init(cfg);
    DOCPRESS_LOG_I("T", "second");
    Log::flush();

    EXPECT_NE(Log::current_path().filename().string().find("second_"), std::string::npos);
    EXPECT_NE(read_log().find("] second"), std::string::npos);
    EXPECT_EQ(read_log().find("] first"), std::string::npos);
}

// ============================================================================
// Async Writer
// ============================================================================

TEST(AsyncWriterTest, WaitFlushSeesAllEntries) {
    AsyncWriter writer;
    std::atomic<int> written{0};
    std::atomic<int> flushes{0};
    writer.start([&](const LogEntry&) { written.fetch_add(1); },
                 [&] { flushes.fetch_add(1); });

    for (int i = 0; i < 500; ++i) {
        ASSERT_TRUE(writer.enqueue(LogLevel::Info, "entry " + std::to_string(i)));
    }
    writer.wait_flush();
    EXPECT_EQ(written.load(), 500);
    EXPECT_GE(flushes.load(), 1);

    writer.stop();
    EXPECT_FALSE(writer.is_running());
    EXPECT_FALSE(writer.enqueue(LogLevel::Info, "after stop"));
}

// ============================================================================
// Formatting Utilities
// ============================================================================

TEST(UtilsTest, UuidShape) {
    auto id = make_uuid_v4();
    EXPECT_TRUE(is_uuid(id)) << id;
    EXPECT_EQ(id.size(), 36u);
    EXPECT_EQ(id[14], '4');
    EXPECT_NE(make_uuid_v4(), id);

    EXPECT_FALSE(is_uuid("not-a-uuid"));
    EXPECT_FALSE(is_uuid("zzzzzzzz-zzzz-4zzz-8zzz-zzzzzzzzzzzz"));
}

TEST(UtilsTest, FormatBytes) {
    EXPECT_EQ(format_bytes(512), "512 B");
    EXPECT_EQ(format_bytes(1536), "1.50 KB");
    EXPECT_EQ(format_bytes(3 * 1024 * 1024), "3.00 MB");
}

} // anonymous namespace
} // namespace docpress

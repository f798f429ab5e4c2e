// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#pragma once

#include "docpress/log.hpp"

#include <concurrentqueue.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <semaphore>
#include <string>
#include <thread>

namespace docpress {

struct LogEntry {
    LogLevel level = LogLevel::Info;
    std::string line;
};

// ============================================================================
// AsyncWriter - lock-free hand-off of formatted lines to one writer thread
//
//   Producers --[enqueue]--> ConcurrentQueue --> writer thread --> sinks
//
// The writer drains the queue on every wake-up and flushes the sinks at
// most every flush_interval, or when wait_flush() asks for it.
// ============================================================================

class AsyncWriter {
public:
    using WriteCallback = std::function<void(const LogEntry&)>;
    using FlushCallback = std::function<void()>;

    static constexpr std::size_t kDefaultCapacity = 256;

    explicit AsyncWriter(std::size_t initial_capacity = kDefaultCapacity);
    ~AsyncWriter();

    // Non-copyable, non-movable
    AsyncWriter(const AsyncWriter&) = delete;
    AsyncWriter& operator=(const AsyncWriter&) = delete;
    AsyncWriter(AsyncWriter&&) = delete;
    AsyncWriter& operator=(AsyncWriter&&) = delete;

    void start(WriteCallback write_cb, FlushCallback flush_cb,
               std::chrono::milliseconds flush_interval = std::chrono::seconds{1});

    // Drains remaining entries, flushes, joins
    void stop();

    [[nodiscard]] bool is_running() const noexcept;

    /// Non-blocking; false once stopped
    [[nodiscard]] bool enqueue(LogLevel level, std::string&& line);

    /// Block until everything enqueued so far has been written and flushed
    void wait_flush();

    [[nodiscard]] std::size_t size_approx() const noexcept;

private:
    void thread_loop();
    void drain_and_flush();

    moodycamel::ConcurrentQueue<LogEntry> queue_;

    WriteCallback write_callback_;
    FlushCallback flush_callback_;
    std::chrono::milliseconds flush_interval_{1000};

    std::optional<std::thread> thread_;
    std::binary_semaphore wake_sem_{0};

    std::mutex flush_mutex_;
    std::condition_variable flush_cv_;
    std::uint64_t flush_completed_ = 0;            // Highest flush ticket served
    std::atomic<std::uint64_t> flush_requested_{0};

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
};

} // namespace docpress

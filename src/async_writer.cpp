// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#include "async_writer.hpp"

#include <algorithm>

namespace docpress {

AsyncWriter::AsyncWriter(std::size_t initial_capacity)
    : queue_(initial_capacity) {}

AsyncWriter::~AsyncWriter() {
    stop();
}

void AsyncWriter::start(WriteCallback write_cb, FlushCallback flush_cb,
                        std::chrono::milliseconds flush_interval) {
    if (running_.load(std::memory_order_acquire)) return;

    write_callback_ = std::move(write_cb);
    flush_callback_ = std::move(flush_cb);
    flush_interval_ = flush_interval;
    stop_requested_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    thread_.emplace([this]() {
        thread_loop();
    });
}

void AsyncWriter::stop() {
    if (!running_.load(std::memory_order_acquire)) return;

    stop_requested_.store(true, std::memory_order_release);
    wake_sem_.release();

    if (thread_ && thread_->joinable()) {
        thread_->join();
    }
    thread_.reset();
    running_.store(false, std::memory_order_release);

    // Release anyone still inside wait_flush()
    {
        std::lock_guard lock(flush_mutex_);
    }
    flush_cv_.notify_all();
}

bool AsyncWriter::is_running() const noexcept {
    return running_.load(std::memory_order_acquire);
}

bool AsyncWriter::enqueue(LogLevel level, std::string&& line) {
    if (!running_.load(std::memory_order_acquire) ||
        stop_requested_.load(std::memory_order_acquire)) {
        return false;
    }

    // Unbounded queue: enqueue always succeeds (unless out of memory)
    queue_.enqueue(LogEntry{level, std::move(line)});
    wake_sem_.release();
    return true;
}

void AsyncWriter::wait_flush() {
    if (!running_.load(std::memory_order_acquire)) return;

    auto ticket = flush_requested_.fetch_add(1, std::memory_order_acq_rel) + 1;
    wake_sem_.release();

    std::unique_lock lock(flush_mutex_);
    flush_cv_.wait(lock, [&] {
        return flush_completed_ >= ticket || !running_.load(std::memory_order_acquire);
    });
}

std::size_t AsyncWriter::size_approx() const noexcept {
    return queue_.size_approx();
}

void AsyncWriter::drain_and_flush() {
    // Taken before draining so every line enqueued ahead of the ticket is written
    auto ticket = flush_requested_.load(std::memory_order_acquire);

    LogEntry entry;
    while (queue_.try_dequeue(entry)) {
        if (write_callback_) {
            write_callback_(entry);
        }
    }
    if (flush_callback_) {
        flush_callback_();
    }
    {
        std::lock_guard lock(flush_mutex_);
        flush_completed_ = std::max(flush_completed_, ticket);
    }
    flush_cv_.notify_all();
}

void AsyncWriter::thread_loop() {
    auto last_flush = std::chrono::steady_clock::now();
    std::uint64_t served = 0;
    bool dirty = false;
    LogEntry entry;

    while (!stop_requested_.load(std::memory_order_acquire)) {
        (void)wake_sem_.try_acquire_for(flush_interval_);

        while (queue_.try_dequeue(entry)) {
            if (write_callback_) {
                write_callback_(entry);
            }
            dirty = true;
        }

        auto now = std::chrono::steady_clock::now();
        auto requested = flush_requested_.load(std::memory_order_acquire);
        if (requested != served || (dirty && now - last_flush >= flush_interval_)) {
            drain_and_flush();
            served = requested;
            dirty = false;
            last_flush = now;
        }
    }

    // Final drain
    drain_and_flush();
}

} // namespace docpress

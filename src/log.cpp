// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#include "docpress/log.hpp"
#include "async_writer.hpp"
#include "platform.hpp"
#include "sink.hpp"
#include "utils.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <shared_mutex>

namespace docpress {

namespace {

// ============================================================================
// Process logger state
// ============================================================================

struct LogState {
    LogConfig config;
    std::unique_ptr<ConsoleSink> console;
    std::unique_ptr<FileSink> file;
    std::unique_ptr<AsyncWriter> writer;

    void write_sinks(LogLevel level, std::string_view line) {
        if (file) file->write(level, line);
        if (console) console->write(level, line);
    }

    void flush_sinks() {
        if (file) file->flush();
        if (console) console->flush();
    }

    void stop() {
        if (writer) {
            writer->stop();
            writer.reset();
        }
        flush_sinks();
    }
};

std::shared_mutex g_mutex;
std::unique_ptr<LogState> g_state;
std::atomic<LogLevel> g_level{LogLevel::Off};

// [L][YYYY-MM-DD +TZ HH:MM:SS.mmm][pid,tid][tag] message
std::string format_line(LogLevel level, std::string_view tag, std::string_view message) {
    return std::format("[{}][{}][{},{}][{}] {}\n",
                       level_char(level), format_timestamp(Timestamp::now()),
                       get_pid(), get_tid(), tag, message);
}

std::unique_ptr<LogState> take_state() {
    std::unique_lock lock(g_mutex);
    g_level.store(LogLevel::Off, std::memory_order_release);
    return std::move(g_state);
}

} // anonymous namespace

// ============================================================================
// Log
// ============================================================================

void Log::init(const LogConfig& config) {
    auto state = std::make_unique<LogState>();
    state->config = config;

    if (config.console_output) {
        state->console = std::make_unique<ConsoleSink>();
    }
    if (!config.log_dir.empty()) {
        state->file = std::make_unique<FileSink>(config.log_dir, config.name);
    }
    if (config.mode == WriteMode::Async) {
        state->writer = std::make_unique<AsyncWriter>();
        auto* raw = state.get();
        state->writer->start(
            [raw](const LogEntry& entry) { raw->write_sinks(entry.level, entry.line); },
            [raw] { raw->flush_sinks(); });
    }

    std::unique_ptr<LogState> previous;
    {
        std::unique_lock lock(g_mutex);
        previous = std::move(g_state);
        g_state = std::move(state);
        g_level.store(config.min_level, std::memory_order_release);
    }
    if (previous) {
        previous->stop();
    }
}

void Log::shutdown() {
    if (auto previous = take_state()) {
        previous->stop();
    }
}

bool Log::is_initialized() noexcept {
    std::shared_lock lock(g_mutex);
    return g_state != nullptr;
}

bool Log::is_enabled(LogLevel level) noexcept {
    auto min = g_level.load(std::memory_order_acquire);
    return level != LogLevel::Off && min != LogLevel::Off && level >= min;
}

void Log::set_level(LogLevel level) noexcept {
    std::shared_lock lock(g_mutex);
    if (g_state) {
        g_level.store(level, std::memory_order_release);
    }
}

LogLevel Log::level() noexcept {
    return g_level.load(std::memory_order_acquire);
}

void Log::flush() {
    std::shared_lock lock(g_mutex);
    if (!g_state) return;
    if (g_state->writer) {
        g_state->writer->wait_flush();
    } else {
        g_state->flush_sinks();
    }
}

std::filesystem::path Log::current_path() {
    std::shared_lock lock(g_mutex);
    if (!g_state || !g_state->file) return {};
    return g_state->file->current_path();
}

void Log::write(LogLevel level, std::string_view tag, std::string_view message) {
    if (!is_enabled(level)) return;

    auto line = format_line(level, tag, message);

    std::shared_lock lock(g_mutex);
    if (!g_state) return;

    if (g_state->writer) {
        if (g_state->writer->enqueue(level, std::move(line))) return;
        // Writer already stopping: fall through to a direct write
    }
    g_state->write_sinks(level, line);
    if (level >= LogLevel::Error) {
        g_state->flush_sinks();
    }
}

} // namespace docpress

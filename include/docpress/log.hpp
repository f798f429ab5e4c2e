// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#pragma once

#include <cstdint>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace docpress {

// ============================================================================
// Log Level / Write Mode
// ============================================================================

enum class LogLevel : std::uint8_t {
    Verbose = 0,
    Debug,
    Info,
    Warn,
    Error,
    Fatal,
    Off
};

[[nodiscard]] constexpr char level_char(LogLevel level) noexcept {
    constexpr char chars[] = {'V', 'D', 'I', 'W', 'E', 'F', '-'};
    return chars[static_cast<std::uint8_t>(level)];
}

enum class WriteMode : std::uint8_t {
    Async,  // Lock-free queue drained by a background thread
    Sync
};

// ============================================================================
// Log Configuration
// ============================================================================

struct LogConfig {
    // Empty = no file output
    std::filesystem::path log_dir;

    // File prefix, e.g. "docpress" -> "docpress_20241127.log"
    std::string name = "docpress";

    WriteMode mode = WriteMode::Async;

    LogLevel min_level = LogLevel::Info;

    bool console_output =
#ifdef NDEBUG
        false;
#else
        true;
#endif
};

// ============================================================================
// Log - process-wide logger
// ============================================================================

class Log {
public:
    /// Install the process logger, replacing any previous one
    static void init(const LogConfig& config);

    /// Flush and tear down. Later log calls become no-ops.
    static void shutdown();

    [[nodiscard]] static bool is_initialized() noexcept;
    [[nodiscard]] static bool is_enabled(LogLevel level) noexcept;

    static void set_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;

    /// Block until queued records reach the sinks
    static void flush();

    /// Path of the file currently written, empty without file output
    [[nodiscard]] static std::filesystem::path current_path();

    static void write(LogLevel level, std::string_view tag, std::string_view message);

    template<typename... Args>
    static void log(LogLevel level, std::string_view tag,
                    std::format_string<Args...> fmt, Args&&... args) {
        if (!is_enabled(level)) return;
        write(level, tag, std::format(fmt, std::forward<Args>(args)...));
    }
};

// ============================================================================
// Convenience Macros
// ============================================================================

#define DOCPRESS_LOG_V(tag, ...) ::docpress::Log::log(::docpress::LogLevel::Verbose, tag, __VA_ARGS__)
#define DOCPRESS_LOG_D(tag, ...) ::docpress::Log::log(::docpress::LogLevel::Debug, tag, __VA_ARGS__)
#define DOCPRESS_LOG_I(tag, ...) ::docpress::Log::log(::docpress::LogLevel::Info, tag, __VA_ARGS__)
#define DOCPRESS_LOG_W(tag, ...) ::docpress::Log::log(::docpress::LogLevel::Warn, tag, __VA_ARGS__)
#define DOCPRESS_LOG_E(tag, ...) ::docpress::Log::log(::docpress::LogLevel::Error, tag, __VA_ARGS__)

} // namespace docpress

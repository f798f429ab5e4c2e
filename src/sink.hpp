// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#pragma once

#include "docpress/log.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace docpress {

// ============================================================================
// Sink Interface - Abstract output destination
// ============================================================================

class ISink {
public:
    virtual ~ISink() = default;

    // Write one formatted line (newline included)
    virtual void write(LogLevel level, std::string_view line) = 0;

    virtual void flush() = 0;
};

// ============================================================================
// File Sink - <log_dir>/<name>_YYYYMMDD.log, reopened when the date changes
// ============================================================================

class FileSink : public ISink {
public:
    FileSink(const std::filesystem::path& log_dir, const std::string& name);
    ~FileSink() override;

    // Non-copyable
    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    void write(LogLevel level, std::string_view line) override;
    void flush() override;

    [[nodiscard]] std::filesystem::path current_path() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Console Sink - Info and below to stdout, Warn and above to stderr
// ============================================================================

class ConsoleSink : public ISink {
public:
    explicit ConsoleSink(bool use_colors = true) noexcept : use_colors_(use_colors) {}

    void write(LogLevel level, std::string_view line) override;
    void flush() override;

private:
    bool use_colors_;
};

} // namespace docpress

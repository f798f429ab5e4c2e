// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#include "sink.hpp"

#include <cstdio>

namespace docpress {

namespace {

constexpr const char* color_for(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Verbose: return "\033[90m";
        case LogLevel::Debug:   return "\033[36m";
        case LogLevel::Info:    return "\033[32m";
        case LogLevel::Warn:    return "\033[33m";
        case LogLevel::Error:   return "\033[31m";
        case LogLevel::Fatal:   return "\033[35m";
        case LogLevel::Off:     break;
    }
    return "";
}

constexpr const char* kReset = "\033[0m";

} // anonymous namespace

void ConsoleSink::write(LogLevel level, std::string_view line) {
    if (!line.empty() && line.back() == '\n') {
        line.remove_suffix(1);
    }

    // printf/fflush are POSIX thread-safe
    std::FILE* out = level >= LogLevel::Warn ? stderr : stdout;
    if (use_colors_) {
        std::fprintf(out, "%s%.*s%s\n", color_for(level),
                     static_cast<int>(line.size()), line.data(), kReset);
    } else {
        std::fprintf(out, "%.*s\n", static_cast<int>(line.size()), line.data());
    }
}

void ConsoleSink::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
}

} // namespace docpress

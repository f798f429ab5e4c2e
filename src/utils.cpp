// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#include "utils.hpp"

#include <array>
#include <ctime>
#include <format>
#include <mutex>
#include <random>

namespace docpress {

// ============================================================================
// Internal: Platform-specific localtime wrapper
// ============================================================================

namespace {

inline std::tm localtime_safe(std::time_t time) {
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif
    return tm_buf;
}

inline double get_tz_offset(const std::tm& tm_buf) {
#ifdef _WIN32
    return static_cast<double>(-_timezone) / 3600.0;
#else
    return tm_buf.tm_gmtoff / 3600.0;
#endif
}

std::uint64_t random_u64() {
    static std::mutex mutex;
    static std::mt19937_64 engine{[] {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
        return std::mt19937_64(seq);
    }()};
    std::lock_guard lock(mutex);
    return engine();
}

} // anonymous namespace

// ============================================================================
// Identifiers
// ============================================================================

std::string make_uuid_v4() {
    std::array<std::uint8_t, 16> bytes{};
    for (std::size_t i = 0; i < bytes.size(); i += 8) {
        auto word = random_u64();
        for (std::size_t j = 0; j < 8; ++j) {
            bytes[i + j] = static_cast<std::uint8_t>(word >> (8 * j));
        }
    }
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC-4122 variant

    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out += '-';
        out += std::format("{:02x}", bytes[i]);
    }
    return out;
}

bool is_uuid(std::string_view text) noexcept {
    if (text.size() != 36) return false;
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') return false;
        } else if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F'))) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Formatting Functions
// ============================================================================

std::string format_date_compact(const Timestamp& tv) {
    auto tm_buf = localtime_safe(static_cast<std::time_t>(tv.tv_sec));

    return std::format("{:04d}{:02d}{:02d}",
        1900 + tm_buf.tm_year, 1 + tm_buf.tm_mon, tm_buf.tm_mday);
}

std::string format_timestamp(const Timestamp& tv) {
    auto tm_buf = localtime_safe(static_cast<std::time_t>(tv.tv_sec));
    double tz_offset = get_tz_offset(tm_buf);

    return std::format("{:04d}-{:02d}-{:02d} {:+.1f} {:02d}:{:02d}:{:02d}.{:03d}",
        1900 + tm_buf.tm_year, 1 + tm_buf.tm_mon, tm_buf.tm_mday,
        tz_offset, tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
        static_cast<int>(tv.tv_usec / 1000));
}

std::string format_bytes(std::int64_t bytes) {
    constexpr double kKB = 1024.0;
    constexpr double kMB = kKB * 1024.0;
    constexpr double kGB = kMB * 1024.0;

    auto value = static_cast<double>(bytes);
    if (value >= kGB) return std::format("{:.2f} GB", value / kGB);
    if (value >= kMB) return std::format("{:.2f} MB", value / kMB);
    if (value >= kKB) return std::format("{:.2f} KB", value / kKB);
    return std::format("{} B", bytes);
}

} // namespace docpress

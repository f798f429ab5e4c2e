// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#ifndef DOCPRESS_UTILS_HPP
#define DOCPRESS_UTILS_HPP

#include "docpress/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace docpress {

// ============================================================================
// Identifiers
// ============================================================================

// Random RFC-4122 version 4 UUID: "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx"
[[nodiscard]] std::string make_uuid_v4();

[[nodiscard]] bool is_uuid(std::string_view text) noexcept;

// ============================================================================
// Formatting Utilities
// ============================================================================

// Compact date: "YYYYMMDD"
[[nodiscard]] std::string format_date_compact(const Timestamp& tv);

// With timezone and millis: "YYYY-MM-DD +TZ HH:MM:SS.mmm"
[[nodiscard]] std::string format_timestamp(const Timestamp& tv);

// Human byte count: "512 B", "1.50 KB", "3.20 MB", "1.00 GB"
[[nodiscard]] std::string format_bytes(std::int64_t bytes);

} // namespace docpress

#endif // DOCPRESS_UTILS_HPP

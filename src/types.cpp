// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#include "docpress/types.hpp"

namespace docpress {

std::optional<CompressionMethod> parse_method(std::string_view text) noexcept {
    for (auto method : {CompressionMethod::None, CompressionMethod::Gzip, CompressionMethod::Zstd,
                        CompressionMethod::Lossy, CompressionMethod::PdfOptimize,
                        CompressionMethod::OfficeOptimize}) {
        if (method_name(method) == text) return method;
    }
    return std::nullopt;
}

std::optional<JobPriority> parse_priority(std::string_view text) noexcept {
    for (auto priority : {JobPriority::Low, JobPriority::Normal, JobPriority::High}) {
        if (priority_name(priority) == text) return priority;
    }
    return std::nullopt;
}

} // namespace docpress

// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#pragma once

#include "record_header.hpp"
#include "docpress/error.hpp"

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <memory>
#include <span>

namespace docpress {

// ============================================================================
// Journal - append-only file of framed records
//
// Replay maps the file read-only and walks records until the first one that
// fails validation. In read-write mode that torn tail is truncated before the
// file is reopened for appending.
// ============================================================================

class Journal {
public:
    /// Return false to abort replay (payload could not be applied)
    using RecordCallback = std::function<bool(RecordKind, std::span<const std::byte>)>;

    struct ReplayStats {
        std::uint64_t records = 0;
        std::uint64_t valid_bytes = 0;
        std::uint64_t dropped_bytes = 0;
    };

    [[nodiscard]] static Result<std::unique_ptr<Journal>>
    open(const std::filesystem::path& path, bool read_only,
         const RecordCallback& on_record, ReplayStats& stats);

    ~Journal();

    Journal(const Journal&) = delete;
    Journal& operator=(const Journal&) = delete;

    /// Append one record and fsync it
    [[nodiscard]] Result<void> append(RecordKind kind, std::span<const std::byte> payload);

    /// Atomically replace the whole journal with one snapshot record
    [[nodiscard]] Result<void> rewrite(std::span<const std::byte> snapshot);

    [[nodiscard]] std::uint64_t size() const noexcept { return size_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    Journal(std::filesystem::path path, bool read_only) noexcept
        : path_(std::move(path)), read_only_(read_only) {}

    [[nodiscard]] Result<void> replay(const RecordCallback& on_record, ReplayStats& stats);
    [[nodiscard]] Result<void> open_for_append();

    std::filesystem::path path_;
    bool read_only_;
    std::FILE* file_ = nullptr;
    std::uint64_t size_ = 0;
    bool broken_ = false;   // A failed write could not be rolled back
};

} // namespace docpress

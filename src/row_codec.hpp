// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors
//
// Row image encoding used inside journal records.
//
// Payload = sequence of | tag (1) | row fields ... |
// Strings are | length (4) | bytes |, optionals are | present (1) | value |.

#pragma once

#include "docpress/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace docpress {

enum class RowTag : std::uint8_t {
    Type = 1,
    Document = 2,
    Job = 3
};

// ============================================================================
// ByteWriter - growable little-endian output buffer
// ============================================================================

class ByteWriter {
public:
    ByteWriter() = default;

    void put_u8(std::uint8_t value) { buf_.push_back(static_cast<std::byte>(value)); }
    void put_u32(std::uint32_t value);
    void put_u64(std::uint64_t value);
    void put_i64(std::int64_t value) { put_u64(static_cast<std::uint64_t>(value)); }
    void put_bool(bool value) { put_u8(value ? 1 : 0); }
    void put_string(std::string_view value);
    void put_timestamp(const Timestamp& ts) { put_i64(ts.micros()); }

    template<typename T, typename PutFn>
    void put_optional(const std::optional<T>& value, PutFn put) {
        put_bool(value.has_value());
        if (value) put(*value);
    }

    [[nodiscard]] std::span<const std::byte> data() const noexcept { return buf_; }
    [[nodiscard]] std::size_t size() const noexcept { return buf_.size(); }
    [[nodiscard]] std::vector<std::byte> take() noexcept { return std::move(buf_); }

private:
    std::vector<std::byte> buf_;
};

// ============================================================================
// ByteReader - bounds-checked cursor; any overrun latches the failed state
// ============================================================================

class ByteReader {
public:
    explicit ByteReader(std::span<const std::byte> data) noexcept : data_(data) {}

    [[nodiscard]] std::uint8_t get_u8() noexcept;
    [[nodiscard]] std::uint32_t get_u32() noexcept;
    [[nodiscard]] std::uint64_t get_u64() noexcept;
    [[nodiscard]] std::int64_t get_i64() noexcept { return static_cast<std::int64_t>(get_u64()); }
    [[nodiscard]] bool get_bool() noexcept { return get_u8() != 0; }
    [[nodiscard]] std::string get_string();
    [[nodiscard]] Timestamp get_timestamp() noexcept { return Timestamp::from_micros(get_i64()); }

    [[nodiscard]] bool ok() const noexcept { return ok_; }
    [[nodiscard]] bool at_end() const noexcept { return pos_ >= data_.size(); }
    void fail() noexcept { ok_ = false; }

private:
    [[nodiscard]] bool ensure(std::size_t n) noexcept;

    std::span<const std::byte> data_;
    std::size_t pos_ = 0;
    bool ok_ = true;
};

// ============================================================================
// Row encoding
// ============================================================================

void encode_row(ByteWriter& out, const DocumentType& type);
void encode_row(ByteWriter& out, const Document& document);
void encode_row(ByteWriter& out, const Job& job);

struct ChangeSet {
    std::vector<DocumentType> types;
    std::vector<Document> documents;
    std::vector<Job> jobs;

    [[nodiscard]] bool empty() const noexcept {
        return types.empty() && documents.empty() && jobs.empty();
    }
};

[[nodiscard]] std::vector<std::byte> encode_change_set(const ChangeSet& changes);

/// Returns nullopt if the payload is malformed
[[nodiscard]] std::optional<ChangeSet> decode_change_set(std::span<const std::byte> payload);

} // namespace docpress

// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#pragma once

#include "docpress/codec.hpp"

#include <cstddef>
#include <memory>
#include <span>
#include <vector>

namespace docpress {

// ============================================================================
// Zstd Compressor
// ============================================================================

class ZstdCompressor {
public:
    static constexpr int kMinLevel = 1;
    static constexpr int kMaxLevel = 22;

    explicit ZstdCompressor(int level);
    ~ZstdCompressor();

    // Non-copyable
    ZstdCompressor(const ZstdCompressor&) = delete;
    ZstdCompressor& operator=(const ZstdCompressor&) = delete;

    // Movable
    ZstdCompressor(ZstdCompressor&&) noexcept;
    ZstdCompressor& operator=(ZstdCompressor&&) noexcept;

    /// Compress input into one complete zstd frame
    [[nodiscard]] CodecResult compress(std::span<const std::byte> input);

    [[nodiscard]] CodecResult decompress(std::span<const std::byte> input);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Gzip Compressor (zlib deflate with gzip wrapper)
// ============================================================================

class GzipCompressor {
public:
    static constexpr int kMinLevel = 1;
    static constexpr int kMaxLevel = 9;

    explicit GzipCompressor(int level) noexcept : level_(level) {}

    /// Compress input into one gzip member (RFC 1952)
    [[nodiscard]] CodecResult compress(std::span<const std::byte> input) const;

    [[nodiscard]] CodecResult decompress(std::span<const std::byte> input) const;

private:
    int level_;
};

} // namespace docpress

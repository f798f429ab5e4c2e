// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors
//
// Journal record format:
// | magic (1) | kind (1) | length (4) | crc32 (4) | payload (length) | end (1) |
//
// Integers are little-endian. The CRC covers the payload only. A record whose
// magic, end marker or CRC does not check out marks the end of the valid
// journal; everything from there on is a torn tail.

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace docpress {

enum class RecordKind : std::uint8_t {
    ChangeSet = 0x01,   // Rows written by one committed transaction
    Snapshot  = 0x02    // Full table image written by compaction
};

struct RecordMagic {
    static constexpr std::byte kMagicStart{0x44};  // 'D'
    static constexpr std::byte kMagicEnd{0x00};

    [[nodiscard]] static constexpr bool is_valid_kind(std::byte kind) noexcept {
        return kind == std::byte{0x01} || kind == std::byte{0x02};
    }
};

class RecordHeader {
public:
    static constexpr std::size_t kHeaderSize = 10;
    static constexpr std::size_t kTailerSize = 1;
    static constexpr std::size_t kLengthOffset = 2;
    static constexpr std::size_t kCrcOffset = 6;

    static void write(std::byte* header, RecordKind kind,
                      std::uint32_t length, std::uint32_t crc) noexcept {
        header[0] = RecordMagic::kMagicStart;
        header[1] = static_cast<std::byte>(kind);
        store_u32(header + kLengthOffset, length);
        store_u32(header + kCrcOffset, crc);
    }

    static void write_tailer(std::byte* tailer) noexcept {
        tailer[0] = RecordMagic::kMagicEnd;
    }

    /**
     * @brief Validate one record starting at data
     * @param available Bytes readable from data
     * @param out_kind Record kind on success
     * @param out_payload Payload view on success
     * @return true if the record is complete and its CRC matches
     */
    [[nodiscard]] static bool parse(const std::byte* data, std::size_t available,
                                    RecordKind& out_kind,
                                    std::span<const std::byte>& out_payload) noexcept;

    [[nodiscard]] static constexpr std::size_t framed_size(std::size_t payload) noexcept {
        return kHeaderSize + payload + kTailerSize;
    }

    static constexpr void store_u32(std::byte* dst, std::uint32_t value) noexcept {
        for (int i = 0; i < 4; ++i) {
            dst[i] = static_cast<std::byte>((value >> (8 * i)) & 0xFF);
        }
    }

    [[nodiscard]] static constexpr std::uint32_t load_u32(const std::byte* src) noexcept {
        std::uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            value |= static_cast<std::uint32_t>(src[i]) << (8 * i);
        }
        return value;
    }
};

/// CRC-32 (zlib polynomial) of a payload
[[nodiscard]] std::uint32_t record_checksum(std::span<const std::byte> payload) noexcept;

} // namespace docpress

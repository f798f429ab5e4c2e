// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#include "compressor.hpp"

#include <zlib.h>

#include <algorithm>
#include <limits>
#include <memory>
#include <string>

namespace docpress {

namespace {

// 15 window bits + 16 selects the gzip wrapper instead of zlib
constexpr int kGzipWindowBits = 15 + 16;
constexpr std::size_t kChunkSize = 64 * 1024;
constexpr std::size_t kMaxFeed = std::numeric_limits<uInt>::max();

CodecError zlib_error(int code, const z_stream& zs) {
    std::string message = "zlib: ";
    message += zs.msg ? zs.msg : zError(code);
    auto kind = (code == Z_DATA_ERROR || code == Z_BUF_ERROR)
        ? CodecErrorKind::CorruptInput
        : CodecErrorKind::IOError;
    return CodecError{kind, std::move(message)};
}

} // anonymous namespace

CodecResult GzipCompressor::compress(std::span<const std::byte> input) const {
    z_stream zs{};
    int ret = deflateInit2(&zs, std::clamp(level_, kMinLevel, kMaxLevel), Z_DEFLATED,
                           kGzipWindowBits, 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        return std::unexpected(zlib_error(ret, zs));
    }
    std::unique_ptr<z_stream, decltype(&deflateEnd)> guard(&zs, deflateEnd);

    std::vector<std::byte> output;
    output.reserve(std::min<std::size_t>(input.size() / 2 + 64, 16 * 1024 * 1024));

    std::size_t consumed = 0;
    std::byte chunk[kChunkSize];

    do {
        std::size_t feed = std::min(input.size() - consumed, kMaxFeed);
        zs.next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(input.data() + consumed));
        zs.avail_in = static_cast<uInt>(feed);
        consumed += feed;
        int flush = consumed == input.size() ? Z_FINISH : Z_NO_FLUSH;

        do {
            zs.next_out = reinterpret_cast<Bytef*>(chunk);
            zs.avail_out = static_cast<uInt>(kChunkSize);
            ret = deflate(&zs, flush);
            if (ret == Z_STREAM_ERROR) {
                return std::unexpected(zlib_error(ret, zs));
            }
            output.insert(output.end(), chunk, chunk + (kChunkSize - zs.avail_out));
        } while (zs.avail_out == 0);

        if (flush == Z_FINISH) break;
    } while (true);

    if (ret != Z_STREAM_END) {
        return std::unexpected(zlib_error(ret, zs));
    }
    return output;
}

CodecResult GzipCompressor::decompress(std::span<const std::byte> input) const {
    z_stream zs{};
    int ret = inflateInit2(&zs, kGzipWindowBits);
    if (ret != Z_OK) {
        return std::unexpected(zlib_error(ret, zs));
    }
    std::unique_ptr<z_stream, decltype(&inflateEnd)> guard(&zs, inflateEnd);

    std::vector<std::byte> output;
    std::byte chunk[kChunkSize];
    std::size_t consumed = 0;

    do {
        std::size_t feed = std::min(input.size() - consumed, kMaxFeed);
        zs.next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(input.data() + consumed));
        zs.avail_in = static_cast<uInt>(feed);
        consumed += feed;

        do {
            zs.next_out = reinterpret_cast<Bytef*>(chunk);
            zs.avail_out = static_cast<uInt>(kChunkSize);
            ret = inflate(&zs, Z_NO_FLUSH);
            if (ret == Z_STREAM_ERROR || ret == Z_NEED_DICT ||
                ret == Z_DATA_ERROR || ret == Z_MEM_ERROR) {
                return std::unexpected(zlib_error(ret == Z_NEED_DICT ? Z_DATA_ERROR : ret, zs));
            }
            output.insert(output.end(), chunk, chunk + (kChunkSize - zs.avail_out));
        } while (zs.avail_out == 0 && ret != Z_STREAM_END);
    } while (ret != Z_STREAM_END && consumed < input.size());

    if (ret != Z_STREAM_END) {
        return std::unexpected(CodecError{CodecErrorKind::CorruptInput, "zlib: truncated gzip stream"});
    }
    return output;
}

} // namespace docpress

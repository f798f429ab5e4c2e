// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#include "compressor.hpp"

#include <zstd.h>

#include <algorithm>
#include <string>

namespace docpress {

struct ZstdCompressor::Impl {
    ZSTD_CCtx* cctx = nullptr;
    ZSTD_DCtx* dctx = nullptr;

    explicit Impl(int level) {
        cctx = ZSTD_createCCtx();
        if (cctx) {
            ZSTD_CCtx_setParameter(cctx, ZSTD_c_compressionLevel,
                                   std::clamp(level, kMinLevel, kMaxLevel));
            ZSTD_CCtx_setParameter(cctx, ZSTD_c_checksumFlag, 1);
        }
        dctx = ZSTD_createDCtx();
    }

    ~Impl() {
        if (cctx) ZSTD_freeCCtx(cctx);
        if (dctx) ZSTD_freeDCtx(dctx);
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
};

ZstdCompressor::ZstdCompressor(int level)
    : impl_(std::make_unique<Impl>(level)) {
}

ZstdCompressor::~ZstdCompressor() = default;

ZstdCompressor::ZstdCompressor(ZstdCompressor&&) noexcept = default;
ZstdCompressor& ZstdCompressor::operator=(ZstdCompressor&&) noexcept = default;

CodecResult ZstdCompressor::compress(std::span<const std::byte> input) {
    if (!impl_->cctx) {
        return std::unexpected(CodecError{CodecErrorKind::IOError, "zstd context allocation failed"});
    }

    std::vector<std::byte> output(ZSTD_compressBound(input.size()));

    ZSTD_inBuffer in_buf = {input.data(), input.size(), 0};
    ZSTD_outBuffer out_buf = {output.data(), output.size(), 0};

    // Output is sized by compressBound, so one ZSTD_e_end call finishes the frame
    std::size_t remaining = ZSTD_compressStream2(impl_->cctx, &out_buf, &in_buf, ZSTD_e_end);
    ZSTD_CCtx_reset(impl_->cctx, ZSTD_reset_session_only);

    if (ZSTD_isError(remaining)) {
        return std::unexpected(CodecError{CodecErrorKind::CorruptInput,
                                          std::string("zstd: ") + ZSTD_getErrorName(remaining)});
    }
    if (remaining != 0) {
        return std::unexpected(CodecError{CodecErrorKind::IOError, "zstd: frame not flushed"});
    }

    output.resize(out_buf.pos);
    return output;
}

CodecResult ZstdCompressor::decompress(std::span<const std::byte> input) {
    if (!impl_->dctx) {
        return std::unexpected(CodecError{CodecErrorKind::IOError, "zstd context allocation failed"});
    }

    std::vector<std::byte> output;
    std::vector<std::byte> chunk(ZSTD_DStreamOutSize());

    ZSTD_inBuffer in_buf = {input.data(), input.size(), 0};
    std::size_t last = 0;

    while (in_buf.pos < in_buf.size) {
        ZSTD_outBuffer out_buf = {chunk.data(), chunk.size(), 0};
        last = ZSTD_decompressStream(impl_->dctx, &out_buf, &in_buf);
        if (ZSTD_isError(last)) {
            ZSTD_DCtx_reset(impl_->dctx, ZSTD_reset_session_only);
            return std::unexpected(CodecError{CodecErrorKind::CorruptInput,
                                              std::string("zstd: ") + ZSTD_getErrorName(last)});
        }
        output.insert(output.end(), chunk.begin(), chunk.begin() + out_buf.pos);
    }
    ZSTD_DCtx_reset(impl_->dctx, ZSTD_reset_session_only);

    if (last != 0) {
        return std::unexpected(CodecError{CodecErrorKind::CorruptInput, "zstd: truncated frame"});
    }
    return output;
}

} // namespace docpress

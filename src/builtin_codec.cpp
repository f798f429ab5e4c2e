// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#include "docpress/codec.hpp"
#include "compressor.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <format>

namespace docpress {

namespace {

std::expected<std::vector<std::byte>, CodecError> read_source(const std::filesystem::path& source) {
    std::FILE* file = std::fopen(source.string().c_str(), "rb");
    if (!file) {
        return std::unexpected(CodecError{CodecErrorKind::IOError,
            std::format("cannot open {}: {}", source.string(), std::strerror(errno))});
    }
    std::unique_ptr<std::FILE, decltype(&std::fclose)> guard(file, std::fclose);

    std::vector<std::byte> data;
    std::byte chunk[64 * 1024];
    std::size_t n = 0;
    while ((n = std::fread(chunk, 1, sizeof(chunk), file)) > 0) {
        data.insert(data.end(), chunk, chunk + n);
    }
    if (std::ferror(file)) {
        return std::unexpected(CodecError{CodecErrorKind::IOError,
            std::format("read failed for {}", source.string())});
    }
    return data;
}

} // anonymous namespace

bool BuiltinCodec::supports(CompressionMethod method) noexcept {
    return method == CompressionMethod::Gzip || method == CompressionMethod::Zstd;
}

CodecResult BuiltinCodec::compress(const std::filesystem::path& source,
                                   CompressionMethod method, int level) {
    if (!supports(method)) {
        return std::unexpected(CodecError{CodecErrorKind::Unsupported,
            std::format("no builtin codec for method '{}'", method_name(method))});
    }

    auto data = read_source(source);
    if (!data) {
        return std::unexpected(std::move(data.error()));
    }

    if (method == CompressionMethod::Gzip) {
        return GzipCompressor(level).compress(*data);
    }
    // A context per call keeps concurrent workers independent
    ZstdCompressor zstd(level);
    return zstd.compress(*data);
}

std::shared_ptr<ICodec> make_builtin_codec() {
    return std::make_shared<BuiltinCodec>();
}

} // namespace docpress

// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#pragma once

#include "types.hpp"
#include "error.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <vector>

namespace docpress {

using CodecResult = std::expected<std::vector<std::byte>, CodecError>;

// ============================================================================
// Codec Interface
//
// Turns a source file into compressed bytes. Implementations must be safe to
// call from several worker threads at once and must not throw.
// ============================================================================

class ICodec {
public:
    virtual ~ICodec() = default;

    [[nodiscard]] virtual CodecResult
    compress(const std::filesystem::path& source, CompressionMethod method, int level) = 0;
};

// ============================================================================
// Builtin Codec - gzip (zlib) and zstd
//
// lossy, pdf_optimize and office_optimize report CodecErrorKind::Unsupported.
// Plug a different ICodec into the engine to handle them.
// ============================================================================

class BuiltinCodec : public ICodec {
public:
    BuiltinCodec() = default;

    [[nodiscard]] CodecResult
    compress(const std::filesystem::path& source, CompressionMethod method, int level) override;

    [[nodiscard]] static bool supports(CompressionMethod method) noexcept;
};

[[nodiscard]] std::shared_ptr<ICodec> make_builtin_codec();

} // namespace docpress

// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace docpress {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode : std::uint8_t {
    Validation,         // Malformed metadata or configuration
    UnknownType,        // Document type not registered
    UnknownDocument,
    UnknownJob,
    DuplicateJob,       // An active job already exists for the document
    InvalidTransition,  // State machine violation (includes repeated complete())
    Persistence,        // Store unavailable or journal write failed
    Codec
};

[[nodiscard]] constexpr std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Validation:        return "ValidationError";
        case ErrorCode::UnknownType:       return "UnknownType";
        case ErrorCode::UnknownDocument:   return "UnknownDocument";
        case ErrorCode::UnknownJob:        return "UnknownJob";
        case ErrorCode::DuplicateJob:      return "DuplicateJob";
        case ErrorCode::InvalidTransition: return "InvalidTransition";
        case ErrorCode::Persistence:       return "PersistenceError";
        case ErrorCode::Codec:             return "CodecError";
    }
    return "UnknownError";
}

struct Error {
    ErrorCode code = ErrorCode::Validation;
    std::string message;

    [[nodiscard]] std::string to_string() const {
        std::string out(error_code_name(code));
        if (!message.empty()) {
            out += ": ";
            out += message;
        }
        return out;
    }
};

template<typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] inline std::unexpected<Error> make_error(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// ============================================================================
// Codec Errors
// ============================================================================

enum class CodecErrorKind : std::uint8_t {
    Unsupported,
    CorruptInput,
    IOError,
    Timeout
};

[[nodiscard]] constexpr std::string_view codec_error_kind_name(CodecErrorKind kind) noexcept {
    switch (kind) {
        case CodecErrorKind::Unsupported:  return "Unsupported";
        case CodecErrorKind::CorruptInput: return "CorruptInput";
        case CodecErrorKind::IOError:      return "IOError";
        case CodecErrorKind::Timeout:      return "Timeout";
    }
    return "Unknown";
}

struct CodecError {
    CodecErrorKind kind = CodecErrorKind::IOError;
    std::string message;

    [[nodiscard]] std::string to_string() const {
        std::string out(codec_error_kind_name(kind));
        if (!message.empty()) {
            out += ": ";
            out += message;
        }
        return out;
    }
};

} // namespace docpress

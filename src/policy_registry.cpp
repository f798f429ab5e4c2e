// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#include "docpress/policy_registry.hpp"
#include "docpress/log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <mutex>

namespace docpress {

namespace {

constexpr const char* kTag = "PolicyRegistry";

constexpr std::array<std::string_view, 14> kGeneralPrefixes = {
    "text/",
    "application/json",
    "application/xml",
    "application/pdf",
    "application/msword",
    "application/vnd.ms-",
    "application/vnd.openxmlformats-officedocument.",
    "application/rtf",
    "application/x-tar",
    "application/sql",
    "application/octet-stream",
    "image/bmp",
    "image/tiff",
    "image/svg+xml",
};

constexpr std::array<std::string_view, 5> kImagePrefixes = {
    "image/jpeg", "image/png", "image/webp", "image/bmp", "image/tiff",
};

constexpr std::array<std::string_view, 1> kPdfPrefixes = {
    "application/pdf",
};

constexpr std::array<std::string_view, 3> kOfficePrefixes = {
    "application/msword",
    "application/vnd.ms-",
    "application/vnd.openxmlformats-officedocument.",
};

template<std::size_t N>
bool matches_any(const std::array<std::string_view, N>& prefixes, std::string_view mime) {
    return std::any_of(prefixes.begin(), prefixes.end(),
                       [&](std::string_view prefix) { return mime.starts_with(prefix); });
}

Policy to_policy(const DocumentType& type) {
    return Policy{type.id, type.compression_level, type.compression_method,
                  type.min_size_for_compression};
}

} // anonymous namespace

bool is_compressible(CompressionMethod method, std::string_view mime_type) {
    std::string mime(mime_type);
    std::transform(mime.begin(), mime.end(), mime.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    switch (method) {
        case CompressionMethod::None:
            return false;
        case CompressionMethod::Gzip:
        case CompressionMethod::Zstd:
            return matches_any(kGeneralPrefixes, mime);
        case CompressionMethod::Lossy:
            return matches_any(kImagePrefixes, mime);
        case CompressionMethod::PdfOptimize:
            return matches_any(kPdfPrefixes, mime);
        case CompressionMethod::OfficeOptimize:
            return matches_any(kOfficePrefixes, mime);
    }
    return false;
}

Result<void> validate_document_type(const DocumentType& type) {
    if (type.name.empty()) {
        return make_error(ErrorCode::Validation, "document type name cannot be empty");
    }
    if (type.min_size_for_compression < 0) {
        return make_error(ErrorCode::Validation, "min_size_for_compression must be non-negative");
    }
    if (type.compression_method != CompressionMethod::None) {
        auto [lo, hi] = level_range(type.compression_method);
        if (type.compression_level < lo || type.compression_level > hi) {
            return make_error(ErrorCode::Validation,
                std::format("compression_level {} out of range [{}, {}] for {}",
                            type.compression_level, lo, hi, method_name(type.compression_method)));
        }
    }
    return {};
}

// ============================================================================
// PolicyRegistry
// ============================================================================

Result<DocumentType> PolicyRegistry::register_type(const DocumentType& type) {
    if (auto valid = validate_document_type(type); !valid) {
        return std::unexpected(std::move(valid.error()));
    }

    auto stored = db_.transact([&](Transaction& tx) -> Result<DocumentType> {
        tx.put(type);
        return type;
    });
    if (!stored) {
        return stored;
    }

    invalidate(type.id);
    DOCPRESS_LOG_I(kTag, "type {} '{}' -> {} level {} min {}",
                   type.id, type.name, method_name(type.compression_method),
                   type.compression_level, type.min_size_for_compression);
    return stored;
}

Result<DocumentType> PolicyRegistry::get_type(TypeId id) const {
    auto type = db_.type(id);
    if (!type) {
        return make_error(ErrorCode::UnknownType, std::format("document type {} is not registered", id));
    }
    return *type;
}

std::vector<DocumentType> PolicyRegistry::list_types() const {
    return db_.snapshot().types;
}

Result<Policy> PolicyRegistry::lookup(TypeId id) const {
    {
        std::shared_lock lock(cache_mutex_);
        if (auto it = cache_.find(id); it != cache_.end()) {
            return it->second;
        }
    }

    // Held across the read so a concurrent invalidate() cannot be overtaken
    std::unique_lock lock(cache_mutex_);
    auto type = get_type(id);
    if (!type) {
        return std::unexpected(std::move(type.error()));
    }

    auto policy = to_policy(*type);
    cache_.insert_or_assign(id, policy);
    return policy;
}

Decision PolicyRegistry::decide(const Document& doc, const Policy& policy) {
    if (policy.method == CompressionMethod::None) {
        return SkipDecision{"compression disabled for document type"};
    }
    if (doc.size_bytes < policy.min_size) {
        return SkipDecision{std::format("size {} below minimum {}", doc.size_bytes, policy.min_size)};
    }
    if (!is_compressible(policy.method, doc.mime_type)) {
        return SkipDecision{std::format("mime type {} not compressible with {}",
                                        doc.mime_type, method_name(policy.method))};
    }
    return CompressDecision{policy.level, policy.method};
}

void PolicyRegistry::invalidate(TypeId id) {
    std::unique_lock lock(cache_mutex_);
    cache_.erase(id);
}

void PolicyRegistry::invalidate_all() {
    std::unique_lock lock(cache_mutex_);
    cache_.clear();
}

} // namespace docpress

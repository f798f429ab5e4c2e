// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#pragma once

#include "database.hpp"

#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace docpress {

// ============================================================================
// Policy / Decision
// ============================================================================

struct Policy {
    TypeId type_id = 0;
    int level = 0;
    CompressionMethod method = CompressionMethod::None;
    std::int64_t min_size = 0;
};

struct CompressDecision {
    int level = 0;
    CompressionMethod method = CompressionMethod::None;
};

struct SkipDecision {
    std::string reason;
};

using Decision = std::variant<CompressDecision, SkipDecision>;

/// Accepted compression_level range for a method (inclusive)
[[nodiscard]] constexpr std::pair<int, int> level_range(CompressionMethod method) noexcept {
    switch (method) {
        case CompressionMethod::None:           return {0, 0};
        case CompressionMethod::Gzip:           return {1, 9};
        case CompressionMethod::Zstd:           return {1, 22};
        case CompressionMethod::Lossy:          return {1, 100};
        case CompressionMethod::PdfOptimize:    return {0, 9};
        case CompressionMethod::OfficeOptimize: return {0, 9};
    }
    return {0, 0};
}

/// Whether method can do anything useful with mime_type (case-insensitive)
[[nodiscard]] bool is_compressible(CompressionMethod method, std::string_view mime_type);

[[nodiscard]] Result<void> validate_document_type(const DocumentType& type);

// ============================================================================
// PolicyRegistry - document type rows plus a read-through policy cache
// ============================================================================

class PolicyRegistry {
public:
    explicit PolicyRegistry(Database& db) noexcept : db_(db) {}

    /// Insert or replace a document type; replacing invalidates its cached policy
    [[nodiscard]] Result<DocumentType> register_type(const DocumentType& type);

    [[nodiscard]] Result<DocumentType> get_type(TypeId id) const;
    [[nodiscard]] std::vector<DocumentType> list_types() const;

    /// Fails with ErrorCode::UnknownType if the type is not registered
    [[nodiscard]] Result<Policy> lookup(TypeId id) const;

    [[nodiscard]] static Decision decide(const Document& doc, const Policy& policy);

    void invalidate(TypeId id);
    void invalidate_all();

private:
    Database& db_;

    mutable std::shared_mutex cache_mutex_;
    mutable std::unordered_map<TypeId, Policy> cache_;
};

} // namespace docpress

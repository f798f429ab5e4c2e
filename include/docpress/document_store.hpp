// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#pragma once

#include "database.hpp"

#include <string>
#include <string_view>

namespace docpress {

// ============================================================================
// DocumentStore - document rows and their compression status transitions
//
//   pending -> processing -> completed
//                         -> failed
//                         -> skipped
//   pending -> skipped | failed
//   failed  -> pending               (retry via re-enqueue)
//
// Each operation comes in two forms: one that runs its own transaction and
// one that writes into a caller's Transaction so it can commit together with
// a job change.
// ============================================================================

class DocumentStore {
public:
    explicit DocumentStore(Database& db) noexcept : db_(db) {}

    [[nodiscard]] static Result<void> validate(const DocumentMeta& meta);

    /// Insert a pending document with a fresh UUID
    [[nodiscard]] Result<Document> register_document(const DocumentMeta& meta);
    [[nodiscard]] static Result<Document> register_document(Transaction& tx, const DocumentMeta& meta);

    [[nodiscard]] Result<Document> get(const DocumentId& id) const;

    [[nodiscard]] Result<Document> mark_processing(const DocumentId& id);
    [[nodiscard]] static Result<Document> mark_processing(Transaction& tx, const DocumentId& id);

    [[nodiscard]] Result<Document> mark_completed(const DocumentId& id,
                                                  std::string compressed_path,
                                                  std::int64_t compressed_size);
    [[nodiscard]] static Result<Document> mark_completed(Transaction& tx, const DocumentId& id,
                                                         std::string compressed_path,
                                                         std::int64_t compressed_size);

    [[nodiscard]] Result<Document> mark_failed(const DocumentId& id, std::string error);
    [[nodiscard]] static Result<Document> mark_failed(Transaction& tx, const DocumentId& id,
                                                      std::string error);

    [[nodiscard]] Result<Document> mark_skipped(const DocumentId& id, std::string reason);
    [[nodiscard]] static Result<Document> mark_skipped(Transaction& tx, const DocumentId& id,
                                                       std::string reason);

    /// failed -> pending with the error cleared
    [[nodiscard]] static Result<Document> reset_for_retry(Transaction& tx, const DocumentId& id);

private:
    Database& db_;
};

} // namespace docpress

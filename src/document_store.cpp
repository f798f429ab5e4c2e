// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#include "docpress/document_store.hpp"
#include "docpress/log.hpp"
#include "utils.hpp"

#include <format>

namespace docpress {

namespace {

constexpr const char* kTag = "DocumentStore";

Result<Document> load(const Transaction& tx, const DocumentId& id) {
    auto doc = tx.document(id);
    if (!doc) {
        return make_error(ErrorCode::UnknownDocument, std::format("document {} not found", id));
    }
    return *doc;
}

std::unexpected<Error> bad_transition(const Document& doc, CompressionStatus to) {
    return make_error(ErrorCode::InvalidTransition,
        std::format("document {} cannot move from {} to {}",
                    doc.id, status_name(doc.compression_status), status_name(to)));
}

} // anonymous namespace

Result<void> DocumentStore::validate(const DocumentMeta& meta) {
    if (meta.original_filename.empty()) {
        return make_error(ErrorCode::Validation, "original_filename cannot be empty");
    }
    if (meta.mime_type.empty()) {
        return make_error(ErrorCode::Validation, "mime_type cannot be empty");
    }
    if (meta.original_path.empty()) {
        return make_error(ErrorCode::Validation, "original_path cannot be empty");
    }
    if (meta.size_bytes < 0) {
        return make_error(ErrorCode::Validation,
            std::format("size_bytes must be non-negative, got {}", meta.size_bytes));
    }
    return {};
}

// ============================================================================
// Registration
// ============================================================================

Result<Document> DocumentStore::register_document(Transaction& tx, const DocumentMeta& meta) {
    if (auto valid = validate(meta); !valid) {
        return std::unexpected(std::move(valid.error()));
    }
    if (!tx.type(meta.type_id)) {
        return make_error(ErrorCode::UnknownType,
            std::format("document type {} is not registered", meta.type_id));
    }

    Document doc;
    doc.id = make_uuid_v4();
    doc.original_filename = meta.original_filename;
    doc.mime_type = meta.mime_type;
    doc.size_bytes = meta.size_bytes;
    doc.original_path = meta.original_path;
    doc.type_id = meta.type_id;
    doc.compression_status = CompressionStatus::Pending;
    doc.created_at = Timestamp::now();
    doc.updated_at = doc.created_at;

    tx.put(doc);
    return doc;
}

Result<Document> DocumentStore::register_document(const DocumentMeta& meta) {
    auto doc = db_.transact([&](Transaction& tx) { return register_document(tx, meta); });
    if (doc) {
        DOCPRESS_LOG_D(kTag, "registered {} ({}, {} bytes)",
                       doc->id, doc->original_filename, doc->size_bytes);
    }
    return doc;
}

Result<Document> DocumentStore::get(const DocumentId& id) const {
    auto doc = db_.document(id);
    if (!doc) {
        return make_error(ErrorCode::UnknownDocument, std::format("document {} not found", id));
    }
    return *doc;
}

// ============================================================================
// Status transitions
// ============================================================================

Result<Document> DocumentStore::mark_processing(Transaction& tx, const DocumentId& id) {
    auto doc = load(tx, id);
    if (!doc) return doc;

    // Re-entering processing happens when a retried job is claimed again
    if (doc->compression_status != CompressionStatus::Pending &&
        doc->compression_status != CompressionStatus::Processing) {
        return bad_transition(*doc, CompressionStatus::Processing);
    }

    doc->compression_status = CompressionStatus::Processing;
    doc->updated_at = Timestamp::now();
    tx.put(*doc);
    return doc;
}

Result<Document> DocumentStore::mark_processing(const DocumentId& id) {
    return db_.transact([&](Transaction& tx) { return mark_processing(tx, id); });
}

Result<Document> DocumentStore::mark_completed(Transaction& tx, const DocumentId& id,
                                               std::string compressed_path,
                                               std::int64_t compressed_size) {
    if (compressed_path.empty()) {
        return make_error(ErrorCode::Validation, "compressed_path cannot be empty");
    }
    if (compressed_size < 0) {
        return make_error(ErrorCode::Validation, "compressed_size must be non-negative");
    }

    auto doc = load(tx, id);
    if (!doc) return doc;

    if (doc->compression_status != CompressionStatus::Processing) {
        return bad_transition(*doc, CompressionStatus::Completed);
    }

    doc->compression_status = CompressionStatus::Completed;
    doc->compressed_path = std::move(compressed_path);
    doc->compressed_size_bytes = compressed_size;
    doc->has_error = false;
    doc->error_message.reset();
    doc->updated_at = Timestamp::now();
    tx.put(*doc);
    return doc;
}

Result<Document> DocumentStore::mark_completed(const DocumentId& id,
                                               std::string compressed_path,
                                               std::int64_t compressed_size) {
    return db_.transact([&](Transaction& tx) {
        return mark_completed(tx, id, std::move(compressed_path), compressed_size);
    });
}

Result<Document> DocumentStore::mark_failed(Transaction& tx, const DocumentId& id, std::string error) {
    auto doc = load(tx, id);
    if (!doc) return doc;

    if (doc->compression_status != CompressionStatus::Pending &&
        doc->compression_status != CompressionStatus::Processing) {
        return bad_transition(*doc, CompressionStatus::Failed);
    }

    doc->compression_status = CompressionStatus::Failed;
    doc->has_error = true;
    doc->error_message = std::move(error);
    doc->updated_at = Timestamp::now();
    tx.put(*doc);
    return doc;
}

Result<Document> DocumentStore::mark_failed(const DocumentId& id, std::string error) {
    return db_.transact([&](Transaction& tx) { return mark_failed(tx, id, std::move(error)); });
}

Result<Document> DocumentStore::mark_skipped(Transaction& tx, const DocumentId& id, std::string reason) {
    auto doc = load(tx, id);
    if (!doc) return doc;

    if (doc->compression_status != CompressionStatus::Pending &&
        doc->compression_status != CompressionStatus::Processing) {
        return bad_transition(*doc, CompressionStatus::Skipped);
    }

    doc->compression_status = CompressionStatus::Skipped;
    doc->skip_reason = std::move(reason);
    doc->has_error = false;
    doc->error_message.reset();
    doc->updated_at = Timestamp::now();
    tx.put(*doc);
    return doc;
}

Result<Document> DocumentStore::mark_skipped(const DocumentId& id, std::string reason) {
    return db_.transact([&](Transaction& tx) { return mark_skipped(tx, id, std::move(reason)); });
}

Result<Document> DocumentStore::reset_for_retry(Transaction& tx, const DocumentId& id) {
    auto doc = load(tx, id);
    if (!doc) return doc;

    if (doc->compression_status != CompressionStatus::Failed) {
        return bad_transition(*doc, CompressionStatus::Pending);
    }

    doc->compression_status = CompressionStatus::Pending;
    doc->has_error = false;
    doc->error_message.reset();
    doc->updated_at = Timestamp::now();
    tx.put(*doc);
    return doc;
}

} // namespace docpress

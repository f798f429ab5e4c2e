// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#pragma once

#include "database.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace docpress {

struct StatusBreakdown {
    CompressionStatus status = CompressionStatus::Pending;
    std::int64_t count = 0;
    std::int64_t original_bytes = 0;
    std::int64_t compressed_bytes = 0;
};

struct Overview {
    std::vector<StatusBreakdown> by_status;   // One entry per status, fixed order

    std::int64_t total_documents = 0;
    std::int64_t total_original_bytes = 0;    // All documents
    std::int64_t total_compressed_bytes = 0;  // Completed documents
    std::int64_t completed_original_bytes = 0;
    std::int64_t space_saved_bytes = 0;
    double savings_percent = 0.0;             // Over completed documents only

    std::optional<Timestamp> last_completed_at;

    [[nodiscard]] std::int64_t count(CompressionStatus status) const noexcept {
        for (const auto& entry : by_status) {
            if (entry.status == status) return entry.count;
        }
        return 0;
    }
};

struct TypeAnalysis {
    DocumentType type;
    std::int64_t document_count = 0;
    std::int64_t compressed_count = 0;
    std::int64_t failed_count = 0;
    std::int64_t skipped_count = 0;
    std::int64_t pending_count = 0;   // pending or processing
    double average_size = 0.0;
    std::int64_t total_original_bytes = 0;
    std::int64_t total_compressed_bytes = 0;
    double savings_percent = 0.0;
};

struct QueueStatus {
    std::int64_t queued = 0;
    std::int64_t running = 0;
    std::int64_t completed = 0;
    std::int64_t failed = 0;
    std::int64_t backing_off = 0;   // queued but not yet eligible
};

// ============================================================================
// StatsReporter - read-only aggregation
//
// Each query works on one consistent Database snapshot.
// ============================================================================

class StatsReporter {
public:
    explicit StatsReporter(const Database& db) noexcept : db_(db) {}

    [[nodiscard]] Overview overview() const;

    /// Every registered type, ordered by document count descending
    [[nodiscard]] std::vector<TypeAnalysis> per_type_analysis() const;

    /// Most recent jobs by queued_at descending
    [[nodiscard]] std::vector<Job> queue_snapshot(std::size_t limit = 20) const;

    [[nodiscard]] QueueStatus queue_status() const;

    /// Newest first by updated_at; limit 0 = all
    [[nodiscard]] std::vector<Document> failed_documents(std::size_t limit = 0) const;
    [[nodiscard]] std::vector<Document> completed_documents(std::size_t limit = 0) const;

private:
    [[nodiscard]] std::vector<Document> documents_in(CompressionStatus status, std::size_t limit) const;

    const Database& db_;
};

[[nodiscard]] double savings_percent(std::int64_t original, std::int64_t compressed) noexcept;

} // namespace docpress

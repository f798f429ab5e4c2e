// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#include "docpress/stats_reporter.hpp"

#include <algorithm>
#include <map>

namespace docpress {

double savings_percent(std::int64_t original, std::int64_t compressed) noexcept {
    if (original <= 0) return 0.0;
    return static_cast<double>(original - compressed) / static_cast<double>(original) * 100.0;
}

Overview StatsReporter::overview() const {
    auto snap = db_.snapshot();

    Overview result;
    for (auto status : kAllCompressionStatuses) {
        result.by_status.push_back(StatusBreakdown{status});
    }

    for (const auto& doc : snap.documents) {
        auto& entry = result.by_status[static_cast<std::size_t>(doc.compression_status)];
        entry.count += 1;
        entry.original_bytes += doc.size_bytes;

        result.total_documents += 1;
        result.total_original_bytes += doc.size_bytes;

        if (doc.compression_status == CompressionStatus::Completed) {
            auto compressed = doc.compressed_size_bytes.value_or(0);
            entry.compressed_bytes += compressed;
            result.total_compressed_bytes += compressed;
            result.completed_original_bytes += doc.size_bytes;
        }
    }

    result.space_saved_bytes = result.completed_original_bytes - result.total_compressed_bytes;
    result.savings_percent = savings_percent(result.completed_original_bytes,
                                             result.total_compressed_bytes);

    for (const auto& job : snap.jobs) {
        if (job.status != JobStatus::Completed || !job.completed_at) continue;
        if (!result.last_completed_at || *job.completed_at > *result.last_completed_at) {
            result.last_completed_at = job.completed_at;
        }
    }
    return result;
}

std::vector<TypeAnalysis> StatsReporter::per_type_analysis() const {
    auto snap = db_.snapshot();

    std::map<TypeId, TypeAnalysis> by_type;
    for (const auto& type : snap.types) {
        by_type[type.id].type = type;
    }

    std::map<TypeId, std::int64_t> completed_original;
    for (const auto& doc : snap.documents) {
        auto it = by_type.find(doc.type_id);
        if (it == by_type.end()) continue;

        auto& row = it->second;
        row.document_count += 1;
        row.total_original_bytes += doc.size_bytes;
        switch (doc.compression_status) {
            case CompressionStatus::Completed:
                row.compressed_count += 1;
                row.total_compressed_bytes += doc.compressed_size_bytes.value_or(0);
                completed_original[doc.type_id] += doc.size_bytes;
                break;
            case CompressionStatus::Failed:
                row.failed_count += 1;
                break;
            case CompressionStatus::Skipped:
                row.skipped_count += 1;
                break;
            case CompressionStatus::Pending:
            case CompressionStatus::Processing:
                row.pending_count += 1;
                break;
        }
    }

    std::vector<TypeAnalysis> result;
    result.reserve(by_type.size());
    for (auto& [id, row] : by_type) {
        if (row.document_count > 0) {
            row.average_size = static_cast<double>(row.total_original_bytes) /
                               static_cast<double>(row.document_count);
        }
        row.savings_percent = savings_percent(completed_original[id], row.total_compressed_bytes);
        result.push_back(std::move(row));
    }

    std::stable_sort(result.begin(), result.end(), [](const TypeAnalysis& a, const TypeAnalysis& b) {
        return a.document_count > b.document_count;
    });
    return result;
}

std::vector<Job> StatsReporter::queue_snapshot(std::size_t limit) const {
    auto jobs = db_.snapshot().jobs;
    std::sort(jobs.begin(), jobs.end(), [](const Job& a, const Job& b) {
        if (a.queued_at != b.queued_at) return a.queued_at > b.queued_at;
        return a.id > b.id;
    });
    if (jobs.size() > limit) {
        jobs.resize(limit);
    }
    return jobs;
}

QueueStatus StatsReporter::queue_status() const {
    auto snap = db_.snapshot();
    auto now = Timestamp::now();

    QueueStatus result;
    for (const auto& job : snap.jobs) {
        switch (job.status) {
            case JobStatus::Queued:
                result.queued += 1;
                if (job.available_at > now) result.backing_off += 1;
                break;
            case JobStatus::Running:   result.running += 1; break;
            case JobStatus::Completed: result.completed += 1; break;
            case JobStatus::Failed:    result.failed += 1; break;
        }
    }
    return result;
}

std::vector<Document> StatsReporter::failed_documents(std::size_t limit) const {
    return documents_in(CompressionStatus::Failed, limit);
}

std::vector<Document> StatsReporter::completed_documents(std::size_t limit) const {
    return documents_in(CompressionStatus::Completed, limit);
}

std::vector<Document> StatsReporter::documents_in(CompressionStatus status, std::size_t limit) const {
    auto snap = db_.snapshot();

    std::vector<Document> result;
    for (auto& doc : snap.documents) {
        if (doc.compression_status == status) {
            result.push_back(std::move(doc));
        }
    }
    std::sort(result.begin(), result.end(), [](const Document& a, const Document& b) {
        if (a.updated_at != b.updated_at) return a.updated_at > b.updated_at;
        return a.id < b.id;
    });
    if (limit > 0 && result.size() > limit) {
        result.resize(limit);
    }
    return result;
}

} // namespace docpress

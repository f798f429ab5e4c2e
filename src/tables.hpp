// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#pragma once

#include "docpress/types.hpp"

#include <algorithm>
#include <compare>
#include <map>
#include <set>
#include <unordered_map>

namespace docpress::detail {

// Dequeue order: priority descending, queued_at ascending, id ascending
struct QueueKey {
    int rank;
    std::int64_t queued_at;
    JobId id;

    auto operator<=>(const QueueKey&) const = default;
};

[[nodiscard]] inline QueueKey queue_key(const Job& job) noexcept {
    return {-static_cast<int>(job.priority), job.queued_at.micros(), job.id};
}

// ============================================================================
// Tables - committed rows plus the indexes the queue needs
// ============================================================================

struct Tables {
    std::map<TypeId, DocumentType> types;
    std::unordered_map<DocumentId, Document> documents;
    std::map<JobId, Job> jobs;

    std::set<QueueKey> queued;                      // status == Queued
    std::unordered_map<DocumentId, JobId> active;   // status is Queued or Running

    JobId last_job_id = 0;

    void put(DocumentType type) {
        auto id = type.id;
        types.insert_or_assign(id, std::move(type));
    }

    void put(Document document) {
        auto id = document.id;
        documents.insert_or_assign(std::move(id), std::move(document));
    }

    void put(Job job) {
        if (auto it = jobs.find(job.id); it != jobs.end()) {
            unindex(it->second);
        }
        index(job);
        last_job_id = std::max(last_job_id, job.id);
        auto id = job.id;
        jobs.insert_or_assign(id, std::move(job));
    }

    void clear() {
        types.clear();
        documents.clear();
        jobs.clear();
        queued.clear();
        active.clear();
        last_job_id = 0;
    }

private:
    void index(const Job& job) {
        if (job.status == JobStatus::Queued) {
            queued.insert(queue_key(job));
        }
        if (is_active(job.status)) {
            active[job.document_id] = job.id;
        }
    }

    void unindex(const Job& job) {
        if (job.status == JobStatus::Queued) {
            queued.erase(queue_key(job));
        }
        if (is_active(job.status)) {
            if (auto it = active.find(job.document_id); it != active.end() && it->second == job.id) {
                active.erase(it);
            }
        }
    }
};

} // namespace docpress::detail

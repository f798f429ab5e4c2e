// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#include "docpress/compression_queue.hpp"
#include "docpress/document_store.hpp"
#include "docpress/log.hpp"

#include <algorithm>
#include <format>

namespace docpress {

namespace {

constexpr const char* kTag = "Queue";

Result<Job> load(const Transaction& tx, JobId id) {
    auto job = tx.job(id);
    if (!job) {
        return make_error(ErrorCode::UnknownJob, std::format("job {} not found", id));
    }
    return *job;
}

std::unexpected<Error> bad_transition(const Job& job, JobStatus to) {
    return make_error(ErrorCode::InvalidTransition,
        std::format("job {} cannot move from {} to {}",
                    job.id, job_status_name(job.status), job_status_name(to)));
}

} // anonymous namespace

CompressionQueue::CompressionQueue(Database& db, QueueOptions options, Clock clock)
    : db_(db)
    , options_(options)
    , clock_(clock ? std::move(clock) : Clock{[] { return Timestamp::now(); }}) {
    options_.max_attempts = std::max(options_.max_attempts, 1);
}

// ============================================================================
// Enqueue
// ============================================================================

Result<Job> CompressionQueue::enqueue(Transaction& tx, const DocumentId& document_id,
                                      JobPriority priority) {
    auto doc = tx.document(document_id);
    if (!doc) {
        return make_error(ErrorCode::UnknownDocument, std::format("document {} not found", document_id));
    }

    if (auto active = tx.active_job(document_id)) {
        return make_error(ErrorCode::DuplicateJob,
            std::format("document {} already has {} job {}",
                        document_id, job_status_name(active->status), active->id));
    }

    switch (doc->compression_status) {
        case CompressionStatus::Completed:
        case CompressionStatus::Skipped:
            return make_error(ErrorCode::InvalidTransition,
                std::format("document {} is already {}", document_id,
                            status_name(doc->compression_status)));
        case CompressionStatus::Failed:
            if (auto reset = DocumentStore::reset_for_retry(tx, document_id); !reset) {
                return std::unexpected(std::move(reset.error()));
            }
            break;
        case CompressionStatus::Pending:
        case CompressionStatus::Processing:
            break;
    }

    Job job;
    job.id = tx.allocate_job_id();
    job.document_id = document_id;
    job.priority = priority;
    job.status = JobStatus::Queued;
    job.queued_at = now();
    job.available_at = job.queued_at;
    tx.put(job);
    return job;
}

Result<Job> CompressionQueue::enqueue(const DocumentId& document_id, JobPriority priority) {
    auto job = db_.transact([&](Transaction& tx) { return enqueue(tx, document_id, priority); });
    if (job) {
        DOCPRESS_LOG_D(kTag, "enqueued job {} for {} ({})",
                       job->id, document_id, priority_name(priority));
        notify_all();
    }
    return job;
}

Result<bool> CompressionQueue::update_priority(const DocumentId& document_id, JobPriority priority) {
    return db_.transact([&](Transaction& tx) -> Result<bool> {
        auto active = tx.active_job(document_id);
        if (!active || active->status != JobStatus::Queued) {
            return false;
        }
        if (active->priority == priority) {
            return false;
        }
        active->priority = priority;
        tx.put(*active);
        return true;
    });
}

Result<std::size_t> CompressionQueue::bulk_update_priority(std::span<const DocumentId> document_ids,
                                                           JobPriority priority) {
    return db_.transact([&](Transaction& tx) -> Result<std::size_t> {
        std::size_t changed = 0;
        for (const auto& id : document_ids) {
            auto active = tx.active_job(id);
            if (!active || active->status != JobStatus::Queued || active->priority == priority) {
                continue;
            }
            active->priority = priority;
            tx.put(*active);
            ++changed;
        }
        return changed;
    });
}

// ============================================================================
// Claim / transitions
// ============================================================================

Result<std::optional<Job>> CompressionQueue::dequeue(Transaction& tx) {
    auto next = tx.next_eligible_job(now());
    if (!next) {
        return std::optional<Job>{};
    }
    auto claimed = mark_running(tx, next->id);
    if (!claimed) {
        return std::unexpected(std::move(claimed.error()));
    }
    return std::optional<Job>{std::move(*claimed)};
}

Result<std::optional<Job>> CompressionQueue::dequeue() {
    return db_.transact([&](Transaction& tx) { return dequeue(tx); });
}

Result<Job> CompressionQueue::mark_running(Transaction& tx, JobId id) {
    auto job = load(tx, id);
    if (!job) return job;

    if (job->status != JobStatus::Queued) {
        return bad_transition(*job, JobStatus::Running);
    }

    job->status = JobStatus::Running;
    job->started_at = now();
    tx.put(*job);
    return job;
}

Result<Job> CompressionQueue::mark_running(JobId id) {
    return db_.transact([&](Transaction& tx) { return mark_running(tx, id); });
}

Result<Job> CompressionQueue::complete(Transaction& tx, JobId id) {
    auto job = load(tx, id);
    if (!job) return job;

    if (job->status != JobStatus::Running) {
        return bad_transition(*job, JobStatus::Completed);
    }

    job->status = JobStatus::Completed;
    job->completed_at = now();
    tx.put(*job);
    return job;
}

Result<Job> CompressionQueue::complete(JobId id) {
    return db_.transact([&](Transaction& tx) { return complete(tx, id); });
}

Result<Job> CompressionQueue::fail_retry(Transaction& tx, JobId id, std::string_view error) {
    auto job = load(tx, id);
    if (!job) return job;

    if (job->status != JobStatus::Running) {
        return bad_transition(*job, JobStatus::Failed);
    }

    auto at = now();
    job->attempts += 1;
    job->error_message = std::string(error);

    if (job->attempts < options_.max_attempts) {
        job->status = JobStatus::Queued;
        job->available_at = at + backoff_for(job->attempts);
    } else {
        job->status = JobStatus::Failed;
        job->completed_at = at;
    }
    tx.put(*job);
    return job;
}

Result<Job> CompressionQueue::fail_retry(JobId id, std::string_view error) {
    auto job = db_.transact([&](Transaction& tx) { return fail_retry(tx, id, error); });
    if (job && job->status == JobStatus::Queued) {
        notify_all();
    }
    return job;
}

Result<std::vector<Job>> CompressionQueue::recover_orphans() {
    constexpr std::string_view kReason = "interrupted by restart";

    auto recovered = db_.transact([&](Transaction& tx) -> Result<std::vector<Job>> {
        std::vector<Job> touched;
        auto at = now();
        for (auto job : tx.jobs_with_status(JobStatus::Running)) {
            job.attempts += 1;
            job.error_message = std::string(kReason);
            if (job.attempts < options_.max_attempts) {
                job.status = JobStatus::Queued;
                job.available_at = at;
            } else {
                job.status = JobStatus::Failed;
                job.completed_at = at;
                auto doc = DocumentStore::mark_failed(tx, job.document_id,
                    std::format("{} (attempts exhausted)", kReason));
                if (!doc) {
                    DOCPRESS_LOG_W(kTag, "orphan job {}: {}", job.id, doc.error().to_string());
                }
            }
            tx.put(job);
            touched.push_back(std::move(job));
        }
        return touched;
    });

    if (recovered) {
        for (const auto& job : *recovered) {
            DOCPRESS_LOG_W(kTag, "recovered orphan job {} for {} -> {} (attempts {})",
                           job.id, job.document_id, job_status_name(job.status), job.attempts);
        }
        if (!recovered->empty()) {
            notify_all();
        }
    }
    return recovered;
}

// ============================================================================
// Queries / wake-up
// ============================================================================

Result<Job> CompressionQueue::get(JobId id) const {
    auto job = db_.job(id);
    if (!job) {
        return make_error(ErrorCode::UnknownJob, std::format("job {} not found", id));
    }
    return *job;
}

std::optional<Job> CompressionQueue::active_job(const DocumentId& document_id) {
    auto found = db_.transact([&](Transaction& tx) -> Result<std::optional<Job>> {
        return tx.active_job(document_id);
    });
    return found ? *found : std::nullopt;
}

std::chrono::milliseconds CompressionQueue::backoff_for(int attempts) const noexcept {
    if (attempts <= 0 || options_.retry_backoff.count() <= 0) {
        return std::chrono::milliseconds{0};
    }
    auto delay = options_.retry_backoff;
    for (int i = 1; i < attempts && delay < options_.max_retry_backoff; ++i) {
        delay *= 2;
    }
    return std::min(delay, options_.max_retry_backoff);
}

std::uint64_t CompressionQueue::work_generation() const {
    std::lock_guard lock(wake_mutex_);
    return generation_;
}

bool CompressionQueue::wait_for_work(std::uint64_t seen, std::chrono::milliseconds timeout) {
    std::unique_lock lock(wake_mutex_);
    return wake_cv_.wait_for(lock, timeout, [&] { return generation_ != seen; });
}

void CompressionQueue::notify_all() {
    {
        std::lock_guard lock(wake_mutex_);
        ++generation_;
    }
    wake_cv_.notify_all();
}

} // namespace docpress

// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#pragma once

#include "database.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace docpress {

struct QueueOptions {
    int max_attempts = 3;
    std::chrono::milliseconds retry_backoff = std::chrono::seconds{2};
    std::chrono::milliseconds max_retry_backoff = std::chrono::minutes{5};
};

using Clock = std::function<Timestamp()>;

// ============================================================================
// CompressionQueue - durable priority queue of compression jobs
//
//   queued -> running -> completed
//                     -> queued     (retry, attempts < max_attempts)
//                     -> failed     (attempts exhausted)
//
// Every operation is a conditional update inside one Database transaction.
// The Transaction& overloads let callers combine a job change with a
// document change; call notify_all() after committing a new queued job.
// ============================================================================

class CompressionQueue {
public:
    explicit CompressionQueue(Database& db, QueueOptions options = {}, Clock clock = {});

    // ========================================================================
    // Producer side
    // ========================================================================

    /// Fails with DuplicateJob while the document has a queued or running job
    [[nodiscard]] Result<Job> enqueue(const DocumentId& document_id,
                                      JobPriority priority = JobPriority::Normal);
    [[nodiscard]] Result<Job> enqueue(Transaction& tx, const DocumentId& document_id,
                                      JobPriority priority = JobPriority::Normal);

    /// Re-prioritise the document's queued job; false if there is none
    [[nodiscard]] Result<bool> update_priority(const DocumentId& document_id, JobPriority priority);
    [[nodiscard]] Result<std::size_t> bulk_update_priority(std::span<const DocumentId> document_ids,
                                                           JobPriority priority);

    // ========================================================================
    // Consumer side
    // ========================================================================

    /// Claim the best eligible job (queued -> running); nullopt when none
    [[nodiscard]] Result<std::optional<Job>> dequeue();
    [[nodiscard]] Result<std::optional<Job>> dequeue(Transaction& tx);

    /// queued -> running for a specific job
    [[nodiscard]] Result<Job> mark_running(JobId id);
    [[nodiscard]] Result<Job> mark_running(Transaction& tx, JobId id);

    /// running -> completed; a second call is rejected with InvalidTransition
    [[nodiscard]] Result<Job> complete(JobId id);
    [[nodiscard]] Result<Job> complete(Transaction& tx, JobId id);

    /// Count a failed attempt: running -> queued, or running -> failed once exhausted
    [[nodiscard]] Result<Job> fail_retry(JobId id, std::string_view error);
    [[nodiscard]] Result<Job> fail_retry(Transaction& tx, JobId id, std::string_view error);

    /**
     * @brief Requeue jobs left running by a previous process
     *
     * Each orphan consumes one attempt. An orphan whose attempts are
     * exhausted fails, and its document is marked failed in the same commit.
     * Call once at startup, before any worker runs.
     */
    [[nodiscard]] Result<std::vector<Job>> recover_orphans();

    // ========================================================================
    // Queries / wake-up
    // ========================================================================

    [[nodiscard]] Result<Job> get(JobId id) const;
    [[nodiscard]] std::optional<Job> active_job(const DocumentId& document_id);

    /// Delay before a job with this many failed attempts becomes eligible again
    [[nodiscard]] std::chrono::milliseconds backoff_for(int attempts) const noexcept;

    [[nodiscard]] std::uint64_t work_generation() const;

    /// Wait until notify_all() runs after generation `seen`, or timeout
    bool wait_for_work(std::uint64_t seen, std::chrono::milliseconds timeout);

    void notify_all();

    [[nodiscard]] const QueueOptions& options() const noexcept { return options_; }
    [[nodiscard]] Timestamp now() const { return clock_(); }

private:
    Database& db_;
    QueueOptions options_;
    Clock clock_;

    mutable std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    std::uint64_t generation_ = 0;
};

} // namespace docpress

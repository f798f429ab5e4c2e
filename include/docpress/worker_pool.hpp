// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#pragma once

#include "codec.hpp"
#include "compression_queue.hpp"
#include "policy_registry.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string_view>

namespace docpress {

struct WorkerOptions {
    std::size_t worker_count = 2;
    std::chrono::milliseconds poll_interval = std::chrono::seconds{1};
    std::chrono::milliseconds job_timeout = std::chrono::minutes{5};
    std::filesystem::path artifact_dir;
};

enum class JobOutcome : std::uint8_t {
    Idle,        // Nothing eligible
    Compressed,
    Skipped,
    Retried,     // Failed attempt, job requeued
    Failed,      // Attempts exhausted
    Abandoned    // Store unavailable; left for the recovery sweep
};

[[nodiscard]] constexpr std::string_view outcome_name(JobOutcome outcome) noexcept {
    switch (outcome) {
        case JobOutcome::Idle:       return "idle";
        case JobOutcome::Compressed: return "compressed";
        case JobOutcome::Skipped:    return "skipped";
        case JobOutcome::Retried:    return "retried";
        case JobOutcome::Failed:     return "failed";
        case JobOutcome::Abandoned:  return "abandoned";
    }
    return "unknown";
}

struct WorkerStats {
    std::uint64_t compressed = 0;
    std::uint64_t skipped = 0;
    std::uint64_t retried = 0;
    std::uint64_t failed = 0;
    std::uint64_t abandoned = 0;
};

// ============================================================================
// WorkerPool - claims jobs, runs the codec, commits the outcome
//
// Claiming (dequeue + document -> processing) and each outcome (document
// status + job transition) are single transactions. The codec runs with no
// store lock held, bounded by job_timeout.
// ============================================================================

class WorkerPool {
public:
    WorkerPool(Database& db, PolicyRegistry& policies, CompressionQueue& queue,
               std::shared_ptr<ICodec> codec, WorkerOptions options);
    ~WorkerPool();

    // Non-copyable, non-movable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    void start();

    /// Stop and join the workers; a job in flight finishes first
    void stop();

    [[nodiscard]] bool is_running() const noexcept;

    // ========================================================================
    // Synchronous processing
    // ========================================================================

    /// Claim and process at most one job on the calling thread
    JobOutcome run_once();

    /// run_once() until nothing is eligible; returns the number of jobs handled
    std::size_t drain();

    [[nodiscard]] WorkerStats stats() const noexcept;

    /// <artifact_dir>/<document_id>.<ext>
    [[nodiscard]] static std::filesystem::path
    artifact_path(const std::filesystem::path& artifact_dir, const DocumentId& id,
                  CompressionMethod method);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace docpress

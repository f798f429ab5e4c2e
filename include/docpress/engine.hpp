// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#pragma once

#include "codec.hpp"
#include "compression_queue.hpp"
#include "config.hpp"
#include "database.hpp"
#include "document_store.hpp"
#include "policy_registry.hpp"
#include "stats_reporter.hpp"
#include "worker_pool.hpp"

#include <memory>

namespace docpress {

// ============================================================================
// Engine - owns one store and every component built on it
// ============================================================================

class Engine {
public:
    /**
     * @brief Open the store under config.data_dir and run the recovery sweep
     * @param config Validated (and directory-prepared) here
     * @param codec Codec for the workers; nullptr selects the builtin gzip/zstd codec
     *
     * Logging is not initialised here. Call Log::init(config.log) first if
     * log output is wanted.
     */
    [[nodiscard]] static Result<std::unique_ptr<Engine>>
    open(const Config& config, std::shared_ptr<ICodec> codec = nullptr);

    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // ========================================================================
    // Document lifecycle
    // ========================================================================

    [[nodiscard]] Result<DocumentType> register_type(const DocumentType& type);

    /// Register a document and enqueue its first job in one commit
    [[nodiscard]] Result<Document> ingest(const DocumentMeta& meta,
                                          JobPriority priority = JobPriority::Normal);

    /// Re-enqueue a failed document
    [[nodiscard]] Result<Job> retry(const DocumentId& id, JobPriority priority = JobPriority::Normal);

    [[nodiscard]] Result<Document> document(const DocumentId& id) const;

    // ========================================================================
    // Workers
    // ========================================================================

    void start();
    void stop();
    std::size_t drain();

    // ========================================================================
    // Components
    // ========================================================================

    [[nodiscard]] Database& database() noexcept;
    [[nodiscard]] DocumentStore& documents() noexcept;
    [[nodiscard]] PolicyRegistry& policies() noexcept;
    [[nodiscard]] CompressionQueue& queue() noexcept;
    [[nodiscard]] WorkerPool& workers() noexcept;
    [[nodiscard]] const StatsReporter& stats() const noexcept;

    [[nodiscard]] const Config& config() const noexcept;

    /// Jobs touched by the recovery sweep at open
    [[nodiscard]] std::size_t recovered_jobs() const noexcept;

private:
    Engine();

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace docpress

// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#pragma once

#include "types.hpp"
#include "error.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace docpress {

namespace detail {
struct Tables;
} // namespace detail

enum class OpenMode : std::uint8_t {
    ReadWrite,
    ReadOnly   // No lock file, mutations fail with ErrorCode::Persistence
};

struct DatabaseOptions {
    // Rewrite the journal as a snapshot once it grows past this many bytes (0 = never)
    std::uint64_t compact_threshold = 16ull * 1024 * 1024;
};

// ============================================================================
// Transaction - write set layered over the committed tables
//
// Reads see the transaction's own writes. Nothing is visible to other
// threads or persisted until Database::transact() commits the write set.
// ============================================================================

class Transaction {
public:
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    // ========================================================================
    // Reads
    // ========================================================================

    [[nodiscard]] std::optional<DocumentType> type(TypeId id) const;
    [[nodiscard]] std::optional<Document> document(const DocumentId& id) const;
    [[nodiscard]] std::optional<Job> job(JobId id) const;

    /// The queued or running job for a document, if any
    [[nodiscard]] std::optional<Job> active_job(const DocumentId& document_id) const;

    /// Highest priority, then oldest queued_at, then lowest id; only jobs
    /// with available_at <= now are considered
    [[nodiscard]] std::optional<Job> next_eligible_job(Timestamp now) const;

    [[nodiscard]] std::vector<Job> jobs_with_status(JobStatus status) const;

    // ========================================================================
    // Writes (full row images)
    // ========================================================================

    void put(DocumentType type);
    void put(Document document);
    void put(Job job);

    [[nodiscard]] JobId allocate_job_id() noexcept { return ++last_job_id_; }

    [[nodiscard]] bool empty() const noexcept {
        return types_.empty() && documents_.empty() && jobs_.empty();
    }

private:
    friend class Database;

    Transaction(const detail::Tables& base, JobId last_job_id) noexcept
        : base_(base), last_job_id_(last_job_id) {}

    const detail::Tables& base_;
    JobId last_job_id_;

    std::map<TypeId, DocumentType> types_;
    std::unordered_map<DocumentId, Document> documents_;
    std::map<JobId, Job> jobs_;
};

// ============================================================================
// Snapshot - consistent copy of every table
// ============================================================================

struct Snapshot {
    std::vector<DocumentType> types;
    std::vector<Document> documents;
    std::vector<Job> jobs;
};

// ============================================================================
// Database - durable table store backed by a redo journal
//
// Layout of the data directory:
//   docpress.journal   framed, checksummed change records
//   LOCK               advisory lock held by the read-write owner
//
// All transactions run under one mutex. A committed change set is appended
// as one record and fsync'ed before it is applied in memory.
// ============================================================================

class Database {
public:
    static constexpr const char* kJournalName = "docpress.journal";
    static constexpr const char* kLockName = "LOCK";

    [[nodiscard]] static Result<std::unique_ptr<Database>>
    open(const std::filesystem::path& dir, OpenMode mode = OpenMode::ReadWrite,
         DatabaseOptions options = {});

    ~Database();

    // Non-copyable, non-movable
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&&) = delete;
    Database& operator=(Database&&) = delete;

    /**
     * @brief Run fn against a fresh Transaction and commit its writes
     * @param fn Callable taking Transaction& and returning Result<T>
     * @return fn's result, or ErrorCode::Persistence if the commit failed
     *
     * When fn returns an error nothing is written. Do not call transact()
     * from inside fn.
     */
    template<typename F>
    auto transact(F&& fn) -> std::invoke_result_t<F&, Transaction&> {
        std::lock_guard lock(mutex_);
        Transaction tx = begin();
        auto result = fn(tx);
        if (!result) {
            return result;
        }
        if (auto committed = commit(tx); !committed) {
            return std::unexpected(std::move(committed.error()));
        }
        return result;
    }

    // ========================================================================
    // Reads
    // ========================================================================

    [[nodiscard]] std::optional<DocumentType> type(TypeId id) const;
    [[nodiscard]] std::optional<Document> document(const DocumentId& id) const;
    [[nodiscard]] std::optional<Job> job(JobId id) const;
    [[nodiscard]] Snapshot snapshot() const;

    // ========================================================================
    // Maintenance
    // ========================================================================

    /// Rewrite the journal as a single snapshot record
    [[nodiscard]] Result<void> compact();

    [[nodiscard]] const std::filesystem::path& directory() const noexcept;
    [[nodiscard]] bool read_only() const noexcept;
    [[nodiscard]] std::uint64_t journal_size() const;

    /// Bytes dropped from a torn journal tail at open
    [[nodiscard]] std::uint64_t recovered_tail_bytes() const noexcept;

private:
    Database();

    [[nodiscard]] Transaction begin();
    [[nodiscard]] Result<void> commit(Transaction& tx);

    mutable std::mutex mutex_;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace docpress

// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#include "docpress/database.hpp"
#include "docpress/log.hpp"
#include "journal.hpp"
#include "row_codec.hpp"
#include "tables.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>

#ifndef _WIN32
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

namespace docpress {

namespace {

constexpr const char* kTag = "Database";

ChangeSet collect(const std::map<TypeId, DocumentType>& types,
                  const std::unordered_map<DocumentId, Document>& documents,
                  const std::map<JobId, Job>& jobs) {
    ChangeSet changes;
    changes.types.reserve(types.size());
    for (const auto& [id, type] : types) changes.types.push_back(type);
    changes.documents.reserve(documents.size());
    for (const auto& [id, doc] : documents) changes.documents.push_back(doc);
    changes.jobs.reserve(jobs.size());
    for (const auto& [id, job] : jobs) changes.jobs.push_back(job);
    return changes;
}

void apply(detail::Tables& tables, ChangeSet&& changes) {
    for (auto& type : changes.types) tables.put(std::move(type));
    for (auto& doc : changes.documents) tables.put(std::move(doc));
    for (auto& job : changes.jobs) tables.put(std::move(job));
}

} // anonymous namespace

// ============================================================================
// Transaction
// ============================================================================

std::optional<DocumentType> Transaction::type(TypeId id) const {
    if (auto it = types_.find(id); it != types_.end()) return it->second;
    if (auto it = base_.types.find(id); it != base_.types.end()) return it->second;
    return std::nullopt;
}

std::optional<Document> Transaction::document(const DocumentId& id) const {
    if (auto it = documents_.find(id); it != documents_.end()) return it->second;
    if (auto it = base_.documents.find(id); it != base_.documents.end()) return it->second;
    return std::nullopt;
}

std::optional<Job> Transaction::job(JobId id) const {
    if (auto it = jobs_.find(id); it != jobs_.end()) return it->second;
    if (auto it = base_.jobs.find(id); it != base_.jobs.end()) return it->second;
    return std::nullopt;
}

std::optional<Job> Transaction::active_job(const DocumentId& document_id) const {
    for (const auto& [id, job] : jobs_) {
        if (job.document_id == document_id && is_active(job.status)) {
            return job;
        }
    }
    if (auto it = base_.active.find(document_id); it != base_.active.end()) {
        // A local write to that job supersedes the committed row
        if (!jobs_.contains(it->second)) {
            return base_.jobs.at(it->second);
        }
    }
    return std::nullopt;
}

std::optional<Job> Transaction::next_eligible_job(Timestamp now) const {
    std::optional<Job> best;

    for (const auto& key : base_.queued) {
        if (jobs_.contains(key.id)) continue;
        const Job& candidate = base_.jobs.at(key.id);
        if (candidate.available_at <= now) {
            best = candidate;
            break;
        }
    }

    for (const auto& [id, job] : jobs_) {
        if (job.status != JobStatus::Queued || job.available_at > now) continue;
        if (!best || detail::queue_key(job) < detail::queue_key(*best)) {
            best = job;
        }
    }
    return best;
}

std::vector<Job> Transaction::jobs_with_status(JobStatus status) const {
    std::vector<Job> result;
    for (const auto& [id, job] : base_.jobs) {
        if (jobs_.contains(id)) continue;
        if (job.status == status) result.push_back(job);
    }
    for (const auto& [id, job] : jobs_) {
        if (job.status == status) result.push_back(job);
    }
    return result;
}

void Transaction::put(DocumentType type) {
    auto id = type.id;
    types_.insert_or_assign(id, std::move(type));
}

void Transaction::put(Document document) {
    auto id = document.id;
    documents_.insert_or_assign(std::move(id), std::move(document));
}

void Transaction::put(Job job) {
    last_job_id_ = std::max(last_job_id_, job.id);
    auto id = job.id;
    jobs_.insert_or_assign(id, std::move(job));
}

// ============================================================================
// Database
// ============================================================================

struct Database::Impl {
    std::filesystem::path dir;
    OpenMode mode = OpenMode::ReadWrite;
    DatabaseOptions options;

    detail::Tables tables;
    std::unique_ptr<Journal> journal;
    std::uint64_t dropped_bytes = 0;

    int lock_fd = -1;

    ~Impl() {
        journal.reset();
        release_lock();
    }

    Result<void> acquire_lock() {
#ifndef _WIN32
        auto lock_path = dir / kLockName;
        lock_fd = ::open(lock_path.string().c_str(), O_RDWR | O_CREAT, 0644);
        if (lock_fd < 0) {
            return make_error(ErrorCode::Persistence,
                std::format("cannot open {}: {}", lock_path.string(), std::strerror(errno)));
        }
        if (::flock(lock_fd, LOCK_EX | LOCK_NB) != 0) {
            ::close(lock_fd);
            lock_fd = -1;
            return make_error(ErrorCode::Persistence,
                std::format("store {} is in use by another process", dir.string()));
        }
#endif
        return {};
    }

    void release_lock() noexcept {
#ifndef _WIN32
        if (lock_fd >= 0) {
            ::flock(lock_fd, LOCK_UN);
            ::close(lock_fd);
            lock_fd = -1;
        }
#endif
    }

    bool on_record(RecordKind kind, std::span<const std::byte> payload) {
        auto changes = decode_change_set(payload);
        if (!changes) return false;
        if (kind == RecordKind::Snapshot) {
            tables.clear();
        }
        apply(tables, std::move(*changes));
        return true;
    }

    Result<void> compact_locked() {
        ChangeSet image = collect(tables.types, tables.documents, tables.jobs);
        auto payload = encode_change_set(image);
        auto before = journal->size();
        if (auto rewritten = journal->rewrite(payload); !rewritten) {
            return rewritten;
        }
        DOCPRESS_LOG_I(kTag, "compacted journal {} -> {} bytes", before, journal->size());
        return {};
    }
};

Database::Database() : impl_(std::make_unique<Impl>()) {}

Database::~Database() = default;

Result<std::unique_ptr<Database>>
Database::open(const std::filesystem::path& dir, OpenMode mode, DatabaseOptions options) {
    if (dir.empty()) {
        return make_error(ErrorCode::Validation, "database directory cannot be empty");
    }

    auto db = std::unique_ptr<Database>(new Database());
    auto& impl = *db->impl_;
    impl.dir = dir;
    impl.mode = mode;
    impl.options = options;

    bool read_only = mode == OpenMode::ReadOnly;

    if (!read_only) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return make_error(ErrorCode::Persistence,
                std::format("cannot create {}: {}", dir.string(), ec.message()));
        }
        if (auto locked = impl.acquire_lock(); !locked) {
            return std::unexpected(std::move(locked.error()));
        }
    }

    Journal::ReplayStats stats;
    auto journal = Journal::open(dir / kJournalName, read_only,
        [&impl](RecordKind kind, std::span<const std::byte> payload) {
            return impl.on_record(kind, payload);
        },
        stats);
    if (!journal) {
        return std::unexpected(std::move(journal.error()));
    }
    impl.journal = std::move(*journal);
    impl.dropped_bytes = stats.dropped_bytes;

    DOCPRESS_LOG_I(kTag, "loaded {} types, {} documents, {} jobs from {}",
                   impl.tables.types.size(), impl.tables.documents.size(),
                   impl.tables.jobs.size(), dir.string());
    return db;
}

Transaction Database::begin() {
    return Transaction(impl_->tables, impl_->tables.last_job_id);
}

Result<void> Database::commit(Transaction& tx) {
    if (tx.empty()) {
        return {};
    }
    if (impl_->mode == OpenMode::ReadOnly) {
        return make_error(ErrorCode::Persistence, "database is open read-only");
    }

    ChangeSet changes = collect(tx.types_, tx.documents_, tx.jobs_);
    auto payload = encode_change_set(changes);

    if (auto appended = impl_->journal->append(RecordKind::ChangeSet, payload); !appended) {
        DOCPRESS_LOG_E(kTag, "commit failed: {}", appended.error().message);
        return appended;
    }

    apply(impl_->tables, std::move(changes));

    auto threshold = impl_->options.compact_threshold;
    if (threshold > 0 && impl_->journal->size() > threshold) {
        // Committed data is already durable; a failed compaction only costs space
        if (auto compacted = impl_->compact_locked(); !compacted) {
            DOCPRESS_LOG_W(kTag, "compaction failed: {}", compacted.error().message);
        }
    }
    return {};
}

std::optional<DocumentType> Database::type(TypeId id) const {
    std::lock_guard lock(mutex_);
    if (auto it = impl_->tables.types.find(id); it != impl_->tables.types.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<Document> Database::document(const DocumentId& id) const {
    std::lock_guard lock(mutex_);
    if (auto it = impl_->tables.documents.find(id); it != impl_->tables.documents.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<Job> Database::job(JobId id) const {
    std::lock_guard lock(mutex_);
    if (auto it = impl_->tables.jobs.find(id); it != impl_->tables.jobs.end()) {
        return it->second;
    }
    return std::nullopt;
}

Snapshot Database::snapshot() const {
    std::lock_guard lock(mutex_);
    auto image = collect(impl_->tables.types, impl_->tables.documents, impl_->tables.jobs);
    return Snapshot{std::move(image.types), std::move(image.documents), std::move(image.jobs)};
}

Result<void> Database::compact() {
    std::lock_guard lock(mutex_);
    if (impl_->mode == OpenMode::ReadOnly) {
        return make_error(ErrorCode::Persistence, "database is open read-only");
    }
    return impl_->compact_locked();
}

const std::filesystem::path& Database::directory() const noexcept {
    return impl_->dir;
}

bool Database::read_only() const noexcept {
    return impl_->mode == OpenMode::ReadOnly;
}

std::uint64_t Database::journal_size() const {
    std::lock_guard lock(mutex_);
    return impl_->journal ? impl_->journal->size() : 0;
}

std::uint64_t Database::recovered_tail_bytes() const noexcept {
    return impl_->dropped_bytes;
}

} // namespace docpress

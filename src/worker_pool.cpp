// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#include "docpress/worker_pool.hpp"
#include "docpress/document_store.hpp"
#include "docpress/log.hpp"

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <format>
#include <future>
#include <thread>
#include <variant>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace docpress {

namespace {

constexpr const char* kTag = "Worker";
constexpr const char* kNotEffective = "compression not effective";

struct Claim {
    Job job;
    std::optional<Document> document;
    std::string problem;   // Why the document could not enter processing
};

std::expected<void, CodecError> write_artifact(const std::filesystem::path& path,
                                               const std::vector<std::byte>& bytes) {
    auto fail = [&](std::string_view what) {
        return std::unexpected(CodecError{CodecErrorKind::IOError,
            std::format("{} {}: {}", what, path.string(), std::strerror(errno))});
    };

    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);

    auto part = path;
    part += ".part";

    std::FILE* file = std::fopen(part.string().c_str(), "wb");
    if (!file) {
        return fail("cannot create");
    }

    bool ok = std::fwrite(bytes.data(), 1, bytes.size(), file) == bytes.size()
           && std::fflush(file) == 0;
#ifndef _WIN32
    ok = ok && ::fsync(fileno(file)) == 0;
#endif
    int saved_errno = ok ? 0 : errno;
    if (std::fclose(file) != 0 && ok) {
        ok = false;
        saved_errno = errno;
    }

    if (!ok) {
        std::filesystem::remove(part, ec);
        errno = saved_errno;
        return fail("write failed on");
    }

    std::filesystem::rename(part, path, ec);
    if (ec) {
        std::filesystem::remove(part, ec);
        return std::unexpected(CodecError{CodecErrorKind::IOError,
            std::format("cannot publish {}: {}", path.string(), ec.message())});
    }
    return {};
}

} // anonymous namespace

// ============================================================================
// WorkerPool Implementation
// ============================================================================

struct WorkerPool::Impl {
    Database& db;
    PolicyRegistry& policies;
    CompressionQueue& queue;
    std::shared_ptr<ICodec> codec;
    WorkerOptions options;

    std::vector<std::thread> threads;
    std::atomic<bool> running{false};
    std::atomic<bool> stop_requested{false};

    std::atomic<std::uint64_t> compressed{0};
    std::atomic<std::uint64_t> skipped{0};
    std::atomic<std::uint64_t> retried{0};
    std::atomic<std::uint64_t> failed{0};
    std::atomic<std::uint64_t> abandoned{0};

    Impl(Database& db_, PolicyRegistry& policies_, CompressionQueue& queue_,
         std::shared_ptr<ICodec> codec_, WorkerOptions options_)
        : db(db_), policies(policies_), queue(queue_)
        , codec(std::move(codec_)), options(std::move(options_)) {
        if (options.worker_count == 0) options.worker_count = 1;
    }

    // ========================================================================
    // One job
    // ========================================================================

    JobOutcome run_once() {
        auto claim = db.transact([&](Transaction& tx) -> Result<std::optional<Claim>> {
            auto next = queue.dequeue(tx);
            if (!next) {
                return std::unexpected(std::move(next.error()));
            }
            if (!next->has_value()) {
                return std::optional<Claim>{};
            }
            Claim c{std::move(**next), std::nullopt, {}};
            if (auto doc = DocumentStore::mark_processing(tx, c.job.document_id)) {
                c.document = std::move(*doc);
            } else {
                c.problem = doc.error().to_string();
            }
            return std::optional<Claim>{std::move(c)};
        });

        if (!claim) {
            DOCPRESS_LOG_E(kTag, "claim failed: {}", claim.error().to_string());
            abandoned.fetch_add(1, std::memory_order_relaxed);
            return JobOutcome::Abandoned;
        }
        if (!claim->has_value()) {
            return JobOutcome::Idle;
        }

        auto& c = **claim;
        DOCPRESS_LOG_I(kTag, "job {} claimed for {} (priority {}, attempts {})",
                       c.job.id, c.job.document_id, priority_name(c.job.priority), c.job.attempts);

        if (!c.document) {
            return record_failure(c.job, false, c.problem);
        }
        return process(c.job, *c.document);
    }

    JobOutcome process(const Job& job, const Document& doc) {
        auto policy = policies.lookup(doc.type_id);
        if (!policy) {
            return record_failure(job, true, policy.error().to_string());
        }

        auto decision = PolicyRegistry::decide(doc, *policy);
        if (const auto* skip = std::get_if<SkipDecision>(&decision)) {
            return record_skip(job, doc, skip->reason);
        }
        const auto& plan = std::get<CompressDecision>(decision);

        auto bytes = run_codec(doc.original_path, plan.method, plan.level);
        if (!bytes) {
            return record_failure(job, true, bytes.error().to_string());
        }

        auto size = static_cast<std::int64_t>(bytes->size());
        if (size >= doc.size_bytes) {
            return record_skip(job, doc, kNotEffective);
        }

        auto path = artifact_path(options.artifact_dir, doc.id, plan.method);
        if (auto written = write_artifact(path, *bytes); !written) {
            return record_failure(job, true, written.error().to_string());
        }

        auto committed = db.transact([&](Transaction& tx) -> Result<void> {
            if (auto d = DocumentStore::mark_completed(tx, doc.id, path.string(), size); !d) {
                return std::unexpected(std::move(d.error()));
            }
            if (auto j = queue.complete(tx, job.id); !j) {
                return std::unexpected(std::move(j.error()));
            }
            return {};
        });

        if (!committed) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (committed.error().code == ErrorCode::Persistence) {
                DOCPRESS_LOG_E(kTag, "job {} abandoned: {}", job.id, committed.error().to_string());
                abandoned.fetch_add(1, std::memory_order_relaxed);
                return JobOutcome::Abandoned;
            }
            return record_failure(job, true, committed.error().to_string());
        }

        compressed.fetch_add(1, std::memory_order_relaxed);
        DOCPRESS_LOG_I(kTag, "job {} completed: {} {} -> {} bytes ({})",
                       job.id, doc.id, doc.size_bytes, size, method_name(plan.method));
        return JobOutcome::Compressed;
    }

    // ========================================================================
    // Codec with wall-clock timeout
    // ========================================================================

    CodecResult run_codec(const std::string& source, CompressionMethod method, int level) {
        auto promise = std::make_shared<std::promise<CodecResult>>();
        auto future = promise->get_future();

        // Detached: an overrunning codec cannot be interrupted, its result is dropped
        std::thread([codec = codec, promise, source, method, level] {
            try {
                promise->set_value(codec->compress(source, method, level));
            } catch (const std::exception& e) {
                promise->set_value(std::unexpected(CodecError{CodecErrorKind::IOError, e.what()}));
            }
        }).detach();

        if (future.wait_for(options.job_timeout) == std::future_status::timeout) {
            return std::unexpected(CodecError{CodecErrorKind::Timeout,
                std::format("codec exceeded {} ms", options.job_timeout.count())});
        }
        return future.get();
    }

    // ========================================================================
    // Outcomes
    // ========================================================================

    JobOutcome record_skip(const Job& job, const Document& doc, const std::string& reason) {
        auto committed = db.transact([&](Transaction& tx) -> Result<void> {
            if (auto d = DocumentStore::mark_skipped(tx, doc.id, reason); !d) {
                return std::unexpected(std::move(d.error()));
            }
            if (auto j = queue.complete(tx, job.id); !j) {
                return std::unexpected(std::move(j.error()));
            }
            return {};
        });

        if (!committed) {
            if (committed.error().code == ErrorCode::Persistence) {
                DOCPRESS_LOG_E(kTag, "job {} abandoned: {}", job.id, committed.error().to_string());
                abandoned.fetch_add(1, std::memory_order_relaxed);
                return JobOutcome::Abandoned;
            }
            return record_failure(job, true, committed.error().to_string());
        }

        skipped.fetch_add(1, std::memory_order_relaxed);
        DOCPRESS_LOG_I(kTag, "job {} skipped {}: {}", job.id, doc.id, reason);
        return JobOutcome::Skipped;
    }

    JobOutcome record_failure(const Job& job, bool has_document, const std::string& message) {
        auto result = db.transact([&](Transaction& tx) -> Result<Job> {
            auto updated = queue.fail_retry(tx, job.id, message);
            if (!updated) {
                return updated;
            }
            if (updated->status == JobStatus::Failed && has_document) {
                if (auto d = DocumentStore::mark_failed(tx, job.document_id, message); !d) {
                    DOCPRESS_LOG_W(kTag, "job {}: {}", job.id, d.error().to_string());
                }
            }
            return updated;
        });

        if (!result) {
            DOCPRESS_LOG_E(kTag, "job {} abandoned: {}", job.id, result.error().to_string());
            abandoned.fetch_add(1, std::memory_order_relaxed);
            return JobOutcome::Abandoned;
        }

        if (result->status == JobStatus::Queued) {
            retried.fetch_add(1, std::memory_order_relaxed);
            DOCPRESS_LOG_W(kTag, "job {} for {} failed attempt {}/{}: {}",
                           job.id, job.document_id, result->attempts,
                           queue.options().max_attempts, message);
            queue.notify_all();
            return JobOutcome::Retried;
        }

        failed.fetch_add(1, std::memory_order_relaxed);
        DOCPRESS_LOG_E(kTag, "job {} for {} failed after {} attempts: {}",
                       job.id, job.document_id, result->attempts, message);
        return JobOutcome::Failed;
    }

    // ========================================================================
    // Worker threads
    // ========================================================================

    void worker_loop(std::size_t index) {
        DOCPRESS_LOG_D(kTag, "worker {} started", index);
        while (!stop_requested.load(std::memory_order_acquire)) {
            auto seen = queue.work_generation();
            auto outcome = run_once();
            if (outcome == JobOutcome::Idle || outcome == JobOutcome::Abandoned) {
                if (stop_requested.load(std::memory_order_acquire)) break;
                queue.wait_for_work(seen, options.poll_interval);
            }
        }
        DOCPRESS_LOG_D(kTag, "worker {} stopped", index);
    }
};

WorkerPool::WorkerPool(Database& db, PolicyRegistry& policies, CompressionQueue& queue,
                       std::shared_ptr<ICodec> codec, WorkerOptions options)
    : impl_(std::make_unique<Impl>(db, policies, queue, std::move(codec), std::move(options))) {
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::start() {
    if (impl_->running.exchange(true, std::memory_order_acq_rel)) return;

    impl_->stop_requested.store(false, std::memory_order_release);
    for (std::size_t i = 0; i < impl_->options.worker_count; ++i) {
        impl_->threads.emplace_back([this, i] { impl_->worker_loop(i); });
    }
    DOCPRESS_LOG_I(kTag, "started {} workers", impl_->options.worker_count);
}

void WorkerPool::stop() {
    if (!impl_->running.load(std::memory_order_acquire)) return;

    impl_->stop_requested.store(true, std::memory_order_release);
    impl_->queue.notify_all();

    for (auto& thread : impl_->threads) {
        if (thread.joinable()) thread.join();
    }
    impl_->threads.clear();
    impl_->running.store(false, std::memory_order_release);
    DOCPRESS_LOG_I(kTag, "workers stopped");
}

bool WorkerPool::is_running() const noexcept {
    return impl_->running.load(std::memory_order_acquire);
}

JobOutcome WorkerPool::run_once() {
    return impl_->run_once();
}

std::size_t WorkerPool::drain() {
    std::size_t handled = 0;
    while (true) {
        auto outcome = impl_->run_once();
        if (outcome == JobOutcome::Idle || outcome == JobOutcome::Abandoned) break;
        ++handled;
    }
    return handled;
}

WorkerStats WorkerPool::stats() const noexcept {
    return WorkerStats{
        impl_->compressed.load(std::memory_order_relaxed),
        impl_->skipped.load(std::memory_order_relaxed),
        impl_->retried.load(std::memory_order_relaxed),
        impl_->failed.load(std::memory_order_relaxed),
        impl_->abandoned.load(std::memory_order_relaxed),
    };
}

std::filesystem::path WorkerPool::artifact_path(const std::filesystem::path& artifact_dir,
                                                const DocumentId& id, CompressionMethod method) {
    return artifact_dir / std::format("{}.{}", id, method_extension(method));
}

} // namespace docpress

// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#include "docpress/engine.hpp"
#include "docpress/log.hpp"

namespace docpress {

namespace {

constexpr const char* kTag = "Engine";

} // anonymous namespace

struct Engine::Impl {
    Config config;
    std::unique_ptr<Database> db;
    std::unique_ptr<DocumentStore> documents;
    std::unique_ptr<PolicyRegistry> policies;
    std::unique_ptr<CompressionQueue> queue;
    std::unique_ptr<StatsReporter> stats;
    std::unique_ptr<WorkerPool> workers;
    std::size_t recovered = 0;

    ~Impl() {
        // Workers reference everything else
        if (workers) workers->stop();
        workers.reset();
    }
};

Engine::Engine() : impl_(std::make_unique<Impl>()) {}

Engine::~Engine() = default;

Result<std::unique_ptr<Engine>> Engine::open(const Config& config, std::shared_ptr<ICodec> codec) {
    if (auto valid = config.validate_with_dirs(); !valid) {
        return make_error(ErrorCode::Validation, describe(valid.error()));
    }

    auto db = Database::open(config.data_dir, OpenMode::ReadWrite,
                             DatabaseOptions{config.journal_compact_bytes});
    if (!db) {
        return std::unexpected(std::move(db.error()));
    }

    auto engine = std::unique_ptr<Engine>(new Engine());
    auto& impl = *engine->impl_;
    impl.config = config;
    impl.db = std::move(*db);

    impl.documents = std::make_unique<DocumentStore>(*impl.db);
    impl.policies = std::make_unique<PolicyRegistry>(*impl.db);
    impl.queue = std::make_unique<CompressionQueue>(*impl.db, QueueOptions{
        config.max_attempts, config.retry_backoff, config.max_retry_backoff});
    impl.stats = std::make_unique<StatsReporter>(*impl.db);

    auto recovered = impl.queue->recover_orphans();
    if (!recovered) {
        return std::unexpected(std::move(recovered.error()));
    }
    impl.recovered = recovered->size();

    impl.workers = std::make_unique<WorkerPool>(*impl.db, *impl.policies, *impl.queue,
        codec ? std::move(codec) : make_builtin_codec(),
        WorkerOptions{config.worker_count, config.poll_interval, config.job_timeout,
                      config.effective_artifact_dir()});

    DOCPRESS_LOG_I(kTag, "opened {} ({} orphan jobs recovered)",
                   config.data_dir.string(), impl.recovered);
    return engine;
}

Result<DocumentType> Engine::register_type(const DocumentType& type) {
    return impl_->policies->register_type(type);
}

Result<Document> Engine::ingest(const DocumentMeta& meta, JobPriority priority) {
    auto doc = impl_->db->transact([&](Transaction& tx) -> Result<Document> {
        auto registered = DocumentStore::register_document(tx, meta);
        if (!registered) {
            return registered;
        }
        if (auto job = impl_->queue->enqueue(tx, registered->id, priority); !job) {
            return std::unexpected(std::move(job.error()));
        }
        return registered;
    });

    if (doc) {
        DOCPRESS_LOG_I(kTag, "ingested {} as {} ({} bytes, type {})",
                       meta.original_filename, doc->id, doc->size_bytes, doc->type_id);
        impl_->queue->notify_all();
    } else {
        DOCPRESS_LOG_W(kTag, "ingest of {} rejected: {}", meta.original_filename, doc.error().to_string());
    }
    return doc;
}

Result<Job> Engine::retry(const DocumentId& id, JobPriority priority) {
    return impl_->queue->enqueue(id, priority);
}

Result<Document> Engine::document(const DocumentId& id) const {
    return impl_->documents->get(id);
}

void Engine::start() {
    impl_->workers->start();
}

void Engine::stop() {
    impl_->workers->stop();
}

std::size_t Engine::drain() {
    return impl_->workers->drain();
}

Database& Engine::database() noexcept { return *impl_->db; }
DocumentStore& Engine::documents() noexcept { return *impl_->documents; }
PolicyRegistry& Engine::policies() noexcept { return *impl_->policies; }
CompressionQueue& Engine::queue() noexcept { return *impl_->queue; }
WorkerPool& Engine::workers() noexcept { return *impl_->workers; }
const StatsReporter& Engine::stats() const noexcept { return *impl_->stats; }
const Config& Engine::config() const noexcept { return impl_->config; }
std::size_t Engine::recovered_jobs() const noexcept { return impl_->recovered; }

} // namespace docpress

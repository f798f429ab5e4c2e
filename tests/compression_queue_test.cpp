// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#include "docpress/compression_queue.hpp"
#include "docpress/document_store.hpp"
#include "docpress/policy_registry.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace docpress {
namespace {

using namespace std::chrono_literals;

class CompressionQueueTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;
    std::unique_ptr<Database> db_;
    std::unique_ptr<DocumentStore> docs_;
    std::unique_ptr<CompressionQueue> queue_;
    std::shared_ptr<std::atomic<std::int64_t>> clock_micros_ =
        std::make_shared<std::atomic<std::int64_t>>(1'700'000'000'000'000);

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    (std::string("docpress_test_queue_") + info->name());
        std::filesystem::remove_all(test_dir_);
        reopen(QueueOptions{3, 0ms, 0ms});

        PolicyRegistry registry(*db_);
        DocumentType type;
        type.id = 1;
        type.name = "text";
        ASSERT_TRUE(registry.register_type(type).has_value());
    }

    void TearDown() override {
        queue_.reset();
        docs_.reset();
        db_.reset();
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    void reopen(QueueOptions options) {
        queue_.reset();
        docs_.reset();
        db_.reset();

        auto db = Database::open(test_dir_);
        ASSERT_TRUE(db.has_value()) << db.error().to_string();
        db_ = std::move(*db);
        docs_ = std::make_unique<DocumentStore>(*db_);
        auto micros = clock_micros_;
        queue_ = std::make_unique<CompressionQueue>(*db_, options,
            [micros] { return Timestamp::from_micros(micros->load()); });
    }

    void advance(std::chrono::microseconds delta) {
        clock_micros_->fetch_add(delta.count());
    }

    DocumentId add_document(const std::string& name = "notes.txt") {
        DocumentMeta meta;
        meta.original_filename = name;
        meta.mime_type = "text/plain";
        meta.size_bytes = 100'000;
        meta.original_path = "/in/" + name;
        meta.type_id = 1;
        auto doc = docs_->register_document(meta);
        EXPECT_TRUE(doc.has_value());
        return doc ? doc->id : DocumentId{};
    }

    Job claim() {
        auto job = queue_->dequeue();
        EXPECT_TRUE(job.has_value());
        EXPECT_TRUE(job && job->has_value());
        return job && job->has_value() ? **job : Job{};
    }
};

// ============================================================================
// Ordering
// ============================================================================

TEST_F(CompressionQueueTest, HigherPriorityFirst) {
    auto low = add_document("low.txt");
    auto high = add_document("high.txt");
    auto normal = add_document("normal.txt");

    ASSERT_TRUE(queue_->enqueue(low, JobPriority::Low).has_value());
    advance(1ms);
    ASSERT_TRUE(queue_->enqueue(high, JobPriority::High).has_value());
    advance(1ms);
    ASSERT_TRUE(queue_->enqueue(normal, JobPriority::Normal).has_value());

    EXPECT_EQ(claim().document_id, high);
    EXPECT_EQ(claim().document_id, normal);
    EXPECT_EQ(claim().document_id, low);

    auto empty = queue_->dequeue();
    ASSERT_TRUE(empty.has_value());
    EXPECT_FALSE(empty->has_value());
}

TEST_F(CompressionQueueTest, OldestFirstWithinPriority) {
    std::vector<DocumentId> order;
    for (int i = 0; i < 5; ++i) {
        order.push_back(add_document("f" + std::to_string(i) + ".txt"));
        ASSERT_TRUE(queue_->enqueue(order.back(), JobPriority::Normal).has_value());
        advance(10us);
    }

    for (const auto& expected : order) {
        EXPECT_EQ(claim().document_id, expected);
    }
}

TEST_F(CompressionQueueTest, SameInstantFallsBackToJobId) {
    auto a = add_document("a.txt");
    auto b = add_document("b.txt");
    auto first = queue_->enqueue(a);
    auto second = queue_->enqueue(b);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    ASSERT_EQ(first->queued_at, second->queued_at);
    EXPECT_LT(first->id, second->id);

    EXPECT_EQ(claim().id, first->id);
    EXPECT_EQ(claim().id, second->id);
}

TEST_F(CompressionQueueTest, DequeueMarksRunning) {
    auto doc = add_document();
    auto job = queue_->enqueue(doc);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->status, JobStatus::Queued);
    EXPECT_EQ(job->attempts, 0);

    auto claimed = claim();
    EXPECT_EQ(claimed.id, job->id);
    EXPECT_EQ(claimed.status, JobStatus::Running);
    ASSERT_TRUE(claimed.started_at.has_value());

    EXPECT_EQ(queue_->get(job->id)->status, JobStatus::Running);
}

// ============================================================================
// Enqueue Rules
// ============================================================================

TEST_F(CompressionQueueTest, DuplicateActiveJobRejected) {
    auto doc = add_document();
    ASSERT_TRUE(queue_->enqueue(doc).has_value());

    auto dup = queue_->enqueue(doc, JobPriority::High);
    ASSERT_FALSE(dup.has_value());
    EXPECT_EQ(dup.error().code, ErrorCode::DuplicateJob);

    claim();
    EXPECT_EQ(queue_->enqueue(doc).error().code, ErrorCode::DuplicateJob);
}

TEST_F(CompressionQueueTest, UnknownDocumentRejected) {
    auto job = queue_->enqueue("00000000-0000-4000-8000-000000000000");
    ASSERT_FALSE(job.has_value());
    EXPECT_EQ(job.error().code, ErrorCode::UnknownDocument);
}

TEST_F(CompressionQueueTest, CompletedDocumentCannotBeRequeued) {
    auto doc = add_document();
    ASSERT_TRUE(queue_->enqueue(doc).has_value());
    auto job = claim();
    ASSERT_TRUE(docs_->mark_processing(doc).has_value());
    ASSERT_TRUE(docs_->mark_completed(doc, "/out/x.gz", 10).has_value());
    ASSERT_TRUE(queue_->complete(job.id).has_value());

    auto again = queue_->enqueue(doc);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::InvalidTransition);
}

TEST_F(CompressionQueueTest, FailedDocumentRequeueResetsToPending) {
    auto doc = add_document();
    ASSERT_TRUE(docs_->mark_failed(doc, "IOError: gone").has_value());

    auto job = queue_->enqueue(doc);
    ASSERT_TRUE(job.has_value()) << job.error().to_string();

    auto stored = docs_->get(doc);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->compression_status, CompressionStatus::Pending);
    EXPECT_FALSE(stored->has_error);
}

TEST_F(CompressionQueueTest, ConcurrentEnqueueCreatesOneJob) {
    auto doc = add_document();

    constexpr int kThreads = 8;
    std::atomic<int> created{0};
    std::atomic<int> duplicates{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&] {
            auto job = queue_->enqueue(doc);
            if (job) {
                created.fetch_add(1);
            } else if (job.error().code == ErrorCode::DuplicateJob) {
                duplicates.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(created.load(), 1);
    EXPECT_EQ(duplicates.load(), kThreads - 1);
}

TEST_F(CompressionQueueTest, ConcurrentDequeueClaimsEachJobOnce) {
    constexpr int kJobs = 40;
    for (int i = 0; i < kJobs; ++i) {
        ASSERT_TRUE(queue_->enqueue(add_document("c" + std::to_string(i) + ".txt")).has_value());
    }

    std::mutex mutex;
    std::vector<JobId> claimed;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            while (true) {
                auto job = queue_->dequeue();
                if (!job || !job->has_value()) break;
                std::lock_guard lock(mutex);
                claimed.push_back((*job)->id);
            }
        });
    }
    for (auto& t : threads) t.join();

    std::set<JobId> unique(claimed.begin(), claimed.end());
    EXPECT_EQ(claimed.size(), static_cast<std::size_t>(kJobs));
    EXPECT_EQ(unique.size(), static_cast<std::size_t>(kJobs));
}

// ============================================================================
// Completion / Retry
// ============================================================================

TEST_F(CompressionQueueTest, CompleteTwiceIsRejected) {
    auto doc = add_document();
    ASSERT_TRUE(queue_->enqueue(doc).has_value());
    auto job = claim();

    auto done = queue_->complete(job.id);
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done->status, JobStatus::Completed);
    ASSERT_TRUE(done->completed_at.has_value());

    auto again = queue_->complete(job.id);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::InvalidTransition);
    EXPECT_EQ(queue_->get(job.id)->completed_at, done->completed_at);
}

TEST_F(CompressionQueueTest, CompleteRequiresRunning) {
    auto doc = add_document();
    auto job = queue_->enqueue(doc);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(queue_->complete(job->id).error().code, ErrorCode::InvalidTransition);
    EXPECT_EQ(queue_->complete(9999).error().code, ErrorCode::UnknownJob);
}

TEST_F(CompressionQueueTest, MarkRunningClaimsSpecificJob) {
    auto doc = add_document();
    auto job = queue_->enqueue(doc);
    ASSERT_TRUE(job.has_value());

    auto running = queue_->mark_running(job->id);
    ASSERT_TRUE(running.has_value());
    EXPECT_EQ(running->status, JobStatus::Running);
    ASSERT_TRUE(running->started_at.has_value());
    EXPECT_EQ(running->started_at->micros(), clock_micros_->load());

    EXPECT_EQ(queue_->mark_running(job->id).error().code, ErrorCode::InvalidTransition);
    EXPECT_EQ(queue_->mark_running(9999).error().code, ErrorCode::UnknownJob);

    auto next = queue_->dequeue();
    ASSERT_TRUE(next.has_value());
    EXPECT_FALSE(next->has_value());
    EXPECT_TRUE(queue_->complete(job->id).has_value());
}

TEST_F(CompressionQueueTest, RetriesUntilMaxAttempts) {
    auto doc = add_document();
    ASSERT_TRUE(queue_->enqueue(doc).has_value());

    auto first = queue_->fail_retry(claim().id, "IOError: 1");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->status, JobStatus::Queued);
    EXPECT_EQ(first->attempts, 1);

    auto second = queue_->fail_retry(claim().id, "IOError: 2");
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->status, JobStatus::Queued);
    EXPECT_EQ(second->attempts, 2);

    auto third = queue_->fail_retry(claim().id, "IOError: 3");
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(third->status, JobStatus::Failed);
    EXPECT_EQ(third->attempts, 3);
    EXPECT_EQ(third->error_message, "IOError: 3");
    EXPECT_TRUE(third->completed_at.has_value());

    auto empty = queue_->dequeue();
    ASSERT_TRUE(empty.has_value());
    EXPECT_FALSE(empty->has_value());
    EXPECT_FALSE(queue_->active_job(doc).has_value());
}

TEST_F(CompressionQueueTest, SuccessOnSecondAttemptKeepsOneFailure) {
    auto doc = add_document();
    ASSERT_TRUE(queue_->enqueue(doc).has_value());

    ASSERT_TRUE(queue_->fail_retry(claim().id, "Timeout").has_value());
    auto done = queue_->complete(claim().id);
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done->status, JobStatus::Completed);
    EXPECT_EQ(done->attempts, 1);
}

TEST_F(CompressionQueueTest, BackoffDelaysEligibility) {
    reopen(QueueOptions{3, 1000ms, 60'000ms});
    auto doc = add_document();
    ASSERT_TRUE(queue_->enqueue(doc).has_value());

    auto retried = queue_->fail_retry(claim().id, "IOError");
    ASSERT_TRUE(retried.has_value());
    EXPECT_EQ(retried->available_at, queue_->now() + 1000ms);

    auto early = queue_->dequeue();
    ASSERT_TRUE(early.has_value());
    EXPECT_FALSE(early->has_value());

    advance(999ms);
    EXPECT_FALSE(queue_->dequeue()->has_value());

    advance(1ms);
    auto ready = queue_->dequeue();
    ASSERT_TRUE(ready.has_value());
    ASSERT_TRUE(ready->has_value());
    EXPECT_EQ((*ready)->id, retried->id);
}

TEST_F(CompressionQueueTest, BackoffGrowsAndIsCapped) {
    CompressionQueue queue(*db_, QueueOptions{10, 2000ms, 10'000ms});
    EXPECT_EQ(queue.backoff_for(0), 0ms);
    EXPECT_EQ(queue.backoff_for(1), 2000ms);
    EXPECT_EQ(queue.backoff_for(2), 4000ms);
    EXPECT_EQ(queue.backoff_for(3), 8000ms);
    EXPECT_EQ(queue.backoff_for(4), 10'000ms);
    EXPECT_EQ(queue.backoff_for(40), 10'000ms);
}

// ============================================================================
// Priority Updates
// ============================================================================

TEST_F(CompressionQueueTest, UpdatePriorityReordersQueuedJob) {
    auto a = add_document("a.txt");
    auto b = add_document("b.txt");
    ASSERT_TRUE(queue_->enqueue(a, JobPriority::Normal).has_value());
    advance(1ms);
    ASSERT_TRUE(queue_->enqueue(b, JobPriority::Normal).has_value());

    auto changed = queue_->update_priority(b, JobPriority::High);
    ASSERT_TRUE(changed.has_value());
    EXPECT_TRUE(*changed);
    EXPECT_FALSE(*queue_->update_priority(b, JobPriority::High));

    EXPECT_EQ(claim().document_id, b);
    EXPECT_FALSE(*queue_->update_priority(b, JobPriority::Low));  // running
    EXPECT_EQ(claim().document_id, a);
}

TEST_F(CompressionQueueTest, BulkUpdatePriority) {
    std::vector<DocumentId> ids;
    for (int i = 0; i < 4; ++i) {
        ids.push_back(add_document("b" + std::to_string(i) + ".txt"));
        ASSERT_TRUE(queue_->enqueue(ids.back(), JobPriority::Low).has_value());
    }
    ids.push_back(add_document("unqueued.txt"));

    auto changed = queue_->bulk_update_priority(ids, JobPriority::High);
    ASSERT_TRUE(changed.has_value());
    EXPECT_EQ(*changed, 4u);

    for (int i = 0; i < 4; ++i) {
        EXPECT_EQ(claim().priority, JobPriority::High);
    }
}

// ============================================================================
// Recovery
// ============================================================================

TEST_F(CompressionQueueTest, RecoverOrphansRequeuesOnce) {
    auto doc = add_document();
    ASSERT_TRUE(queue_->enqueue(doc).has_value());
    auto running = claim();

    // Simulated crash: reopen with the job still running
    reopen(QueueOptions{3, 0ms, 0ms});

    auto recovered = queue_->recover_orphans();
    ASSERT_TRUE(recovered.has_value());
    ASSERT_EQ(recovered->size(), 1u);
    EXPECT_EQ((*recovered)[0].id, running.id);
    EXPECT_EQ((*recovered)[0].status, JobStatus::Queued);
    EXPECT_EQ((*recovered)[0].attempts, 1);

    auto second = queue_->recover_orphans();
    ASSERT_TRUE(second.has_value());
    EXPECT_TRUE(second->empty());

    EXPECT_EQ(claim().id, running.id);
}

TEST_F(CompressionQueueTest, RecoverOrphanWithExhaustedAttemptsFails) {
    reopen(QueueOptions{1, 0ms, 0ms});
    auto doc = add_document();
    ASSERT_TRUE(queue_->enqueue(doc).has_value());
    ASSERT_TRUE(docs_->mark_processing(doc).has_value());
    auto running = claim();

    reopen(QueueOptions{1, 0ms, 0ms});
    auto recovered = queue_->recover_orphans();
    ASSERT_TRUE(recovered.has_value());
    ASSERT_EQ(recovered->size(), 1u);
    EXPECT_EQ((*recovered)[0].status, JobStatus::Failed);

    auto stored = docs_->get(doc);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->compression_status, CompressionStatus::Failed);
    EXPECT_TRUE(stored->has_error);
    EXPECT_EQ(queue_->get(running.id)->status, JobStatus::Failed);
}

// ============================================================================
// Wake-up
// ============================================================================

TEST_F(CompressionQueueTest, WaitForWorkWakesOnEnqueue) {
    auto doc = add_document();
    auto seen = queue_->work_generation();

    std::thread producer([&] {
        std::this_thread::sleep_for(20ms);
        EXPECT_TRUE(queue_->enqueue(doc).has_value());
    });

    EXPECT_TRUE(queue_->wait_for_work(seen, 5000ms));
    producer.join();
}

TEST_F(CompressionQueueTest, WaitForWorkTimesOut) {
    auto seen = queue_->work_generation();
    EXPECT_FALSE(queue_->wait_for_work(seen, 20ms));
}

} // anonymous namespace
} // namespace docpress

// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#include "docpress/stats_reporter.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

namespace docpress {
namespace {

class StatsReporterTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;
    std::unique_ptr<Database> db_;
    std::unique_ptr<StatsReporter> stats_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    (std::string("docpress_test_stats_") + info->name());
        std::filesystem::remove_all(test_dir_);

        auto db = Database::open(test_dir_);
        ASSERT_TRUE(db.has_value()) << db.error().to_string();
        db_ = std::move(*db);
        stats_ = std::make_unique<StatsReporter>(*db_);
    }

    void TearDown() override {
        stats_.reset();
        db_.reset();
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    void put_type(TypeId id, const std::string& name) {
        ASSERT_TRUE(db_->transact([&](Transaction& tx) -> Result<void> {
            DocumentType type;
            type.id = id;
            type.name = name;
            tx.put(type);
            return {};
        }).has_value());
    }

    void put_document(const std::string& id, TypeId type_id, CompressionStatus status,
                      std::int64_t size, std::optional<std::int64_t> compressed = std::nullopt,
                      std::int64_t updated_micros = 0) {
        ASSERT_TRUE(db_->transact([&](Transaction& tx) -> Result<void> {
            Document doc;
            doc.id = id;
            doc.original_filename = id;
            doc.mime_type = "text/plain";
            doc.original_path = "/in/" + id;
            doc.type_id = type_id;
            doc.compression_status = status;
            doc.size_bytes = size;
            doc.compressed_size_bytes = compressed;
            if (compressed) doc.compressed_path = "/out/" + id + ".gz";
            doc.has_error = status == CompressionStatus::Failed;
            doc.updated_at = Timestamp::from_micros(updated_micros);
            tx.put(doc);
            return {};
        }).has_value());
    }

    void put_job(JobId id, const std::string& doc_id, JobStatus status, std::int64_t queued_micros,
                 std::int64_t available_micros = 0) {
        ASSERT_TRUE(db_->transact([&](Transaction& tx) -> Result<void> {
            Job job;
            job.id = id;
            job.document_id = doc_id;
            job.status = status;
            job.queued_at = Timestamp::from_micros(queued_micros);
            job.available_at = Timestamp::from_micros(available_micros);
            if (status == JobStatus::Completed || status == JobStatus::Failed) {
                job.completed_at = Timestamp::from_micros(queued_micros + 1000);
            }
            tx.put(job);
            return {};
        }).has_value());
    }
};

// ============================================================================
// Overview
// ============================================================================

TEST_F(StatsReporterTest, EmptyStore) {
    auto overview = stats_->overview();
    EXPECT_EQ(overview.total_documents, 0);
    EXPECT_EQ(overview.by_status.size(), 5u);
    EXPECT_DOUBLE_EQ(overview.savings_percent, 0.0);
    EXPECT_FALSE(overview.last_completed_at.has_value());
    EXPECT_TRUE(stats_->per_type_analysis().empty());
    EXPECT_TRUE(stats_->queue_snapshot().empty());
}

TEST_F(StatsReporterTest, OverviewCountsAndSavings) {
    put_type(1, "text");
    put_document("a", 1, CompressionStatus::Completed, 100'000, 25'000);
    put_document("b", 1, CompressionStatus::Completed, 50'000, 25'000);
    put_document("c", 1, CompressionStatus::Failed, 10'000);
    put_document("d", 1, CompressionStatus::Skipped, 500);
    put_document("e", 1, CompressionStatus::Pending, 2'000);
    put_job(1, "a", JobStatus::Completed, 1'000);
    put_job(2, "b", JobStatus::Completed, 5'000);

    auto overview = stats_->overview();
    EXPECT_EQ(overview.total_documents, 5);
    EXPECT_EQ(overview.count(CompressionStatus::Completed), 2);
    EXPECT_EQ(overview.count(CompressionStatus::Failed), 1);
    EXPECT_EQ(overview.count(CompressionStatus::Skipped), 1);
    EXPECT_EQ(overview.count(CompressionStatus::Pending), 1);
    EXPECT_EQ(overview.count(CompressionStatus::Processing), 0);

    EXPECT_EQ(overview.total_original_bytes, 162'500);
    EXPECT_EQ(overview.completed_original_bytes, 150'000);
    EXPECT_EQ(overview.total_compressed_bytes, 50'000);
    EXPECT_EQ(overview.space_saved_bytes, 100'000);
    EXPECT_NEAR(overview.savings_percent, 66.6667, 0.001);

    ASSERT_TRUE(overview.last_completed_at.has_value());
    EXPECT_EQ(overview.last_completed_at->micros(), 6'000);
}

TEST(SavingsPercentTest, Values) {
    EXPECT_DOUBLE_EQ(savings_percent(100'000, 25'000), 75.0);
    EXPECT_DOUBLE_EQ(savings_percent(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(savings_percent(100, 100), 0.0);
}

// ============================================================================
// Per-type analysis
// ============================================================================

TEST_F(StatsReporterTest, PerTypeSortedByCount) {
    put_type(1, "contracts");
    put_type(2, "scans");
    put_type(3, "unused");

    put_document("c1", 1, CompressionStatus::Completed, 40'000, 10'000);
    put_document("s1", 2, CompressionStatus::Completed, 10'000, 5'000);
    put_document("s2", 2, CompressionStatus::Failed, 20'000);
    put_document("s3", 2, CompressionStatus::Processing, 30'000);

    auto rows = stats_->per_type_analysis();
    ASSERT_EQ(rows.size(), 3u);

    EXPECT_EQ(rows[0].type.name, "scans");
    EXPECT_EQ(rows[0].document_count, 3);
    EXPECT_EQ(rows[0].compressed_count, 1);
    EXPECT_EQ(rows[0].failed_count, 1);
    EXPECT_EQ(rows[0].pending_count, 1);
    EXPECT_DOUBLE_EQ(rows[0].average_size, 20'000.0);
    EXPECT_DOUBLE_EQ(rows[0].savings_percent, 50.0);

    EXPECT_EQ(rows[1].type.name, "contracts");
    EXPECT_DOUBLE_EQ(rows[1].savings_percent, 75.0);

    EXPECT_EQ(rows[2].type.name, "unused");
    EXPECT_EQ(rows[2].document_count, 0);
    EXPECT_DOUBLE_EQ(rows[2].average_size, 0.0);
}

// ============================================================================
// Queue
// ============================================================================

TEST_F(StatsReporterTest, QueueSnapshotNewestFirst) {
    put_type(1, "text");
    for (int i = 1; i <= 25; ++i) {
        auto id = "d" + std::to_string(i);
        put_document(id, 1, CompressionStatus::Pending, 1'000);
        put_job(static_cast<JobId>(i), id, JobStatus::Queued, i * 100);
    }

    auto recent = stats_->queue_snapshot();
    ASSERT_EQ(recent.size(), 20u);
    EXPECT_EQ(recent.front().id, 25u);
    EXPECT_EQ(recent.back().id, 6u);

    EXPECT_EQ(stats_->queue_snapshot(3).size(), 3u);
}

TEST_F(StatsReporterTest, QueueStatusCountsBackoff) {
    put_type(1, "text");
    for (const char* id : {"a", "b", "c", "d", "e"}) {
        put_document(id, 1, CompressionStatus::Pending, 1'000);
    }
    auto far_future = Timestamp::now().micros() + 3'600'000'000LL;

    put_job(1, "a", JobStatus::Queued, 1);
    put_job(2, "b", JobStatus::Queued, 2, far_future);
    put_job(3, "c", JobStatus::Running, 3);
    put_job(4, "d", JobStatus::Completed, 4);
    put_job(5, "e", JobStatus::Failed, 5);

    auto status = stats_->queue_status();
    EXPECT_EQ(status.queued, 2);
    EXPECT_EQ(status.backing_off, 1);
    EXPECT_EQ(status.running, 1);
    EXPECT_EQ(status.completed, 1);
    EXPECT_EQ(status.failed, 1);
}

TEST_F(StatsReporterTest, FailedAndCompletedListsNewestFirst) {
    put_type(1, "text");
    put_document("old-fail", 1, CompressionStatus::Failed, 10, std::nullopt, 100);
    put_document("new-fail", 1, CompressionStatus::Failed, 10, std::nullopt, 300);
    put_document("done", 1, CompressionStatus::Completed, 10, 5, 200);

    auto failed = stats_->failed_documents();
    ASSERT_EQ(failed.size(), 2u);
    EXPECT_EQ(failed[0].id, "new-fail");
    EXPECT_EQ(failed[1].id, "old-fail");
    EXPECT_EQ(stats_->failed_documents(1).size(), 1u);

    auto completed = stats_->completed_documents();
    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed[0].id, "done");
}

} // anonymous namespace
} // namespace docpress

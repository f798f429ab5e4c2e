// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#include "docpress/policy_registry.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <variant>

namespace docpress {
namespace {

class PolicyRegistryTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;
    std::unique_ptr<Database> db_;
    std::unique_ptr<PolicyRegistry> registry_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    (std::string("docpress_test_policy_") + info->name());
        std::filesystem::remove_all(test_dir_);

        auto db = Database::open(test_dir_);
        ASSERT_TRUE(db.has_value()) << db.error().to_string();
        db_ = std::move(*db);
        registry_ = std::make_unique<PolicyRegistry>(*db_);
    }

    void TearDown() override {
        registry_.reset();
        db_.reset();
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    static DocumentType make_type(TypeId id, CompressionMethod method = CompressionMethod::Gzip,
                                  int level = 6, std::int64_t min_size = 1024) {
        DocumentType type;
        type.id = id;
        type.name = "type-" + std::to_string(id);
        type.compression_method = method;
        type.compression_level = level;
        type.min_size_for_compression = min_size;
        return type;
    }
};

// ============================================================================
// Registration / Lookup
// ============================================================================

TEST_F(PolicyRegistryTest, LookupRegisteredType) {
    ASSERT_TRUE(registry_->register_type(make_type(1, CompressionMethod::Zstd, 19, 2048)).has_value());

    auto policy = registry_->lookup(1);
    ASSERT_TRUE(policy.has_value());
    EXPECT_EQ(policy->type_id, 1);
    EXPECT_EQ(policy->method, CompressionMethod::Zstd);
    EXPECT_EQ(policy->level, 19);
    EXPECT_EQ(policy->min_size, 2048);
}

TEST_F(PolicyRegistryTest, LookupUnknownTypeFails) {
    auto policy = registry_->lookup(42);
    ASSERT_FALSE(policy.has_value());
    EXPECT_EQ(policy.error().code, ErrorCode::UnknownType);
}

TEST_F(PolicyRegistryTest, ReRegisterReplacesCachedPolicy) {
    ASSERT_TRUE(registry_->register_type(make_type(1, CompressionMethod::Gzip, 6)).has_value());
    ASSERT_EQ(registry_->lookup(1)->level, 6);

    ASSERT_TRUE(registry_->register_type(make_type(1, CompressionMethod::Gzip, 9)).has_value());
    EXPECT_EQ(registry_->lookup(1)->level, 9);
    EXPECT_EQ(registry_->list_types().size(), 1u);
}

TEST_F(PolicyRegistryTest, DirectStoreWriteNeedsInvalidate) {
    ASSERT_TRUE(registry_->register_type(make_type(1, CompressionMethod::Gzip, 6)).has_value());
    ASSERT_EQ(registry_->lookup(1)->level, 6);

    ASSERT_TRUE(db_->transact([](Transaction& tx) -> Result<void> {
        tx.put(make_type(1, CompressionMethod::Gzip, 2));
        return {};
    }).has_value());

    EXPECT_EQ(registry_->lookup(1)->level, 6);
    registry_->invalidate(1);
    EXPECT_EQ(registry_->lookup(1)->level, 2);
}

TEST_F(PolicyRegistryTest, RegisterValidatesType) {
    auto unnamed = make_type(1);
    unnamed.name.clear();
    EXPECT_EQ(registry_->register_type(unnamed).error().code, ErrorCode::Validation);

    EXPECT_EQ(registry_->register_type(make_type(2, CompressionMethod::Gzip, 12)).error().code,
              ErrorCode::Validation);
    EXPECT_EQ(registry_->register_type(make_type(3, CompressionMethod::Zstd, 0)).error().code,
              ErrorCode::Validation);
    EXPECT_EQ(registry_->register_type(make_type(4, CompressionMethod::Gzip, 6, -1)).error().code,
              ErrorCode::Validation);

    EXPECT_TRUE(registry_->register_type(make_type(5, CompressionMethod::Zstd, 22)).has_value());
    EXPECT_TRUE(registry_->register_type(make_type(6, CompressionMethod::None, 0)).has_value());
    EXPECT_EQ(registry_->list_types().size(), 2u);
}

TEST_F(PolicyRegistryTest, GetTypeRoundTrip) {
    ASSERT_TRUE(registry_->register_type(make_type(7, CompressionMethod::PdfOptimize, 3)).has_value());
    auto type = registry_->get_type(7);
    ASSERT_TRUE(type.has_value());
    EXPECT_EQ(type->name, "type-7");
    EXPECT_EQ(type->compression_method, CompressionMethod::PdfOptimize);

    EXPECT_EQ(registry_->get_type(8).error().code, ErrorCode::UnknownType);
}

// ============================================================================
// Decisions
// ============================================================================

TEST(PolicyDecisionTest, CompressesEligibleDocument) {
    Policy policy{1, 6, CompressionMethod::Gzip, 10'240};
    Document doc;
    doc.mime_type = "text/plain";
    doc.size_bytes = 1'000'000;

    auto decision = PolicyRegistry::decide(doc, policy);
    ASSERT_TRUE(std::holds_alternative<CompressDecision>(decision));
    EXPECT_EQ(std::get<CompressDecision>(decision).level, 6);
    EXPECT_EQ(std::get<CompressDecision>(decision).method, CompressionMethod::Gzip);
}

TEST(PolicyDecisionTest, SkipsBelowMinimumSize) {
    Policy policy{1, 6, CompressionMethod::Gzip, 10'240};
    Document doc;
    doc.mime_type = "text/plain";
    doc.size_bytes = 5'000;

    auto decision = PolicyRegistry::decide(doc, policy);
    ASSERT_TRUE(std::holds_alternative<SkipDecision>(decision));
    EXPECT_EQ(std::get<SkipDecision>(decision).reason, "size 5000 below minimum 10240");
}

TEST(PolicyDecisionTest, SizeEqualToMinimumCompresses) {
    Policy policy{1, 6, CompressionMethod::Gzip, 10'240};
    Document doc;
    doc.mime_type = "text/csv";
    doc.size_bytes = 10'240;
    EXPECT_TRUE(std::holds_alternative<CompressDecision>(PolicyRegistry::decide(doc, policy)));
}

TEST(PolicyDecisionTest, SkipsWhenMethodIsNone) {
    Policy policy{1, 0, CompressionMethod::None, 0};
    Document doc;
    doc.mime_type = "text/plain";
    doc.size_bytes = 1'000'000;

    auto decision = PolicyRegistry::decide(doc, policy);
    ASSERT_TRUE(std::holds_alternative<SkipDecision>(decision));
    EXPECT_EQ(std::get<SkipDecision>(decision).reason, "compression disabled for document type");
}

TEST(PolicyDecisionTest, SkipsIncompatibleMime) {
    Policy policy{1, 80, CompressionMethod::Lossy, 0};
    Document doc;
    doc.mime_type = "application/pdf";
    doc.size_bytes = 1'000'000;

    auto decision = PolicyRegistry::decide(doc, policy);
    ASSERT_TRUE(std::holds_alternative<SkipDecision>(decision));
    EXPECT_NE(std::get<SkipDecision>(decision).reason.find("not compressible"), std::string::npos);
}

TEST(PolicyDecisionTest, MimeMatchingIsCaseInsensitive) {
    EXPECT_TRUE(is_compressible(CompressionMethod::Gzip, "Text/HTML"));
    EXPECT_TRUE(is_compressible(CompressionMethod::Lossy, "IMAGE/JPEG"));
    EXPECT_TRUE(is_compressible(CompressionMethod::PdfOptimize, "application/pdf"));
    EXPECT_TRUE(is_compressible(CompressionMethod::OfficeOptimize,
        "application/vnd.openxmlformats-officedocument.wordprocessingml.document"));

    EXPECT_FALSE(is_compressible(CompressionMethod::Gzip, "image/jpeg"));
    EXPECT_FALSE(is_compressible(CompressionMethod::Zstd, "video/mp4"));
    EXPECT_FALSE(is_compressible(CompressionMethod::None, "text/plain"));
}

TEST(PolicyDecisionTest, LevelRanges) {
    EXPECT_EQ(level_range(CompressionMethod::Gzip), (std::pair<int, int>{1, 9}));
    EXPECT_EQ(level_range(CompressionMethod::Zstd), (std::pair<int, int>{1, 22}));
    EXPECT_EQ(level_range(CompressionMethod::Lossy), (std::pair<int, int>{1, 100}));
}

} // anonymous namespace
} // namespace docpress

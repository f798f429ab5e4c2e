// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#include "row_codec.hpp"


namespace docpress {

// ============================================================================
// ByteWriter / ByteReader
// ============================================================================

void ByteWriter::put_u32(std::uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        buf_.push_back(static_cast<std::byte>((value >> (8 * i)) & 0xFF));
    }
}

void ByteWriter::put_u64(std::uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        buf_.push_back(static_cast<std::byte>((value >> (8 * i)) & 0xFF));
    }
}

void ByteWriter::put_string(std::string_view value) {
    put_u32(static_cast<std::uint32_t>(value.size()));
    const auto* bytes = reinterpret_cast<const std::byte*>(value.data());
    buf_.insert(buf_.end(), bytes, bytes + value.size());
}

bool ByteReader::ensure(std::size_t n) noexcept {
    if (!ok_ || data_.size() - pos_ < n) {
        ok_ = false;
        return false;
    }
    return true;
}

std::uint8_t ByteReader::get_u8() noexcept {
    if (!ensure(1)) return 0;
    return static_cast<std::uint8_t>(data_[pos_++]);
}

std::uint32_t ByteReader::get_u32() noexcept {
    if (!ensure(4)) return 0;
    std::uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= static_cast<std::uint32_t>(data_[pos_++]) << (8 * i);
    }
    return value;
}

std::uint64_t ByteReader::get_u64() noexcept {
    if (!ensure(8)) return 0;
    std::uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<std::uint64_t>(data_[pos_++]) << (8 * i);
    }
    return value;
}

std::string ByteReader::get_string() {
    auto len = get_u32();
    if (!ensure(len)) return {};
    std::string value(reinterpret_cast<const char*>(data_.data() + pos_), len);
    pos_ += len;
    return value;
}

// ============================================================================
// Rows
// ============================================================================

namespace {

template<typename E>
E get_enum(ByteReader& in, std::uint8_t max_value) {
    auto raw = in.get_u8();
    if (raw > max_value) {
        in.fail();
    }
    return static_cast<E>(raw);
}

JobPriority get_priority(ByteReader& in) {
    auto raw = in.get_u8();
    switch (static_cast<JobPriority>(raw)) {
        case JobPriority::Low:
        case JobPriority::Normal:
        case JobPriority::High:
            return static_cast<JobPriority>(raw);
    }
    in.fail();
    return JobPriority::Normal;
}

std::optional<std::string> get_optional_string(ByteReader& in) {
    if (!in.get_bool()) return std::nullopt;
    return in.get_string();
}

DocumentType decode_type(ByteReader& in) {
    DocumentType type;
    type.id = in.get_i64();
    type.name = in.get_string();
    type.compression_level = static_cast<int>(static_cast<std::int32_t>(in.get_u32()));
    type.compression_method = get_enum<CompressionMethod>(
        in, static_cast<std::uint8_t>(CompressionMethod::OfficeOptimize));
    type.min_size_for_compression = in.get_i64();
    return type;
}

Document decode_document(ByteReader& in) {
    Document doc;
    doc.id = in.get_string();
    doc.original_filename = in.get_string();
    doc.mime_type = in.get_string();
    doc.size_bytes = in.get_i64();
    if (in.get_bool()) doc.compressed_size_bytes = in.get_i64();
    doc.original_path = in.get_string();
    doc.compressed_path = get_optional_string(in);
    doc.compression_status = get_enum<CompressionStatus>(
        in, static_cast<std::uint8_t>(CompressionStatus::Skipped));
    doc.has_error = in.get_bool();
    doc.error_message = get_optional_string(in);
    doc.skip_reason = get_optional_string(in);
    doc.type_id = in.get_i64();
    doc.created_at = in.get_timestamp();
    doc.updated_at = in.get_timestamp();
    return doc;
}

Job decode_job(ByteReader& in) {
    Job job;
    job.id = in.get_u64();
    job.document_id = in.get_string();
    job.priority = get_priority(in);
    job.status = get_enum<JobStatus>(in, static_cast<std::uint8_t>(JobStatus::Failed));
    job.queued_at = in.get_timestamp();
    if (in.get_bool()) job.started_at = in.get_timestamp();
    if (in.get_bool()) job.completed_at = in.get_timestamp();
    job.available_at = in.get_timestamp();
    job.attempts = static_cast<int>(static_cast<std::int32_t>(in.get_u32()));
    job.error_message = get_optional_string(in);
    return job;
}

} // anonymous namespace

void encode_row(ByteWriter& out, const DocumentType& type) {
    out.put_u8(static_cast<std::uint8_t>(RowTag::Type));
    out.put_i64(type.id);
    out.put_string(type.name);
    out.put_u32(static_cast<std::uint32_t>(type.compression_level));
    out.put_u8(static_cast<std::uint8_t>(type.compression_method));
    out.put_i64(type.min_size_for_compression);
}

void encode_row(ByteWriter& out, const Document& doc) {
    auto put_str = [&](const std::string& s) { out.put_string(s); };
    out.put_u8(static_cast<std::uint8_t>(RowTag::Document));
    out.put_string(doc.id);
    out.put_string(doc.original_filename);
    out.put_string(doc.mime_type);
    out.put_i64(doc.size_bytes);
    out.put_optional(doc.compressed_size_bytes, [&](std::int64_t v) { out.put_i64(v); });
    out.put_string(doc.original_path);
    out.put_optional(doc.compressed_path, put_str);
    out.put_u8(static_cast<std::uint8_t>(doc.compression_status));
    out.put_bool(doc.has_error);
    out.put_optional(doc.error_message, put_str);
    out.put_optional(doc.skip_reason, put_str);
    out.put_i64(doc.type_id);
    out.put_timestamp(doc.created_at);
    out.put_timestamp(doc.updated_at);
}

void encode_row(ByteWriter& out, const Job& job) {
    auto put_ts = [&](const Timestamp& ts) { out.put_timestamp(ts); };
    out.put_u8(static_cast<std::uint8_t>(RowTag::Job));
    out.put_u64(job.id);
    out.put_string(job.document_id);
    out.put_u8(static_cast<std::uint8_t>(job.priority));
    out.put_u8(static_cast<std::uint8_t>(job.status));
    out.put_timestamp(job.queued_at);
    out.put_optional(job.started_at, put_ts);
    out.put_optional(job.completed_at, put_ts);
    out.put_timestamp(job.available_at);
    out.put_u32(static_cast<std::uint32_t>(job.attempts));
    out.put_optional(job.error_message, [&](const std::string& s) { out.put_string(s); });
}

std::vector<std::byte> encode_change_set(const ChangeSet& changes) {
    ByteWriter out;
    // Types first so replay never sees a document before its type
    for (const auto& type : changes.types) encode_row(out, type);
    for (const auto& doc : changes.documents) encode_row(out, doc);
    for (const auto& job : changes.jobs) encode_row(out, job);
    return out.take();
}

std::optional<ChangeSet> decode_change_set(std::span<const std::byte> payload) {
    ChangeSet changes;
    ByteReader in(payload);

    while (in.ok() && !in.at_end()) {
        switch (static_cast<RowTag>(in.get_u8())) {
            case RowTag::Type:
                changes.types.push_back(decode_type(in));
                break;
            case RowTag::Document:
                changes.documents.push_back(decode_document(in));
                break;
            case RowTag::Job:
                changes.jobs.push_back(decode_job(in));
                break;
            default:
                in.fail();
                break;
        }
    }

    if (!in.ok()) {
        return std::nullopt;
    }
    return changes;
}

} // namespace docpress

// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace docpress {

// ============================================================================
// Timestamp
// ============================================================================

struct Timestamp {
    std::int64_t tv_sec = 0;   // Seconds since epoch
    std::int64_t tv_usec = 0;  // Microseconds

    static Timestamp now() noexcept {
        auto tp = std::chrono::system_clock::now();
        return from_micros(
            std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count());
    }

    [[nodiscard]] static constexpr Timestamp from_micros(std::int64_t micros) noexcept {
        return {micros / 1'000'000, micros % 1'000'000};
    }

    [[nodiscard]] constexpr std::int64_t micros() const noexcept {
        return tv_sec * 1'000'000 + tv_usec;
    }

    [[nodiscard]] constexpr Timestamp operator+(std::chrono::microseconds delta) const noexcept {
        return from_micros(micros() + delta.count());
    }

    constexpr auto operator<=>(const Timestamp&) const = default;
};

// ============================================================================
// Identifiers
// ============================================================================

using DocumentId = std::string;     // RFC-4122 v4 UUID text
using TypeId = std::int64_t;        // Chosen by the administrator
using JobId = std::uint64_t;        // Monotonic, restored from the journal

// ============================================================================
// Compression Status (document)
// ============================================================================

enum class CompressionStatus : std::uint8_t {
    Pending = 0,
    Processing,
    Completed,
    Failed,
    Skipped
};

inline constexpr CompressionStatus kAllCompressionStatuses[] = {
    CompressionStatus::Pending,
    CompressionStatus::Processing,
    CompressionStatus::Completed,
    CompressionStatus::Failed,
    CompressionStatus::Skipped,
};

[[nodiscard]] constexpr std::string_view status_name(CompressionStatus status) noexcept {
    switch (status) {
        case CompressionStatus::Pending:    return "pending";
        case CompressionStatus::Processing: return "processing";
        case CompressionStatus::Completed:  return "completed";
        case CompressionStatus::Failed:     return "failed";
        case CompressionStatus::Skipped:    return "skipped";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(CompressionStatus status) noexcept {
    return status == CompressionStatus::Completed ||
           status == CompressionStatus::Failed ||
           status == CompressionStatus::Skipped;
}

// ============================================================================
// Compression Method (closed set, per document type)
// ============================================================================

enum class CompressionMethod : std::uint8_t {
    None = 0,
    Gzip,
    Zstd,
    Lossy,           // Image re-encoding, external codec
    PdfOptimize,     // External codec
    OfficeOptimize   // External codec
};

[[nodiscard]] constexpr std::string_view method_name(CompressionMethod method) noexcept {
    switch (method) {
        case CompressionMethod::None:           return "none";
        case CompressionMethod::Gzip:           return "gzip";
        case CompressionMethod::Zstd:           return "zstd";
        case CompressionMethod::Lossy:          return "lossy";
        case CompressionMethod::PdfOptimize:    return "pdf_optimize";
        case CompressionMethod::OfficeOptimize: return "office_optimize";
    }
    return "unknown";
}

/// Artifact file extension for a method (without the dot)
[[nodiscard]] constexpr std::string_view method_extension(CompressionMethod method) noexcept {
    switch (method) {
        case CompressionMethod::None:           return "bin";
        case CompressionMethod::Gzip:           return "gz";
        case CompressionMethod::Zstd:           return "zst";
        case CompressionMethod::Lossy:          return "lossy";
        case CompressionMethod::PdfOptimize:    return "pdf";
        case CompressionMethod::OfficeOptimize: return "office";
    }
    return "bin";
}

[[nodiscard]] std::optional<CompressionMethod> parse_method(std::string_view text) noexcept;

// ============================================================================
// Job Priority / Status
// ============================================================================

enum class JobPriority : std::uint8_t {
    Low = 1,
    Normal = 5,
    High = 10
};

[[nodiscard]] constexpr std::string_view priority_name(JobPriority priority) noexcept {
    switch (priority) {
        case JobPriority::Low:    return "low";
        case JobPriority::Normal: return "normal";
        case JobPriority::High:   return "high";
    }
    return "unknown";
}

[[nodiscard]] std::optional<JobPriority> parse_priority(std::string_view text) noexcept;

enum class JobStatus : std::uint8_t {
    Queued = 0,
    Running,
    Completed,
    Failed
};

[[nodiscard]] constexpr std::string_view job_status_name(JobStatus status) noexcept {
    switch (status) {
        case JobStatus::Queued:    return "queued";
        case JobStatus::Running:   return "running";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed:    return "failed";
    }
    return "unknown";
}

/// Queued and running jobs are active; at most one exists per document
[[nodiscard]] constexpr bool is_active(JobStatus status) noexcept {
    return status == JobStatus::Queued || status == JobStatus::Running;
}

// ============================================================================
// Rows
// ============================================================================

struct DocumentType {
    TypeId id = 0;
    std::string name;
    int compression_level = 6;
    CompressionMethod compression_method = CompressionMethod::Gzip;
    std::int64_t min_size_for_compression = 10240;  // bytes
};

struct Document {
    DocumentId id;
    std::string original_filename;
    std::string mime_type;
    std::int64_t size_bytes = 0;
    std::optional<std::int64_t> compressed_size_bytes;
    std::string original_path;
    std::optional<std::string> compressed_path;
    CompressionStatus compression_status = CompressionStatus::Pending;
    bool has_error = false;
    std::optional<std::string> error_message;
    std::optional<std::string> skip_reason;
    TypeId type_id = 0;
    Timestamp created_at{};
    Timestamp updated_at{};
};

/// Caller-supplied metadata for registering a document
struct DocumentMeta {
    std::string original_filename;
    std::string mime_type;
    std::int64_t size_bytes = 0;
    std::string original_path;
    TypeId type_id = 0;
};

struct Job {
    JobId id = 0;
    DocumentId document_id;
    JobPriority priority = JobPriority::Normal;
    JobStatus status = JobStatus::Queued;
    Timestamp queued_at{};
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> completed_at;
    Timestamp available_at{};  // Not eligible for dequeue before this instant
    int attempts = 0;          // Failed attempts, never the final success
    std::optional<std::string> error_message;
};

} // namespace docpress

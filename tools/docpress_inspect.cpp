// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors
//
// docpress_inspect - Read-only report over a docpress store
//
// Prints status totals, recent completions and failures, the job queue,
// per-type analysis and a scan of the artifact directory.
//
// Usage:
//   docpress_inspect <data_dir> [--limit N] [--artifacts <dir>]

#include <docpress/database.hpp>
#include <docpress/stats_reporter.hpp>

#include "utils.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using namespace docpress;

// ============================================================================
// Utilities
// ============================================================================

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "docpress_inspect - Report on a docpress store (read-only)\n\n"
        "Usage:\n"
        "  %s <data_dir> [options]\n\n"
        "Options:\n"
        "  -n, --limit <N>        Rows per listing (default 10)\n"
        "  -a, --artifacts <dir>  Artifact directory (default <data_dir>/compressed)\n"
        "  -h, --help             Show this help message\n",
        prog);
}

static void print_rule(const char* title) {
    std::printf("\n== %s ", title);
    for (std::size_t i = std::strlen(title); i < 60; ++i) std::putchar('=');
    std::putchar('\n');
}

static std::string short_id(const std::string& id) {
    return id.size() > 8 ? id.substr(0, 8) : id;
}

// ============================================================================
// Sections
// ============================================================================

static void print_overview(const StatsReporter& stats) {
    auto overview = stats.overview();
    print_rule("Overview");

    std::printf("  documents:        %lld\n", static_cast<long long>(overview.total_documents));
    std::printf("  original size:    %s\n", format_bytes(overview.total_original_bytes).c_str());
    std::printf("  compressed size:  %s\n", format_bytes(overview.total_compressed_bytes).c_str());
    std::printf("  space saved:      %s (%.1f%%)\n",
                format_bytes(overview.space_saved_bytes).c_str(), overview.savings_percent);
    if (overview.last_completed_at) {
        std::printf("  last completion:  %s\n", format_timestamp(*overview.last_completed_at).c_str());
    }

    std::printf("\n  %-12s %8s %14s %14s\n", "status", "count", "original", "compressed");
    for (const auto& entry : overview.by_status) {
        std::printf("  %-12s %8lld %14s %14s\n",
                    std::string(status_name(entry.status)).c_str(),
                    static_cast<long long>(entry.count),
                    format_bytes(entry.original_bytes).c_str(),
                    format_bytes(entry.compressed_bytes).c_str());
    }
}

static void print_completed(const StatsReporter& stats, std::size_t limit) {
    print_rule("Recently completed");
    auto docs = stats.completed_documents(limit);
    if (docs.empty()) {
        std::printf("  (none)\n");
        return;
    }
    for (const auto& doc : docs) {
        auto compressed = doc.compressed_size_bytes.value_or(0);
        std::printf("  %s  %-32s %12s -> %-12s %5.1f%%\n",
                    short_id(doc.id).c_str(), doc.original_filename.c_str(),
                    format_bytes(doc.size_bytes).c_str(), format_bytes(compressed).c_str(),
                    savings_percent(doc.size_bytes, compressed));
    }
}

static void print_failed(const StatsReporter& stats, std::size_t limit) {
    print_rule("Failed");
    auto docs = stats.failed_documents(limit);
    if (docs.empty()) {
        std::printf("  (none)\n");
        return;
    }
    for (const auto& doc : docs) {
        std::printf("  %s  %-32s %s\n", short_id(doc.id).c_str(), doc.original_filename.c_str(),
                    doc.error_message.value_or("").c_str());
    }
}

static void print_queue(const StatsReporter& stats, std::size_t limit) {
    auto status = stats.queue_status();
    print_rule("Queue");
    std::printf("  queued %lld (backing off %lld), running %lld, completed %lld, failed %lld\n\n",
                static_cast<long long>(status.queued), static_cast<long long>(status.backing_off),
                static_cast<long long>(status.running), static_cast<long long>(status.completed),
                static_cast<long long>(status.failed));

    for (const auto& job : stats.queue_snapshot(limit)) {
        std::printf("  #%-6llu %s  %-7s %-9s attempts %d  queued %s\n",
                    static_cast<unsigned long long>(job.id), short_id(job.document_id).c_str(),
                    std::string(priority_name(job.priority)).c_str(),
                    std::string(job_status_name(job.status)).c_str(),
                    job.attempts, format_timestamp(job.queued_at).c_str());
        if (job.error_message) {
            std::printf("          last error: %s\n", job.error_message->c_str());
        }
    }
}

static void print_types(const StatsReporter& stats) {
    print_rule("Document types");
    auto rows = stats.per_type_analysis();
    if (rows.empty()) {
        std::printf("  (none)\n");
        return;
    }
    std::printf("  %-4s %-20s %-15s %6s %6s %6s %6s %12s %8s\n",
                "id", "name", "method", "docs", "done", "skip", "fail", "avg size", "saved");
    for (const auto& row : rows) {
        std::printf("  %-4lld %-20s %-15s %6lld %6lld %6lld %6lld %12s %7.1f%%\n",
                    static_cast<long long>(row.type.id), row.type.name.c_str(),
                    std::string(method_name(row.type.compression_method)).c_str(),
                    static_cast<long long>(row.document_count),
                    static_cast<long long>(row.compressed_count),
                    static_cast<long long>(row.skipped_count),
                    static_cast<long long>(row.failed_count),
                    format_bytes(static_cast<std::int64_t>(row.average_size)).c_str(),
                    row.savings_percent);
    }
}

static void print_artifacts(const fs::path& dir) {
    print_rule("Artifacts");
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        std::printf("  %s does not exist\n", dir.string().c_str());
        return;
    }

    std::size_t files = 0;
    std::size_t partial = 0;
    std::uintmax_t bytes = 0;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file()) continue;
        if (entry.path().extension() == ".part") {
            ++partial;
            continue;
        }
        ++files;
        bytes += entry.file_size(ec);
    }
    std::printf("  %s: %zu file(s), %s", dir.string().c_str(), files,
                format_bytes(static_cast<std::int64_t>(bytes)).c_str());
    if (partial > 0) {
        std::printf(", %zu unfinished .part file(s)", partial);
    }
    std::putchar('\n');
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    fs::path data_dir;
    fs::path artifact_dir;
    std::size_t limit = 10;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }

        if (std::strcmp(arg, "-n") == 0 || std::strcmp(arg, "--limit") == 0) {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "Missing value for %s\n", arg);
                return 1;
            }
            limit = static_cast<std::size_t>(std::strtoul(argv[++i], nullptr, 10));
            continue;
        }

        if (std::strcmp(arg, "-a") == 0 || std::strcmp(arg, "--artifacts") == 0) {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "Missing value for %s\n", arg);
                return 1;
            }
            artifact_dir = argv[++i];
            continue;
        }

        if (!data_dir.empty()) {
            std::fprintf(stderr, "Unexpected argument: %s\n", arg);
            return 1;
        }
        data_dir = arg;
    }

    if (data_dir.empty()) {
        std::fprintf(stderr, "Missing data directory\n");
        print_usage(argv[0]);
        return 1;
    }
    if (artifact_dir.empty()) {
        artifact_dir = data_dir / "compressed";
    }

    auto db = Database::open(data_dir, OpenMode::ReadOnly);
    if (!db) {
        std::fprintf(stderr, "[ERROR] %s\n", db.error().to_string().c_str());
        return 1;
    }

    std::printf("docpress store %s (journal %s)\n", data_dir.string().c_str(),
                format_bytes(static_cast<std::int64_t>((*db)->journal_size())).c_str());
    if ((*db)->recovered_tail_bytes() > 0) {
        std::printf("warning: %llu byte torn journal tail ignored\n",
                    static_cast<unsigned long long>((*db)->recovered_tail_bytes()));
    }

    StatsReporter stats(**db);
    print_overview(stats);
    print_completed(stats, limit);
    print_failed(stats, limit);
    print_queue(stats, limit);
    print_types(stats);
    print_artifacts(artifact_dir);
    return 0;
}

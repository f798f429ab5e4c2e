// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors
//
// docpress_run - Register types, ingest files and run the compression workers
//
// Usage:
//   docpress_run <data_dir> [--workers N] [--once]
//                [--type id:name:method:level:min_size]...
//                [--ingest type_id:path[:priority]]...

#include <docpress/engine.hpp>
#include <docpress/log.hpp>

#include "utils.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace docpress;

// ============================================================================
// Global Options
// ============================================================================

static std::atomic<bool> g_stop{false};

struct IngestRequest {
    TypeId type_id = 0;
    fs::path path;
    JobPriority priority = JobPriority::Normal;
};

// ============================================================================
// Utilities
// ============================================================================

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "docpress_run - Compress documents into a docpress store\n\n"
        "Usage:\n"
        "  %s <data_dir> [options]\n\n"
        "Options:\n"
        "  -w, --workers <N>                      Worker threads (default 2)\n"
        "  -1, --once                             Drain the queue once and exit\n"
        "  -t, --type id:name:method:level:min    Register or replace a document type\n"
        "  -i, --ingest type_id:path[:priority]   Ingest a file (priority low|normal|high)\n"
        "  -v, --verbose                          Debug logging\n"
        "  -h, --help                             Show this help message\n\n"
        "Methods: none, gzip, zstd, lossy, pdf_optimize, office_optimize\n\n"
        "Examples:\n"
        "  %s ./store -t 1:reports:gzip:6:10240 -i 1:q3.csv --once\n"
        "  %s ./store --workers 4               # run until Ctrl-C\n",
        prog, prog, prog);
}

static void on_signal(int) {
    g_stop.store(true);
}

static std::vector<std::string_view> split(std::string_view text, char sep) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        auto pos = text.find(sep, start);
        parts.push_back(text.substr(start, pos - start));
        if (pos == std::string_view::npos) break;
        start = pos + 1;
    }
    return parts;
}

static bool parse_int(std::string_view text, long long& out) {
    std::string s(text);
    char* end = nullptr;
    errno = 0;
    out = std::strtoll(s.c_str(), &end, 10);
    return !s.empty() && errno == 0 && end && *end == '\0';
}

static bool parse_type(std::string_view text, DocumentType& out) {
    auto parts = split(text, ':');
    if (parts.size() != 5) return false;

    long long id = 0, level = 0, min_size = 0;
    auto method = parse_method(parts[2]);
    if (!parse_int(parts[0], id) || !parse_int(parts[3], level) ||
        !parse_int(parts[4], min_size) || !method || parts[1].empty()) {
        return false;
    }

    out.id = id;
    out.name = std::string(parts[1]);
    out.compression_method = *method;
    out.compression_level = static_cast<int>(level);
    out.min_size_for_compression = min_size;
    return true;
}

static bool parse_ingest(std::string_view text, IngestRequest& out) {
    auto colon = text.find(':');
    if (colon == std::string_view::npos) return false;

    long long type_id = 0;
    if (!parse_int(text.substr(0, colon), type_id)) return false;
    out.type_id = type_id;

    auto rest = text.substr(colon + 1);
    if (auto last = rest.rfind(':'); last != std::string_view::npos) {
        if (auto priority = parse_priority(rest.substr(last + 1))) {
            out.priority = *priority;
            rest = rest.substr(0, last);
        }
    }
    out.path = fs::path(std::string(rest));
    return !rest.empty();
}

// Best-effort MIME type from the file extension
static std::string guess_mime(const fs::path& path) {
    struct Entry { const char* ext; const char* mime; };
    static constexpr Entry kTable[] = {
        {".txt",  "text/plain"},
        {".log",  "text/plain"},
        {".csv",  "text/csv"},
        {".html", "text/html"},
        {".htm",  "text/html"},
        {".json", "application/json"},
        {".xml",  "application/xml"},
        {".sql",  "application/sql"},
        {".rtf",  "application/rtf"},
        {".tar",  "application/x-tar"},
        {".pdf",  "application/pdf"},
        {".doc",  "application/msword"},
        {".xls",  "application/vnd.ms-excel"},
        {".ppt",  "application/vnd.ms-powerpoint"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
        {".jpg",  "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".png",  "image/png"},
        {".webp", "image/webp"},
        {".bmp",  "image/bmp"},
        {".tif",  "image/tiff"},
        {".tiff", "image/tiff"},
        {".svg",  "image/svg+xml"},
        {".zip",  "application/zip"},
        {".gz",   "application/gzip"},
        {".mp4",  "video/mp4"},
    };

    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& entry : kTable) {
        if (ext == entry.ext) return entry.mime;
    }
    return "application/octet-stream";
}

static void print_summary(const Engine& engine) {
    auto overview = engine.stats().overview();
    std::printf("\ncompleted %lld, skipped %lld, failed %lld, pending %lld, processing %lld\n",
                static_cast<long long>(overview.count(CompressionStatus::Completed)),
                static_cast<long long>(overview.count(CompressionStatus::Skipped)),
                static_cast<long long>(overview.count(CompressionStatus::Failed)),
                static_cast<long long>(overview.count(CompressionStatus::Pending)),
                static_cast<long long>(overview.count(CompressionStatus::Processing)));
    std::printf("saved %s of %s (%.1f%%)\n",
                format_bytes(overview.space_saved_bytes).c_str(),
                format_bytes(overview.completed_original_bytes).c_str(),
                overview.savings_percent);
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
    std::size_t workers = 2;
    bool once = false;
    bool verbose = false;
    std::vector<DocumentType> types;
    std::vector<IngestRequest> ingests;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto needs_value = [&]() -> const char* {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "Missing value for %s\n", arg);
                return nullptr;
            }
            return argv[++i];
        };

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "-1") == 0 || std::strcmp(arg, "--once") == 0) {
            once = true;
            continue;
        }
        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            verbose = true;
            continue;
        }
        if (std::strcmp(arg, "-w") == 0 || std::strcmp(arg, "--workers") == 0) {
            const char* value = needs_value();
            long long n = 0;
            if (!value || !parse_int(value, n) || n <= 0) {
                std::fprintf(stderr, "Invalid worker count\n");
                return 1;
            }
            workers = static_cast<std::size_t>(n);
            continue;
        }
        if (std::strcmp(arg, "-t") == 0 || std::strcmp(arg, "--type") == 0) {
            const char* value = needs_value();
            DocumentType type;
            if (!value || !parse_type(value, type)) {
                std::fprintf(stderr, "Invalid type (expected id:name:method:level:min_size)\n");
                return 1;
            }
            types.push_back(std::move(type));
            continue;
        }
        if (std::strcmp(arg, "-i") == 0 || std::strcmp(arg, "--ingest") == 0) {
            const char* value = needs_value();
            IngestRequest request;
            if (!value || !parse_ingest(value, request)) {
                std::fprintf(stderr, "Invalid ingest argument (expected type_id:path[:priority])\n");
                return 1;
            }
            ingests.push_back(std::move(request));
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

    LogConfig log_config;
    log_config.log_dir = data_dir / "logs";
    log_config.name = "docpress_run";
    log_config.console_output = true;
    log_config.min_level = verbose ? LogLevel::Debug : LogLevel::Info;

    auto config = ConfigBuilder()
        .data_dir(data_dir)
        .workers(workers)
        .log(log_config)
        .build_and_prepare();
    if (!config) {
        std::fprintf(stderr, "[ERROR] %s\n", describe(config.error()).c_str());
        return 1;
    }

    Log::init(config->log);

    auto opened = Engine::open(*config);
    if (!opened) {
        std::fprintf(stderr, "[ERROR] %s\n", opened.error().to_string().c_str());
        Log::shutdown();
        return 1;
    }
    auto& engine = **opened;

    int failures = 0;
    for (const auto& type : types) {
        if (auto registered = engine.register_type(type); !registered) {
            std::fprintf(stderr, "[ERROR] type %lld: %s\n", static_cast<long long>(type.id),
                         registered.error().to_string().c_str());
            ++failures;
        }
    }

    for (const auto& request : ingests) {
        std::error_code ec;
        auto size = fs::file_size(request.path, ec);
        if (ec) {
            std::fprintf(stderr, "[ERROR] %s: %s\n", request.path.string().c_str(), ec.message().c_str());
            ++failures;
            continue;
        }

        DocumentMeta meta;
        meta.original_filename = request.path.filename().string();
        meta.mime_type = guess_mime(request.path);
        meta.size_bytes = static_cast<std::int64_t>(size);
        meta.original_path = fs::absolute(request.path, ec).string();
        meta.type_id = request.type_id;

        auto doc = engine.ingest(meta, request.priority);
        if (!doc) {
            std::fprintf(stderr, "[ERROR] %s: %s\n", request.path.string().c_str(),
                         doc.error().to_string().c_str());
            ++failures;
            continue;
        }
        std::printf("[OK] %s -> %s (%s, %s)\n", meta.original_filename.c_str(), doc->id.c_str(),
                    meta.mime_type.c_str(), format_bytes(meta.size_bytes).c_str());
    }

    if (once) {
        auto handled = engine.drain();
        std::printf("processed %zu job(s)\n", handled);
    } else {
        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);

        engine.start();
        std::printf("running %zu worker(s), Ctrl-C to stop\n", workers);
        while (!g_stop.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        engine.stop();
    }

    print_summary(engine);
    opened->reset();
    Log::shutdown();
    return failures > 0 ? 1 : 0;
}

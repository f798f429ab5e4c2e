// SPDX-License-Identifier: MIT
// Docpress Basic Example
//
// Build:
//   cmake -S . -B build && cmake --build build --target docpress_example
//
// Writes a text report and a small note into ./docpress_example_data/uploads,
// ingests both and compresses them on the calling thread.

#include <docpress/engine.hpp>
#include <docpress/log.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>

int main() {
    namespace fs = std::filesystem;
    const fs::path root = "./docpress_example_data";
    fs::create_directories(root / "uploads");

    // Sample input: one large text file, one below the size threshold
    const fs::path report = root / "uploads" / "report.txt";
    {
        std::ofstream out(report, std::ios::binary);
        for (int i = 0; i < 4000; ++i) {
            out << "2024-Q3, region " << (i % 7) << ", revenue line item " << i << "\n";
        }
    }
    const fs::path note = root / "uploads" / "note.txt";
    std::ofstream(note) << "short note\n";

    // Create configuration using ConfigBuilder (fluent API)
    docpress::LogConfig log;
    log.log_dir = root / "logs";
    log.name = "example";
    log.min_level = docpress::LogLevel::Debug;
    log.console_output = true;

    auto config = docpress::ConfigBuilder()
        .data_dir(root / "data")
        .workers(2)
        .max_attempts(3)
        .log(log)
        .build_and_prepare();

    if (!config) {
        std::cerr << "Config error: " << docpress::describe(config.error()) << "\n";
        return 1;
    }

    docpress::Log::init(config->log);

    auto engine = docpress::Engine::open(*config);
    if (!engine) {
        std::cerr << "Open failed: " << engine.error().to_string() << "\n";
        return 1;
    }

    // Plain text: gzip level 6, nothing under 10 KB
    docpress::DocumentType text;
    text.id = 1;
    text.name = "text";
    text.compression_method = docpress::CompressionMethod::Gzip;
    text.compression_level = 6;
    text.min_size_for_compression = 10 * 1024;
    if (auto registered = (*engine)->register_type(text); !registered) {
        std::cerr << registered.error().to_string() << "\n";
        return 1;
    }

    for (const auto& path : {report, note}) {
        docpress::DocumentMeta meta;
        meta.original_filename = path.filename().string();
        meta.mime_type = "text/plain";
        meta.size_bytes = static_cast<std::int64_t>(fs::file_size(path));
        meta.original_path = fs::absolute(path).string();
        meta.type_id = text.id;

        auto doc = (*engine)->ingest(meta);
        if (!doc) {
            std::cerr << "Ingest failed: " << doc.error().to_string() << "\n";
            continue;
        }
        std::cout << "Ingested " << meta.original_filename << " as " << doc->id << "\n";
    }

    // Process everything on this thread
    (*engine)->drain();

    auto overview = (*engine)->stats().overview();
    std::cout << "Completed: " << overview.count(docpress::CompressionStatus::Completed)
              << ", skipped: " << overview.count(docpress::CompressionStatus::Skipped)
              << ", saved " << overview.space_saved_bytes << " bytes ("
              << overview.savings_percent << "%)\n";

    engine->reset();
    docpress::Log::shutdown();

    std::cout << "Artifacts written to " << config->effective_artifact_dir() << "\n";
    return 0;
}

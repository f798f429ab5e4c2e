// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#include "sink.hpp"
#include "utils.hpp"

#include <cstdio>
#include <format>
#include <mutex>

namespace docpress {

// ============================================================================
// FileSink Implementation
// ============================================================================

struct FileSink::Impl {
    std::filesystem::path log_dir;
    std::string name;

    std::FILE* file = nullptr;
    std::filesystem::path current_path;
    std::string current_date;
    mutable std::mutex mutex;

    Impl(const std::filesystem::path& dir, const std::string& prefix)
        : log_dir(dir), name(prefix) {
        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);
    }

    ~Impl() {
        close_file();
    }

    bool open_file(const std::string& date) {
        current_path = log_dir / std::format("{}_{}.log", name, date);
        file = std::fopen(current_path.string().c_str(), "ab");
        if (!file) return false;
        current_date = date;
        return true;
    }

    void close_file() {
        if (file) {
            std::fclose(file);
            file = nullptr;
        }
    }
};

FileSink::FileSink(const std::filesystem::path& log_dir, const std::string& name)
    : impl_(std::make_unique<Impl>(log_dir, name)) {
}

FileSink::~FileSink() = default;

void FileSink::write(LogLevel, std::string_view line) {
    if (line.empty()) return;

    auto date = format_date_compact(Timestamp::now());

    std::lock_guard lock(impl_->mutex);

    if (impl_->file && date != impl_->current_date) {
        impl_->close_file();
    }
    if (!impl_->file && !impl_->open_file(date)) {
        return;
    }

    std::fwrite(line.data(), 1, line.size(), impl_->file);
}

void FileSink::flush() {
    std::lock_guard lock(impl_->mutex);
    if (impl_->file) {
        std::fflush(impl_->file);
    }
}

std::filesystem::path FileSink::current_path() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->current_path;
}

} // namespace docpress

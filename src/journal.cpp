// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#include "journal.hpp"
#include "docpress/log.hpp"

#include <mio/mmap.hpp>
#include <zlib.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>
#include <limits>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define fileno _fileno
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace docpress {

namespace {

constexpr const char* kTag = "Journal";

std::unexpected<Error> io_error(std::string_view what, const std::filesystem::path& path) {
    return make_error(ErrorCode::Persistence,
                      std::format("{} {}: {}", what, path.string(), std::strerror(errno)));
}

bool sync_file(std::FILE* file) {
    if (std::fflush(file) != 0) return false;
#ifdef _WIN32
    return _commit(fileno(file)) == 0;
#else
    return ::fsync(fileno(file)) == 0;
#endif
}

// Persist a rename by syncing the containing directory
void sync_directory(const std::filesystem::path& dir) {
#ifndef _WIN32
    int fd = ::open(dir.string().c_str(), O_RDONLY | O_DIRECTORY);
    if (fd >= 0) {
        if (::fsync(fd) != 0) {
            DOCPRESS_LOG_W(kTag, "fsync of directory {} failed: {}", dir.string(), std::strerror(errno));
        }
        ::close(fd);
    }
#else
    (void)dir;
#endif
}

std::vector<std::byte> frame(RecordKind kind, std::span<const std::byte> payload) {
    std::vector<std::byte> record(RecordHeader::framed_size(payload.size()));
    RecordHeader::write(record.data(), kind, static_cast<std::uint32_t>(payload.size()),
                        record_checksum(payload));
    if (!payload.empty()) {
        std::memcpy(record.data() + RecordHeader::kHeaderSize, payload.data(), payload.size());
    }
    RecordHeader::write_tailer(record.data() + RecordHeader::kHeaderSize + payload.size());
    return record;
}

} // anonymous namespace

// ============================================================================
// Record validation
// ============================================================================

std::uint32_t record_checksum(std::span<const std::byte> payload) noexcept {
    uLong crc = crc32(0L, Z_NULL, 0);
    std::size_t offset = 0;
    while (offset < payload.size()) {
        auto chunk = static_cast<uInt>(std::min<std::size_t>(payload.size() - offset,
                                                             std::numeric_limits<uInt>::max()));
        crc = crc32(crc, reinterpret_cast<const Bytef*>(payload.data() + offset), chunk);
        offset += chunk;
    }
    return static_cast<std::uint32_t>(crc);
}

bool RecordHeader::parse(const std::byte* data, std::size_t available,
                         RecordKind& out_kind,
                         std::span<const std::byte>& out_payload) noexcept {
    if (available < kHeaderSize + kTailerSize) return false;
    if (data[0] != RecordMagic::kMagicStart) return false;
    if (!RecordMagic::is_valid_kind(data[1])) return false;

    std::uint32_t length = load_u32(data + kLengthOffset);
    if (available - kHeaderSize - kTailerSize < length) return false;
    if (data[kHeaderSize + length] != RecordMagic::kMagicEnd) return false;

    std::span<const std::byte> payload(data + kHeaderSize, length);
    if (record_checksum(payload) != load_u32(data + kCrcOffset)) return false;

    out_kind = static_cast<RecordKind>(data[1]);
    out_payload = payload;
    return true;
}

// ============================================================================
// Journal
// ============================================================================

Result<std::unique_ptr<Journal>>
Journal::open(const std::filesystem::path& path, bool read_only,
              const RecordCallback& on_record, ReplayStats& stats) {
    std::error_code ec;
    bool exists = std::filesystem::exists(path, ec);

    if (!exists && read_only) {
        return make_error(ErrorCode::Persistence, std::format("no journal at {}", path.string()));
    }

    auto journal = std::unique_ptr<Journal>(new Journal(path, read_only));

    if (exists) {
        if (auto replayed = journal->replay(on_record, stats); !replayed) {
            return std::unexpected(std::move(replayed.error()));
        }
    }

    if (stats.dropped_bytes > 0) {
        DOCPRESS_LOG_W(kTag, "dropping {} byte torn tail from {}", stats.dropped_bytes, path.string());
        if (!read_only) {
            std::filesystem::resize_file(path, stats.valid_bytes, ec);
            if (ec) {
                return make_error(ErrorCode::Persistence,
                    std::format("cannot truncate {}: {}", path.string(), ec.message()));
            }
        }
    }
    journal->size_ = stats.valid_bytes;

    if (!read_only) {
        if (auto opened = journal->open_for_append(); !opened) {
            return std::unexpected(std::move(opened.error()));
        }
    }

    DOCPRESS_LOG_I(kTag, "opened {} ({} records, {} bytes)",
                   path.string(), stats.records, stats.valid_bytes);
    return journal;
}

Journal::~Journal() {
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
}

Result<void> Journal::replay(const RecordCallback& on_record, ReplayStats& stats) {
    std::error_code ec;
    auto file_size = std::filesystem::file_size(path_, ec);
    if (ec) {
        return make_error(ErrorCode::Persistence,
            std::format("cannot stat {}: {}", path_.string(), ec.message()));
    }
    if (file_size == 0) {
        return {};
    }

    mio::mmap_source source;
    source.map(path_.string(), ec);
    if (ec) {
        return make_error(ErrorCode::Persistence,
            std::format("cannot map {}: {}", path_.string(), ec.message()));
    }

    const auto* base = reinterpret_cast<const std::byte*>(source.data());
    std::size_t total = source.size();
    std::size_t offset = 0;

    while (offset < total) {
        RecordKind kind{};
        std::span<const std::byte> payload;
        if (!RecordHeader::parse(base + offset, total - offset, kind, payload)) {
            break;
        }
        if (!on_record(kind, payload)) {
            return make_error(ErrorCode::Persistence,
                std::format("unreadable record at offset {} in {}", offset, path_.string()));
        }
        offset += RecordHeader::framed_size(payload.size());
        ++stats.records;
    }

    stats.valid_bytes = offset;
    stats.dropped_bytes = total - offset;
    return {};
}

Result<void> Journal::open_for_append() {
    file_ = std::fopen(path_.string().c_str(), "ab");
    if (!file_) {
        return io_error("cannot open", path_);
    }
    return {};
}

Result<void> Journal::append(RecordKind kind, std::span<const std::byte> payload) {
    if (read_only_ || !file_) {
        return make_error(ErrorCode::Persistence, "journal is read-only");
    }
    if (broken_) {
        return make_error(ErrorCode::Persistence, "journal is unusable after a failed write");
    }
    if (payload.size() > std::numeric_limits<std::uint32_t>::max()) {
        return make_error(ErrorCode::Persistence, "change set too large");
    }

    auto record = frame(kind, payload);

    bool written = std::fwrite(record.data(), 1, record.size(), file_) == record.size();
    if (written && sync_file(file_)) {
        size_ += record.size();
        return {};
    }

    auto failure = io_error("write failed on", path_);

    // Roll the file back so the next record does not follow garbage
    std::clearerr(file_);
    std::fflush(file_);
#ifndef _WIN32
    if (::ftruncate(fileno(file_), static_cast<off_t>(size_)) != 0) {
        broken_ = true;
    }
#else
    broken_ = true;
#endif
    if (broken_) {
        DOCPRESS_LOG_E(kTag, "cannot roll back {} after failed write", path_.string());
    }
    return failure;
}

Result<void> Journal::rewrite(std::span<const std::byte> snapshot) {
    if (read_only_) {
        return make_error(ErrorCode::Persistence, "journal is read-only");
    }
    if (snapshot.size() > std::numeric_limits<std::uint32_t>::max()) {
        return make_error(ErrorCode::Persistence, "snapshot too large");
    }

    auto tmp_path = path_;
    tmp_path += ".tmp";

    auto record = frame(RecordKind::Snapshot, snapshot);

    std::FILE* tmp = std::fopen(tmp_path.string().c_str(), "wb");
    if (!tmp) {
        return io_error("cannot create", tmp_path);
    }
    bool ok = std::fwrite(record.data(), 1, record.size(), tmp) == record.size() && sync_file(tmp);
    std::fclose(tmp);

    std::error_code ec;
    if (!ok) {
        auto failure = io_error("write failed on", tmp_path);
        std::filesystem::remove(tmp_path, ec);
        return failure;
    }

    std::filesystem::rename(tmp_path, path_, ec);
    if (ec) {
        std::filesystem::remove(tmp_path, ec);
        return make_error(ErrorCode::Persistence,
            std::format("cannot replace {}: {}", path_.string(), ec.message()));
    }
    sync_directory(path_.parent_path());

    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
    size_ = record.size();
    broken_ = false;

    if (auto opened = open_for_append(); !opened) {
        broken_ = true;
        return opened;
    }
    return {};
}

} // namespace docpress

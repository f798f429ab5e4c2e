// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Docpress Contributors

#pragma once

#include "log.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace docpress {

// ============================================================================
// Constants
// ============================================================================

inline constexpr std::size_t kMinWorkers = 1;
inline constexpr std::size_t kMaxWorkers = 64;
inline constexpr auto kMinPollInterval = std::chrono::milliseconds{10};
inline constexpr auto kMinJobTimeout = std::chrono::milliseconds{100};
inline constexpr std::uint64_t kDefaultCompactBytes = 16ull * 1024 * 1024;

// ============================================================================
// Configuration Error
// ============================================================================

enum class ConfigError {
    EmptyDataDir,
    InvalidWorkerCount,       // Out of range [1, 64]
    InvalidMaxAttempts,       // Less than 1
    InvalidRetryBackoff,      // Negative, or max below base
    InvalidPollInterval,      // Too short
    InvalidJobTimeout,        // Too short
    DataDirNotWritable,
    ArtifactDirNotWritable,
    LogDirNotWritable,
};

[[nodiscard]] constexpr std::string_view config_error_message(ConfigError err) noexcept {
    switch (err) {
        case ConfigError::EmptyDataDir:
            return "data_dir cannot be empty";
        case ConfigError::InvalidWorkerCount:
            return "worker_count must be in range [1, 64]";
        case ConfigError::InvalidMaxAttempts:
            return "max_attempts must be at least 1";
        case ConfigError::InvalidRetryBackoff:
            return "retry_backoff must be non-negative and not exceed max_retry_backoff";
        case ConfigError::InvalidPollInterval:
            return "poll_interval must be at least 10ms";
        case ConfigError::InvalidJobTimeout:
            return "job_timeout must be at least 100ms";
        case ConfigError::DataDirNotWritable:
            return "data_dir is not writable or cannot be created";
        case ConfigError::ArtifactDirNotWritable:
            return "artifact_dir is not writable or cannot be created";
        case ConfigError::LogDirNotWritable:
            return "log.log_dir is not writable or cannot be created";
    }
    return "unknown configuration error";
}

// ============================================================================
// Configuration
// ============================================================================

struct Config {
    // Required: journal, snapshot and lock file live here
    std::filesystem::path data_dir;

    // Compressed artifacts (empty = <data_dir>/compressed)
    std::filesystem::path artifact_dir;

    std::size_t worker_count = 2;

    // A job fails terminally once this many attempts have failed
    int max_attempts = 3;

    // Delay before a failed job is eligible again: retry_backoff * 2^(attempts-1)
    std::chrono::milliseconds retry_backoff = std::chrono::seconds{2};
    std::chrono::milliseconds max_retry_backoff = std::chrono::minutes{5};

    // Idle workers re-check the queue at least this often
    std::chrono::milliseconds poll_interval = std::chrono::seconds{1};

    // Codec calls running longer are reported as CodecError::Timeout
    std::chrono::milliseconds job_timeout = std::chrono::minutes{5};

    // Journal is rewritten as a snapshot once it grows past this size
    std::uint64_t journal_compact_bytes = kDefaultCompactBytes;

    LogConfig log;

    [[nodiscard]] std::filesystem::path effective_artifact_dir() const {
        return artifact_dir.empty() ? data_dir / "compressed" : artifact_dir;
    }

    // ========================================================================
    // Validation
    // ========================================================================

    [[nodiscard]] std::expected<void, std::vector<ConfigError>> validate() const {
        std::vector<ConfigError> errors;

        if (data_dir.empty()) {
            errors.push_back(ConfigError::EmptyDataDir);
        }

        if (worker_count < kMinWorkers || worker_count > kMaxWorkers) {
            errors.push_back(ConfigError::InvalidWorkerCount);
        }

        if (max_attempts < 1) {
            errors.push_back(ConfigError::InvalidMaxAttempts);
        }

        if (retry_backoff.count() < 0 || max_retry_backoff < retry_backoff) {
            errors.push_back(ConfigError::InvalidRetryBackoff);
        }

        if (poll_interval < kMinPollInterval) {
            errors.push_back(ConfigError::InvalidPollInterval);
        }

        if (job_timeout < kMinJobTimeout) {
            errors.push_back(ConfigError::InvalidJobTimeout);
        }

        if (errors.empty()) {
            return {};
        }
        return std::unexpected(std::move(errors));
    }

    /// Validate and create the configured directories
    [[nodiscard]] std::expected<void, std::vector<ConfigError>> validate_with_dirs() const {
        auto result = validate();
        std::vector<ConfigError> errors;

        if (!result) {
            errors = std::move(result.error());
        }

        auto prepare = [&](const std::filesystem::path& dir, ConfigError err) {
            if (dir.empty()) return;
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
            if (ec) {
                errors.push_back(err);
            }
        };

        prepare(data_dir, ConfigError::DataDirNotWritable);
        if (!data_dir.empty() || !artifact_dir.empty()) {
            prepare(effective_artifact_dir(), ConfigError::ArtifactDirNotWritable);
        }
        prepare(log.log_dir, ConfigError::LogDirNotWritable);

        if (errors.empty()) {
            return {};
        }
        return std::unexpected(std::move(errors));
    }
};

/// Join validation errors into one line
[[nodiscard]] inline std::string describe(const std::vector<ConfigError>& errors) {
    std::string out;
    for (auto err : errors) {
        if (!out.empty()) out += "; ";
        out += config_error_message(err);
    }
    return out;
}

// ============================================================================
// Config Builder
// ============================================================================

class ConfigBuilder {
public:
    ConfigBuilder() = default;

    ConfigBuilder& data_dir(std::filesystem::path path) {
        config_.data_dir = std::move(path);
        return *this;
    }

    ConfigBuilder& artifact_dir(std::filesystem::path path) {
        config_.artifact_dir = std::move(path);
        return *this;
    }

    ConfigBuilder& workers(std::size_t count) {
        config_.worker_count = count;
        return *this;
    }

    ConfigBuilder& max_attempts(int attempts) {
        config_.max_attempts = attempts;
        return *this;
    }

    /// Set retry backoff base, with an optional cap
    ConfigBuilder& retry_backoff(std::chrono::milliseconds base,
                                 std::optional<std::chrono::milliseconds> cap = std::nullopt) {
        config_.retry_backoff = base;
        if (cap.has_value()) {
            config_.max_retry_backoff = *cap;
        }
        return *this;
    }

    ConfigBuilder& poll_interval(std::chrono::milliseconds interval) {
        config_.poll_interval = interval;
        return *this;
    }

    ConfigBuilder& job_timeout(std::chrono::milliseconds timeout) {
        config_.job_timeout = timeout;
        return *this;
    }

    ConfigBuilder& compact_after(std::uint64_t bytes) {
        config_.journal_compact_bytes = bytes;
        return *this;
    }

    ConfigBuilder& log(LogConfig log_config) {
        config_.log = std::move(log_config);
        return *this;
    }

    /// Build with validation (no I/O)
    [[nodiscard]] std::expected<Config, std::vector<ConfigError>> build() const {
        auto result = config_.validate();
        if (!result) {
            return std::unexpected(std::move(result.error()));
        }
        return config_;
    }

    /// Build and create directories
    [[nodiscard]] std::expected<Config, std::vector<ConfigError>> build_and_prepare() const {
        auto result = config_.validate_with_dirs();
        if (!result) {
            return std::unexpected(std::move(result.error()));
        }
        return config_;
    }

    [[nodiscard]] Config build_unchecked() const {
        return config_;
    }

private:
    Config config_;
};

} // namespace docpress

/**
 * @file config.hpp
 * @brief Engine configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/result.hpp"

namespace sandbox_exec {

struct EngineConfig {
    uint32_t max_concurrent = 4;          ///< N: simultaneous sandboxes
    uint32_t max_queue_depth = 16;        ///< M: FIFO waiters before fail-fast
    uint32_t worker_threads = 0;          ///< 0 = max_concurrent + max_queue_depth
    uint64_t retention_ms = 600000;       ///< Terminal records kept this long
    uint32_t sweep_interval_ms = 5000;
};

struct LimitsConfig {
    uint64_t max_code_bytes = 100000;
    uint32_t min_timeout_ms = 1000;
    uint32_t max_timeout_ms = 60000;
    uint32_t default_timeout_ms = 10000;
    uint64_t output_cap_bytes = 65536;
    uint32_t kill_grace_ms = 500;         ///< SIGTERM → SIGKILL on cancel
};

struct SandboxConfig {
    std::filesystem::path root_dir = "/tmp/sandbox_exec";
    std::string path;                     ///< Sandbox PATH; empty = inherit host PATH
    bool clean_environment = true;
    bool require_landlock = true;         ///< Refuse to run when writes cannot be confined
    bool pid_namespace = true;            ///< Try a private user+pid namespace per sandbox
};

/**
 * @brief Per-language isolation overrides. Unset fields keep the built-in value.
 */
struct LanguageOverride {
    std::optional<bool> enabled;
    std::optional<int64_t> cpu_seconds;
    std::optional<int64_t> memory_mb;
    std::optional<int64_t> data_mb;
    std::optional<int64_t> file_size_mb;
    std::optional<int64_t> max_processes;
    std::optional<int64_t> max_open_files;
};

struct LanguagesConfig {
    std::vector<std::string> disabled;
    std::map<std::string, LanguageOverride> overrides;
};

struct StatsConfig {
    uint32_t latency_window = 1024;       ///< Samples kept per language
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    std::string log_level = "info";
    std::string events_file = "events";   ///< NDJSON lifecycle events; empty = off
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
};

/**
 * @brief Top-level engine configuration.
 */
struct Config {
    EngineConfig engine;
    LimitsConfig limits;
    SandboxConfig sandbox;
    LanguagesConfig languages;
    StatsConfig stats;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file and validate it.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Reject configurations the engine cannot run with.
 */
Result<void> validate_config(const Config& config);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace sandbox_exec

/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

namespace sandbox_exec {

namespace {

LanguageOverride parse_override(const toml::table& tbl) {
    LanguageOverride ov;
    if (auto v = tbl["enabled"].value<bool>()) ov.enabled = *v;
    if (auto v = tbl["cpu_seconds"].value<int64_t>()) ov.cpu_seconds = *v;
    if (auto v = tbl["memory_mb"].value<int64_t>()) ov.memory_mb = *v;
    if (auto v = tbl["data_mb"].value<int64_t>()) ov.data_mb = *v;
    if (auto v = tbl["file_size_mb"].value<int64_t>()) ov.file_size_mb = *v;
    if (auto v = tbl["max_processes"].value<int64_t>()) ov.max_processes = *v;
    if (auto v = tbl["max_open_files"].value<int64_t>()) ov.max_open_files = *v;
    return ov;
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorKind::Config, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [engine]
        if (auto engine = tbl["engine"]; engine.is_table()) {
            config.engine.max_concurrent = static_cast<uint32_t>(
                engine["max_concurrent"].value_or(int64_t{4}));
            config.engine.max_queue_depth = static_cast<uint32_t>(
                engine["max_queue_depth"].value_or(int64_t{16}));
            config.engine.worker_threads = static_cast<uint32_t>(
                engine["worker_threads"].value_or(int64_t{0}));
            config.engine.retention_ms = static_cast<uint64_t>(
                engine["retention_ms"].value_or(int64_t{600000}));
            config.engine.sweep_interval_ms = static_cast<uint32_t>(
                engine["sweep_interval_ms"].value_or(int64_t{5000}));
        }

        // [limits]
        if (auto limits = tbl["limits"]; limits.is_table()) {
            config.limits.max_code_bytes = static_cast<uint64_t>(
                limits["max_code_bytes"].value_or(int64_t{100000}));
            config.limits.min_timeout_ms = static_cast<uint32_t>(
                limits["min_timeout_ms"].value_or(int64_t{1000}));
            config.limits.max_timeout_ms = static_cast<uint32_t>(
                limits["max_timeout_ms"].value_or(int64_t{60000}));
            config.limits.default_timeout_ms = static_cast<uint32_t>(
                limits["default_timeout_ms"].value_or(int64_t{10000}));
            config.limits.output_cap_bytes = static_cast<uint64_t>(
                limits["output_cap_bytes"].value_or(int64_t{65536}));
            config.limits.kill_grace_ms = static_cast<uint32_t>(
                limits["kill_grace_ms"].value_or(int64_t{500}));
        }

        // [sandbox]
        if (auto sandbox = tbl["sandbox"]; sandbox.is_table()) {
            config.sandbox.root_dir =
                sandbox["root_dir"].value_or(std::string{"/tmp/sandbox_exec"});
            config.sandbox.path = sandbox["path"].value_or(std::string{});
            config.sandbox.clean_environment = sandbox["clean_environment"].value_or(true);
            config.sandbox.require_landlock = sandbox["require_landlock"].value_or(true);
            config.sandbox.pid_namespace = sandbox["pid_namespace"].value_or(true);
        }

        // [languages] and [languages.<name>]
        if (auto languages = tbl["languages"].as_table()) {
            for (const auto& [key, node] : *languages) {
                if (key.str() == "disabled") {
                    if (auto arr = node.as_array()) {
                        for (const auto& item : *arr) {
                            if (auto name = item.value<std::string>()) {
                                config.languages.disabled.push_back(*name);
                            }
                        }
                    }
                } else if (auto sub = node.as_table()) {
                    config.languages.overrides[std::string{key.str()}] = parse_override(*sub);
                }
            }
        }

        // [stats]
        if (auto stats = tbl["stats"]; stats.is_table()) {
            config.stats.latency_window = static_cast<uint32_t>(
                stats["latency_window"].value_or(int64_t{1024}));
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.events_file =
                telemetry["events_file"].value_or(std::string{"events"});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
        }

        if (auto valid = validate_config(config); !valid) {
            return valid.error();
        }
        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<void> validate_config(const Config& config) {
    if (config.engine.max_concurrent == 0) {
        return Error{ErrorKind::Config, "engine.max_concurrent must be at least 1"};
    }
    // Every admitted or queued execution needs its own worker.
    const uint64_t needed = uint64_t{config.engine.max_concurrent} + config.engine.max_queue_depth;
    if (config.engine.worker_threads != 0 && config.engine.worker_threads < needed) {
        return Error{ErrorKind::Config,
                     "engine.worker_threads must be 0 or at least max_concurrent + max_queue_depth"};
    }
    if (config.engine.sweep_interval_ms == 0) {
        return Error{ErrorKind::Config, "engine.sweep_interval_ms must be positive"};
    }
    if (config.limits.min_timeout_ms == 0
        || config.limits.min_timeout_ms > config.limits.max_timeout_ms) {
        return Error{ErrorKind::Config,
                     "limits.min_timeout_ms must be in (0, limits.max_timeout_ms]"};
    }
    if (config.limits.default_timeout_ms < config.limits.min_timeout_ms
        || config.limits.default_timeout_ms > config.limits.max_timeout_ms) {
        return Error{ErrorKind::Config,
                     "limits.default_timeout_ms must lie within the timeout bounds"};
    }
    if (config.limits.max_code_bytes == 0) {
        return Error{ErrorKind::Config, "limits.max_code_bytes must be positive"};
    }
    if (config.limits.output_cap_bytes == 0) {
        return Error{ErrorKind::Config, "limits.output_cap_bytes must be positive"};
    }
    if (config.sandbox.root_dir.empty()) {
        return Error{ErrorKind::Config, "sandbox.root_dir must not be empty"};
    }
    if (config.stats.latency_window == 0) {
        return Error{ErrorKind::Config, "stats.latency_window must be positive"};
    }
    if (!parse_log_level(config.telemetry.log_level)) {
        return Error{ErrorKind::Config, "Unknown telemetry.log_level: " + config.telemetry.log_level};
    }
    return Result<void>{};
}

Config default_config() {
    return Config{};
}

}  // namespace sandbox_exec

/**
 * @file main.cpp
 * @brief sandbox_execd entry point.
 *
 * Wires all modules into one engine and runs a single execution from the
 * command line:
 *   Config → Logger → LanguageRegistry → Sandbox → Engine → Telemetry
 *
 * Results are printed to stdout as JSON; logs go to telemetry.log_dir.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "engine/execution_engine.hpp"
#include "telemetry/event_recorder.hpp"
#include "telemetry/json_sink.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace sandbox_exec;

namespace {

constexpr int kExitSucceeded = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_usage() {
    std::cout << "Usage: sandbox_execd [OPTIONS]\n"
              << "  --config <path>      Configuration file (default: config/default.toml)\n"
              << "  --language <name>    Language of the submitted code\n"
              << "  --file <path>|-      Source file to run ('-' reads stdin)\n"
              << "  --timeout <ms>       Wall-clock timeout for this execution\n"
              << "  --owner <id>         Owner identity (default: anonymous)\n"
              << "  --project <id>       Optional project id\n"
              << "  --list-languages     Print the language table and exit\n"
              << "  --stats              Print statistics after the run\n"
              << "  --health             Print the health report and exit\n"
              << "  --log-dir <path>     Log output directory\n"
              << "  --help, -h           Show this help message\n";
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    bool config_explicit = false;
    std::string language;
    std::string file;
    std::optional<uint32_t> timeout_ms;
    std::string owner;
    std::optional<std::string> project_id;
    std::string log_dir;
    bool list_languages = false;
    bool print_stats = false;
    bool print_health = false;
    bool help = false;
};

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](const char* flag) -> Result<std::string> {
            if (i + 1 >= argc) {
                return make_error<std::string>(ErrorKind::Validation,
                                               std::string{flag} + " requires a value");
            }
            return std::string{argv[++i]};
        };

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        } else if (arg == "--list-languages") {
            args.list_languages = true;
        } else if (arg == "--stats") {
            args.print_stats = true;
        } else if (arg == "--health") {
            args.print_health = true;
        } else if (arg == "--config" || arg == "--language" || arg == "--file"
                   || arg == "--timeout" || arg == "--owner" || arg == "--project"
                   || arg == "--log-dir") {
            auto value = next(arg.c_str());
            if (!value) return value.error();
            if (arg == "--config") {
                args.config_path = *value;
                args.config_explicit = true;
            } else if (arg == "--language") {
                args.language = *value;
            } else if (arg == "--file") {
                args.file = *value;
            } else if (arg == "--owner") {
                args.owner = *value;
            } else if (arg == "--project") {
                args.project_id = *value;
            } else if (arg == "--log-dir") {
                args.log_dir = *value;
            } else {
                try {
                    auto parsed = std::stoul(*value);
                    args.timeout_ms = static_cast<uint32_t>(parsed);
                } catch (const std::exception&) {
                    return make_error<CLIArgs>(ErrorKind::Validation,
                                               "--timeout expects milliseconds, got " + *value);
                }
            }
        } else {
            return make_error<CLIArgs>(ErrorKind::Validation, "Unknown option: " + arg);
        }
    }
    return args;
}

Result<std::string> read_source(const std::string& file) {
    if (file == "-") {
        return std::string{std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
    }
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return make_error<std::string>(ErrorKind::Validation, "Cannot open source file: " + file);
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

int64_t epoch_ms(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

std::string to_json(const Execution& e) {
    std::ostringstream oss;
    oss << R"({"id":")" << e.id << "\""
        << R"(,"language":")" << json_escape(e.language) << "\""
        << R"(,"owner":")" << json_escape(e.owner_id) << "\""
        << R"(,"status":")" << to_string(e.status) << "\""
        << R"(,"created_at_ms":)" << epoch_ms(e.created_at);
    if (e.project_id) oss << R"(,"project_id":")" << json_escape(*e.project_id) << "\"";
    if (e.started_at) oss << R"(,"started_at_ms":)" << epoch_ms(*e.started_at);
    if (e.ended_at) oss << R"(,"ended_at_ms":)" << epoch_ms(*e.ended_at);
    oss << R"(,"duration_ms":)" << e.duration().count()
        << R"(,"timeout_ms":)" << e.timeout_ms;
    if (e.exit_code) oss << R"(,"exit_code":)" << *e.exit_code;
    if (e.term_signal) oss << R"(,"signal":)" << *e.term_signal;
    if (e.usage) {
        oss << R"(,"usage":{"cpu_user_ms":)" << e.usage->user_cpu_ms
            << R"(,"cpu_system_ms":)" << e.usage->system_cpu_ms
            << R"(,"peak_memory_kb":)" << e.usage->peak_memory_kb << "}";
    }
    if (e.error_kind) {
        oss << R"(,"error":{"kind":")" << to_string(*e.error_kind) << "\""
            << R"(,"message":")" << json_escape(e.error_message) << "\"}";
    }
    oss << R"(,"output_truncated":)" << (e.output_truncated ? "true" : "false")
        << R"(,"output":")" << json_escape(e.output) << "\"}";
    return oss.str();
}

std::string to_json(const std::vector<LanguageSummary>& languages) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < languages.size(); ++i) {
        const auto& l = languages[i];
        if (i > 0) oss << ",";
        oss << R"({"name":")" << json_escape(l.name) << "\""
            << R"(,"display_name":")" << json_escape(l.display_name) << "\""
            << R"(,"extension":")" << json_escape(l.extension) << "\""
            << R"(,"runtime":")" << json_escape(l.runtime) << "\""
            << R"(,"enabled":)" << (l.enabled ? "true" : "false")
            << R"(,"example":")" << json_escape(l.example_code) << "\"}";
    }
    oss << "]";
    return oss.str();
}

void write_counters(std::ostringstream& oss, const LanguageStats& s) {
    oss << R"({"attempts":)" << s.attempts
        << R"(,"succeeded":)" << s.succeeded
        << R"(,"failed":)" << s.failed
        << R"(,"timed_out":)" << s.timed_out
        << R"(,"cancelled":)" << s.cancelled
        << R"(,"rejected":)" << s.rejected
        << R"(,"latency_ms":{"samples":)" << s.latency.samples
        << R"(,"p50":)" << s.latency.p50.count()
        << R"(,"p95":)" << s.latency.p95.count()
        << R"(,"max":)" << s.latency.max.count() << "}}";
}

std::string to_json(const StatsSnapshot& stats) {
    std::ostringstream oss;
    oss << R"({"totals":)";
    write_counters(oss, stats.totals);
    oss << R"(,"languages":{)";
    bool first = true;
    for (const auto& [name, s] : stats.per_language) {
        if (!first) oss << ",";
        first = false;
        oss << "\"" << json_escape(name) << "\":";
        write_counters(oss, s);
    }
    oss << "}}";
    return oss.str();
}

std::string to_json(const HealthReport& h) {
    std::ostringstream oss;
    oss << R"({"state":")" << to_string(h.state) << "\""
        << R"(,"active":)" << h.active_count
        << R"(,"queued":)" << h.queue_depth
        << R"(,"capacity":)" << h.capacity
        << R"(,"queue_capacity":)" << h.queue_capacity
        << R"(,"tracked":)" << h.tracked_executions
        << R"(,"unavailable_languages":[)";
    for (size_t i = 0; i < h.unavailable_languages.size(); ++i) {
        if (i > 0) oss << ",";
        oss << "\"" << json_escape(h.unavailable_languages[i]) << "\"";
    }
    oss << R"(],"issues":[)";
    for (size_t i = 0; i < h.issues.size(); ++i) {
        if (i > 0) oss << ",";
        oss << "\"" << json_escape(h.issues[i]) << "\"";
    }
    oss << "]}";
    return oss.str();
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args_result = parse_args(argc, argv);
    if (!args_result) {
        std::cerr << args_result.error().message << "\n";
        print_usage();
        return kExitUsage;
    }
    auto args = std::move(args_result).value();
    if (args.help) {
        print_usage();
        return kExitSucceeded;
    }

    // Load configuration
    Config config = default_config();
    auto config_result = load_config(args.config_path);
    if (config_result) {
        config = *config_result;
    } else if (args.config_explicit || std::filesystem::exists(args.config_path)) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        return kExitUsage;
    }

    // Apply CLI overrides
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    // ── Initialize Logger ────────────────────
    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "sandbox_execd",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }

    // ── Initialize Telemetry ─────────────────
    std::vector<std::shared_ptr<IExecutionObserver>> observers;
    if (!config.telemetry.log_dir.empty() && !config.telemetry.events_file.empty()) {
        observers.push_back(std::make_shared<EventRecorder>(std::make_unique<JsonFileSink>(
            config.telemetry.log_dir, config.telemetry.events_file,
            config.telemetry.max_file_size_mb, config.telemetry.rotate_count)));
    }

    ExecutionEngine engine(ExecutionEngine::Options{
        .config = config,
        .log_sink = std::move(log_sink),
        .log_level = level,
        .sandbox_manager = nullptr,
        .observers = std::move(observers)
    });

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (args.list_languages) {
        std::cout << to_json(engine.list_languages()) << std::endl;
        return kExitSucceeded;
    }
    if (args.print_health) {
        std::cout << to_json(engine.health()) << std::endl;
        return kExitSucceeded;
    }

    if (args.language.empty() || args.file.empty()) {
        if (args.print_stats) {
            std::cout << to_json(engine.stats()) << std::endl;
            return kExitSucceeded;
        }
        std::cerr << "--language and --file are required to run code\n";
        print_usage();
        return kExitUsage;
    }

    auto source = read_source(args.file);
    if (!source) {
        std::cerr << source.error().message << "\n";
        return kExitUsage;
    }

    ExecutionRequest request{
        .language = args.language,
        .code = std::move(*source),
        .options = ExecutionOptions{.timeout_ms = args.timeout_ms, .project_id = args.project_id}
    };
    Identity identity = args.owner.empty() ? Identity::anonymous() : Identity{args.owner};

    auto id = engine.submit(request, identity);
    if (!id) {
        std::cerr << id.error().describe() << "\n";
        return id.error().is(ErrorKind::Validation) ? kExitUsage : kExitFailed;
    }

    // Poll so Ctrl+C can cancel the execution instead of killing the daemon mid-run.
    Result<Execution> result = engine.wait(*id, Duration{100});
    while (result && !result->terminal()) {
        if (g_shutdown_requested) {
            engine.logger().warn("Interrupted, cancelling " + *id);
            auto outcome = engine.cancel(*id);
            if (!outcome) engine.logger().error("Cancel failed: " + outcome.error().message);
            g_shutdown_requested = 0;
        }
        result = engine.wait(*id, Duration{100});
    }
    if (!result) {
        std::cerr << result.error().message << "\n";
        return kExitFailed;
    }

    std::cout << to_json(*result) << std::endl;
    if (args.print_stats) {
        std::cout << to_json(engine.stats()) << std::endl;
    }

    engine.shutdown();
    return result->status == ExecutionStatus::Succeeded ? kExitSucceeded : kExitFailed;
}

/**
 * @file language_registry.hpp
 * @brief Static table of supported languages and how to run them.
 *
 * The registry is built once at engine construction and never mutated, so
 * lookups need no synchronization.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sandbox_exec {

/**
 * @brief Resource limits applied to every process of one sandbox.
 *
 * A value of -1 leaves the corresponding rlimit untouched.
 */
struct IsolationProfile {
    int64_t cpu_seconds = 30;                       ///< RLIMIT_CPU ceiling
    int64_t memory_bytes = 512LL * 1024 * 1024;     ///< RLIMIT_AS
    int64_t data_bytes = -1;                        ///< RLIMIT_DATA (heap and private mappings)
    int64_t file_size_bytes = 16LL * 1024 * 1024;   ///< RLIMIT_FSIZE
    int64_t max_processes = -1;                     ///< RLIMIT_NPROC (per uid)
    int64_t max_open_files = 64;                    ///< RLIMIT_NOFILE
};

/**
 * @brief Language-specific recipe for running submitted code.
 *
 * run_command is an argv template: "{file}" expands to source_filename and
 * "{dir}" to the sandbox workspace.
 *
 * A clean sandbox environment drops every host variable except those in
 * inherited_env. home_env fills a variable the host leaves unset with a
 * directory under the host HOME, if that directory exists; toolchain
 * managers such as rustup locate their installation this way.
 */
struct LanguageAdapter {
    LanguageName name;
    std::string display_name;
    std::string extension;
    std::string source_filename;
    std::vector<std::string> run_command;
    std::string runtime;                ///< Binary that must be on PATH
    IsolationProfile isolation;
    bool enabled = true;
    std::string example_code;
    std::vector<std::string> inherited_env;
    std::vector<std::pair<std::string, std::string>> home_env;   ///< variable, path under HOME
};

/**
 * @brief Discovery view of an adapter.
 */
struct LanguageSummary {
    LanguageName name;
    std::string display_name;
    std::string extension;
    std::string runtime;
    bool enabled = true;
    std::string example_code;
};

/**
 * @brief Expand the adapter's argv template for a concrete workspace.
 */
[[nodiscard]] std::vector<std::string> expand_command(const LanguageAdapter& adapter,
                                                      std::string_view workspace);

class LanguageRegistry {
public:
    explicit LanguageRegistry(std::vector<LanguageAdapter> adapters);

    /// Built-in adapters with disables and isolation overrides applied.
    [[nodiscard]] static LanguageRegistry with_builtins(const LanguagesConfig& config = {});

    /// The unmodified built-in table.
    [[nodiscard]] static std::vector<LanguageAdapter> builtin_adapters();

    /// Fails with UnsupportedLanguage when the name is unknown or disabled.
    [[nodiscard]] Result<LanguageAdapter> resolve(std::string_view name) const;

    /// Every adapter, enabled or not, in registration order.
    [[nodiscard]] std::vector<LanguageSummary> list() const;

    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] size_t size() const noexcept { return adapters_.size(); }

private:
    std::vector<LanguageAdapter> adapters_;
    std::unordered_map<std::string, size_t> index_;
};

}  // namespace sandbox_exec

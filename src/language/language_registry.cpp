/**
 * @file language_registry.cpp
 * @brief LanguageRegistry lookup and configuration overlay.
 */

#include "language/language_registry.hpp"

#include <algorithm>

namespace sandbox_exec {

namespace {

constexpr int64_t kMiB = 1024 * 1024;

void replace_all(std::string& text, std::string_view token, std::string_view value) {
    size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.size(), value);
        pos += value.size();
    }
}

void apply_override(LanguageAdapter& adapter, const LanguageOverride& ov) {
    if (ov.enabled) adapter.enabled = *ov.enabled;
    if (ov.cpu_seconds) adapter.isolation.cpu_seconds = *ov.cpu_seconds;
    if (ov.memory_mb) {
        adapter.isolation.memory_bytes = *ov.memory_mb < 0 ? -1 : *ov.memory_mb * kMiB;
    }
    if (ov.data_mb) {
        adapter.isolation.data_bytes = *ov.data_mb < 0 ? -1 : *ov.data_mb * kMiB;
    }
    if (ov.file_size_mb) {
        adapter.isolation.file_size_bytes = *ov.file_size_mb < 0 ? -1 : *ov.file_size_mb * kMiB;
    }
    if (ov.max_processes) adapter.isolation.max_processes = *ov.max_processes;
    if (ov.max_open_files) adapter.isolation.max_open_files = *ov.max_open_files;
}

}  // namespace

std::vector<std::string> expand_command(const LanguageAdapter& adapter,
                                        std::string_view workspace) {
    std::vector<std::string> argv;
    argv.reserve(adapter.run_command.size());
    for (auto arg : adapter.run_command) {
        replace_all(arg, "{file}", adapter.source_filename);
        replace_all(arg, "{dir}", workspace);
        argv.push_back(std::move(arg));
    }
    return argv;
}

LanguageRegistry::LanguageRegistry(std::vector<LanguageAdapter> adapters)
    : adapters_(std::move(adapters)) {
    for (size_t i = 0; i < adapters_.size(); ++i) {
        index_.emplace(adapters_[i].name, i);
    }
}

LanguageRegistry LanguageRegistry::with_builtins(const LanguagesConfig& config) {
    auto adapters = builtin_adapters();
    for (auto& adapter : adapters) {
        if (std::find(config.disabled.begin(), config.disabled.end(), adapter.name)
            != config.disabled.end()) {
            adapter.enabled = false;
        }
        if (auto it = config.overrides.find(adapter.name); it != config.overrides.end()) {
            apply_override(adapter, it->second);
        }
    }
    return LanguageRegistry(std::move(adapters));
}

Result<LanguageAdapter> LanguageRegistry::resolve(std::string_view name) const {
    auto it = index_.find(std::string{name});
    if (it == index_.end()) {
        return Error{ErrorKind::UnsupportedLanguage,
                     "Unsupported language: " + std::string{name}};
    }
    const auto& adapter = adapters_[it->second];
    if (!adapter.enabled) {
        return Error{ErrorKind::UnsupportedLanguage,
                     "Language disabled: " + std::string{name}};
    }
    return adapter;
}

std::vector<LanguageSummary> LanguageRegistry::list() const {
    std::vector<LanguageSummary> out;
    out.reserve(adapters_.size());
    for (const auto& a : adapters_) {
        out.push_back(LanguageSummary{
            .name = a.name,
            .display_name = a.display_name,
            .extension = a.extension,
            .runtime = a.runtime,
            .enabled = a.enabled,
            .example_code = a.example_code
        });
    }
    return out;
}

bool LanguageRegistry::contains(std::string_view name) const {
    return index_.count(std::string{name}) > 0;
}

}  // namespace sandbox_exec

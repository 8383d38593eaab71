/**
 * @file process_sandbox.hpp
 * @brief Restricted-subprocess isolation backend.
 *
 * Each sandbox is a supervisor process that starts the run command in a
 * private 0700 workspace under sandbox.root_dir. The supervisor is pid 1 of
 * a fresh user+pid namespace when the kernel allows it, otherwise a child
 * subreaper; either way every descendant of the program, including ones
 * that call setsid() or are orphaned, dies with the supervisor.
 *
 * The program runs with rlimits on CPU time, address space, data segment,
 * file size, process count and open files, a scrubbed environment,
 * no_new_privs, SIGKILL on parent death, and a Landlock ruleset that
 * confines filesystem writes to the workspace and /dev/null.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "sandbox/sandbox.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include <sys/resource.h>

namespace sandbox_exec {

/**
 * @brief Handle to one sandbox supervisor and the program it runs.
 *
 * pid() is the supervisor as seen from the engine.
 */
class ProcessSandboxHandle final : public SandboxHandle {
public:
    ProcessSandboxHandle(pid_t supervisor, pid_t program, bool pid_namespace,
                         int stdout_fd, int stderr_fd, int report_fd,
                         std::filesystem::path workspace);
    ~ProcessSandboxHandle() override;

    ProcessSandboxHandle(const ProcessSandboxHandle&) = delete;
    ProcessSandboxHandle& operator=(const ProcessSandboxHandle&) = delete;

    [[nodiscard]] pid_t pid() const noexcept override { return supervisor_; }
    [[nodiscard]] const std::filesystem::path& workspace() const noexcept override {
        return workspace_;
    }
    [[nodiscard]] bool in_pid_namespace() const noexcept { return pid_namespace_; }

    bool read_output(Duration wait, const OutputSink& sink) override;
    std::optional<ExitStatus> try_wait() override;
    ExitStatus wait() override;
    void kill(int signal) noexcept override;

    /// Kill, reap and close; returns the workspace to delete (empty if done).
    std::filesystem::path teardown() noexcept;

private:
    void signal_locked(int signal) noexcept;
    ExitStatus decode_exit(int supervisor_status, const rusage& usage) noexcept;
    void close_streams() noexcept;

    const pid_t supervisor_;
    const pid_t program_;               ///< Namespace-local when pid_namespace_
    const bool pid_namespace_;
    int stdout_fd_;
    int stderr_fd_;
    int report_fd_;
    std::filesystem::path workspace_;

    std::mutex state_mutex_;            ///< Guards exit_ and released_ against kill()
    std::optional<ExitStatus> exit_;
    bool released_{false};
};

/**
 * @brief ISandboxManager backed by a per-sandbox supervisor with rlimits
 *        and Landlock.
 */
class ProcessSandboxManager final : public ISandboxManager {
public:
    ProcessSandboxManager(SandboxConfig config, Logger logger);

    Result<std::unique_ptr<SandboxHandle>> acquire(const SandboxSpec& spec) override;
    void release(SandboxHandle& handle) noexcept override;

    [[nodiscard]] size_t active_count() const noexcept override { return active_.load(); }
    [[nodiscard]] Result<void> check_ready() const override;
    [[nodiscard]] bool runtime_available(const LanguageAdapter& adapter) const override;

    /// Search the sandbox PATH for @p program; empty if not found.
    [[nodiscard]] std::string find_executable(const std::string& program) const;

    /// Landlock ABI version of the running kernel, 0 if unsupported.
    [[nodiscard]] int landlock_abi() const noexcept { return landlock_abi_; }

    /// Whether new sandboxes still try a private pid namespace.
    [[nodiscard]] bool pid_namespace_enabled() const noexcept {
        return config_.pid_namespace && pid_namespace_usable_.load();
    }

    [[nodiscard]] const SandboxConfig& config() const noexcept { return config_; }

private:
    Result<std::filesystem::path> create_workspace(const SandboxSpec& spec) const;
    std::vector<std::string> build_environment(const std::filesystem::path& workspace,
                                               const LanguageAdapter& adapter) const;
    Result<int> build_landlock_ruleset(const std::filesystem::path& workspace) const;
    void remove_workspace(const std::filesystem::path& workspace) noexcept;

    SandboxConfig config_;
    std::string search_path_;
    Logger logger_;
    int landlock_abi_{0};
    std::atomic<bool> pid_namespace_usable_{true};
    std::atomic<size_t> active_{0};
};

}  // namespace sandbox_exec

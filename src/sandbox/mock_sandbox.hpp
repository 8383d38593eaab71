/**
 * @file mock_sandbox.hpp
 * @brief In-memory sandbox backend with scripted outcomes.
 *
 * Nothing is forked: each handle replays a SandboxScript (output, exit code,
 * run time) chosen by the submitted code. Used by tests and benchmarks to
 * drive the engine deterministically.
 */

#pragma once

#include "sandbox/sandbox.hpp"

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <set>

namespace sandbox_exec {

/**
 * @brief How one mock sandbox behaves.
 */
struct SandboxScript {
    std::string output;
    int exit_code = 0;
    Duration run_time{0};              ///< Time until the process exits on its own
    bool hang = false;                 ///< Never exits unless killed
    bool ignore_sigterm = false;       ///< Only SIGKILL ends it
    std::optional<ResourceUsage> usage;   ///< Reported with the exit status
    std::optional<std::string> acquire_error;
};

/**
 * @brief Signal counters shared by a manager and its handles.
 */
struct MockSignalLog {
    std::atomic<size_t> sigterm{0};
    std::atomic<size_t> sigkill{0};
};

class MockSandboxHandle final : public SandboxHandle {
public:
    MockSandboxHandle(pid_t pid, SandboxScript script, std::shared_ptr<MockSignalLog> signals);

    [[nodiscard]] pid_t pid() const noexcept override { return pid_; }
    [[nodiscard]] const std::filesystem::path& workspace() const noexcept override {
        return workspace_;
    }

    bool read_output(Duration wait, const OutputSink& sink) override;
    std::optional<ExitStatus> try_wait() override;
    ExitStatus wait() override;
    void kill(int signal) noexcept override;

    /// First call returns true; later calls false.
    bool mark_released() noexcept;

private:
    void settle_locked();

    const pid_t pid_;
    const SandboxScript script_;
    const SteadyTime started_;
    const std::filesystem::path workspace_;
    std::shared_ptr<MockSignalLog> signals_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<ExitStatus> exit_;
    bool output_sent_{false};
    bool released_{false};
};

/**
 * @brief ISandboxManager returning MockSandboxHandles.
 *
 * The script is picked by exact match on SandboxSpec::code, falling back
 * to the default script.
 */
class MockSandboxManager final : public ISandboxManager {
public:
    explicit MockSandboxManager(SandboxScript default_script = {});

    Result<std::unique_ptr<SandboxHandle>> acquire(const SandboxSpec& spec) override;
    void release(SandboxHandle& handle) noexcept override;

    [[nodiscard]] size_t active_count() const noexcept override { return active_.load(); }
    [[nodiscard]] Result<void> check_ready() const override;
    [[nodiscard]] bool runtime_available(const LanguageAdapter& adapter) const override;

    // Test helpers
    void set_default_script(SandboxScript script);
    void set_script(const std::string& code, SandboxScript script);
    void set_ready_error(std::optional<std::string> error);
    void set_runtime_missing(const LanguageName& language);

    [[nodiscard]] size_t acquired_count() const noexcept { return acquired_.load(); }
    [[nodiscard]] size_t peak_active() const noexcept { return peak_.load(); }
    [[nodiscard]] size_t sigterm_count() const noexcept { return signals_->sigterm.load(); }
    [[nodiscard]] size_t sigkill_count() const noexcept { return signals_->sigkill.load(); }

private:
    mutable std::mutex mutex_;
    SandboxScript default_script_;
    std::map<std::string, SandboxScript> scripts_;
    std::optional<std::string> ready_error_;
    std::set<LanguageName> missing_runtimes_;

    std::shared_ptr<MockSignalLog> signals_;
    std::atomic<size_t> active_{0};
    std::atomic<size_t> acquired_{0};
    std::atomic<size_t> peak_{0};
    std::atomic<pid_t> next_pid_{100000};
};

}  // namespace sandbox_exec

/**
 * @file process_sandbox.cpp
 * @brief Supervised sandbox backend: pid namespace or subreaper teardown,
 *        rlimits, and Landlock write confinement.
 */

#include "sandbox/process_sandbox.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <thread>

#include <dirent.h>
#include <fcntl.h>
#include <linux/landlock.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

extern char** environ;

namespace sandbox_exec {

namespace fs = std::filesystem;

// ─────────────────────────────────────────────
// ExitStatus
// ─────────────────────────────────────────────

ExitStatus ExitStatus::from_wait_status(int status) noexcept {
    if (WIFEXITED(status)) {
        return ExitStatus{.exit_code = WEXITSTATUS(status), .term_signal = std::nullopt};
    }
    if (WIFSIGNALED(status)) {
        return ExitStatus{.exit_code = 128 + WTERMSIG(status), .term_signal = WTERMSIG(status)};
    }
    return ExitStatus{.exit_code = -1, .term_signal = std::nullopt};
}

namespace {

// ── Supervisor protocol ─────────────────────

/// Message from the supervisor to the engine over the report pipe.
struct SupervisorReport {
    int kind;
    int stage;
    int value;      ///< errno for kReportFailed, wait status for kReportExited
    pid_t pid;
};

enum ReportKind : int {
    kReportStarted = 1,
    kReportFailed,
    kReportExited
};

/// Failure written by the program over its close-on-exec pipe.
struct ChildFailure {
    int stage;
    int error;
};

enum ChildStage : int {
    kStageSetsid = 1,
    kStageStdio,
    kStageChdir,
    kStageRlimit,
    kStageLandlock,
    kStageExec,
    kStageFork
};

const char* stage_name(int stage) {
    switch (stage) {
        case kStageSetsid:   return "setsid";
        case kStageStdio:    return "stdio redirect";
        case kStageChdir:    return "chdir";
        case kStageRlimit:   return "setrlimit";
        case kStageLandlock: return "landlock";
        case kStageExec:     return "exec";
        case kStageFork:     return "fork";
    }
    return "child setup";
}

// Descriptor layout inside the supervisor. 0-2 are the program's stdio.
constexpr int kSlotReport = 3;
constexpr int kSlotLandlock = 4;
constexpr int kStagingFloor = 64;

constexpr size_t kSupervisorStackSize = 256 * 1024;
constexpr auto kTeardownGrace = std::chrono::seconds(2);

constexpr uint64_t kLandlockWriteAccess =
      LANDLOCK_ACCESS_FS_WRITE_FILE
    | LANDLOCK_ACCESS_FS_REMOVE_DIR
    | LANDLOCK_ACCESS_FS_REMOVE_FILE
    | LANDLOCK_ACCESS_FS_MAKE_CHAR
    | LANDLOCK_ACCESS_FS_MAKE_DIR
    | LANDLOCK_ACCESS_FS_MAKE_REG
    | LANDLOCK_ACCESS_FS_MAKE_SOCK
    | LANDLOCK_ACCESS_FS_MAKE_FIFO
    | LANDLOCK_ACCESS_FS_MAKE_BLOCK
    | LANDLOCK_ACCESS_FS_MAKE_SYM;

struct RlimitSetting {
    int resource;
    rlim_t soft;
    rlim_t hard;
};

std::vector<RlimitSetting> build_rlimits(const IsolationProfile& profile, Duration timeout) {
    std::vector<RlimitSetting> limits;

    // CPU ceiling never exceeds the wall-clock budget by more than a second.
    auto timeout_s = static_cast<int64_t>((timeout.count() + 999) / 1000) + 1;
    int64_t cpu = profile.cpu_seconds < 0 ? timeout_s : std::min(profile.cpu_seconds, timeout_s);
    limits.push_back({RLIMIT_CPU, static_cast<rlim_t>(cpu), static_cast<rlim_t>(cpu + 1)});

    if (profile.memory_bytes >= 0) {
        auto v = static_cast<rlim_t>(profile.memory_bytes);
        limits.push_back({RLIMIT_AS, v, v});
    }
    if (profile.data_bytes >= 0) {
        auto v = static_cast<rlim_t>(profile.data_bytes);
        limits.push_back({RLIMIT_DATA, v, v});
    }
    if (profile.file_size_bytes >= 0) {
        auto v = static_cast<rlim_t>(profile.file_size_bytes);
        limits.push_back({RLIMIT_FSIZE, v, v});
    }
    if (profile.max_processes >= 0) {
        auto v = static_cast<rlim_t>(profile.max_processes);
        limits.push_back({RLIMIT_NPROC, v, v});
    }
    if (profile.max_open_files >= 0) {
        auto v = static_cast<rlim_t>(profile.max_open_files);
        limits.push_back({RLIMIT_NOFILE, v, v});
    }
    limits.push_back({RLIMIT_CORE, 0, 0});
    return limits;
}

void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int64_t to_ms(const timeval& tv) noexcept {
    return static_cast<int64_t>(tv.tv_sec) * 1000 + tv.tv_usec / 1000;
}

bool read_report(int fd, SupervisorReport& report) noexcept {
    ssize_t n;
    do {
        n = ::read(fd, &report, sizeof(report));
    } while (n < 0 && errno == EINTR);
    return n == static_cast<ssize_t>(sizeof(report));
}

bool write_proc_file(const std::string& path, const std::string& content) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CLOEXEC);
    if (fd < 0) return false;
    ssize_t n = ::write(fd, content.data(), content.size());
    int saved = errno;
    ::close(fd);
    errno = saved;
    return n == static_cast<ssize_t>(content.size());
}

/// Map the engine's ids 1:1 into the supervisor's user namespace.
bool write_id_maps(pid_t pid) {
    const std::string proc = "/proc/" + std::to_string(pid);
    const auto uid = std::to_string(::geteuid());
    const auto gid = std::to_string(::getegid());
    return write_proc_file(proc + "/setgroups", "deny")
        && write_proc_file(proc + "/uid_map", uid + " " + uid + " 1\n")
        && write_proc_file(proc + "/gid_map", gid + " " + gid + " 1\n");
}

// ── Supervisor (async-signal-safe calls only) ──

/// Everything the supervisor needs, prepared before it is created.
struct SupervisorContext {
    int stdout_w;
    int stderr_w;
    int report_w;
    int sync_r;             ///< Namespace mode: released once id maps are written
    int sync_w;
    int landlock_fd;        ///< -1 when Landlock is unavailable
    bool pid_namespace;
    pid_t engine;
    const char* workspace;
    const RlimitSetting* limits;
    size_t limit_count;
    const char* exe;
    char* const* argv;
    char* const* envp;
};

/// fork() without glibc's atfork locks, which another engine thread may hold.
pid_t raw_fork() noexcept {
    return static_cast<pid_t>(::syscall(SYS_clone, SIGCHLD, 0, nullptr, nullptr, 0));
}

void write_report(int fd, int kind, int stage, int value, pid_t pid) noexcept {
    SupervisorReport report{kind, stage, value, pid};
    ssize_t ignored = ::write(fd, &report, sizeof(report));
    (void)ignored;
}

void close_from(int first) noexcept {
    if (::syscall(SYS_close_range, static_cast<unsigned>(first), ~0U, 0U) == 0) return;
    struct rlimit rl {};
    int last = (::getrlimit(RLIMIT_NOFILE, &rl) == 0 && rl.rlim_cur != RLIM_INFINITY)
             ? static_cast<int>(rl.rlim_cur) : 4096;
    for (int fd = first; fd < last; ++fd) ::close(fd);
}

/// Move stdio and the report/Landlock descriptors into fixed slots and close the rest.
bool place_descriptors(const SupervisorContext& ctx) noexcept {
    const int sources[4] = {ctx.stdout_w, ctx.stderr_w, ctx.report_w, ctx.landlock_fd};
    int staged[4] = {-1, -1, -1, -1};
    for (int i = 0; i < 4; ++i) {
        if (sources[i] < 0) continue;
        staged[i] = ::fcntl(sources[i], F_DUPFD_CLOEXEC, kStagingFloor);
        if (staged[i] < 0) return false;
    }

    // Not close-on-exec: if it lands on 0 the dup2 below is a no-op.
    int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd < 0) return false;
    if (::dup2(null_fd, STDIN_FILENO) < 0
        || ::dup2(staged[0], STDOUT_FILENO) < 0
        || ::dup2(staged[1], STDERR_FILENO) < 0
        || ::dup3(staged[2], kSlotReport, O_CLOEXEC) < 0) {
        return false;
    }
    if (staged[3] >= 0 && ::dup3(staged[3], kSlotLandlock, O_CLOEXEC) < 0) return false;

    close_from(staged[3] >= 0 ? kSlotLandlock + 1 : kSlotLandlock);
    return true;
}

/// Reap every exited child; false once none remain.
bool reap_children(pid_t program, int& program_status, bool& program_done) noexcept {
    for (;;) {
        int status = 0;
        pid_t w = ::waitpid(-1, &status, WNOHANG);
        if (w > 0) {
            if (w == program) {
                program_status = status;
                program_done = true;
            }
            continue;
        }
        if (w == 0) return true;
        if (errno == EINTR) continue;
        return false;
    }
}

/// Parent pid from /proc/<pid>/stat, -1 if the process is gone.
pid_t parent_of(const char* pid_name) noexcept {
    char path[64] = "/proc/";
    size_t len = 6;
    for (const char* c = pid_name; *c && len < sizeof(path) - 6; ++c) path[len++] = *c;
    std::memcpy(path + len, "/stat", 6);

    int fd = ::open(path, O_RDONLY | O_CLOEXEC);
    if (fd < 0) return -1;
    char buf[512];
    ssize_t n = ::read(fd, buf, sizeof(buf) - 1);
    ::close(fd);
    if (n <= 0) return -1;
    buf[n] = '\0';

    // "pid (comm) state ppid ..."; comm may itself contain ") ".
    const char* close_paren = nullptr;
    for (ssize_t i = 0; i < n; ++i) {
        if (buf[i] == ')') close_paren = buf + i;
    }
    if (!close_paren || close_paren + 4 >= buf + n) return -1;
    const char* p = close_paren + 4;
    pid_t ppid = 0;
    while (*p >= '0' && *p <= '9') ppid = ppid * 10 + (*p++ - '0');
    return ppid;
}

/// SIGKILL every direct child, found by scanning /proc.
void kill_children() noexcept {
    int dir = ::open("/proc", O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dir < 0) return;
    const pid_t self = ::getpid();
    alignas(dirent64) char buf[4096];
    for (;;) {
        long n = ::syscall(SYS_getdents64, dir, buf, sizeof(buf));
        if (n <= 0) break;
        for (long off = 0; off < n;) {
            const auto* entry = reinterpret_cast<const dirent64*>(buf + off);
            off += entry->d_reclen;
            if (entry->d_name[0] < '1' || entry->d_name[0] > '9') continue;
            if (parent_of(entry->d_name) != self) continue;
            pid_t pid = 0;
            for (const char* c = entry->d_name; *c >= '0' && *c <= '9'; ++c) pid = pid * 10 + (*c - '0');
            ::kill(pid, SIGKILL);
        }
    }
    ::close(dir);
}

/// Subreaper teardown: orphans reparent to us, so kill until no child is left.
void kill_descendants(pid_t program, int& program_status, bool& program_done) noexcept {
    const timespec pause{0, 1000000};
    for (;;) {
        kill_children();
        if (!reap_children(program, program_status, program_done)) return;
        ::nanosleep(&pause, nullptr);
    }
}

[[noreturn]] void run_program(const SupervisorContext& ctx, int error_w) {
    auto fail = [error_w](int stage) {
        ChildFailure failure{stage, errno};
        ssize_t ignored = ::write(error_w, &failure, sizeof(failure));
        (void)ignored;
        _exit(127);
    };

    if (::setsid() < 0) fail(kStageSetsid);
    ::prctl(PR_SET_PDEATHSIG, SIGKILL);

    struct sigaction dfl {};
    dfl.sa_handler = SIG_DFL;
    for (int sig = 1; sig < NSIG; ++sig) {
        if (sig != SIGKILL && sig != SIGSTOP) ::sigaction(sig, &dfl, nullptr);
    }
    sigset_t empty;
    sigemptyset(&empty);
    ::sigprocmask(SIG_SETMASK, &empty, nullptr);

    if (::chdir(ctx.workspace) != 0) fail(kStageChdir);
    ::umask(077);

    for (size_t i = 0; i < ctx.limit_count; ++i) {
        struct rlimit rl;
        rl.rlim_cur = ctx.limits[i].soft;
        rl.rlim_max = ctx.limits[i].hard;
        if (::setrlimit(ctx.limits[i].resource, &rl) != 0) fail(kStageRlimit);
    }

    if (ctx.landlock_fd >= 0) {
        if (::syscall(SYS_landlock_restrict_self, kSlotLandlock, 0U) != 0) fail(kStageLandlock);
        ::close(kSlotLandlock);
    }

    ::execve(ctx.exe, ctx.argv, ctx.envp);
    fail(kStageExec);
    _exit(127);
}

[[noreturn]] void run_supervisor(const SupervisorContext& ctx) {
    if (ctx.sync_r >= 0) {
        ::close(ctx.sync_w);
        char go = 0;
        ssize_t n;
        do {
            n = ::read(ctx.sync_r, &go, 1);
        } while (n < 0 && errno == EINTR);
        if (n != 1) _exit(1);
    }

    ::prctl(PR_SET_PDEATHSIG, SIGKILL);
    ::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
    if (!ctx.pid_namespace) ::prctl(PR_SET_CHILD_SUBREAPER, 1, 0, 0, 0);

    sigset_t all;
    sigfillset(&all);
    ::sigprocmask(SIG_SETMASK, &all, nullptr);

    if (::setsid() < 0) {
        write_report(ctx.report_w, kReportFailed, kStageSetsid, errno, 0);
        _exit(1);
    }
    if (!place_descriptors(ctx)) {
        write_report(ctx.report_w, kReportFailed, kStageStdio, errno, 0);
        _exit(1);
    }

    int exec_pipe[2];
    if (::pipe2(exec_pipe, O_CLOEXEC) != 0) {
        write_report(kSlotReport, kReportFailed, kStageFork, errno, 0);
        _exit(1);
    }
    const pid_t program = raw_fork();
    if (program < 0) {
        write_report(kSlotReport, kReportFailed, kStageFork, errno, 0);
        _exit(1);
    }
    if (program == 0) {
        ::close(exec_pipe[0]);
        run_program(ctx, exec_pipe[1]);
    }
    ::close(exec_pipe[1]);

    int program_status = 0;
    bool program_done = false;

    // EOF on the exec pipe means execve() succeeded.
    ChildFailure failure{};
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    ::close(exec_pipe[0]);
    if (n > 0) {
        write_report(kSlotReport, kReportFailed, failure.stage, failure.error, program);
        while (reap_children(program, program_status, program_done) && !program_done) {
            ::sigwaitinfo(&all, nullptr);
        }
        _exit(1);
    }
    write_report(kSlotReport, kReportStarted, 0, 0, program);

    for (;;) {
        siginfo_t info{};
        int sig = ::sigwaitinfo(&all, &info);
        if (sig < 0) continue;

        if (sig == SIGCHLD) {
            reap_children(program, program_status, program_done);
            if (program_done) break;
            continue;
        }

        // Only the engine may steer the sandbox. Senders outside our pid
        // namespace show up with si_pid 0.
        const bool from_engine = ctx.pid_namespace
            ? (info.si_code == SI_USER && info.si_pid == 0)
            : info.si_pid == ctx.engine;
        if (!from_engine) continue;

        if (!ctx.pid_namespace && sig == SIGUSR1) break;  // kill request
        ::kill(-program, sig);
    }

    // In a pid namespace the kernel kills everything left once we exit.
    if (!ctx.pid_namespace) kill_descendants(program, program_status, program_done);
    if (program_done) write_report(kSlotReport, kReportExited, 0, program_status, program);
    _exit(0);
}

int supervisor_entry(void* arg) {
    run_supervisor(*static_cast<const SupervisorContext*>(arg));
}

/// clone() into a new user and pid namespace; -1 with errno set on failure.
pid_t clone_supervisor(SupervisorContext& ctx) {
    std::vector<char> stack(kSupervisorStackSize);
    return ::clone(supervisor_entry, stack.data() + stack.size(),
                   CLONE_NEWUSER | CLONE_NEWPID | SIGCHLD, &ctx);
}

bool namespace_unsupported(int error) noexcept {
    return error == EPERM || error == EINVAL || error == ENOSPC
        || error == EUSERS || error == ENOSYS || error == EACCES;
}

void reap(pid_t pid) noexcept {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

}  // namespace

// ─────────────────────────────────────────────
// ProcessSandboxHandle
// ─────────────────────────────────────────────

ProcessSandboxHandle::ProcessSandboxHandle(pid_t supervisor, pid_t program, bool pid_namespace,
                                           int stdout_fd, int stderr_fd, int report_fd,
                                           fs::path workspace)
    : supervisor_(supervisor)
    , program_(program)
    , pid_namespace_(pid_namespace)
    , stdout_fd_(stdout_fd)
    , stderr_fd_(stderr_fd)
    , report_fd_(report_fd)
    , workspace_(std::move(workspace)) {}

ProcessSandboxHandle::~ProcessSandboxHandle() {
    auto leftover = teardown();
    if (!leftover.empty()) {
        std::error_code ec;
        fs::remove_all(leftover, ec);
    }
}

bool ProcessSandboxHandle::read_output(Duration wait, const OutputSink& sink) {
    std::array<pollfd, 2> fds{};
    nfds_t count = 0;
    if (stdout_fd_ >= 0) fds[count++] = pollfd{stdout_fd_, POLLIN, 0};
    if (stderr_fd_ >= 0) fds[count++] = pollfd{stderr_fd_, POLLIN, 0};
    if (count == 0) return false;

    int ready = ::poll(fds.data(), count, static_cast<int>(wait.count()));
    if (ready < 0) {
        if (errno == EINTR) return true;
        close_fd(stdout_fd_);
        close_fd(stderr_fd_);
        return false;
    }
    if (ready == 0) return true;

    std::array<char, 4096> buf;
    for (nfds_t i = 0; i < count; ++i) {
        if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
        int& fd = (fds[i].fd == stdout_fd_) ? stdout_fd_ : stderr_fd_;
        for (;;) {
            ssize_t n = ::read(fd, buf.data(), buf.size());
            if (n > 0) {
                sink(std::string_view{buf.data(), static_cast<size_t>(n)});
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
            close_fd(fd);  // EOF or hard error
            break;
        }
    }
    return stdout_fd_ >= 0 || stderr_fd_ >= 0;
}

ExitStatus ProcessSandboxHandle::decode_exit(int supervisor_status, const rusage& usage) noexcept {
    // Without an exit report the supervisor itself was killed; its status
    // stands in for the program's.
    ExitStatus status = ExitStatus::from_wait_status(supervisor_status);
    SupervisorReport report{};
    while (report_fd_ >= 0 && read_report(report_fd_, report)) {
        if (report.kind == kReportExited) {
            status = ExitStatus::from_wait_status(report.value);
        }
    }
    status.usage = ResourceUsage{
        .user_cpu_ms = to_ms(usage.ru_utime),
        .system_cpu_ms = to_ms(usage.ru_stime),
        .peak_memory_kb = static_cast<int64_t>(usage.ru_maxrss)
    };
    return status;
}

std::optional<ExitStatus> ProcessSandboxHandle::try_wait() {
    std::lock_guard lock(state_mutex_);
    if (exit_) return exit_;
    int status = 0;
    rusage usage{};
    pid_t w;
    do {
        w = ::wait4(supervisor_, &status, WNOHANG, &usage);
    } while (w < 0 && errno == EINTR);
    if (w == supervisor_) {
        exit_ = decode_exit(status, usage);
    } else if (w < 0) {
        exit_ = ExitStatus{.exit_code = -1, .term_signal = std::nullopt};
    }
    return exit_;
}

ExitStatus ProcessSandboxHandle::wait() {
    {
        std::lock_guard lock(state_mutex_);
        if (exit_) return *exit_;
    }
    int status = 0;
    rusage usage{};
    pid_t w;
    do {
        w = ::wait4(supervisor_, &status, 0, &usage);
    } while (w < 0 && errno == EINTR);

    std::lock_guard lock(state_mutex_);
    if (!exit_) {
        exit_ = (w == supervisor_) ? decode_exit(status, usage)
                                   : ExitStatus{.exit_code = -1, .term_signal = std::nullopt};
    }
    return *exit_;
}

void ProcessSandboxHandle::kill(int signal) noexcept {
    std::lock_guard lock(state_mutex_);
    signal_locked(signal);
}

void ProcessSandboxHandle::signal_locked(int signal) noexcept {
    // Once the supervisor is reaped the whole tree is gone and its pid may
    // belong to someone else.
    if (released_ || exit_ || supervisor_ <= 0) return;
    if (pid_namespace_) {
        // SIGKILL on the namespace init takes the namespace with it; anything
        // else is forwarded to the program's process group.
        ::kill(supervisor_, signal);
    } else {
        ::kill(supervisor_, signal == SIGKILL ? SIGUSR1 : signal);
    }
}

fs::path ProcessSandboxHandle::teardown() noexcept {
    {
        std::lock_guard lock(state_mutex_);
        if (released_) return {};
        signal_locked(SIGKILL);
    }

    const auto give_up = std::chrono::steady_clock::now() + kTeardownGrace;
    bool exited = try_wait().has_value();
    while (!exited && std::chrono::steady_clock::now() < give_up) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        exited = try_wait().has_value();
    }
    if (!exited) {
        ::kill(supervisor_, SIGKILL);
        if (!pid_namespace_ && program_ > 0) ::kill(-program_, SIGKILL);
        (void)wait();
    }
    close_streams();

    std::lock_guard lock(state_mutex_);
    released_ = true;
    return std::move(workspace_);
}

void ProcessSandboxHandle::close_streams() noexcept {
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    close_fd(report_fd_);
}

// ─────────────────────────────────────────────
// ProcessSandboxManager
// ─────────────────────────────────────────────

ProcessSandboxManager::ProcessSandboxManager(SandboxConfig config, Logger logger)
    : config_(std::move(config)), logger_(std::move(logger)) {
    if (!config_.path.empty()) {
        search_path_ = config_.path;
    } else if (const char* host_path = std::getenv("PATH")) {
        search_path_ = host_path;
    } else {
        search_path_ = "/usr/local/bin:/usr/bin:/bin";
    }

    long abi = ::syscall(SYS_landlock_create_ruleset, nullptr, 0, LANDLOCK_CREATE_RULESET_VERSION);
    landlock_abi_ = abi > 0 ? static_cast<int>(abi) : 0;
    logger_.info("Sandbox backend: landlock abi " + std::to_string(landlock_abi_)
                 + (config_.pid_namespace ? ", pid namespaces requested" : ", subreaper supervision"));
}

std::string ProcessSandboxManager::find_executable(const std::string& program) const {
    if (program.empty()) return {};
    if (program.find('/') != std::string::npos) {
        return ::access(program.c_str(), X_OK) == 0 ? program : std::string{};
    }
    size_t start = 0;
    while (start <= search_path_.size()) {
        size_t end = search_path_.find(':', start);
        if (end == std::string::npos) end = search_path_.size();
        std::string dir = search_path_.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + program;
        struct stat st {};
        if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode)
            && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        start = end + 1;
    }
    return {};
}

bool ProcessSandboxManager::runtime_available(const LanguageAdapter& adapter) const {
    return !find_executable(adapter.runtime).empty();
}

Result<void> ProcessSandboxManager::check_ready() const {
    std::error_code ec;
    fs::create_directories(config_.root_dir, ec);
    if (ec) {
        return Error{ErrorKind::InternalSandboxError,
                     "Cannot create sandbox root " + config_.root_dir.string() + ": " + ec.message()};
    }
    if (::access(config_.root_dir.c_str(), W_OK | X_OK) != 0) {
        return Error{ErrorKind::InternalSandboxError,
                     "Sandbox root not writable: " + config_.root_dir.string()};
    }
    if (config_.require_landlock && landlock_abi_ <= 0) {
        return Error{ErrorKind::InternalSandboxError,
                     "Landlock unavailable: filesystem writes cannot be confined"};
    }
    return Result<void>{};
}

Result<fs::path> ProcessSandboxManager::create_workspace(const SandboxSpec& spec) const {
    if (auto ready = check_ready(); !ready) {
        return ready.error();
    }

    std::string tmpl = (config_.root_dir / ("exec-" + spec.execution_id.substr(0, 8) + "-XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (::mkdtemp(buf.data()) == nullptr) {
        return Error{ErrorKind::InternalSandboxError,
                     std::string{"mkdtemp failed: "} + std::strerror(errno)};
    }
    fs::path workspace{buf.data()};

    std::error_code ec;
    fs::create_directory(workspace / "home", ec);
    if (!ec) fs::create_directory(workspace / "tmp", ec);
    if (ec) {
        fs::remove_all(workspace, ec);
        return Error{ErrorKind::InternalSandboxError, "Cannot prepare workspace: " + ec.message()};
    }

    std::ofstream source(workspace / spec.adapter.source_filename,
                         std::ios::binary | std::ios::trunc);
    source.write(spec.code.data(), static_cast<std::streamsize>(spec.code.size()));
    source.close();
    if (!source) {
        fs::remove_all(workspace, ec);
        return Error{ErrorKind::InternalSandboxError,
                     "Cannot write source file " + spec.adapter.source_filename};
    }
    return workspace;
}

std::vector<std::string> ProcessSandboxManager::build_environment(const fs::path& workspace,
                                                                  const LanguageAdapter& adapter) const {
    std::vector<std::string> env;
    const auto home = (workspace / "home").string();
    const auto tmp = (workspace / "tmp").string();

    if (config_.clean_environment) {
        env.push_back("PATH=" + search_path_);
        env.push_back("HOME=" + home);
        env.push_back("TMPDIR=" + tmp);
        env.push_back("USER=sandbox");
        env.push_back("LOGNAME=sandbox");
        for (const char* name : {"LANG", "LC_ALL", "TZ"}) {
            if (const char* value = std::getenv(name)) {
                env.push_back(std::string{name} + "=" + value);
            }
        }
        for (const auto& name : adapter.inherited_env) {
            if (const char* value = std::getenv(name.c_str())) {
                env.push_back(name + "=" + value);
            }
        }
    } else {
        for (char** e = environ; e && *e; ++e) {
            std::string_view entry{*e};
            if (entry.starts_with("TMPDIR=") || entry.starts_with("PATH=")) continue;
            env.emplace_back(entry);
        }
        env.push_back("PATH=" + search_path_);
        env.push_back("TMPDIR=" + tmp);
    }

    // The sandbox HOME is empty, so toolchain managers are pointed back at
    // the host installation.
    const char* host_home = std::getenv("HOME");
    for (const auto& [name, relative] : adapter.home_env) {
        if (std::getenv(name.c_str()) || !host_home) continue;
        fs::path dir = fs::path{host_home} / relative;
        std::error_code ec;
        if (fs::is_directory(dir, ec)) env.push_back(name + "=" + dir.string());
    }

    env.push_back("SANDBOX_EXEC=1");
    return env;
}

Result<int> ProcessSandboxManager::build_landlock_ruleset(const fs::path& workspace) const {
    landlock_ruleset_attr attr{};
    attr.handled_access_fs = kLandlockWriteAccess;
    if (landlock_abi_ >= 2) attr.handled_access_fs |= LANDLOCK_ACCESS_FS_REFER;

    int ruleset = static_cast<int>(::syscall(SYS_landlock_create_ruleset, &attr, sizeof(attr), 0U));
    if (ruleset < 0) {
        return make_error<int>(ErrorKind::InternalSandboxError,
            std::string{"landlock_create_ruleset failed: "} + std::strerror(errno));
    }

    auto allow = [ruleset](const fs::path& path, uint64_t access) {
        int fd = ::open(path.c_str(), O_PATH | O_CLOEXEC);
        if (fd < 0) return false;
        landlock_path_beneath_attr rule{};
        rule.allowed_access = access;
        rule.parent_fd = fd;
        long rc = ::syscall(SYS_landlock_add_rule, ruleset, LANDLOCK_RULE_PATH_BENEATH, &rule, 0U);
        int saved = errno;
        ::close(fd);
        errno = saved;
        return rc == 0;
    };

    if (!allow(workspace, attr.handled_access_fs)) {
        int saved = errno;
        ::close(ruleset);
        return make_error<int>(ErrorKind::InternalSandboxError,
            "Cannot allow writes under " + workspace.string() + ": " + std::strerror(saved));
    }
    if (!allow("/dev/null", LANDLOCK_ACCESS_FS_WRITE_FILE)) {
        int saved = errno;
        ::close(ruleset);
        return make_error<int>(ErrorKind::InternalSandboxError,
            std::string{"Cannot allow writes to /dev/null: "} + std::strerror(saved));
    }
    return ruleset;
}

Result<std::unique_ptr<SandboxHandle>> ProcessSandboxManager::acquire(const SandboxSpec& spec) {
    auto argv_strings = expand_command(spec.adapter, "");
    if (argv_strings.empty()) {
        return Error{ErrorKind::InternalSandboxError,
                     "Empty run command for " + spec.adapter.name};
    }
    const std::string exe = find_executable(argv_strings.front());
    if (exe.empty()) {
        return Error{ErrorKind::InternalSandboxError,
                     "Runtime not found: " + argv_strings.front()};
    }

    auto workspace_result = create_workspace(spec);
    if (!workspace_result) {
        return workspace_result.error();
    }
    fs::path workspace = std::move(workspace_result).value();
    argv_strings = expand_command(spec.adapter, workspace.string());

    // Everything the supervisor touches is prepared before it is created.
    auto env_strings = build_environment(workspace, spec.adapter);
    std::vector<char*> argv;
    for (auto& s : argv_strings) argv.push_back(s.data());
    argv.push_back(nullptr);
    std::vector<char*> envp;
    for (auto& s : env_strings) envp.push_back(s.data());
    envp.push_back(nullptr);
    const auto limits = build_rlimits(spec.adapter.isolation, spec.timeout);
    const std::string workspace_str = workspace.string();

    int landlock_fd = -1;
    if (landlock_abi_ > 0) {
        auto ruleset = build_landlock_ruleset(workspace);
        if (!ruleset) {
            remove_workspace(workspace);
            logger_.warn(ruleset.error().message);
            return ruleset.error();
        }
        landlock_fd = *ruleset;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int report_pipe[2] = {-1, -1};
    int sync_pipe[2] = {-1, -1};
    auto close_all = [&] {
        for (int* p : {out_pipe, err_pipe, report_pipe, sync_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        close_fd(landlock_fd);
    };
    auto abort_spawn = [&](const std::string& what) -> Result<std::unique_ptr<SandboxHandle>> {
        int saved = errno;
        close_all();
        remove_workspace(workspace);
        return Error{ErrorKind::InternalSandboxError, what + ": " + std::strerror(saved)};
    };

    if (::pipe2(out_pipe, O_CLOEXEC) != 0
        || ::pipe2(err_pipe, O_CLOEXEC) != 0
        || ::pipe2(report_pipe, O_CLOEXEC) != 0
        || ::pipe2(sync_pipe, O_CLOEXEC) != 0) {
        return abort_spawn("pipe failed");
    }

    SupervisorContext ctx{
        .stdout_w = out_pipe[1],
        .stderr_w = err_pipe[1],
        .report_w = report_pipe[1],
        .sync_r = sync_pipe[0],
        .sync_w = sync_pipe[1],
        .landlock_fd = landlock_fd,
        .pid_namespace = true,
        .engine = ::getpid(),
        .workspace = workspace_str.c_str(),
        .limits = limits.data(),
        .limit_count = limits.size(),
        .exe = exe.c_str(),
        .argv = argv.data(),
        .envp = envp.data()
    };

    pid_t supervisor = -1;
    bool pid_namespace = false;
    if (pid_namespace_enabled()) {
        supervisor = clone_supervisor(ctx);
        int saved = errno;
        if (supervisor >= 0 && !write_id_maps(supervisor)) {
            saved = errno;
            ::kill(supervisor, SIGKILL);
            reap(supervisor);
            supervisor = -1;
        }
        if (supervisor < 0) {
            if (namespace_unsupported(saved) && pid_namespace_usable_.exchange(false)) {
                logger_.warn(std::string{"pid namespaces unavailable ("} + std::strerror(saved)
                             + "), falling back to subreaper supervision");
            }
        } else {
            char go = 1;
            if (::write(sync_pipe[1], &go, 1) != 1) {
                ::kill(supervisor, SIGKILL);
                reap(supervisor);
                return abort_spawn("sandbox release failed");
            }
            pid_namespace = true;
        }
    }
    close_fd(sync_pipe[0]);
    close_fd(sync_pipe[1]);

    if (supervisor < 0) {
        ctx.pid_namespace = false;
        ctx.sync_r = -1;
        ctx.sync_w = -1;
        supervisor = ::fork();
        if (supervisor < 0) {
            return abort_spawn("fork failed");
        }
        if (supervisor == 0) {
            run_supervisor(ctx);
        }
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(report_pipe[1]);
    close_fd(landlock_fd);

    SupervisorReport first{};
    const bool reported = read_report(report_pipe[0], first);
    if (!reported || first.kind != kReportStarted) {
        reap(supervisor);
        close_all();
        remove_workspace(workspace);
        std::string message = (reported && first.kind == kReportFailed)
            ? std::string{"Sandbox "} + stage_name(first.stage) + " failed for " + exe
                + ": " + std::strerror(first.value)
            : std::string{"Sandbox supervisor exited during setup for "} + exe;
        logger_.warn(message);
        return Error{ErrorKind::InternalSandboxError, message};
    }

    for (int fd : {out_pipe[0], err_pipe[0], report_pipe[0]}) {
        ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);
    }

    active_.fetch_add(1);
    logger_.debug("Sandbox started: execution=" + spec.execution_id
                  + " supervisor=" + std::to_string(supervisor)
                  + " program=" + std::to_string(first.pid)
                  + (pid_namespace ? " (pid namespace)" : " (subreaper)")
                  + " workspace=" + workspace_str);

    return std::unique_ptr<SandboxHandle>(std::make_unique<ProcessSandboxHandle>(
        supervisor, first.pid, pid_namespace,
        out_pipe[0], err_pipe[0], report_pipe[0], std::move(workspace)));
}

void ProcessSandboxManager::release(SandboxHandle& handle) noexcept {
    auto* process = dynamic_cast<ProcessSandboxHandle*>(&handle);
    if (!process) return;

    const pid_t pid = process->pid();
    auto workspace = process->teardown();
    if (workspace.empty()) return;  // already released

    remove_workspace(workspace);
    active_.fetch_sub(1);
    logger_.debug("Sandbox released: supervisor=" + std::to_string(pid));
}

void ProcessSandboxManager::remove_workspace(const fs::path& workspace) noexcept {
    std::error_code ec;
    fs::remove_all(workspace, ec);
    if (ec) {
        try {
            logger_.error("Failed to remove workspace " + workspace.string() + ": " + ec.message());
        } catch (const std::exception&) {
            // Logging itself failed; the workspace path is lost with it.
        }
    }
}

}  // namespace sandbox_exec

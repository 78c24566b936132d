#include "process.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

#ifdef _WIN32
#  include <windows.h>
#else
#  include <unistd.h>
#  include <sys/wait.h>
#  include <signal.h>
#  include <fcntl.h>
#  include <cerrno>
extern char** environ;
#endif

#include <cstring>
#include <optional>
#include <sstream>

namespace platform {

std::string describe(const ProgramError& error) {
    switch (error.kind) {
        case ProgramError::Kind::ProgramNotFound:
            return fmt::format("program '{}' was not found", error.program);
        case ProgramError::Kind::NoPermission:
            return fmt::format("no permission to execute '{}'", error.program);
        case ProgramError::Kind::ProcessInterrupted:
            return fmt::format("'{}' was interrupted", error.program);
        case ProgramError::Kind::NonZeroExitCode:
            return fmt::format("'{}' exited with status {}", error.program, error.exit_code);
        case ProgramError::Kind::UnexpectedError:
            break;
    }
    return fmt::format("unexpected error running '{}': {}", error.program, error.detail);
}

static ProgramError make_error(ProgramError::Kind kind, const std::string& program,
                               const std::string& detail = "") {
    ProgramError e;
    e.kind = kind;
    e.program = program;
    e.detail = detail;
    return e;
}

// Merge overrides into a NAME=value list. Later duplicates win.
static void apply_env_overrides(std::vector<std::string>& env,
                                const std::vector<std::pair<std::string, std::string>>& overrides) {
    for (const auto& [name, value] : overrides) {
        std::string prefix = name + "=";
        bool replaced = false;
        for (auto& entry : env) {
            if (entry.compare(0, prefix.size(), prefix) == 0) {
                entry = prefix + value;
                replaced = true;
                break;
            }
        }
        if (!replaced) env.push_back(prefix + value);
    }
}

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
#ifdef _WIN32
    if (handle_ != INVALID_HANDLE_VALUE) CloseHandle(handle_);
    if (thread_ != INVALID_HANDLE_VALUE) CloseHandle(thread_);
#endif
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : program_(std::move(other.program_)) {
#ifdef _WIN32
    handle_ = other.handle_;
    thread_ = other.thread_;
    other.handle_ = INVALID_HANDLE_VALUE;
    other.thread_ = INVALID_HANDLE_VALUE;
#else
    pid_ = other.pid_;
    other.pid_ = -1;
#endif
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        program_ = std::move(other.program_);
#ifdef _WIN32
        if (handle_ != INVALID_HANDLE_VALUE) CloseHandle(handle_);
        if (thread_ != INVALID_HANDLE_VALUE) CloseHandle(thread_);
        handle_ = other.handle_;
        thread_ = other.thread_;
        other.handle_ = INVALID_HANDLE_VALUE;
        other.thread_ = INVALID_HANDLE_VALUE;
#else
        pid_ = other.pid_;
        other.pid_ = -1;
#endif
    }
    return *this;
}

bool ProcessHandle::valid() const {
#ifdef _WIN32
    return handle_ != INVALID_HANDLE_VALUE;
#else
    return pid_ > 0;
#endif
}

Result<void, ProgramError> ProcessHandle::wait() {
    using Kind = ProgramError::Kind;
#ifdef _WIN32
    if (handle_ == INVALID_HANDLE_VALUE) {
        return Result<void, ProgramError>::Err(make_error(Kind::UnexpectedError, program_, "no process"));
    }
    if (WaitForSingleObject(handle_, INFINITE) != WAIT_OBJECT_0) {
        return Result<void, ProgramError>::Err(make_error(Kind::ProcessInterrupted, program_));
    }
    DWORD code = 1;
    if (!GetExitCodeProcess(handle_, &code)) {
        return Result<void, ProgramError>::Err(make_error(Kind::UnexpectedError, program_, "exit status unavailable"));
    }
    if (code != 0) {
        ProgramError e = make_error(Kind::NonZeroExitCode, program_);
        e.exit_code = static_cast<int>(code);
        return Result<void, ProgramError>::Err(e);
    }
    return Result<void, ProgramError>::Ok();
#else
    if (pid_ <= 0) {
        return Result<void, ProgramError>::Err(make_error(Kind::UnexpectedError, program_, "no process"));
    }

    int status = 0;
    if (waitpid(pid_, &status, 0) < 0) {
        if (errno == EINTR) {
            return Result<void, ProgramError>::Err(make_error(Kind::ProcessInterrupted, program_));
        }
        return Result<void, ProgramError>::Err(make_error(Kind::UnexpectedError, program_, std::strerror(errno)));
    }
    pid_ = -1;

    if (WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        if (code == 0) return Result<void, ProgramError>::Ok();
        ProgramError e = make_error(Kind::NonZeroExitCode, program_);
        e.exit_code = code;
        return Result<void, ProgramError>::Err(e);
    }
    // Killed or stopped by a signal
    return Result<void, ProgramError>::Err(make_error(Kind::ProcessInterrupted, program_));
#endif
}

// CommandLineToArgvW rules: backslashes are literal unless they precede a quote,
// so a run of them before '"' (or the closing quote) is doubled.
std::string quote_windows_arg(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == std::string::npos) return arg;
    std::string out = "\"";
    size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') {
            backslashes++;
            continue;
        }
        if (c == '"') {
            out.append(backslashes * 2 + 1, '\\');
        } else {
            out.append(backslashes, '\\');
        }
        backslashes = 0;
        out += c;
    }
    out.append(backslashes * 2, '\\');
    out += '"';
    return out;
}

// ── spawn ────────────────────────────────────────────────────

#ifdef _WIN32

static std::vector<std::string> inherited_environment() {
    std::vector<std::string> env;
    LPCH block = GetEnvironmentStringsA();
    if (!block) return env;
    for (LPCH p = block; *p; p += std::strlen(p) + 1) {
        env.emplace_back(p);
    }
    FreeEnvironmentStringsA(block);
    return env;
}

Result<ProcessHandle, ProgramError> spawn(const LaunchOptions& options) {
    using Kind = ProgramError::Kind;
    ProcessHandle handle;
    handle.program_ = options.program;

    // Build command line
    std::ostringstream cmdline;
    cmdline << quote_windows_arg(options.program);
    for (const auto& arg : options.args) {
        cmdline << " " << quote_windows_arg(arg);
    }
    std::string cmd_str = cmdline.str();

    std::string env_block;
    if (!options.env.empty()) {
        auto env = inherited_environment();
        apply_env_overrides(env, options.env);
        for (const auto& entry : env) {
            env_block += entry;
            env_block.push_back('\0');
        }
        env_block.push_back('\0');
    }

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi = {};

    HANDLE hNull = INVALID_HANDLE_VALUE;
    if (options.quiet) {
        SECURITY_ATTRIBUTES sa = {};
        sa.nLength = sizeof(sa);
        sa.bInheritHandle = TRUE;
        hNull = CreateFileA("NUL", GENERIC_READ | GENERIC_WRITE,
                            FILE_SHARE_READ | FILE_SHARE_WRITE, &sa,
                            OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (hNull != INVALID_HANDLE_VALUE) {
            si.dwFlags |= STARTF_USESTDHANDLES;
            si.hStdInput = hNull;
            si.hStdOutput = hNull;
            si.hStdError = hNull;
        }
    }

    std::string cwd = options.cwd ? options.cwd->string() : std::string();
    DWORD flags = options.fork_mode ? DETACHED_PROCESS : 0;

    BOOL created = CreateProcessA(nullptr, cmd_str.data(), nullptr, nullptr, TRUE,
                                  flags,
                                  env_block.empty() ? nullptr : env_block.data(),
                                  cwd.empty() ? nullptr : cwd.c_str(),
                                  &si, &pi);
    DWORD err = created ? 0 : GetLastError();
    if (hNull != INVALID_HANDLE_VALUE) CloseHandle(hNull);

    if (!created) {
        if (err == ERROR_FILE_NOT_FOUND || err == ERROR_PATH_NOT_FOUND) {
            return Result<ProcessHandle, ProgramError>::Err(make_error(Kind::ProgramNotFound, options.program));
        }
        if (err == ERROR_ACCESS_DENIED) {
            return Result<ProcessHandle, ProgramError>::Err(make_error(Kind::NoPermission, options.program));
        }
        return Result<ProcessHandle, ProgramError>::Err(
            make_error(Kind::UnexpectedError, options.program, fmt::format("CreateProcess error {}", err)));
    }

    handle.handle_ = pi.hProcess;
    handle.thread_ = pi.hThread;
    return Result<ProcessHandle, ProgramError>::Ok(std::move(handle));
}

#else // Unix

namespace {

// Written by the child to the status pipe when it cannot reach exec.
struct ChildFailure {
    int stage;   // kStageChdir or kStageExec
    int err;
};

constexpr int kStageChdir = 1;
constexpr int kStageExec  = 2;

[[noreturn]] void child_fail(int fd, int stage, int err) {
    ChildFailure failure{stage, err};
    ssize_t ignored = write(fd, &failure, sizeof(failure));
    (void)ignored;
    _exit(127);
}

ProgramError classify_child_failure(const ChildFailure& failure, const LaunchOptions& options) {
    using Kind = ProgramError::Kind;
    if (failure.stage == kStageChdir) {
        return make_error(Kind::UnexpectedError, options.program,
                          fmt::format("cannot enter '{}': {}",
                                      options.cwd ? options.cwd->string() : std::string(),
                                      std::strerror(failure.err)));
    }
    switch (failure.err) {
        case ENOENT:
        case ENOTDIR:
            return make_error(Kind::ProgramNotFound, options.program);
        case EACCES:
        case EPERM:
            return make_error(Kind::NoPermission, options.program);
        case EINTR:
            return make_error(Kind::ProcessInterrupted, options.program);
        default:
            return make_error(Kind::UnexpectedError, options.program, std::strerror(failure.err));
    }
}

} // namespace

// Dispositions the parent had before a shield went up; the child restores them
// before exec.
static bool g_shielded = false;
static struct sigaction g_saved_int {};
static struct sigaction g_saved_quit {};

// Ignore terminal interrupts in the parent for the whole life of a blocking
// child, the way system(3) does. A child sharing the terminal's foreground
// process group receives Ctrl-C too, and the caller must survive it to roll back.
struct InterruptShield {
    InterruptShield() {
        struct sigaction ignore {};
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        sigaction(SIGINT, &ignore, &g_saved_int);
        sigaction(SIGQUIT, &ignore, &g_saved_quit);
        g_shielded = true;
    }

    ~InterruptShield() {
        sigaction(SIGINT, &g_saved_int, nullptr);
        sigaction(SIGQUIT, &g_saved_quit, nullptr);
        g_shielded = false;
    }

    InterruptShield(const InterruptShield&) = delete;
    InterruptShield& operator=(const InterruptShield&) = delete;
};

Result<ProcessHandle, ProgramError> spawn(const LaunchOptions& options) {
    using Kind = ProgramError::Kind;
    ProcessHandle handle;
    handle.program_ = options.program;

    if (options.program.empty()) {
        return Result<ProcessHandle, ProgramError>::Err(make_error(Kind::ProgramNotFound, options.program));
    }

    // Everything the child needs is built before fork(); the child only calls
    // async-signal-safe functions.
    std::vector<const char*> argv;
    argv.push_back(options.program.c_str());
    for (const auto& a : options.args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    std::vector<char*> envp;
    if (!options.env.empty()) {
        for (char** e = environ; e && *e; ++e) env_storage.emplace_back(*e);
        apply_env_overrides(env_storage, options.env);
        for (auto& entry : env_storage) envp.push_back(entry.data());
        envp.push_back(nullptr);
    }

    std::string cwd = options.cwd ? options.cwd->string() : std::string();

    int status_pipe[2];
    if (pipe(status_pipe) != 0) {
        return Result<ProcessHandle, ProgramError>::Err(
            make_error(Kind::UnexpectedError, options.program, std::strerror(errno)));
    }
    fcntl(status_pipe[0], F_SETFD, FD_CLOEXEC);
    fcntl(status_pipe[1], F_SETFD, FD_CLOEXEC);

    int null_fd = -1;
    if (options.quiet) {
        null_fd = open("/dev/null", O_RDWR | O_CLOEXEC);
        if (null_fd < 0) {
            int err = errno;
            close(status_pipe[0]);
            close(status_pipe[1]);
            return Result<ProcessHandle, ProgramError>::Err(
                make_error(Kind::UnexpectedError, options.program, std::strerror(err)));
        }
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(status_pipe[0]);
        close(status_pipe[1]);
        if (null_fd >= 0) close(null_fd);
        return Result<ProcessHandle, ProgramError>::Err(
            make_error(Kind::UnexpectedError, options.program, std::strerror(err)));
    }

    if (pid == 0) {
        // Child process
        close(status_pipe[0]);

        if (g_shielded) {
            sigaction(SIGINT, &g_saved_int, nullptr);
            sigaction(SIGQUIT, &g_saved_quit, nullptr);
        }

        if (null_fd >= 0) {
            dup2(null_fd, STDIN_FILENO);
            dup2(null_fd, STDOUT_FILENO);
            dup2(null_fd, STDERR_FILENO);
        }

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            child_fail(status_pipe[1], kStageChdir, errno);
        }

        if (!envp.empty()) environ = envp.data();

        execvp(options.program.c_str(), const_cast<char* const*>(argv.data()));
        child_fail(status_pipe[1], kStageExec, errno);
    }

    // Parent: EOF on the pipe means exec succeeded (CLOEXEC closed the write end).
    close(status_pipe[1]);
    if (null_fd >= 0) close(null_fd);

    ChildFailure failure{};
    ssize_t n;
    do {
        n = read(status_pipe[0], &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
        return Result<ProcessHandle, ProgramError>::Err(classify_child_failure(failure, options));
    }

    handle.pid_ = pid;
    return Result<ProcessHandle, ProgramError>::Ok(std::move(handle));
}

#endif

Result<void, ProgramError> launch(const LaunchOptions& options) {
    kanri_log(fmt::format("launch: {} [{}] cwd={} fork={} quiet={}",
                          options.program, join(options.args, ", "),
                          options.cwd ? options.cwd->string() : ".",
                          options.fork_mode, options.quiet));

#ifndef _WIN32
    // Up before fork() so an interrupt sent the moment the child starts is covered
    std::optional<InterruptShield> shield;
    if (!options.fork_mode) shield.emplace();
#endif

    auto spawned = spawn(options);
    if (spawned.is_err()) {
        kanri_log("launch failed: " + describe(spawned.error));
        return Result<void, ProgramError>::Err(spawned.error);
    }

    // Forked children are not reaped; the CLI exits right after and init adopts them.
    if (options.fork_mode) {
        return Result<void, ProgramError>::Ok();
    }

    auto result = spawned.value.wait();
    if (result.is_err()) {
        kanri_log("launch: " + describe(result.error));
    }
    return result;
}

} // namespace platform

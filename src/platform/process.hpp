#pragma once

#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <functional>
#include <filesystem>
#include <core/types.hpp>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#endif

namespace platform {

// One-shot description of a child process.
struct LaunchOptions {
    std::string program;
    std::vector<std::string> args;
    std::optional<std::filesystem::path> cwd;                   // caller's cwd when unset
    std::vector<std::pair<std::string, std::string>> env;        // merged over the inherited environment
    bool quiet = false;       // discard stdin/stdout/stderr
    bool fork_mode = false;   // spawn and return without waiting
};

struct ProgramError {
    enum class Kind {
        ProgramNotFound,
        NoPermission,
        ProcessInterrupted,
        NonZeroExitCode,
        UnexpectedError,
    };

    Kind kind = Kind::UnexpectedError;
    std::string program;
    int exit_code = 0;        // NonZeroExitCode only
    std::string detail;       // UnexpectedError only
};

// Human-readable rendering of a ProgramError.
std::string describe(const ProgramError& error);

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Block until the process exits and classify its status.
    // A non-zero exit is NonZeroExitCode; death by signal or an interrupted wait is
    // ProcessInterrupted.
    Result<void, ProgramError> wait();

private:
    std::string program_;
#ifdef _WIN32
    HANDLE handle_ = INVALID_HANDLE_VALUE;
    HANDLE thread_ = INVALID_HANDLE_VALUE;
#else
    int pid_ = -1;
#endif
    friend Result<ProcessHandle, ProgramError> spawn(const LaunchOptions& options);
};

// Spawn a child process. Exec failures (missing program, no permission) are
// reported here, before the handle is returned.
Result<ProcessHandle, ProgramError> spawn(const LaunchOptions& options);

// Spawn and, unless fork_mode is set, wait for the child to exit.
Result<void, ProgramError> launch(const LaunchOptions& options);

// Quote one argument for a Win32 command line so CommandLineToArgvW splits it
// back unchanged.
std::string quote_windows_arg(const std::string& arg);

// Seam for callers that run programs; defaults to launch().
using ProgramRunner = std::function<Result<void, ProgramError>(const LaunchOptions&)>;

} // namespace platform

#pragma once

#include <string>
#include <optional>
#include <functional>
#include <core/types.hpp>
#include <platform/process.hpp>
#include "library.hpp"
#include "template_store.hpp"

enum class ProvisionState {
    Idle,
    Created,        // directory exists, no command has run yet
    Provisioning,   // running template commands
    Completed,
    RolledBack,     // a command failed and the directory was removed (or removal was attempted)
};

const char* to_string(ProvisionState state);

struct ProvisionError {
    enum class Kind {
        TemplateNotFound,
        ShellNotConfigured,
        CreateFailed,       // library create failed; nothing to clean up
        CommandFailed,
    };

    Kind kind = Kind::CommandFailed;
    std::string project;
    std::string template_name;

    std::optional<LibraryError> create_error;       // CreateFailed

    std::string command;                            // CommandFailed: the failing step
    size_t command_index = 0;                       // zero-based
    platform::ProgramError program;

    // Set when the compensating delete failed as well. Reported next to the
    // original failure, never in place of it.
    std::optional<LibraryError> cleanup_error;
};

std::string describe(const ProvisionError& error);

struct ProvisionRequest {
    std::string project;
    std::string template_name;
    bool quiet = false;
};

// Materializes a new project from a template: create the directory, run each
// command in the profile's shell inside it, and delete the directory again if a
// command fails.
class Provisioner {
public:
    // (command, 1-based step, total steps), called before each command runs
    using ProgressCallback = std::function<void(const std::string&, size_t, size_t)>;

    Provisioner(Library& library, const TemplateStore& templates, const Profile& profile,
                platform::ProgramRunner runner = platform::launch);

    Result<void, ProvisionError> provision(const ProvisionRequest& request,
                                           const ProgressCallback& on_step = nullptr);

    ProvisionState state() const { return state_; }

private:
    platform::LaunchOptions command_options(const Project& project, const std::string& command,
                                            bool quiet) const;
    void transition(ProvisionState next);

    Library& library_;
    const TemplateStore& templates_;
    const Profile& profile_;
    platform::ProgramRunner runner_;
    ProvisionState state_ = ProvisionState::Idle;
};

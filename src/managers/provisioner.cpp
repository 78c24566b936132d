#include "provisioner.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

const char* to_string(ProvisionState state) {
    switch (state) {
        case ProvisionState::Idle:         return "idle";
        case ProvisionState::Created:      return "created";
        case ProvisionState::Provisioning: return "provisioning";
        case ProvisionState::Completed:    return "completed";
        case ProvisionState::RolledBack:   return "rolled-back";
    }
    return "unknown";
}

std::string describe(const ProvisionError& error) {
    using Kind = ProvisionError::Kind;
    switch (error.kind) {
        case Kind::TemplateNotFound:
            return fmt::format("template '{}' not found", error.template_name);
        case Kind::ShellNotConfigured:
            return "shell is not configured in the active profile";
        case Kind::CreateFailed:
            return error.create_error ? describe(*error.create_error)
                                      : fmt::format("could not create '{}'", error.project);
        case Kind::CommandFailed:
            break;
    }

    std::string msg = fmt::format("template command #{} '{}' failed: {}",
                                  error.command_index + 1, error.command,
                                  platform::describe(error.program));
    if (error.cleanup_error) {
        msg += fmt::format("; additionally, cleanup failed: {}", describe(*error.cleanup_error));
    }
    return msg;
}

Provisioner::Provisioner(Library& library, const TemplateStore& templates, const Profile& profile,
                         platform::ProgramRunner runner)
    : library_(library), templates_(templates), profile_(profile), runner_(std::move(runner)) {}

void Provisioner::transition(ProvisionState next) {
    kanri_logf("provision: {} -> {}", to_string(state_), to_string(next));
    state_ = next;
}

platform::LaunchOptions Provisioner::command_options(const Project& project,
                                                     const std::string& command,
                                                     bool quiet) const {
    platform::LaunchOptions options;
    options.program = profile_.shell;
    options.args = profile_.shell_args;
    options.args.push_back(command);
    options.cwd = project.path;
    options.env = {{ENV_PROJECT, project.name}};
    options.quiet = quiet;
    options.fork_mode = false;
    return options;
}

Result<void, ProvisionError> Provisioner::provision(const ProvisionRequest& request,
                                                    const ProgressCallback& on_step) {
    using Kind = ProvisionError::Kind;
    state_ = ProvisionState::Idle;

    ProvisionError error;
    error.project = request.project;
    error.template_name = request.template_name;

    const Template* tmpl = templates_.get(request.template_name);
    if (!tmpl) {
        error.kind = Kind::TemplateNotFound;
        return Result<void, ProvisionError>::Err(error);
    }
    if (profile_.shell.empty()) {
        error.kind = Kind::ShellNotConfigured;
        return Result<void, ProvisionError>::Err(error);
    }

    auto created = library_.create(request.project);
    if (created.is_err()) {
        error.kind = Kind::CreateFailed;
        error.create_error = created.error;
        return Result<void, ProvisionError>::Err(error);
    }
    transition(ProvisionState::Created);

    // Copy: the library may reallocate its index while we hold the entry.
    Project project = *library_.get(request.project);

    transition(ProvisionState::Provisioning);
    const size_t total = tmpl->commands.size();
    for (size_t i = 0; i < total; i++) {
        const std::string& command = tmpl->commands[i];
        if (on_step) on_step(command, i + 1, total);

        auto ran = runner_(command_options(project, command, request.quiet));
        if (ran.is_ok()) continue;

        error.kind = Kind::CommandFailed;
        error.command = command;
        error.command_index = i;
        error.program = ran.error;
        kanri_logf("provision: '{}' step {} failed: {}", request.project, i + 1,
                   platform::describe(ran.error));

        auto cleaned = library_.remove(request.project);
        if (cleaned.is_err()) {
            error.cleanup_error = cleaned.error;
            kanri_log("provision: cleanup failed: " + describe(cleaned.error));
        }
        transition(ProvisionState::RolledBack);
        return Result<void, ProvisionError>::Err(error);
    }

    transition(ProvisionState::Completed);
    return Result<void, ProvisionError>::Ok();
}

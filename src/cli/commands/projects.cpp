#include "command_helpers.hpp"
#include "../theme.hpp"
#include <core/constants.hpp>
#include <managers/provisioner.hpp>
#include <iostream>
#include <chrono>
#include <fmt/format.h>

// ── new ──────────────────────────────────────────────────────

static int do_new(BaseCLI& cli, const std::vector<std::string>& argv) {
    auto args = parse_command_args(argv,
        {{"-t", "--template"}, {"--template", "--template"},
         {"-q", "--quiet"}, {"--quiet", "--quiet"}},
        {"--template"});

    if (args.positional.size() != 1) {
        return usage_error("Missing project name.", "kanri new <name> [-t <template>] [-q]");
    }
    const std::string name = args.arg(0);

    auto library = cli.open_library();
    if (!library) return 1;

    auto template_name = args.value("--template");
    if (!template_name) {
        auto created = library->create(name);
        if (created.is_err()) {
            std::cout << theme::fail(describe(created.error));
            return 1;
        }
        std::cout << theme::ok("Created " + library->get(name)->path.string());
        return 0;
    }

    auto templates = cli.load_templates();
    if (!templates) return 1;
    auto profile = cli.current_profile();
    if (!profile) return 1;

    std::cout << theme::step(fmt::format("Generating '{}' from template '{}'", name, *template_name));

    Provisioner provisioner(*library, *templates, *profile);
    auto started = std::chrono::steady_clock::now();
    auto result = provisioner.provision(
        {name, *template_name, args.has("--quiet")},
        [](const std::string& command, size_t current, size_t total) {
            std::cout << theme::progress(command, current, total) << std::flush;
        });

    if (result.is_err()) {
        std::cout << theme::fail(describe(result.error));
        if (provisioner.state() == ProvisionState::RolledBack && !result.error.cleanup_error) {
            std::cout << theme::info("Removed partially generated '" + name + "'");
        }
        return 1;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    std::cout << theme::ok(fmt::format("Generated '{}' in {} ms", name, elapsed));
    return 0;
}

// ── clone ────────────────────────────────────────────────────

static int do_clone(BaseCLI& cli, const std::vector<std::string>& argv) {
    auto args = parse_command_args(argv,
        {{"-b", "--branch"}, {"--branch", "--branch"}}, {"--branch"});

    if (args.positional.empty() || args.positional.size() > 2) {
        return usage_error("Missing repository URL.", "kanri clone <remote> [name] [-b <branch>]");
    }

    auto library = cli.open_library();
    if (!library) return 1;

    CloneOptions options;
    options.remote = args.arg(0);
    if (args.positional.size() == 2) options.name = args.arg(1);
    options.branch = args.value("--branch");

    auto cloned = library->clone_repository(options);
    if (cloned.is_err()) {
        std::cout << theme::fail(describe(cloned.error));
        return 1;
    }
    std::cout << theme::ok("Repository has been cloned.");
    return 0;
}

// ── open ─────────────────────────────────────────────────────

static int do_open(BaseCLI& cli, const std::vector<std::string>& argv) {
    auto args = parse_command_args(argv,
        {{"-s", "--shell"}, {"--shell", "--shell"},
         {"-p", "--path"}, {"--path", "--path"}});

    if (args.positional.size() != 1) {
        return usage_error("Missing project name.", "kanri open <name|-> [-s] [-p]");
    }

    auto library = cli.open_library();
    if (!library) return 1;

    auto name = resolve_project(cli, *library, args.arg(0));
    if (!name) return 1;
    const Project& project = *library->get(*name);

    if (args.has("--path")) {
        std::cout << project.path.string() << "\n";
        return 0;
    }

    auto profile = cli.current_profile();
    if (!profile) return 1;

    const bool shell = args.has("--shell");
    platform::LaunchOptions options;
    options.cwd = project.path;
    if (shell) {
        options.program = profile->shell;
        options.env = {{ENV_SESSION, "1"}};
    } else {
        options.program = profile->editor;
        options.args = profile->editor_args;
        options.fork_mode = profile->editor_fork_mode;
    }

    if (options.program.empty()) {
        std::cout << theme::fail(shell ? "No shell is set in the active profile."
                                       : "No editor is set in the active profile.");
        return 1;
    }

    if (shell) std::cout << theme::step("Starting shell in " + project.path.string());

    auto launched = platform::launch(options);
    if (launched.is_err()) {
        std::cout << theme::fail(platform::describe(launched.error));
        return 1;
    }

    if (shell) std::cout << theme::step("Shell session ended");

    auto& recent = cli.config->recent();
    if (recent.enabled && recent.recent_project != *name) {
        recent.recent_project = *name;
        if (!cli.save_config()) return 1;
    }

    if (options.fork_mode) {
        std::cout << theme::ok("Editor launched.");
    }
    return 0;
}

// ── list ─────────────────────────────────────────────────────

static int do_list(BaseCLI& cli, const std::vector<std::string>& argv) {
    auto args = parse_command_args(argv, {{"--pure", "--pure"}});

    auto library = cli.open_library();
    if (!library) return 1;

    if (args.has("--pure")) {
        for (const auto& project : library->projects()) {
            std::cout << project.name << "\n";
        }
        return 0;
    }

    if (library->empty()) {
        std::cout << theme::info("No projects found in " + library->base_path().string());
        return 0;
    }

    const std::string& recent = cli.config->recent().recent_project;
    std::cout << theme::section("Your projects");
    for (const auto& project : library->projects()) {
        std::cout << theme::item(project.name, project.name == recent ? "(recent)" : "");
    }
    std::cout << "\n";
    return 0;
}

// ── rename ───────────────────────────────────────────────────

static int do_rename(BaseCLI& cli, const std::vector<std::string>& argv) {
    auto args = parse_command_args(argv, {});
    if (args.positional.size() != 2) {
        return usage_error("Expected an old and a new name.", "kanri rename <old> <new>");
    }
    const std::string old_name = args.arg(0);
    const std::string new_name = args.arg(1);

    auto library = cli.open_library();
    if (!library) return 1;

    auto renamed = library->rename(old_name, new_name);
    if (renamed.is_err()) {
        std::cout << theme::fail(describe(renamed.error));
        return 1;
    }

    // Keep "-" pointing at the same project
    auto& recent = cli.config->recent();
    if (recent.recent_project == old_name) {
        recent.recent_project = new_name;
        if (!cli.save_config()) return 1;
    }

    std::cout << theme::ok(fmt::format("Renamed '{}' to '{}'", old_name, new_name));
    return 0;
}

// ── remove ───────────────────────────────────────────────────

static int do_remove(BaseCLI& cli, const std::vector<std::string>& argv) {
    auto args = parse_command_args(argv, {{"-f", "--force"}, {"--force", "--force"}});
    if (args.positional.size() != 1) {
        return usage_error("Missing project name.", "kanri remove <name|-> [-f]");
    }

    auto library = cli.open_library();
    if (!library) return 1;

    auto name = resolve_project(cli, *library, args.arg(0));
    if (!name) return 1;

    if (!args.has("--force")) {
        auto empty = library->is_project_empty(*name);
        if (empty.is_err()) {
            std::cout << theme::fail(describe(empty.error));
            return 1;
        }
        if (!empty.value && !cli.confirm("'" + *name + "' is not empty. Remove it anyway?", false)) {
            std::cout << theme::info("Canceled.");
            return 0;
        }
    }

    auto removed = library->remove(*name);
    if (removed.is_err()) {
        std::cout << theme::fail(describe(removed.error));
        return 1;
    }

    auto& recent = cli.config->recent();
    if (recent.recent_project == *name) {
        recent.recent_project.clear();
        if (!cli.save_config()) return 1;
    }

    std::cout << theme::ok("Removed '" + *name + "'");
    return 0;
}

void register_project_commands(BaseCLI& cli) {
    cli.add_command("new", do_new, "Create a project, optionally from a template");
    cli.add_command("clone", do_clone, "Clone a git repository into the projects directory");
    cli.add_command("open", do_open, "Open a project in the editor (or a shell with -s)");
    cli.add_command("list", do_list, "List projects");
    cli.add_command("rename", do_rename, "Rename a project");
    cli.add_command("remove", do_remove, "Delete a project directory");
}

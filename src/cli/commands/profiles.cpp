#include "command_helpers.hpp"
#include "../theme.hpp"
#include "../prompts.hpp"
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <iostream>
#include <fmt/format.h>

static const char* kProfilesUsage = "kanri profiles <new|set|info|list|remove> [name]";

static int profiles_new(BaseCLI& cli, const CommandArgs&) {
    if (!cli.require_config()) return 1;

    std::string name = ask_string("Profile name");
    if (name.empty()) {
        std::cout << theme::fail("Profile name is empty.");
        return 1;
    }
    if (cli.config->has_profile(name)) {
        std::cout << theme::fail("Profile '" + name + "' already exists.");
        return 1;
    }

    std::string editor = ask_string("Editor (program name)");
    if (editor.empty()) {
        std::cout << theme::fail("Editor name is empty.");
        return 1;
    }
    std::string shell = ask_string("Shell (program name)", platform::default_shell());
    if (shell.empty()) {
        std::cout << theme::fail("Shell name is empty.");
        return 1;
    }

    Profile profile = make_profile(editor, shell);
    if (!is_gui_editor(editor)) {
        profile.editor_fork_mode = cli.confirm("Run the editor forked (detached from the terminal)?", false);
    }

    cli.config->set_profile(name, profile);
    if (!cli.save_config()) return 1;

    std::cout << theme::ok("Profile '" + name + "' saved.");
    std::cout << theme::step("Switch to it with 'kanri profiles set " + name + "'.");
    return 0;
}

static int profiles_set(BaseCLI& cli, const CommandArgs& args) {
    if (args.positional.size() != 2) {
        return usage_error("Missing profile name.", "kanri profiles set <name>");
    }
    if (!cli.require_config()) return 1;

    const std::string name = args.arg(1);
    if (!cli.config->has_profile(name)) {
        std::cout << theme::fail("Profile '" + name + "' was not found.");
        return 1;
    }

    cli.config->options().current_profile = name;
    if (!cli.save_config()) return 1;
    std::cout << theme::ok("Switched to profile '" + name + "'");
    return 0;
}

static int profiles_info(BaseCLI& cli, const CommandArgs& args) {
    if (!cli.require_config()) return 1;

    std::string name = args.positional.size() > 1 ? args.arg(1)
                                                   : cli.config->options().current_profile;
    auto profile = cli.config->profile(name);
    if (profile.is_err()) {
        std::cout << theme::fail(profile.error);
        return 1;
    }

    const Profile& p = profile.value;
    std::cout << theme::section("Profile " + name);
    std::cout << theme::kv("editor", p.editor + (p.editor_args.empty() ? "" : " " + join(p.editor_args, " ")));
    std::cout << theme::kv("forked", p.editor_fork_mode ? "yes" : "no");
    std::cout << theme::kv("shell", p.shell + (p.shell_args.empty() ? "" : " " + join(p.shell_args, " ")));
    std::cout << "\n";
    return 0;
}

static int profiles_list(BaseCLI& cli, const CommandArgs&) {
    if (!cli.require_config()) return 1;

    const std::string& current = cli.config->options().current_profile;
    std::cout << theme::section("Your profiles");
    for (const auto& entry : cli.config->profiles()) {
        std::cout << theme::item(entry.first, entry.first == current ? "(current)" : "");
    }
    std::cout << "\n";
    return 0;
}

static int profiles_remove(BaseCLI& cli, const CommandArgs& args) {
    if (args.positional.size() != 2) {
        return usage_error("Missing profile name.", "kanri profiles remove <name>");
    }
    if (!cli.require_config()) return 1;

    const std::string name = args.arg(1);
    if (!cli.config->has_profile(name)) {
        std::cout << theme::fail("Profile '" + name + "' was not found.");
        return 1;
    }
    if (name == cli.config->options().current_profile) {
        std::cout << theme::fail("'" + name + "' is the active profile.");
        std::cout << theme::step("Switch to another profile before removing it.");
        return 1;
    }
    if (!cli.confirm("Delete profile '" + name + "'?", false)) {
        std::cout << theme::info("Aborted.");
        return 0;
    }

    cli.config->remove_profile(name);
    if (!cli.save_config()) return 1;
    std::cout << theme::ok("Profile '" + name + "' removed.");
    return 0;
}

static int do_profiles(BaseCLI& cli, const std::vector<std::string>& argv) {
    auto args = parse_command_args(argv, {});
    if (args.positional.empty()) {
        return usage_error("Missing subcommand.", kProfilesUsage);
    }

    const std::string sub = args.arg(0);
    if (sub == "new")    return profiles_new(cli, args);
    if (sub == "set")    return profiles_set(cli, args);
    if (sub == "info")   return profiles_info(cli, args);
    if (sub == "list")   return profiles_list(cli, args);
    if (sub == "remove") return profiles_remove(cli, args);

    return usage_error("Unknown subcommand: " + sub, kProfilesUsage);
}

void register_profile_commands(BaseCLI& cli) {
    cli.add_command("profiles", do_profiles, "Manage editor/shell profiles (new, set, info, list, remove)");
}

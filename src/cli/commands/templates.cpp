#include "command_helpers.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <iostream>
#include <fstream>
#include <sstream>
#include <fmt/format.h>

static const char* kTemplatesUsage =
    "kanri templates <new|list|get|edit|path|clear|remove> [args]";

// Commands typed into the scratch file, one per line. Blank lines and
// '#' comments are skipped.
static std::vector<std::string> read_command_lines(const fs::path& path) {
    std::vector<std::string> commands;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        std::string trimmed = line;
        trim(trimmed);
        if (trimmed.empty() || trimmed[0] == '#') continue;
        commands.push_back(trimmed);
    }
    return commands;
}

static int templates_new(BaseCLI& cli, const CommandArgs& args) {
    if (args.positional.size() != 2) {
        return usage_error("Missing template name.", "kanri templates new <name>");
    }
    const std::string name = args.arg(1);

    auto store = cli.load_templates();
    if (!store) return 1;
    if (store->get(name)) {
        std::cout << theme::fail("Template '" + name + "' already exists.");
        return 1;
    }

    auto profile = cli.current_profile();
    if (!profile) return 1;
    if (profile->editor.empty()) {
        std::cout << theme::fail("No editor is set in the active profile.");
        return 1;
    }

    fs::path scratch = platform::temp_file("kanri_template");
    {
        std::ofstream out(scratch);
        if (!out) {
            std::cout << theme::fail("Failed to create " + scratch.string());
            return 1;
        }
        out << "# Commands for template '" << name << "', one per line.\n"
            << "# Each runs in the new project directory; $KANRI_PROJECT holds its name.\n";
    }

    std::cout << theme::step("Opening the editor. Save and close it to continue.");
    auto edited = edit_file(*profile, scratch, true);
    std::vector<std::string> commands;
    if (edited.is_ok()) commands = read_command_lines(scratch);

    std::error_code ec;
    fs::remove(scratch, ec);

    if (edited.is_err()) {
        std::cout << theme::fail(platform::describe(edited.error));
        return 1;
    }
    if (commands.empty()) {
        std::cout << theme::fail("No commands entered.");
        return 1;
    }

    auto added = store->add(name, commands);
    if (added.is_err()) {
        std::cout << theme::fail(added.error);
        return 1;
    }
    if (!cli.save_templates(*store)) return 1;

    std::cout << theme::ok(fmt::format("Template '{}' created ({} commands)", name, commands.size()));
    return 0;
}

static int templates_list(BaseCLI& cli, const CommandArgs& args) {
    auto store = cli.load_templates();
    if (!store) return 1;

    if (args.has("--pure")) {
        for (const auto& name : store->names()) std::cout << name << "\n";
        return 0;
    }

    if (store->empty()) {
        std::cout << theme::info("No templates found.");
        return 0;
    }

    std::cout << theme::section("Templates");
    for (const auto& tmpl : store->templates()) {
        std::cout << theme::item(tmpl.name, fmt::format("({} commands)", tmpl.commands.size()));
    }
    std::cout << "\n";
    return 0;
}

static int templates_get(BaseCLI& cli, const CommandArgs& args) {
    if (args.positional.size() != 2) {
        return usage_error("Missing template name.", "kanri templates get <name> [--pure]");
    }

    auto store = cli.load_templates();
    if (!store) return 1;

    const Template* tmpl = store->get(args.arg(1));
    if (!tmpl) {
        std::cout << theme::fail("Template '" + args.arg(1) + "' not found.");
        return 1;
    }

    if (args.has("--pure")) {
        for (const auto& cmd : tmpl->commands) std::cout << cmd << "\n";
        return 0;
    }

    std::cout << theme::section("Commands of " + tmpl->name);
    for (size_t i = 0; i < tmpl->commands.size(); i++) {
        std::cout << theme::progress(tmpl->commands[i], i + 1, tmpl->commands.size());
    }
    std::cout << "\n";
    return 0;
}

static int templates_edit(BaseCLI& cli, const CommandArgs&) {
    if (!cli.require_config()) return 1;
    auto profile = cli.current_profile();
    if (!profile) return 1;
    if (profile->editor.empty()) {
        std::cout << theme::fail("No editor is set in the active profile.");
        return 1;
    }

    auto edited = edit_file(*profile, cli.templates_path, false);
    if (edited.is_err()) {
        std::cout << theme::fail(platform::describe(edited.error));
        return 1;
    }
    return 0;
}

static int templates_clear(BaseCLI& cli, const CommandArgs&) {
    auto store = cli.load_templates();
    if (!store) return 1;

    if (store->empty()) {
        std::cout << theme::info("No templates to clear.");
        return 0;
    }
    if (!cli.confirm("Clear all templates?", false)) {
        std::cout << theme::info("Aborted.");
        return 0;
    }

    store->clear();
    if (!cli.save_templates(*store)) return 1;
    std::cout << theme::ok("Templates cleared.");
    return 0;
}

static int templates_remove(BaseCLI& cli, const CommandArgs& args) {
    if (args.positional.size() != 2) {
        return usage_error("Missing template name.", "kanri templates remove <name>");
    }

    auto store = cli.load_templates();
    if (!store) return 1;

    auto removed = store->remove(args.arg(1));
    if (removed.is_err()) {
        std::cout << theme::fail(removed.error);
        return 1;
    }
    if (!cli.save_templates(*store)) return 1;
    std::cout << theme::ok("Template '" + args.arg(1) + "' removed.");
    return 0;
}

static int do_templates(BaseCLI& cli, const std::vector<std::string>& argv) {
    auto args = parse_command_args(argv, {{"--pure", "--pure"}});
    if (args.positional.empty()) {
        return usage_error("Missing subcommand.", kTemplatesUsage);
    }

    const std::string sub = args.arg(0);
    if (sub == "new")    return templates_new(cli, args);
    if (sub == "list")   return templates_list(cli, args);
    if (sub == "get")    return templates_get(cli, args);
    if (sub == "edit")   return templates_edit(cli, args);
    if (sub == "clear")  return templates_clear(cli, args);
    if (sub == "remove") return templates_remove(cli, args);
    if (sub == "path") {
        std::cout << cli.templates_path.string() << "\n";
        return 0;
    }

    return usage_error("Unknown subcommand: " + sub, kTemplatesUsage);
}

void register_template_commands(BaseCLI& cli) {
    cli.add_command("templates", do_templates, "Manage templates (new, list, get, edit, path, clear, remove)");
}

#include "command_helpers.hpp"
#include "../theme.hpp"
#include <core/constants.hpp>
#include <managers/backup.hpp>
#include <iostream>

static const char* kConfigUsage = "kanri config <path|edit|recent [--clear]|reset>";

static int config_edit(BaseCLI& cli) {
    auto profile = cli.current_profile();
    if (!profile) return 1;
    if (profile->editor.empty()) {
        std::cout << theme::fail("No editor is set in the active profile.");
        return 1;
    }

    auto edited = edit_file(*profile, cli.config_path, false);
    if (edited.is_err()) {
        std::cout << theme::fail(platform::describe(edited.error));
        return 1;
    }
    return 0;
}

static int config_recent(BaseCLI& cli, const CommandArgs& args) {
    if (!cli.require_config()) return 1;

    auto& recent = cli.config->recent();
    if (!recent.enabled) {
        std::cout << theme::fail("Recent project tracking is disabled in the configuration.");
        return 1;
    }

    if (args.has("--clear")) {
        if (recent.recent_project.empty()) {
            std::cout << theme::info("Nothing to clear.");
            return 0;
        }
        recent.recent_project.clear();
        if (!cli.save_config()) return 1;
        std::cout << theme::ok("Cleared.");
        return 0;
    }

    if (recent.recent_project.empty()) {
        std::cout << theme::fail("No recent project.");
        return 1;
    }
    std::cout << recent.recent_project << "\n";
    return 0;
}

static int config_reset(BaseCLI& cli) {
    if (!cli.require_config()) return 1;

    if (!cli.confirm("Reset your configuration to defaults?", false)) {
        std::cout << theme::info("Aborted.");
        return 0;
    }
    cli.config->reset();
    if (!cli.save_config()) return 1;
    std::cout << theme::ok("Configuration reset.");
    return 0;
}

static int do_config(BaseCLI& cli, const std::vector<std::string>& argv) {
    auto args = parse_command_args(argv, {{"--clear", "--clear"}});
    if (args.positional.size() != 1) {
        return usage_error("Missing subcommand.", kConfigUsage);
    }

    const std::string sub = args.arg(0);
    if (sub == "path") {
        std::cout << cli.config_path.string() << "\n";
        return 0;
    }
    if (sub == "edit")   return config_edit(cli);
    if (sub == "recent") return config_recent(cli, args);
    if (sub == "reset")  return config_reset(cli);

    return usage_error("Unknown subcommand: " + sub, kConfigUsage);
}

// ── backup / import ──────────────────────────────────────────

static int do_backup(BaseCLI& cli, const std::vector<std::string>& argv) {
    auto args = parse_command_args(argv, {});
    if (args.positional.size() > 1) {
        return usage_error("Too many arguments.", "kanri backup [file]");
    }
    if (!cli.require_config()) return 1;

    fs::path out = args.positional.empty() ? fs::path(DEFAULT_BACKUP_FILE) : fs::path(args.arg(0));
    auto saved = save_backup(cli.config_path.parent_path(), out);
    if (saved.is_err()) {
        std::cout << theme::fail(saved.error);
        return 1;
    }
    std::cout << theme::ok("Backup saved to " + out.string());
    return 0;
}

static int do_import(BaseCLI& cli, const std::vector<std::string>& argv) {
    auto args = parse_command_args(argv, {});
    if (args.positional.size() != 1) {
        return usage_error("Missing backup file.", "kanri import <file>");
    }

    if (fs::exists(cli.config_path) &&
        !cli.confirm("Replace the current configuration and templates?", true)) {
        std::cout << theme::info("Aborted.");
        return 0;
    }

    auto imported = import_backup(args.arg(0), cli.config_path.parent_path());
    if (imported.is_err()) {
        std::cout << theme::fail(imported.error);
        return 1;
    }
    cli.config.reset();
    std::cout << theme::ok("Backup imported.");
    return 0;
}

void register_config_commands(BaseCLI& cli) {
    cli.add_command("config", do_config, "Show, edit or reset the configuration (path, edit, recent, reset)");
    cli.add_command("backup", do_backup, "Save config and templates to a tar archive");
    cli.add_command("import", do_import, "Restore config and templates from a backup");
}

#include "base_cli.hpp"
#include "theme.hpp"
#include "prompts.hpp"
#include <core/log.hpp>
#include <iostream>
#include <stdexcept>
#include <fmt/format.h>

// ── Argument splitting ───────────────────────────────────────

std::optional<std::string> CommandArgs::value(const std::string& option) const {
    auto it = values.find(option);
    if (it == values.end()) return std::nullopt;
    return it->second;
}

std::string CommandArgs::arg(size_t index) const {
    return index < positional.size() ? positional[index] : std::string();
}

CommandArgs parse_command_args(const std::vector<std::string>& args,
                               const std::map<std::string, std::string>& aliases,
                               const std::set<std::string>& takes_value) {
    CommandArgs out;
    bool only_positional = false;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& a = args[i];

        // "-" alone is the recent-project sentinel, not a flag
        if (only_positional || a.size() < 2 || a[0] != '-') {
            out.positional.push_back(a);
            continue;
        }
        if (a == "--") {
            only_positional = true;
            continue;
        }

        auto alias = aliases.find(a);
        if (alias == aliases.end()) {
            throw std::runtime_error("Unknown option: " + a);
        }
        const std::string& name = alias->second;

        if (takes_value.count(name)) {
            if (i + 1 >= args.size()) {
                throw std::runtime_error("Option " + a + " requires a value");
            }
            out.values[name] = args[++i];
        } else {
            out.flags.insert(name);
        }
    }
    return out;
}

// ── BaseCLI ──────────────────────────────────────────────────

BaseCLI::BaseCLI()
    : config_path(get_config_path()),
      templates_path(get_templates_path()),
      confirm(ask_dialog) {}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

int BaseCLI::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Run 'kanri --help' for available commands.");
        return 1;
    }

    kanri_logf("cli: {} ({} args)", command, args.size());
    try {
        return it->second.first(*this, args);
    } catch (const std::exception& e) {
        kanri_logf("cli: {} failed: {}", command, e.what());
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Projects",      {"new", "clone", "open", "list", "rename", "remove"}},
        {"Templates",     {"templates"}},
        {"Configuration", {"config", "profiles", "backup", "import"}},
        {"General",       {"help", "zen"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::BROWN << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::BLUE
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

// ── Shared state ─────────────────────────────────────────────

bool BaseCLI::require_config() {
    if (config.has_value()) return true;

    auto created = create_default_config();
    if (created.is_err()) {
        std::cout << theme::fail(created.error);
        return false;
    }
    if (!fs::exists(templates_path)) {
        auto saved = TemplateStore().save(templates_path);
        if (saved.is_err()) {
            std::cout << theme::fail(saved.error);
            return false;
        }
    }

    auto loaded = Config::load(config_path);
    if (loaded.is_err()) {
        std::cout << theme::fail(loaded.error);
        std::cout << theme::step("Fix " + config_path.string() + " or run 'kanri config reset'.");
        return false;
    }
    config = loaded.value;
    return true;
}

bool BaseCLI::save_config() {
    if (!config) return false;
    auto saved = config->save(config_path);
    if (saved.is_err()) {
        std::cout << theme::fail(saved.error);
        return false;
    }
    return true;
}

std::optional<Library> BaseCLI::open_library() {
    if (!require_config()) return std::nullopt;

    const auto& options = config->options();
    auto library = Library::open(options.projects_directory, options.display_hidden);
    if (library.is_err()) {
        std::cout << theme::fail(describe(library.error));
        if (library.error.kind == LibraryError::Kind::InvalidPath) {
            std::cout << theme::step("Create it, or point options.projects_directory at an existing directory.");
        }
        return std::nullopt;
    }
    return std::move(library.value);
}

std::optional<TemplateStore> BaseCLI::load_templates() {
    if (!require_config()) return std::nullopt;

    auto store = TemplateStore::load(templates_path);
    if (store.is_err()) {
        std::cout << theme::fail(store.error);
        return std::nullopt;
    }
    return std::move(store.value);
}

bool BaseCLI::save_templates(const TemplateStore& store) {
    auto saved = store.save(templates_path);
    if (saved.is_err()) {
        std::cout << theme::fail(saved.error);
        return false;
    }
    return true;
}

std::optional<Profile> BaseCLI::current_profile() {
    if (!require_config()) return std::nullopt;

    auto profile = config->current_profile();
    if (profile.is_err()) {
        std::cout << theme::fail(profile.error);
        return std::nullopt;
    }
    return profile.value;
}

#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <functional>
#include <core/config.hpp>
#include <managers/library.hpp>
#include <managers/template_store.hpp>

// Positional arguments plus flags, split from a command's argv tail.
struct CommandArgs {
    std::vector<std::string> positional;
    std::set<std::string> flags;                      // switches that were present
    std::map<std::string, std::string> values;        // option -> value

    bool has(const std::string& flag) const { return flags.count(flag) > 0; }
    std::optional<std::string> value(const std::string& option) const;
    std::string arg(size_t index) const;              // "" when absent
};

// `aliases` maps every accepted spelling to its canonical name ("-t" -> "--template").
// Options listed in `takes_value` consume the next argument. Throws
// std::runtime_error on an unknown flag or a missing value.
CommandArgs parse_command_args(const std::vector<std::string>& args,
                               const std::map<std::string, std::string>& aliases,
                               const std::set<std::string>& takes_value = {});

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<int(BaseCLI&, const std::vector<std::string>&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    bool has_command(const std::string& name) const { return commands_.count(name) > 0; }

    // Runs a command; returns its exit status. Exceptions are reported and map to 1.
    int execute_command(const std::string& command, const std::vector<std::string>& args);
    void print_help() const;

    // Loads config.yaml (creating defaults on first run). Prints and returns false on failure.
    bool require_config();
    bool save_config();

    // Scans the projects directory from the loaded config.
    std::optional<Library> open_library();

    std::optional<TemplateStore> load_templates();
    bool save_templates(const TemplateStore& store);

    // Active profile from the loaded config.
    std::optional<Profile> current_profile();

    // Public state
    std::optional<Config> config;
    fs::path config_path;
    fs::path templates_path;
    ConfirmFn confirm;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};

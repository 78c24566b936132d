#pragma once

#include <string>
#include <vector>
#include <utility>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

struct GeneralOptions {
    fs::path projects_directory;
    std::string current_profile;
    bool display_hidden = false;
};

struct RecentOptions {
    bool enabled = true;
    std::string recent_project;
};

struct AutocompleteOptions {
    bool enabled = true;
    bool always_accept = true;
};

class Config {
public:
    // Built-in defaults for this host (editor from $VISUAL/$EDITOR, shell from $SHELL).
    static Config defaults();

    // Load config.yaml. Missing keys take their defaults; unknown keys are ignored.
    static Result<Config> load(const fs::path& path);

    Result<void> save(const fs::path& path) const;

    // Profile lookup; error message names the missing profile.
    Result<Profile> profile(const std::string& name) const;
    Result<Profile> current_profile() const { return profile(options_.current_profile); }

    bool has_profile(const std::string& name) const;
    // Insert or replace. New profiles are appended.
    void set_profile(const std::string& name, const Profile& profile);
    bool remove_profile(const std::string& name);
    const std::vector<std::pair<std::string, Profile>>& profiles() const { return profiles_; }

    void reset() { *this = defaults(); }

    // Accessors
    const std::string& version() const { return version_; }
    const GeneralOptions& options() const { return options_; }
    GeneralOptions& options() { return options_; }
    const RecentOptions& recent() const { return recent_; }
    RecentOptions& recent() { return recent_; }
    const AutocompleteOptions& autocomplete() const { return autocomplete_; }
    AutocompleteOptions& autocomplete() { return autocomplete_; }

public:
    Config() = default;

private:
    std::string version_;
    GeneralOptions options_;
    std::vector<std::pair<std::string, Profile>> profiles_;   // file order
    RecentOptions recent_;
    AutocompleteOptions autocomplete_;
};

// Build a profile for an editor/shell pair, filling in the usual arguments.
// GUI editors (code, zed, ...) open "." and run forked.
Profile make_profile(const std::string& editor, const std::string& shell);

// True for editors that detach from the terminal and should be launched forked.
bool is_gui_editor(const std::string& editor);

// Base arguments for running one command string in the given shell.
std::vector<std::string> default_shell_args(const std::string& shell);

// Get paths
fs::path get_config_path();
fs::path get_templates_path();

// Helper to check if the config exists
bool config_exists();

// Create default config.yaml (never overwrites an existing one)
Result<void> create_default_config();

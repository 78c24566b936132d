#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <fstream>

namespace fs = std::filesystem;

// ── Profile defaults ─────────────────────────────────────────

bool is_gui_editor(const std::string& editor) {
    static const std::vector<std::string> gui = {
        "code", "code-insiders", "codium", "code-oss", "cursor", "windsurf", "zed",
    };
    std::string name = fs::path(editor).filename().string();
    if (name.size() > 4 && name.compare(name.size() - 4, 4, ".cmd") == 0) {
        name.erase(name.size() - 4);
    }
    return std::find(gui.begin(), gui.end(), name) != gui.end();
}

std::vector<std::string> default_shell_args(const std::string& shell) {
    std::string name = fs::path(shell).filename().string();
    if (name == "powershell" || name == "powershell.exe" || name == "pwsh" || name == "pwsh.exe") {
        return {"-NoLogo", "-Command"};
    }
    if (name == "cmd" || name == "cmd.exe") {
        return {"/C"};
    }
    return {"-c"};
}

Profile make_profile(const std::string& editor, const std::string& shell) {
    Profile p;
    p.editor = editor;
    if (is_gui_editor(editor)) {
        p.editor_args.push_back(".");
        p.editor_fork_mode = true;
    }
    p.shell = shell;
    p.shell_args = default_shell_args(shell);
    return p;
}

// ── Paths ────────────────────────────────────────────────────

fs::path get_config_path() {
    return platform::config_dir() / CONFIG_FILE_NAME;
}

fs::path get_templates_path() {
    return platform::config_dir() / TEMPLATES_FILE_NAME;
}

bool config_exists() {
    return fs::exists(get_config_path());
}

// ── Load / save ──────────────────────────────────────────────

Config Config::defaults() {
    Config config;
    config.version_ = CONFIG_VERSION;
    config.options_.projects_directory = platform::default_projects_dir();
    config.options_.current_profile = DEFAULT_PROFILE;
    config.options_.display_hidden = false;
    config.profiles_.push_back({DEFAULT_PROFILE,
                                make_profile(platform::default_editor(), platform::default_shell())});
    return config;
}

static Profile parse_profile(const YAML::Node& node) {
    Profile p;
    p.editor = node["editor"].as<std::string>("");
    p.editor_args = node["editor_args"].as<std::vector<std::string>>(std::vector<std::string>());
    p.editor_fork_mode = node["editor_fork_mode"].as<bool>(false);
    p.shell = node["shell"].as<std::string>("");
    if (node["shell_args"]) {
        p.shell_args = node["shell_args"].as<std::vector<std::string>>(std::vector<std::string>());
    } else {
        p.shell_args = default_shell_args(p.shell);
    }
    return p;
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        Config config = defaults();

        config.version_ = root["version"].as<std::string>(CONFIG_VERSION);

        if (const YAML::Node options = root["options"]) {
            if (options["projects_directory"]) {
                config.options_.projects_directory = options["projects_directory"].as<std::string>();
            }
            config.options_.current_profile =
                options["current_profile"].as<std::string>(DEFAULT_PROFILE);
            config.options_.display_hidden = options["display_hidden"].as<bool>(false);
        }

        if (const YAML::Node profiles = root["profiles"]) {
            if (!profiles.IsMap()) {
                return Result<Config>::Err("Failed to parse config: 'profiles' must be a map");
            }
            config.profiles_.clear();
            for (const auto& kv : profiles) {
                config.profiles_.push_back({kv.first.as<std::string>(), parse_profile(kv.second)});
            }
        }

        if (const YAML::Node recent = root["recent"]) {
            config.recent_.enabled = recent["enabled"].as<bool>(true);
            config.recent_.recent_project = recent["recent_project"].as<std::string>("");
        }

        if (const YAML::Node ac = root["autocomplete"]) {
            config.autocomplete_.enabled = ac["enabled"].as<bool>(true);
            config.autocomplete_.always_accept = ac["always_accept"].as<bool>(true);
        }

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<void> Config::save(const fs::path& path) const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "version" << YAML::Value << YAML::DoubleQuoted << version_;

    out << YAML::Key << "options" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "projects_directory" << YAML::Value << options_.projects_directory.string();
    out << YAML::Key << "current_profile" << YAML::Value << options_.current_profile;
    out << YAML::Key << "display_hidden" << YAML::Value << options_.display_hidden;
    out << YAML::EndMap;

    out << YAML::Key << "profiles" << YAML::Value << YAML::BeginMap;
    for (const auto& [name, p] : profiles_) {
        out << YAML::Key << name << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "editor" << YAML::Value << p.editor;
        out << YAML::Key << "editor_args" << YAML::Value << YAML::Flow << p.editor_args;
        out << YAML::Key << "editor_fork_mode" << YAML::Value << p.editor_fork_mode;
        out << YAML::Key << "shell" << YAML::Value << p.shell;
        out << YAML::Key << "shell_args" << YAML::Value << YAML::Flow << p.shell_args;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;

    out << YAML::Key << "recent" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "enabled" << YAML::Value << recent_.enabled;
    out << YAML::Key << "recent_project" << YAML::Value << recent_.recent_project;
    out << YAML::EndMap;

    out << YAML::Key << "autocomplete" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "enabled" << YAML::Value << autocomplete_.enabled;
    out << YAML::Key << "always_accept" << YAML::Value << autocomplete_.always_accept;
    out << YAML::EndMap;

    out << YAML::EndMap;

    if (!out.good()) {
        return Result<void>::Err("Failed to format config: " + out.GetLastError());
    }

    try {
        if (path.has_parent_path()) fs::create_directories(path.parent_path());
        std::ofstream file(path);
        if (!file) {
            return Result<void>::Err("Failed to write config file at " + path.string());
        }
        file << out.c_str() << "\n";
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err(std::string("Failed to write config file: ") + e.what());
    }
}

Result<void> create_default_config() {
    fs::path config_path = get_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }
    return Config::defaults().save(config_path);
}

// ── Profiles ─────────────────────────────────────────────────

Result<Profile> Config::profile(const std::string& name) const {
    for (const auto& [key, p] : profiles_) {
        if (key == name) return Result<Profile>::Ok(p);
    }
    return Result<Profile>::Err("Profile '" + name + "' was not found.");
}

bool Config::has_profile(const std::string& name) const {
    return std::any_of(profiles_.begin(), profiles_.end(),
                       [&](const auto& kv) { return kv.first == name; });
}

void Config::set_profile(const std::string& name, const Profile& profile) {
    for (auto& [key, p] : profiles_) {
        if (key == name) {
            p = profile;
            return;
        }
    }
    profiles_.push_back({name, profile});
}

bool Config::remove_profile(const std::string& name) {
    auto it = std::find_if(profiles_.begin(), profiles_.end(),
                           [&](const auto& kv) { return kv.first == name; });
    if (it == profiles_.end()) return false;
    profiles_.erase(it);
    return true;
}

#pragma once

#include <string>
#include <filesystem>

namespace platform {

#ifdef _WIN32
constexpr bool kWindowsHost = true;
#else
constexpr bool kWindowsHost = false;
#endif

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Returns a fresh path in the temp directory with the given prefix. The file is not created.
std::filesystem::path temp_file(const std::string& prefix);

// Directory holding config.yaml and templates.yaml.
// KANRI_CONFIG_DIR, then XDG_CONFIG_HOME/kanri (APPDATA\kanri on Windows), then ~/.config/kanri.
std::filesystem::path config_dir();

// ~/Projects
std::filesystem::path default_projects_dir();

// Editor and shell program names from the environment, with fallbacks.
std::string default_editor();
std::string default_shell();

} // namespace platform

#include "platform.hpp"
#include <core/constants.hpp>
#include <cstdlib>
#include <ctime>
#include <random>

#ifndef _WIN32
#  include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace platform {

static std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

fs::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home) home = std::getenv("HOME");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

fs::path temp_file(const std::string& prefix) {
    static std::mt19937 rng(static_cast<unsigned>(std::time(nullptr)));
    std::uniform_int_distribution<int> dist(10000, 99999);
#ifdef _WIN32
    std::string pid_part;
#else
    std::string pid_part = std::to_string(getpid()) + "_";
#endif
    fs::path p;
    do {
        p = temp_dir() / (prefix + "_" + pid_part + std::to_string(dist(rng)));
    } while (fs::exists(p));
    return p;
}

fs::path config_dir() {
    std::string override_dir = env_or_empty(ENV_CONFIG_DIR);
    if (!override_dir.empty()) return fs::path(override_dir);

#ifdef _WIN32
    std::string appdata = env_or_empty("APPDATA");
    if (!appdata.empty()) return fs::path(appdata) / "kanri";
#else
    std::string xdg = env_or_empty("XDG_CONFIG_HOME");
    if (!xdg.empty()) return fs::path(xdg) / "kanri";
#endif
    return home_dir() / ".config" / "kanri";
}

fs::path default_projects_dir() {
    return home_dir() / "Projects";
}

std::string default_editor() {
    std::string editor = env_or_empty("VISUAL");
    if (editor.empty()) editor = env_or_empty("EDITOR");
    if (!editor.empty()) return editor;
#ifdef _WIN32
    return "notepad";
#else
    return "vim";
#endif
}

std::string default_shell() {
#ifdef _WIN32
    return "powershell";
#else
    std::string shell = env_or_empty("SHELL");
    if (shell.empty()) return "sh";
    // Keep only the program name; the shell is resolved through PATH.
    return fs::path(shell).filename().string();
#endif
}

} // namespace platform

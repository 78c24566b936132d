#pragma once

#include <string>
#include <vector>
#include <cstdlib>
#include <fmt/format.h>
#include <core/constants.hpp>

namespace theme {

// Escape codes are blanked when NO_COLOR is set (https://no-color.org).
inline bool colors_enabled() {
    static const bool enabled = [] {
        const char* v = std::getenv(ENV_NO_COLOR);
        return v == nullptr || *v == '\0';
    }();
    return enabled;
}

inline std::string esc(const char* code) {
    return colors_enabled() ? std::string(code) : std::string();
}

// Palette (ANSI escape sequences)
// Indigo: #5C6BC0
// Amber:  #C8963E
namespace color {
    const std::string BLUE      = esc("\033[38;2;92;107;192m");
    const std::string BROWN     = esc("\033[38;2;200;150;62m");
    const std::string WHITE     = esc("\033[97m");
    const std::string GRAY      = esc("\033[90m");
    const std::string RED       = esc("\033[91m");
    const std::string GREEN     = esc("\033[92m");
    const std::string YELLOW    = esc("\033[93m");
    const std::string BOLD      = esc("\033[1m");
    const std::string DIM       = esc("\033[2m");
    const std::string RESET     = esc("\033[0m");
}

// Shorthand wrappers
inline std::string blue(const std::string& s)   { return color::BLUE + s + color::RESET; }
inline std::string brown(const std::string& s)   { return color::BROWN + s + color::RESET; }
inline std::string bold(const std::string& s)    { return color::BOLD + s + color::RESET; }
inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }
inline std::string green(const std::string& s)   { return color::GREEN + s + color::RESET; }
inline std::string red(const std::string& s)     { return color::RED + s + color::RESET; }
inline std::string yellow(const std::string& s)  { return color::YELLOW + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

inline std::string rule() {
    std::string line;
    for (int i = 0; i < 44; i++) line += "\xe2\x94\x80";
    return color::DIM + "  " + line + color::RESET + "\n";
}

// Title, version, rule
inline std::string banner(const std::string& version) {
    return "\n" + color::BLUE + color::BOLD
        + "  kanri\n"
        + color::RESET + color::DIM + "  v" + version + "\n"
        + "  Local project manager"
        + color::RESET + "\n\n"
        + rule();
}

// Section header: blank line before title, blank line after
inline std::string section(const std::string& title) {
    return "\n" + color::BROWN + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::BLUE + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::BROWN + "    > " + color::RESET + msg + "\n";
}

// Progress line for one step of a multi-step operation: "  [2/5] cmd"
inline std::string progress(const std::string& msg, size_t current, size_t total) {
    return color::DIM + fmt::format("    [{}/{}] ", current, total) + color::RESET + msg + "\n";
}

// List row, optionally tagged ("(recent)", "(current)")
inline std::string item(const std::string& name, const std::string& tag = "") {
    std::string line = "    " + name;
    if (!tag.empty()) line += " " + dim(tag);
    return line + "\n";
}

// Key-value row for detail panels
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<10}", key) + color::RESET + value + "\n";
}

// ── Zen ─────────────────────────────────────────────────

inline const std::vector<std::string>& zen_lines() {
    static const std::vector<std::string> lines = {
        "Projects should be simple.",
        "Each command does one thing well.",
        "Configuration is explicit.",
        "Sensible defaults guide the way.",
        "The shell is a friend.",
        "Templates accelerate your workflow.",
        "Cross-platform by design.",
        "Clear messages beat surprises.",
        "Your editor is respected.",
        "Enjoy your work.",
    };
    return lines;
}

inline std::string zen() {
    std::string out = section("The zen of kanri");
    for (const auto& line : zen_lines()) {
        out += color::DIM + "    * " + color::RESET + line + "\n";
    }
    return out + "\n";
}

} // namespace theme

#pragma once

#include <string>
#include <fstream>
#include <filesystem>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string kanri_log_path() {
    static std::string path = (platform::temp_dir() / "kanri_debug.log").string();
    return path;
}

// Append a timestamped line to the debug log. Silently drops the line if the
// log file cannot be opened.
inline void kanri_log(const std::string& msg) {
    std::ofstream out(kanri_log_path(), std::ios::app);
    if (!out) return;
    out << "[" << now_log_stamp() << "] " << msg << "\n";
}

template <typename... Args>
inline void kanri_logf(fmt::format_string<Args...> fmt_str, Args&&... args) {
    kanri_log(fmt::format(fmt_str, std::forward<Args>(args)...));
}

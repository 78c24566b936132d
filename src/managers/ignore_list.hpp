#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <system_error>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Names listed in <projects root>/.ignore. One name per line; blank lines and
// '#' comments are skipped. Matching is exact, no globs.
class IgnoreList {
public:
    IgnoreList() = default;

    // Load the ignore file from base_dir. A missing file yields an empty list;
    // an unreadable one is an error.
    static Result<IgnoreList, std::error_code> load(const fs::path& base_dir);

    // Parse ignore file content.
    static IgnoreList parse(const std::string& content);

    bool contains(const std::string& name) const;
    bool empty() const { return names_.empty(); }
    const std::vector<std::string>& names() const { return names_; }

private:
    std::vector<std::string> names_;
};

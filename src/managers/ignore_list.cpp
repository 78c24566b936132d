#include "ignore_list.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <algorithm>
#include <cerrno>
#include <fstream>
#include <sstream>

Result<IgnoreList, std::error_code> IgnoreList::load(const fs::path& base_dir) {
    fs::path ignore_path = base_dir / IGNORE_FILE_NAME;

    std::error_code ec;
    bool present = fs::exists(ignore_path, ec);
    if (ec) {
        return Result<IgnoreList, std::error_code>::Err(ec);
    }
    if (!present) {
        return Result<IgnoreList, std::error_code>::Ok(IgnoreList());
    }

    std::ifstream file(ignore_path);
    if (!file) {
        int err = errno != 0 ? errno : EIO;
        return Result<IgnoreList, std::error_code>::Err(std::error_code(err, std::generic_category()));
    }

    std::ostringstream content;
    content << file.rdbuf();
    return Result<IgnoreList, std::error_code>::Ok(parse(content.str()));
}

IgnoreList IgnoreList::parse(const std::string& content) {
    IgnoreList list;
    std::istringstream in(content);
    std::string line;

    while (std::getline(in, line)) {
        trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }

        list.names_.push_back(line);
    }

    return list;
}

bool IgnoreList::contains(const std::string& name) const {
    return std::find(names_.begin(), names_.end(), name) != names_.end();
}

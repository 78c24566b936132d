#include "library.hpp"
#include "ignore_list.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>

namespace {

using Kind = LibraryError::Kind;

LibraryError make_error(Kind kind, const std::string& target) {
    LibraryError e;
    e.kind = kind;
    e.target = target;
    return e;
}

// Map an OS error onto the library's error kinds, keeping the original code.
LibraryError classify_io(const std::error_code& ec, const std::string& target) {
    LibraryError e = make_error(Kind::IoError, target);
    e.io = ec;
    if (ec == std::errc::no_such_file_or_directory) {
        e.kind = Kind::DirectoryNotFound;
    } else if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        e.kind = Kind::PermissionDenied;
    } else if (ec == std::errc::not_a_directory) {
        e.kind = Kind::NotADirectory;
    } else if (ec == std::errc::file_exists || ec == std::errc::directory_not_empty) {
        e.kind = Kind::AlreadyExists;
    }
    return e;
}

LibraryError invalid_name(NameError reason, const std::string& target) {
    LibraryError e = make_error(Kind::InvalidProjectName, target);
    e.name_error = reason;
    return e;
}

// True if something (file, directory, dangling link) occupies path.
// Errors other than "not found" are reported through ec.
bool occupied(const fs::path& path, std::error_code& ec) {
    auto st = fs::symlink_status(path, ec);
    if (st.type() == fs::file_type::not_found) {
        ec.clear();
        return false;
    }
    return !ec;
}

} // namespace

std::string describe(const LibraryError& error) {
    switch (error.kind) {
        case Kind::AlreadyExists:
            return fmt::format("name '{}' is already taken", error.target);
        case Kind::ProjectNotFound:
            return fmt::format("project '{}' not found", error.target);
        case Kind::InvalidPath:
            return fmt::format("invalid path to the projects directory: {}", error.target);
        case Kind::InvalidProjectName:
            return fmt::format("'{}': {}", error.target, describe(error.name_error));
        case Kind::DirectoryNotFound:
            return fmt::format("'{}' does not exist", error.target);
        case Kind::PermissionDenied:
            return fmt::format("not enough permission to access '{}'", error.target);
        case Kind::NotADirectory:
            return fmt::format("'{}' is not a directory", error.target);
        case Kind::CloneFailed:
            return fmt::format("failed to clone repository: {}", platform::describe(error.program));
        case Kind::IoError:
            break;
    }
    return fmt::format("I/O error on '{}': {}", error.target, error.io.message());
}

// ── Scan ─────────────────────────────────────────────────────

Result<Library, LibraryError> Library::open(const fs::path& base_path, bool display_hidden) {
    std::error_code ec;
    if (!fs::is_directory(base_path, ec)) {
        return Result<Library, LibraryError>::Err(make_error(Kind::InvalidPath, base_path.string()));
    }

    Library library;
    library.base_path_ = base_path;

    fs::directory_iterator it(base_path, ec);
    if (ec) {
        return Result<Library, LibraryError>::Err(classify_io(ec, base_path.string()));
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;

        const auto& entry = *it;
        std::string name = entry.path().filename().string();

        if (!display_hidden && !name.empty() && name[0] == '.') continue;
        if (is_system_name(name)) continue;

        // Broken links and unreadable entries simply are not projects.
        std::error_code type_ec;
        if (!entry.is_directory(type_ec)) continue;

        library.projects_.push_back({name, entry.path()});
    }
    if (ec) {
        return Result<Library, LibraryError>::Err(classify_io(ec, base_path.string()));
    }

    auto ignore = IgnoreList::load(base_path);
    if (ignore.is_err()) {
        return Result<Library, LibraryError>::Err(
            classify_io(ignore.error, (base_path / IGNORE_FILE_NAME).string()));
    }
    if (!ignore.value.empty()) {
        auto& projects = library.projects_;
        projects.erase(std::remove_if(projects.begin(), projects.end(),
                                      [&](const Project& p) { return ignore.value.contains(p.name); }),
                       projects.end());
    }

    // Sort for consistent ordering
    std::sort(library.projects_.begin(), library.projects_.end(),
              [](const Project& a, const Project& b) { return a.name < b.name; });

    kanri_logf("library: scanned {} ({} projects, hidden={})",
               base_path.string(), library.projects_.size(), display_hidden);
    return Result<Library, LibraryError>::Ok(std::move(library));
}

// ── Mutations ────────────────────────────────────────────────

Result<void, LibraryError> Library::create(const std::string& name) {
    fs::path path = base_path_ / name;

    std::error_code ec;
    if (occupied(path, ec)) {
        return Result<void, LibraryError>::Err(make_error(Kind::AlreadyExists, name));
    }
    if (ec) {
        return Result<void, LibraryError>::Err(classify_io(ec, name));
    }

    auto valid = validate_project_name(name);
    if (valid.is_err()) {
        return Result<void, LibraryError>::Err(invalid_name(valid.error, name));
    }

    if (!fs::create_directory(path, ec) || ec) {
        if (!ec) ec = std::make_error_code(std::errc::file_exists);
        kanri_logf("library: create {} failed: {}", name, ec.message());
        return Result<void, LibraryError>::Err(classify_io(ec, name));
    }

    projects_.push_back({name, path});
    kanri_logf("library: created {}", path.string());
    return Result<void, LibraryError>::Ok();
}

Result<void, LibraryError> Library::remove(const std::string& name) {
    // Only a single path component below the root may be removed.
    if (validate_project_name(name, false).is_err()) {
        return Result<void, LibraryError>::Err(make_error(Kind::ProjectNotFound, name));
    }

    fs::path path = base_path_ / name;

    std::error_code ec;
    if (!occupied(path, ec)) {
        if (!ec) ec = std::make_error_code(std::errc::no_such_file_or_directory);
        return Result<void, LibraryError>::Err(classify_io(ec, name));
    }

    fs::remove_all(path, ec);
    if (ec) {
        kanri_logf("library: remove {} failed: {}", name, ec.message());
        return Result<void, LibraryError>::Err(classify_io(ec, name));
    }

    projects_.erase(std::remove_if(projects_.begin(), projects_.end(),
                                   [&](const Project& p) { return p.name == name; }),
                    projects_.end());
    kanri_logf("library: removed {}", path.string());
    return Result<void, LibraryError>::Ok();
}

Result<void, LibraryError> Library::rename(const std::string& old_name, const std::string& new_name) {
    auto entry = std::find_if(projects_.begin(), projects_.end(),
                              [&](const Project& p) { return p.name == old_name; });
    if (entry == projects_.end()) {
        return Result<void, LibraryError>::Err(make_error(Kind::ProjectNotFound, old_name));
    }

    if (contains(new_name)) {
        return Result<void, LibraryError>::Err(make_error(Kind::AlreadyExists, new_name));
    }

    auto valid = validate_project_name(new_name);
    if (valid.is_err()) {
        return Result<void, LibraryError>::Err(invalid_name(valid.error, new_name));
    }

    fs::path old_path = base_path_ / old_name;
    fs::path new_path = base_path_ / new_name;

    // Hidden or ignored entries are not indexed but still occupy the name, and
    // rename(2) would silently replace an empty directory.
    std::error_code ec;
    if (occupied(new_path, ec)) {
        return Result<void, LibraryError>::Err(make_error(Kind::AlreadyExists, new_name));
    }
    if (ec) {
        return Result<void, LibraryError>::Err(classify_io(ec, new_name));
    }

    fs::rename(old_path, new_path, ec);
    if (ec) {
        kanri_logf("library: rename {} -> {} failed: {}", old_name, new_name, ec.message());
        return Result<void, LibraryError>::Err(classify_io(ec, old_name));
    }

    // Swap the entry in place; position in the listing is kept.
    *entry = Project{new_name, new_path};
    kanri_logf("library: renamed {} -> {}", old_name, new_name);
    return Result<void, LibraryError>::Ok();
}

Result<void, LibraryError> Library::clone_repository(const CloneOptions& options,
                                                     const platform::ProgramRunner& runner) const {
    if (options.name) {
        auto valid = validate_project_name(*options.name);
        if (valid.is_err()) {
            return Result<void, LibraryError>::Err(invalid_name(valid.error, *options.name));
        }
        if (contains(*options.name)) {
            return Result<void, LibraryError>::Err(make_error(Kind::AlreadyExists, *options.name));
        }
    }

    platform::LaunchOptions launch;
    launch.program = "git";
    launch.args = {"clone", options.remote};
    if (options.name) {
        launch.args.push_back(*options.name);
    }
    if (options.branch) {
        launch.args.push_back("-b");
        launch.args.push_back(*options.branch);
    }
    launch.cwd = base_path_;

    auto result = runner(launch);
    if (result.is_err()) {
        LibraryError e = make_error(Kind::CloneFailed, options.remote);
        e.program = result.error;
        return Result<void, LibraryError>::Err(e);
    }
    return Result<void, LibraryError>::Ok();
}

// ── Lookups ──────────────────────────────────────────────────

const Project* Library::get(const std::string& name) const {
    auto it = std::find_if(projects_.begin(), projects_.end(),
                           [&](const Project& p) { return p.name == name; });
    return it == projects_.end() ? nullptr : &*it;
}

bool Library::contains(const std::string& name) const {
    return get(name) != nullptr;
}

std::vector<std::string> Library::names() const {
    std::vector<std::string> out;
    out.reserve(projects_.size());
    for (const auto& p : projects_) out.push_back(p.name);
    return out;
}

Result<bool, LibraryError> Library::is_project_empty(const std::string& name) const {
    const Project* project = get(name);
    if (!project) {
        return Result<bool, LibraryError>::Err(make_error(Kind::ProjectNotFound, name));
    }

    std::error_code ec;
    fs::directory_iterator it(project->path, ec);
    if (ec) {
        return Result<bool, LibraryError>::Err(classify_io(ec, name));
    }
    return Result<bool, LibraryError>::Ok(it == fs::directory_iterator());
}

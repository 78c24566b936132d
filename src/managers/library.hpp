#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <system_error>
#include <core/types.hpp>
#include <core/name_validator.hpp>
#include <platform/process.hpp>

namespace fs = std::filesystem;

struct LibraryError {
    enum class Kind {
        AlreadyExists,
        ProjectNotFound,
        InvalidPath,          // projects root is not an existing directory
        InvalidProjectName,
        DirectoryNotFound,
        PermissionDenied,
        NotADirectory,
        CloneFailed,
        IoError,
    };

    Kind kind = Kind::IoError;
    std::string target;               // project name or path the operation was about
    NameError name_error = NameError::Empty;      // InvalidProjectName only
    std::error_code io;                            // filesystem kinds
    platform::ProgramError program;                // CloneFailed only
};

std::string describe(const LibraryError& error);

struct CloneOptions {
    std::string remote;
    std::optional<std::string> branch;
    std::optional<std::string> name;
};

// Snapshot of the project directories under one root.
//
// The index is filled by a single scan in open() and is only changed by this
// object's own mutations afterwards. Changes made to the root by anyone else are
// invisible until a new Library is opened.
class Library {
public:
    Library() = default;

    // Scan base_path. Fails with InvalidPath if it is not an existing directory;
    // any I/O error during the scan fails the whole open.
    static Result<Library, LibraryError> open(const fs::path& base_path, bool display_hidden);

    // Create base_path/name and index it.
    Result<void, LibraryError> create(const std::string& name);

    // Recursively delete base_path/name. The index entry is dropped only when the
    // filesystem reports success.
    Result<void, LibraryError> remove(const std::string& name);

    // Rename a project directory. On failure the index is left untouched.
    Result<void, LibraryError> rename(const std::string& old_name, const std::string& new_name);

    // Run `git clone` inside the projects root. The index is not updated; open a new
    // Library to see the clone.
    Result<void, LibraryError> clone_repository(const CloneOptions& options,
                                                const platform::ProgramRunner& runner = platform::launch) const;

    // Index lookups. These never touch the filesystem.
    const Project* get(const std::string& name) const;
    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;
    const std::vector<Project>& projects() const { return projects_; }
    bool empty() const { return projects_.empty(); }
    size_t size() const { return projects_.size(); }

    // Live check: true iff the project's directory currently has no entries.
    Result<bool, LibraryError> is_project_empty(const std::string& name) const;

    const fs::path& base_path() const { return base_path_; }

private:
    fs::path base_path_;
    std::vector<Project> projects_;   // scan/insertion order
};

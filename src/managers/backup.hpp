#pragma once

#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Pack config.yaml and templates.yaml from config_dir into a tar archive.
Result<void> save_backup(const fs::path& config_dir, const fs::path& out_path);

// Restore both files from a backup archive into config_dir. Each file must be
// present and parse before anything in config_dir is replaced.
Result<void> import_backup(const fs::path& archive_path, const fs::path& config_dir);

#include "backup.hpp"
#include "template_store.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/archive.hpp>
#include <platform/platform.hpp>
#include <algorithm>

namespace {

const std::vector<std::string>& backup_files() {
    static const std::vector<std::string> files = {CONFIG_FILE_NAME, TEMPLATES_FILE_NAME};
    return files;
}

// Scratch directory removed on scope exit
struct StagingDir {
    fs::path path;
    explicit StagingDir(fs::path p) : path(std::move(p)) {}
    ~StagingDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    StagingDir(const StagingDir&) = delete;
    StagingDir& operator=(const StagingDir&) = delete;
};

} // namespace

Result<void> save_backup(const fs::path& config_dir, const fs::path& out_path) {
    try {
        platform::create_tar(out_path, config_dir, backup_files());
    } catch (const std::exception& e) {
        kanri_logf("backup: {} failed: {}", out_path.string(), e.what());
        return Result<void>::Err(std::string("Failed to create backup: ") + e.what());
    }
    kanri_logf("backup: wrote {}", out_path.string());
    return Result<void>::Ok();
}

Result<void> import_backup(const fs::path& archive_path, const fs::path& config_dir) {
    std::error_code ec;
    if (!fs::is_regular_file(archive_path, ec)) {
        return Result<void>::Err("Backup file not found: " + archive_path.string());
    }

    StagingDir staging(platform::temp_file("kanri_import"));
    fs::create_directories(staging.path, ec);
    if (ec) {
        return Result<void>::Err("Failed to create staging directory: " + ec.message());
    }

    std::vector<std::string> found;
    try {
        found = platform::extract_tar(archive_path, staging.path, backup_files());
    } catch (const std::exception& e) {
        return Result<void>::Err(std::string("Failed to read backup: ") + e.what());
    }

    for (const auto& name : backup_files()) {
        if (std::find(found.begin(), found.end(), name) == found.end()) {
            return Result<void>::Err("Backup is missing " + name);
        }
    }

    // Validate before touching the live files
    auto config = Config::load(staging.path / CONFIG_FILE_NAME);
    if (config.is_err()) {
        return Result<void>::Err("Backup contains an invalid config: " + config.error);
    }
    auto templates = TemplateStore::load(staging.path / TEMPLATES_FILE_NAME);
    if (templates.is_err()) {
        return Result<void>::Err("Backup contains invalid templates: " + templates.error);
    }

    fs::create_directories(config_dir, ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + config_dir.string() + ": " + ec.message());
    }
    for (const auto& name : backup_files()) {
        fs::copy_file(staging.path / name, config_dir / name,
                      fs::copy_options::overwrite_existing, ec);
        if (ec) {
            return Result<void>::Err("Failed to install " + name + ": " + ec.message());
        }
    }

    kanri_logf("backup: imported {} into {}", archive_path.string(), config_dir.string());
    return Result<void>::Ok();
}

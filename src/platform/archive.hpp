#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace platform {

// Create a tar archive at tar_path containing the specified files
// from base_dir. Each entry in files is a relative path from base_dir.
// Throws std::runtime_error if the archive or any listed file cannot be written.
void create_tar(const std::filesystem::path& tar_path,
                const std::filesystem::path& base_dir,
                const std::vector<std::string>& files);

// Extract the entries named in `wanted` from tar_path into dest_dir.
// Other entries are skipped. Returns the names that were found.
// Throws std::runtime_error on a corrupt or unreadable archive.
std::vector<std::string> extract_tar(const std::filesystem::path& tar_path,
                                     const std::filesystem::path& dest_dir,
                                     const std::vector<std::string>& wanted);

} // namespace platform

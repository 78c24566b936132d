#include "archive.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <cstdint>
#include <cstring>

namespace fs = std::filesystem;

namespace platform {

// file_time_type's epoch is implementation-defined; tar wants Unix seconds
static int64_t unix_mtime(const fs::path& path) {
    using namespace std::chrono;
    std::error_code ec;
    auto ftime = fs::last_write_time(path, ec);
    if (ec) return static_cast<int64_t>(system_clock::to_time_t(system_clock::now()));

    auto sctp = time_point_cast<system_clock::duration>(
        ftime - fs::file_time_type::clock::now() + system_clock::now());
    int64_t secs = duration_cast<seconds>(sctp.time_since_epoch()).count();
    return std::max<int64_t>(secs, 0);
}

static std::string archive_message(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown error";
}

void create_tar(const fs::path& tar_path,
                const fs::path& base_dir,
                const std::vector<std::string>& files) {
    struct archive* a = archive_write_new();
    if (!a) throw std::runtime_error("Failed to create archive writer");

    archive_write_set_format_ustar(a);

    if (archive_write_open_filename(a, tar_path.string().c_str()) != ARCHIVE_OK) {
        std::string err = archive_message(a);
        archive_write_free(a);
        throw std::runtime_error("Failed to open tar file: " + err);
    }

    struct archive_entry* entry = archive_entry_new();

    auto abort_with = [&](const std::string& msg) {
        archive_entry_free(entry);
        archive_write_close(a);
        archive_write_free(a);
        std::error_code ec;
        fs::remove(tar_path, ec);
        throw std::runtime_error(msg);
    };

    for (const auto& rel_path : files) {
        fs::path full_path = base_dir / rel_path;

        std::error_code ec;
        if (!fs::is_regular_file(full_path, ec)) {
            abort_with("Missing file: " + full_path.string());
        }

        auto file_size = fs::file_size(full_path, ec);
        if (ec) abort_with("Failed to stat " + full_path.string() + ": " + ec.message());
        int64_t mtime_sec = unix_mtime(full_path);

        archive_entry_clear(entry);
        archive_entry_set_pathname(entry, rel_path.c_str());
        archive_entry_set_size(entry, static_cast<int64_t>(file_size));
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, 0644);
        archive_entry_set_mtime(entry, mtime_sec, 0);

        if (archive_write_header(a, entry) != ARCHIVE_OK) {
            abort_with("Failed to write header for " + rel_path + ": " + archive_message(a));
        }

        // Write file contents in chunks
        std::ifstream in(full_path, std::ios::binary);
        if (!in) abort_with("Failed to read " + full_path.string());

        char buf[65536];
        while (in) {
            in.read(buf, sizeof(buf));
            auto bytes_read = in.gcount();
            if (bytes_read > 0 &&
                archive_write_data(a, buf, static_cast<size_t>(bytes_read)) < 0) {
                abort_with("Failed to write " + rel_path + ": " + archive_message(a));
            }
        }
    }

    archive_entry_free(entry);
    if (archive_write_close(a) != ARCHIVE_OK) {
        std::string err = archive_message(a);
        archive_write_free(a);
        throw std::runtime_error("Failed to finish tar file: " + err);
    }
    archive_write_free(a);
}

std::vector<std::string> extract_tar(const fs::path& tar_path,
                                     const fs::path& dest_dir,
                                     const std::vector<std::string>& wanted) {
    struct archive* a = archive_read_new();
    if (!a) throw std::runtime_error("Failed to create archive reader");

    archive_read_support_format_tar(a);
    archive_read_support_filter_all(a);

    if (archive_read_open_filename(a, tar_path.string().c_str(), 10240) != ARCHIVE_OK) {
        std::string err = archive_message(a);
        archive_read_free(a);
        throw std::runtime_error("Failed to open " + tar_path.string() + ": " + err);
    }

    auto abort_with = [&](const std::string& msg) {
        archive_read_close(a);
        archive_read_free(a);
        throw std::runtime_error(msg);
    };

    std::vector<std::string> found;
    struct archive_entry* entry = nullptr;
    int rc;
    while ((rc = archive_read_next_header(a, &entry)) == ARCHIVE_OK) {
        const char* raw_name = archive_entry_pathname(entry);
        if (!raw_name) {
            archive_read_data_skip(a);
            continue;
        }
        std::string name = raw_name;

        // Only exact top-level names are taken, so nothing lands outside dest_dir
        bool take = std::find(wanted.begin(), wanted.end(), name) != wanted.end()
                    && archive_entry_filetype(entry) == AE_IFREG;
        if (!take) {
            archive_read_data_skip(a);
            continue;
        }

        fs::path out_path = dest_dir / name;
        std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
        if (!out) abort_with("Failed to write " + out_path.string());

        char buf[65536];
        la_ssize_t n;
        while ((n = archive_read_data(a, buf, sizeof(buf))) > 0) {
            out.write(buf, n);
        }
        if (n < 0) abort_with("Failed to read " + name + ": " + archive_message(a));
        if (!out) abort_with("Failed to write " + out_path.string());

        found.push_back(name);
    }

    if (rc != ARCHIVE_EOF) {
        abort_with("Corrupt archive " + tar_path.string() + ": " + archive_message(a));
    }

    archive_read_close(a);
    archive_read_free(a);
    return found;
}

} // namespace platform

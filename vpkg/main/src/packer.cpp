#include "packer.hpp"
#include "archive.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <nlohmann/json.hpp>

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <climits>
#include <ctime>
#include <fstream>
#include <memory>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

struct ArchiveWriter {
    struct archive* a = archive_write_new();

    ~ArchiveWriter() {
        if (a) {
            archive_write_close(a);
            archive_write_free(a);
        }
    }

    // Closing flushes the compressor; its result must be checked before the package is trusted.
    void close() {
        int r = archive_write_close(a);
        if (r != ARCHIVE_OK) {
            std::string err = archive_error_text(a);
            archive_write_free(a);
            a = nullptr;
            throw VpkgException(ErrorKind::Io, "Archive close failed: " + err);
        }
        archive_write_free(a);
        a = nullptr;
    }
};

void add_entry(struct archive* a, const fs::path& path, const std::string& entry_name) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        return;
    }

    std::unique_ptr<struct archive_entry, decltype(&archive_entry_free)> entry(archive_entry_new(), archive_entry_free);
    archive_entry_set_pathname(entry.get(), entry_name.c_str());
    archive_entry_copy_stat(entry.get(), &st);

    if (S_ISLNK(st.st_mode)) {
        char link_target[PATH_MAX];
        ssize_t len = readlink(path.c_str(), link_target, sizeof(link_target) - 1);
        if (len != -1) {
            link_target[len] = '\0';
            archive_entry_set_symlink(entry.get(), link_target);
        }
    }

    if (archive_write_header(a, entry.get()) != ARCHIVE_OK) {
        throw VpkgException(ErrorKind::Io, "Archive write header failed: " + archive_error_text(a));
    }

    if (S_ISREG(st.st_mode)) {
        std::ifstream f(path, std::ios::binary);
        char buffer[8192];
        while (f.read(buffer, sizeof(buffer)) || f.gcount() > 0) {
            if (archive_write_data(a, buffer, static_cast<size_t>(f.gcount())) < 0) {
                throw VpkgException(ErrorKind::Io, "Archive write data failed: " + archive_error_text(a));
            }
            if (f.eof()) break;
        }
    }
}

std::string utc_timestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

} // anonymous namespace

PackResult pack_package(const fs::path& source_dir, const fs::path& output_file, const PackOptions& options) {
    if (!fs::is_directory(source_dir)) {
        throw VpkgException(ErrorKind::Io, string_format("error.pack_source_not_found", source_dir.string()));
    }

    std::vector<fs::path> entries;
    for (const auto& entry : fs::recursive_directory_iterator(source_dir)) {
        fs::path rel = entry.path().lexically_relative(source_dir);
        if (options.generate_manifest && rel == "manifest.json") continue;
        entries.push_back(rel);
    }
    std::sort(entries.begin(), entries.end());

    PackResult result;
    json checksums = json::object();
    for (const auto& rel : entries) {
        const fs::path full = source_dir / rel;
        if (fs::is_regular_file(fs::symlink_status(full))) {
            ++result.file_count;
            if (options.generate_manifest) {
                checksums[rel.generic_string()] = calculate_sha256(full);
            }
        }
    }

    log_info(string_format("info.pack_writing", output_file.string()));

    ArchiveWriter writer;
    archive_write_add_filter_gzip(writer.a);
    archive_write_set_format_pax_restricted(writer.a);
    if (archive_write_open_filename(writer.a, output_file.c_str()) != ARCHIVE_OK) {
        throw VpkgException(ErrorKind::Io, string_format("error.create_file_failed", output_file.string()) + ": " + archive_error_text(writer.a));
    }

    if (options.generate_manifest) {
        json manifest = {
            {"version", options.version},
            {"channel", options.channel},
            {"build_date", utc_timestamp()},
            {"checksums", checksums}
        };
        const fs::path tmp_manifest = output_file.string() + ".manifest.tmp";
        {
            std::ofstream f(tmp_manifest);
            if (!f) {
                throw VpkgException(ErrorKind::Io, string_format("error.create_file_failed", tmp_manifest.string()));
            }
            f << manifest.dump(2) << "\n";
        }
        try {
            add_entry(writer.a, tmp_manifest, "manifest.json");
        } catch (...) {
            fs::remove(tmp_manifest);
            throw;
        }
        fs::remove(tmp_manifest);
    }

    for (const auto& rel : entries) {
        add_entry(writer.a, source_dir / rel, rel.generic_string());
    }
    writer.close();

    result.sha256 = calculate_sha256(output_file);
    result.size_bytes = fs::file_size(output_file);
    return result;
}

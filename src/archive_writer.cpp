#include "cbxconv/archive_writer.hpp"
#include "cbxconv/errors.hpp"
#include "cbxconv/fs_utils.hpp"
#include <fstream>
#include <memory>
#include <string>

#include <sys/stat.h>

#include <archive.h>
#include <archive_entry.h>

namespace cbxconv {

namespace fs = std::filesystem;

namespace {

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const noexcept {
        archive_write_free(a);
    }
};

struct EntryDeleter {
    void operator()(struct archive_entry* e) const noexcept {
        archive_entry_free(e);
    }
};

using ArchiveWritePtr = std::unique_ptr<struct archive, ArchiveWriteDeleter>;
using EntryPtr = std::unique_ptr<struct archive_entry, EntryDeleter>;

void check(struct archive* a, int r, const std::string& what) {
    if (r < ARCHIVE_WARN) {
        const char* msg = archive_error_string(a);
        throw PackagingFailure(what + ": " + (msg ? msg : "unknown libarchive error"));
    }
}

void configure_format(struct archive* a, ArchiveFormat format, int level) {
    const std::string lvl = std::to_string(level);

    switch (format) {
        case ArchiveFormat::ZIP:
            check(a, archive_write_set_format_zip(a), "Cannot select zip format");
            if (level == 0) {
                check(a, archive_write_set_format_option(a, "zip", "compression", "store"),
                      "Cannot set zip compression");
            } else {
                check(a, archive_write_set_format_option(a, "zip", "compression", "deflate"),
                      "Cannot set zip compression");
                check(a, archive_write_set_format_option(a, "zip", "compression-level", lvl.c_str()),
                      "Cannot set zip compression level");
            }
            break;
        case ArchiveFormat::SEVEN_ZIP:
            check(a, archive_write_set_format_7zip(a), "Cannot select 7z format");
            if (level == 0) {
                check(a, archive_write_set_format_option(a, "7zip", "compression", "store"),
                      "Cannot set 7z compression");
            } else {
                check(a, archive_write_set_format_option(a, "7zip", "compression", "lzma2"),
                      "Cannot set 7z compression");
                check(a, archive_write_set_format_option(a, "7zip", "compression-level", lvl.c_str()),
                      "Cannot set 7z compression level");
            }
            break;
        case ArchiveFormat::RAR:
            throw PackagingFailure("RAR output is not supported, use cbz/zip or cb7/7z");
    }
}

void add_file(struct archive* a, const fs::path& source_dir, const fs::path& rel,
              std::vector<char>& buffer) {
    const fs::path full = source_dir / rel;

    struct stat st;
    if (::stat(full.c_str(), &st) != 0) {
        throw PackagingFailure("Cannot stat " + full.string());
    }

    EntryPtr entry(archive_entry_new());
    archive_entry_copy_stat(entry.get(), &st);
    archive_entry_set_pathname(entry.get(), rel.generic_string().c_str());
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), 0644);
    check(a, archive_write_header(a, entry.get()), "Cannot write header for " + rel.generic_string());

    std::ifstream in(full, std::ios::binary);
    if (!in) {
        throw PackagingFailure("Cannot open " + full.string());
    }
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize n = in.gcount();
        if (n <= 0) break;
        la_ssize_t written = archive_write_data(a, buffer.data(), static_cast<size_t>(n));
        if (written < 0) {
            const char* msg = archive_error_string(a);
            throw PackagingFailure("Cannot write " + rel.generic_string() + ": " +
                                   (msg ? msg : "unknown libarchive error"));
        }
    }
    if (in.bad()) {
        throw PackagingFailure("Read error on " + full.string());
    }
}

} // namespace

bool is_writable_format(ArchiveFormat format) {
    return format == ArchiveFormat::ZIP || format == ArchiveFormat::SEVEN_ZIP;
}

void write_archive(const fs::path& source_dir,
                   const std::vector<fs::path>& files,
                   const fs::path& output_path,
                   ArchiveFormat format,
                   int compression_level) {
    if (compression_level < 0 || compression_level > 9) {
        throw PackagingFailure("Compression level must be between 0 and 9");
    }
    if (!is_writable_format(format)) {
        throw PackagingFailure("RAR output is not supported, use cbz/zip or cb7/7z");
    }

    ArchiveWritePtr a(archive_write_new());
    if (!a) {
        throw PackagingFailure("Failed to allocate archive writer");
    }

    try {
        configure_format(a.get(), format, compression_level);
        if (output_path.has_parent_path()) {
            fs::create_directories(output_path.parent_path());
        }
        check(a.get(), archive_write_open_filename(a.get(), output_path.c_str()),
              "Cannot create " + output_path.string());

        std::vector<char> buffer(64 * 1024);
        for (const auto& rel : files) {
            add_file(a.get(), source_dir, rel, buffer);
        }

        // close schreibt beim zip erst das central directory
        check(a.get(), archive_write_close(a.get()), "Cannot finalize " + output_path.string());
    } catch (const PackagingFailure&) {
        a.reset();
        std::error_code ec;
        fs::remove(output_path, ec);
        throw;
    } catch (const std::exception& e) {
        a.reset();
        std::error_code ec;
        fs::remove(output_path, ec);
        throw PackagingFailure(e.what());
    }
}

size_t write_archive(const fs::path& source_dir,
                     const fs::path& output_path,
                     ArchiveFormat format,
                     int compression_level) {
    auto files = fsutil::list_files_sorted(source_dir);
    write_archive(source_dir, files, output_path, format, compression_level);
    return files.size();
}

} // namespace cbxconv

#include "cbxconv/archive_reader.hpp"
#include "cbxconv/errors.hpp"
#include "cbxconv/fs_utils.hpp"
#include <algorithm>
#include <fstream>
#include <memory>

#include <archive.h>
#include <archive_entry.h>

namespace cbxconv {

namespace fs = std::filesystem;

namespace {

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const noexcept {
        archive_read_free(a);
    }
};

using ArchiveReadPtr = std::unique_ptr<struct archive, ArchiveReadDeleter>;

ArchiveReadPtr open_for_reading(const fs::path& path) {
    ArchiveReadPtr a(archive_read_new());
    if (!a) {
        throw ExtractionFailure("Failed to allocate archive reader");
    }
    // cbr sind oft zips mit falscher endung, deshalb alles erlauben
    archive_read_support_filter_all(a.get());
    archive_read_support_format_all(a.get());

    if (archive_read_open_filename(a.get(), path.c_str(), 10240) != ARCHIVE_OK) {
        const char* msg = archive_error_string(a.get());
        throw ExtractionFailure("Cannot open " + path.string() + ": " +
                                (msg ? msg : "unknown libarchive error"));
    }
    return a;
}

std::string error_of(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

} // namespace

const char* to_string(ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::ZIP:       return "zip";
        case ArchiveFormat::RAR:       return "rar";
        case ArchiveFormat::SEVEN_ZIP: return "7z";
    }
    return "unknown";
}

std::optional<ArchiveFormat> format_from_extension(const fs::path& path) {
    auto ext = fsutil::lower_extension(path);
    if (ext == ".cbz" || ext == ".zip") return ArchiveFormat::ZIP;
    if (ext == ".cbr" || ext == ".rar") return ArchiveFormat::RAR;
    if (ext == ".cb7" || ext == ".7z") return ArchiveFormat::SEVEN_ZIP;
    return std::nullopt;
}

std::string archive_extension(ArchiveFormat format, bool comic) {
    switch (format) {
        case ArchiveFormat::ZIP:       return comic ? ".cbz" : ".zip";
        case ArchiveFormat::RAR:       return comic ? ".cbr" : ".rar";
        case ArchiveFormat::SEVEN_ZIP: return comic ? ".cb7" : ".7z";
    }
    return ".cbz";
}

bool is_supported_archive(const fs::path& path) {
    return format_from_extension(path).has_value();
}

SourceArchive describe_archive(const fs::path& path) {
    auto format = format_from_extension(path);
    if (!format) {
        throw UnsupportedFormat("Unsupported archive format: " + path.extension().string());
    }

    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        throw ExtractionFailure("Cannot read " + path.string() + ": " + ec.message());
    }
    return SourceArchive{path, *format, size};
}

std::optional<fs::path> resolve_entry_path(const fs::path& destination, const std::string& entry_name) {
    // windows archive nutzen gern backslashes
    std::string name = entry_name;
    std::replace(name.begin(), name.end(), '\\', '/');

    fs::path entry(name);
    if (entry.is_absolute() || entry.has_root_name() || entry.has_root_directory()) {
        throw UnsafeEntryPath("Unsafe absolute path in archive entry: " + entry_name);
    }
    // "C:foo" auf posix ist kein root_name, trotzdem ablehnen
    if (name.size() >= 2 && name[1] == ':') {
        throw UnsafeEntryPath("Unsafe drive path in archive entry: " + entry_name);
    }

    fs::path normal = entry.lexically_normal();
    if (normal.empty() || normal == ".") {
        return std::nullopt;
    }
    if (*normal.begin() == "..") {
        throw UnsafeEntryPath("Path traversal detected in archive entry: " + entry_name);
    }

    // doppelt hält besser: ergebnis muss unter destination liegen
    fs::path base = destination.lexically_normal();
    fs::path target = (base / normal).lexically_normal();
    fs::path rel = target.lexically_relative(base);
    if (rel.empty() || *rel.begin() == "..") {
        throw UnsafeEntryPath("Path traversal detected in archive entry: " + entry_name);
    }
    return target;
}

size_t extract(const SourceArchive& archive, const fs::path& destination) {
    if (!format_from_extension(archive.path)) {
        throw UnsupportedFormat("Unsupported archive format: " + archive.path.extension().string());
    }

    std::error_code ec;
    fs::create_directories(destination, ec);
    if (ec) {
        throw ExtractionFailure("Cannot create " + destination.string() + ": " + ec.message());
    }

    auto a = open_for_reading(archive.path);
    size_t files_written = 0;
    std::vector<char> buffer(64 * 1024);

    while (true) {
        struct archive_entry* entry = nullptr;
        int r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_WARN) {
            throw ExtractionFailure("Corrupt archive " + archive.path.filename().string() + ": " +
                                    error_of(a.get()));
        }

        const char* raw_name = archive_entry_pathname(entry);
        if (!raw_name) {
            archive_read_data_skip(a.get());
            continue;
        }

        auto target = resolve_entry_path(destination, raw_name);
        if (!target) {
            archive_read_data_skip(a.get());
            continue;
        }

        auto type = archive_entry_filetype(entry);
        if (type == AE_IFDIR) {
            fs::create_directories(*target, ec);
            if (ec) {
                throw ExtractionFailure("Cannot create " + target->string() + ": " + ec.message());
            }
            continue;
        }
        if (type != AE_IFREG) {
            // links und devices gibts in comics nich, nie anlegen
            archive_read_data_skip(a.get());
            continue;
        }

        fs::create_directories(target->parent_path(), ec);
        if (ec) {
            throw ExtractionFailure("Cannot create " + target->parent_path().string() + ": " + ec.message());
        }

        std::ofstream out(*target, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw ExtractionFailure("Cannot write " + target->string());
        }

        while (true) {
            la_ssize_t n = archive_read_data(a.get(), buffer.data(), buffer.size());
            if (n == 0) break;
            if (n < 0) {
                throw ExtractionFailure("Error reading " + std::string(raw_name) + " from " +
                                        archive.path.filename().string() + ": " + error_of(a.get()));
            }
            out.write(buffer.data(), n);
        }
        out.close();
        if (!out) {
            throw ExtractionFailure("Write failed for " + target->string());
        }
        files_written++;
    }

    return files_written;
}

std::vector<std::string> list_entries(const fs::path& archive_path) {
    auto a = open_for_reading(archive_path);
    std::vector<std::string> names;

    while (true) {
        struct archive_entry* entry = nullptr;
        int r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_WARN) {
            throw ExtractionFailure("Corrupt archive " + archive_path.filename().string() + ": " +
                                    error_of(a.get()));
        }
        if (const char* name = archive_entry_pathname(entry)) {
            names.emplace_back(name);
        }
        archive_read_data_skip(a.get());
    }
    return names;
}

std::vector<fs::path> find_archives(const fs::path& directory, bool recursive) {
    std::vector<fs::path> archives;

    if (recursive) {
        for (const auto& entry : fs::recursive_directory_iterator(
                 directory, fs::directory_options::skip_permission_denied)) {
            if (entry.is_regular_file() && is_supported_archive(entry.path())) {
                archives.push_back(entry.path());
            }
        }
    } else {
        for (const auto& entry : fs::directory_iterator(directory)) {
            if (entry.is_regular_file() && is_supported_archive(entry.path())) {
                archives.push_back(entry.path());
            }
        }
    }

    std::sort(archives.begin(), archives.end());
    return archives;
}

} // namespace cbxconv

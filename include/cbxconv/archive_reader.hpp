#pragma once
// archive lesen: cbz/zip, cbr/rar, cb7/7z über libarchive

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cbxconv {

enum class ArchiveFormat {
    ZIP,
    RAR,
    SEVEN_ZIP
};

const char* to_string(ArchiveFormat format);

// read-only input, wird nie verändert
struct SourceArchive {
    std::filesystem::path path;
    ArchiveFormat format = ArchiveFormat::ZIP;
    uint64_t size = 0;
};

// nach extension, case-insensitive. nullopt = kein archiv
std::optional<ArchiveFormat> format_from_extension(const std::filesystem::path& path);

// ".cbz" / ".cbr" / ".cb7", mit comic=false ".zip" / ".rar" / ".7z"
std::string archive_extension(ArchiveFormat format, bool comic = true);

bool is_supported_archive(const std::filesystem::path& path);

// wirft UnsupportedFormat oder ExtractionFailure (nich lesbar)
SourceArchive describe_archive(const std::filesystem::path& path);

// entry name -> pfad unter destination
// wirft UnsafeEntryPath wenns rausführen würde (absolut, "..", laufwerk)
// nullopt für entries ohne ziel ("", "./")
std::optional<std::filesystem::path> resolve_entry_path(const std::filesystem::path& destination,
                                                        const std::string& entry_name);

// alles nach destination entpacken, relative pfade bleiben
// symlinks/hardlinks werden übersprungen
// wirft UnsupportedFormat, UnsafeEntryPath, ExtractionFailure
// gibt anzahl geschriebener files zurück
size_t extract(const SourceArchive& archive, const std::filesystem::path& destination);

// entry namen in archiv-reihenfolge
std::vector<std::string> list_entries(const std::filesystem::path& archive_path);

// alle unterstützten archive, sortiert
std::vector<std::filesystem::path> find_archives(const std::filesystem::path& directory,
                                                 bool recursive);

} // namespace cbxconv

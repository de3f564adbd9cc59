#pragma once
// archive schreiben über libarchive, zip (deflate) und 7z (lzma2)
// rar kann keiner schreiben

#include "cbxconv/archive_reader.hpp"
#include <filesystem>
#include <vector>

namespace cbxconv {

bool is_writable_format(ArchiveFormat format);

// schreibt files (relativ zu source_dir) genau in der übergebenen reihenfolge
// compression_level 0-9, 0 = store
// wirft PackagingFailure, halbfertiges output wird gelöscht
void write_archive(const std::filesystem::path& source_dir,
                   const std::vector<std::filesystem::path>& files,
                   const std::filesystem::path& output_path,
                   ArchiveFormat format,
                   int compression_level);

// ganzer ordner, sortiert nach relativem pfad
size_t write_archive(const std::filesystem::path& source_dir,
                     const std::filesystem::path& output_path,
                     ArchiveFormat format,
                     int compression_level);

} // namespace cbxconv

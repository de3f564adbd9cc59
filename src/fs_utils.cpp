#include "cbxconv/fs_utils.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace cbxconv {
namespace fsutil {

namespace fs = std::filesystem;

std::string lower_extension(const fs::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

fs::path make_unique_directory(const fs::path& base, const std::string& stem) {
    fs::create_directories(base);

    fs::path candidate = base / stem;
    for (int i = 1; i < 10000; ++i) {
        // create_directory liefert false wenns schon da war
        if (fs::create_directory(candidate)) {
            return candidate;
        }
        candidate = base / (stem + "_" + std::to_string(i));
    }
    throw std::runtime_error("Cannot create unique directory for " + (base / stem).string());
}

fs::path make_temp_directory(const fs::path& root, const std::string& prefix) {
    fs::path base = root.empty() ? fs::temp_directory_path() : root;
    fs::create_directories(base);

    thread_local std::mt19937_64 rng{std::random_device{}()};

    for (int attempt = 0; attempt < 100; ++attempt) {
        std::ostringstream name;
        name << prefix << std::hex << std::setw(12) << std::setfill('0')
             << (rng() & 0xffffffffffffULL);
        fs::path candidate = base / name.str();
        if (fs::create_directory(candidate)) {
            return candidate;
        }
    }
    throw std::runtime_error("Cannot create temporary directory under " + base.string());
}

std::vector<fs::path> list_files_sorted(const fs::path& dir) {
    std::vector<fs::path> files;
    for (const auto& entry : fs::recursive_directory_iterator(dir)) {
        if (entry.is_regular_file() && !entry.is_symlink()) {
            files.push_back(fs::relative(entry.path(), dir));
        }
    }
    std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
        return a.generic_string() < b.generic_string();
    });
    return files;
}

uint64_t directory_size(const fs::path& dir) {
    uint64_t total = 0;
    std::error_code ec;
    for (const auto& entry : fs::recursive_directory_iterator(dir, ec)) {
        if (entry.is_regular_file(ec) && !entry.is_symlink(ec)) {
            auto size = entry.file_size(ec);
            if (!ec) total += size;
        }
    }
    return total;
}

std::string format_size(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    size_t unit = 0;
    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        unit++;
    }
    std::ostringstream out;
    if (unit == 0) {
        out << bytes << " B";
    } else {
        out << std::fixed << std::setprecision(2) << size << " " << units[unit];
    }
    return out.str();
}

void ScopedDirectory::remove() noexcept {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    path_.clear();
}

} // namespace fsutil
} // namespace cbxconv

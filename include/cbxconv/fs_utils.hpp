#pragma once
// dateisystem kleinkram: temp ordner, größen, listings

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace cbxconv {
namespace fsutil {

// lowercase extension inkl punkt, ".jpg"
std::string lower_extension(const std::filesystem::path& path);

// legt base/stem an, bei kollision base/stem_1, base/stem_2, ...
// create_directory ist atomar, zwei archive kriegen nie denselben ordner
std::filesystem::path make_unique_directory(const std::filesystem::path& base,
                                            const std::string& stem);

// frischer ordner mit zufallsnamen unter root (leer = system temp)
std::filesystem::path make_temp_directory(const std::filesystem::path& root,
                                          const std::string& prefix);

// alle regulären files unter dir, relativ, sortiert nach generic_string
// symlinks werden nich verfolgt
std::vector<std::filesystem::path> list_files_sorted(const std::filesystem::path& dir);

uint64_t directory_size(const std::filesystem::path& dir);

std::string format_size(uint64_t bytes);

// löscht den ordner im destruktor, release() gibt ihn frei
class ScopedDirectory {
public:
    ScopedDirectory() = default;
    explicit ScopedDirectory(std::filesystem::path path) : path_(std::move(path)) {}
    ~ScopedDirectory() { remove(); }

    ScopedDirectory(const ScopedDirectory&) = delete;
    ScopedDirectory& operator=(const ScopedDirectory&) = delete;

    ScopedDirectory(ScopedDirectory&& other) noexcept : path_(std::move(other.path_)) {
        other.path_.clear();
    }

    ScopedDirectory& operator=(ScopedDirectory&& other) noexcept {
        if (this != &other) {
            remove();
            path_ = std::move(other.path_);
            other.path_.clear();
        }
        return *this;
    }

    const std::filesystem::path& path() const noexcept { return path_; }

    std::filesystem::path release() noexcept {
        auto p = std::move(path_);
        path_.clear();
        return p;
    }

    // best effort, fehler werden geschluckt weil destruktor
    void remove() noexcept;

private:
    std::filesystem::path path_;
};

} // namespace fsutil
} // namespace cbxconv

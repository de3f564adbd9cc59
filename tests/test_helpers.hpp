#pragma once
// gemeinsamer kram für die tests: temp ordner, bilder und zips bauen

#include "cbxconv/fs_utils.hpp"
#include "cbxconv/image_processor.hpp"
#include "cbxconv/logger.hpp"
#include <archive.h>
#include <archive_entry.h>
// libarchive makro kollidiert mit cbxconv::EventKind::ARCHIVE_FAILED
#undef ARCHIVE_FAILED
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace cbxconv {
namespace test {

namespace fs = std::filesystem;

// ein frischer ordner pro test, wird danach weggeräumt
class TempDir {
public:
    TempDir() : dir_(fsutil::make_temp_directory({}, "cbxconv-test-")) {}

    const fs::path& path() const { return dir_.path(); }
    fs::path operator/(const std::string& rel) const { return dir_.path() / rel; }

private:
    fsutil::ScopedDirectory dir_;
};

inline void write_bytes(const fs::path& path, const std::string& bytes) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    std::ofstream out(path, std::ios::binary);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        throw std::runtime_error("could not write " + path.string());
    }
}

inline std::string read_bytes(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// farbverlauf, damit der encoder was zu tun hat
inline ImageData make_image(int width, int height, int channels = 3) {
    ImageData image;
    image.width = width;
    image.height = height;
    image.channels = channels;
    image.pixels.resize(static_cast<size_t>(width) * height * channels);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            uint8_t* px = &image.pixels[(static_cast<size_t>(y) * width + x) * channels];
            for (int c = 0; c < channels; ++c) {
                px[c] = static_cast<uint8_t>((x * 7 + y * 3 + c * 60) & 0xFF);
            }
            if (channels == 4) px[3] = 255;
        }
    }
    return image;
}

inline void write_png(const fs::path& path, int width, int height, int channels = 3) {
    ImageProcessor processor;
    auto encoded = processor.encode_png(make_image(width, height, channels));
    write_bytes(path, std::string(encoded.begin(), encoded.end()));
}

// zip direkt über libarchive, damit auch böse entry namen gehen
inline void write_zip(const fs::path& path,
                      const std::vector<std::pair<std::string, std::string>>& entries) {
    struct archive* a = archive_write_new();
    archive_write_set_format_zip(a);
    if (archive_write_open_filename(a, path.string().c_str()) != ARCHIVE_OK) {
        std::string msg = archive_error_string(a) ? archive_error_string(a) : "open failed";
        archive_write_free(a);
        throw std::runtime_error(msg);
    }
    for (const auto& [name, data] : entries) {
        struct archive_entry* entry = archive_entry_new();
        archive_entry_set_pathname(entry, name.c_str());
        archive_entry_set_size(entry, static_cast<la_int64_t>(data.size()));
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, 0644);
        archive_write_header(a, entry);
        archive_write_data(a, data.data(), data.size());
        archive_entry_free(entry);
    }
    archive_write_close(a);
    archive_write_free(a);
}

// comic mit pages png seiten
inline void write_comic(const fs::path& path, int pages, int width = 64, int height = 96) {
    std::vector<std::pair<std::string, std::string>> entries;
    TempDir scratch;
    for (int i = 0; i < pages; ++i) {
        char name[32];
        std::snprintf(name, sizeof(name), "page_%03d.png", i + 1);
        write_png(scratch / name, width, height);
        entries.emplace_back(name, read_bytes(scratch / name));
    }
    write_zip(path, entries);
}

// merkt sich alle events, thread-safe. wait_for blockt bis ein passendes event kam
class RecordingLogger : public Logger {
public:
    void log(LogLevel, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.push_back(message);
    }

    void on_event(const PipelineEvent& event) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        }
        changed_.notify_all();
    }

    bool wait_for(EventKind kind, const fs::path& archive, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return changed_.wait_for(lock, timeout, [&] { return has_locked(kind, archive); });
    }

    std::vector<PipelineEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    // index vom ersten passenden event, -1 wenns keins gibt
    int index_of(EventKind kind, const fs::path& archive) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = 0; i < events_.size(); ++i) {
            if (events_[i].kind == kind && events_[i].archive == archive) {
                return static_cast<int>(i);
            }
        }
        return -1;
    }

    size_t count(EventKind kind) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count_if(events_.begin(), events_.end(),
            [kind](const PipelineEvent& e) { return e.kind == kind; }));
    }

private:
    bool has_locked(EventKind kind, const fs::path& archive) const {
        for (const auto& e : events_) {
            if (e.kind == kind && e.archive == archive) return true;
        }
        return false;
    }

    mutable std::mutex mutex_;
    std::condition_variable changed_;
    std::vector<PipelineEvent> events_;
    std::vector<std::string> messages_;
};

} // namespace test
} // namespace cbxconv

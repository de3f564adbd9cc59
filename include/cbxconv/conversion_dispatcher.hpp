#pragma once
// alle bilder eines staging ordners durch den pool jagen

#include "cbxconv/image_processor.hpp"
#include "cbxconv/logger.hpp"
#include "cbxconv/thread_pool.hpp"
#include <cstdint>
#include <filesystem>
#include <vector>

namespace cbxconv {

struct DispatchReport {
    std::vector<ConversionResult> results;  // eins pro bild, sortiert nach pfad
    size_t images_succeeded = 0;
    size_t images_failed = 0;
    size_t passthrough_files = 0;
    uint64_t original_bytes = 0;    // nur erfolgreiche
    uint64_t converted_bytes = 0;   // nur erfolgreiche

    // mindestens eine seite muss durch sein
    bool success() const noexcept { return images_succeeded > 0; }
};

class ConversionDispatcher {
public:
    ConversionDispatcher(ThreadPool& pool, Logger& logger) : pool_(pool), logger_(logger) {}

    // bilder -> output_dir (gleiche relative pfade, neue extension)
    // alles andere wird 1:1 kopiert (ComicInfo.xml etc)
    // kehrt erst zurück wenn jeder task ein result hat
    // archive ist nur fürs logging
    DispatchReport convert_all(const std::filesystem::path& source_dir,
                               const std::filesystem::path& output_dir,
                               const ConversionParams& params,
                               const std::filesystem::path& archive = {});

private:
    ThreadPool& pool_;
    Logger& logger_;
    ImageProcessor processor_;
};

// eigener pool mit worker_count threads (0 = auto)
DispatchReport convert_all(const std::filesystem::path& source_dir,
                           const std::filesystem::path& output_dir,
                           const ConversionParams& params,
                           size_t worker_count,
                           Logger& logger);

} // namespace cbxconv

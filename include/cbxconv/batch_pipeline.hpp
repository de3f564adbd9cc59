#pragma once
// batch orchestrator
// archiv i wird gepackt während archiv i+1 schon konvertiert wird:
// conversion pool kriegt max(1, threads-1), ein thread bleibt fürs packen

#include "cbxconv/archive_reader.hpp"
#include "cbxconv/conversion_dispatcher.hpp"
#include "cbxconv/image_processor.hpp"
#include "cbxconv/logger.hpp"
#include "cbxconv/packaging_worker.hpp"
#include "cbxconv/stats_store.hpp"
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace cbxconv {

enum class OutputKind {
    ARCHIVE,
    FOLDER   // konvertierter ordner bleibt liegen, kein packen
};

enum class ArchiveState {
    PENDING,
    EXTRACTING,
    CONVERTING,
    PACKAGING,
    COMPLETED,
    FAILED
};

const char* to_string(ArchiveState state);

struct PipelineConfig {
    ConversionParams params;
    OutputKind output_kind = OutputKind::ARCHIVE;
    ArchiveFormat output_format = ArchiveFormat::ZIP;
    bool comic_extension = true;   // .cbz statt .zip
    int compression_level = 6;     // 0-9
    size_t threads = 0;            // 0 = auto
    bool keep_originals = false;   // konvertierten ordner nach dem packen behalten
    std::filesystem::path temp_root;  // leer = system temp

    // wirft ConfigurationError
    void validate() const;
};

struct ArchiveJob {
    std::filesystem::path source;
    std::filesystem::path target_dir;
};

struct ArchiveRecord {
    std::filesystem::path source;
    std::filesystem::path output_path;
    ArchiveState state = ArchiveState::PENDING;
    std::string failed_stage;
    std::string error_message;
    uint64_t original_size = 0;
    uint64_t converted_size = 0;
    size_t images_succeeded = 0;
    size_t images_failed = 0;

    bool succeeded() const noexcept { return state == ArchiveState::COMPLETED; }
};

struct BatchReport {
    std::vector<ArchiveRecord> archives;
    BatchStats stats;
    double elapsed_seconds = 0;
    bool interrupted = false;

    size_t succeeded() const;
    size_t failed() const;
};

// archiv oder ordner -> jobs. mit preserve_structure bleibt der
// unterordner relativ zu input erhalten
// wirft ConfigurationError wenn input nich existiert oder kein archiv ist
std::vector<ArchiveJob> plan_jobs(const std::filesystem::path& input,
                                  const std::filesystem::path& output_dir,
                                  bool recursive,
                                  bool preserve_structure);

class BatchPipeline {
public:
    // packager == nullptr -> ArchivePackager mit config.keep_originals
    BatchPipeline(PipelineConfig config, Logger& logger,
                  StatsStore* stats_store = nullptr, Packager* packager = nullptr);

    // fehler pro archiv landen im report, nur ConfigurationError fliegt raus
    BatchReport run(const std::vector<ArchiveJob>& jobs);

    // aus dem signal handler aufrufbar: keine neuen archive mehr,
    // gequeuete packaging tasks laufen noch zu ende
    void request_stop() noexcept { stop_requested_.store(true); }
    bool stop_requested() const noexcept { return stop_requested_.load(); }

    // pipelined wenn archive output und mehr als ein job
    bool pipelined(size_t job_count) const noexcept;
    size_t conversion_threads(size_t job_count) const noexcept;

private:
    std::optional<PackagingTask> prepare(const ArchiveJob& job, ArchiveRecord& record,
                                         ConversionDispatcher& dispatcher);
    void finalize(ArchiveRecord& record, const PackagingOutcome& outcome, BatchStats& stats);
    void complete(ArchiveRecord& record, BatchStats& stats);
    void fail(ArchiveRecord& record, const std::string& stage, const std::string& message);
    // reserviert den namen für diesen lauf, kollisionen kriegen _1, _2, ...
    std::filesystem::path output_path_for(const ArchiveJob& job);

    PipelineConfig config_;
    Logger& logger_;
    StatsStore* stats_store_;
    std::unique_ptr<ArchivePackager> own_packager_;
    Packager* packager_;
    std::atomic<bool> stop_requested_{false};
    std::set<std::filesystem::path> claimed_outputs_;
};

} // namespace cbxconv

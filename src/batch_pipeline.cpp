#include "cbxconv/batch_pipeline.hpp"
#include "cbxconv/archive_writer.hpp"
#include "cbxconv/errors.hpp"
#include "cbxconv/fs_utils.hpp"
#include "cbxconv/thread_pool.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <utility>

namespace cbxconv {

namespace fs = std::filesystem;

const char* to_string(ArchiveState state) {
    switch (state) {
        case ArchiveState::PENDING:    return "pending";
        case ArchiveState::EXTRACTING: return "extracting";
        case ArchiveState::CONVERTING: return "converting";
        case ArchiveState::PACKAGING:  return "packaging";
        case ArchiveState::COMPLETED:  return "completed";
        case ArchiveState::FAILED:     return "failed";
    }
    return "unknown";
}

void PipelineConfig::validate() const {
    params.validate();
    if (compression_level < 0 || compression_level > 9) {
        throw ConfigurationError("Compression level must be between 0 and 9, got " +
                                 std::to_string(compression_level));
    }
    if (output_kind == OutputKind::ARCHIVE && !is_writable_format(output_format)) {
        throw ConfigurationError(std::string("Unsupported output format: ") + to_string(output_format) +
                                 ". Supported formats are: cbz, zip, cb7, 7z, folder");
    }
}

size_t BatchReport::succeeded() const {
    return static_cast<size_t>(std::count_if(archives.begin(), archives.end(),
        [](const ArchiveRecord& r) { return r.succeeded(); }));
}

size_t BatchReport::failed() const {
    return static_cast<size_t>(std::count_if(archives.begin(), archives.end(),
        [](const ArchiveRecord& r) { return r.state == ArchiveState::FAILED; }));
}

std::vector<ArchiveJob> plan_jobs(const fs::path& input, const fs::path& output_dir,
                                  bool recursive, bool preserve_structure) {
    if (input.empty()) {
        throw ConfigurationError("Input path cannot be empty");
    }
    if (output_dir.empty()) {
        throw ConfigurationError("Output path cannot be empty");
    }

    std::error_code ec;
    if (fs::is_regular_file(input, ec)) {
        if (!is_supported_archive(input)) {
            throw ConfigurationError("Not a supported archive: " + input.string());
        }
        return {ArchiveJob{input, output_dir}};
    }
    if (!fs::is_directory(input, ec)) {
        throw ConfigurationError("Input path not found: " + input.string());
    }

    std::vector<ArchiveJob> jobs;
    for (const auto& archive : find_archives(input, recursive)) {
        fs::path target = output_dir;
        if (preserve_structure) {
            fs::path rel = archive.parent_path().lexically_relative(input);
            if (!rel.empty() && rel != ".") {
                target /= rel;
            }
        }
        jobs.push_back(ArchiveJob{archive, target});
    }
    return jobs;
}

BatchPipeline::BatchPipeline(PipelineConfig config, Logger& logger,
                             StatsStore* stats_store, Packager* packager)
    : config_(std::move(config)), logger_(logger), stats_store_(stats_store), packager_(packager) {
    if (!packager_) {
        own_packager_ = std::make_unique<ArchivePackager>(logger_, config_.keep_originals);
        packager_ = own_packager_.get();
    }
}

bool BatchPipeline::pipelined(size_t job_count) const noexcept {
    return config_.output_kind == OutputKind::ARCHIVE && job_count > 1;
}

size_t BatchPipeline::conversion_threads(size_t job_count) const noexcept {
    size_t total = config_.threads > 0 ? config_.threads : ThreadPool::hardware_threads();
    if (!pipelined(job_count)) {
        return total;
    }
    // ein thread fürs packen reservieren
    return std::max<size_t>(1, total - 1);
}

fs::path BatchPipeline::output_path_for(const ArchiveJob& job) {
    const std::string stem = job.source.stem().string();
    const std::string ext = archive_extension(config_.output_format, config_.comic_extension);
    const fs::path source = fs::absolute(job.source).lexically_normal();

    // nie das original überschreiben, nie zwei archive auf denselben namen
    auto taken = [&](const fs::path& candidate) {
        fs::path normal = fs::absolute(candidate).lexically_normal();
        return normal == source || claimed_outputs_.count(normal) > 0;
    };

    fs::path out = job.target_dir / (stem + ext);
    if (taken(out)) {
        out = job.target_dir / (stem + ".converted" + ext);
    }
    for (int i = 1; taken(out); ++i) {
        out = job.target_dir / (stem + "_" + std::to_string(i) + ext);
    }

    claimed_outputs_.insert(fs::absolute(out).lexically_normal());
    return out;
}

void BatchPipeline::fail(ArchiveRecord& record, const std::string& stage, const std::string& message) {
    record.state = ArchiveState::FAILED;
    record.failed_stage = stage;
    record.error_message = message;
    logger_.on_event({EventKind::ARCHIVE_FAILED, record.source, stage, message, false});
}

void BatchPipeline::complete(ArchiveRecord& record, BatchStats& stats) {
    record.state = ArchiveState::COMPLETED;
    stats.files_processed++;
    stats.original_bytes += record.original_size;
    stats.converted_bytes += record.converted_size;

    std::ostringstream detail;
    detail << fsutil::format_size(record.original_size) << " -> "
           << fsutil::format_size(record.converted_size);
    if (record.original_size > 0) {
        double saved = 100.0 * (static_cast<double>(record.original_size) - record.converted_size) /
                       record.original_size;
        detail << " (" << std::fixed << std::setprecision(1) << saved << "% saved)";
    }
    logger_.on_event({EventKind::ARCHIVE_COMPLETED, record.source, "", detail.str(), true});
}

void BatchPipeline::finalize(ArchiveRecord& record, const PackagingOutcome& outcome, BatchStats& stats) {
    if (!outcome.success) {
        // konvertiert, aber nich gepackt -> zählt als fehlschlag, bytes zählen nich
        fail(record, "package", outcome.error_message);
        return;
    }
    record.converted_size = outcome.new_size;
    complete(record, stats);
}

std::optional<PackagingTask> BatchPipeline::prepare(const ArchiveJob& job, ArchiveRecord& record,
                                                    ConversionDispatcher& dispatcher) {
    fs::path staging;

    try {
        record.state = ArchiveState::EXTRACTING;
        SourceArchive source = describe_archive(job.source);
        record.original_size = source.size;

        // entpackter kram fliegt weg sobald die konvertierung durch ist
        fsutil::ScopedDirectory extract_dir(fsutil::make_temp_directory(config_.temp_root, "cbxconv-"));
        logger_.on_event({EventKind::EXTRACTION_STARTED, job.source, "extract",
                          extract_dir.path().string(), true});
        extract(source, extract_dir.path());

        record.state = ArchiveState::CONVERTING;
        staging = fsutil::make_unique_directory(job.target_dir, job.source.stem().string());

        DispatchReport report = dispatcher.convert_all(extract_dir.path(), staging,
                                                       config_.params, job.source);
        record.images_succeeded = report.images_succeeded;
        record.images_failed = report.images_failed;

        if (!report.success()) {
            if (report.results.empty()) {
                throw ConversionFailure("No images found in archive");
            }
            throw ConversionFailure("All " + std::to_string(report.results.size()) +
                                    " images failed to convert");
        }

        PackagingTask task;
        task.staging_dir = staging;
        task.output_path = output_path_for(job);
        task.source = source;
        task.result = std::make_shared<PackagingOutcome>();
        task.compression_level = config_.compression_level;
        task.format = config_.output_format;
        return task;
    } catch (const std::exception& e) {
        const char* stage = record.state == ArchiveState::CONVERTING ? "convert" : "extract";
        if (!staging.empty()) {
            std::error_code ec;
            fs::remove_all(staging, ec);
        }
        fail(record, stage, e.what());
        return std::nullopt;
    }
}

BatchReport BatchPipeline::run(const std::vector<ArchiveJob>& jobs) {
    // config fehler bevor irgendwas angelegt wird
    config_.validate();
    claimed_outputs_.clear();

    auto start_time = std::chrono::steady_clock::now();

    BatchReport report;
    report.archives.resize(jobs.size());
    for (size_t i = 0; i < jobs.size(); ++i) {
        report.archives[i].source = jobs[i].source;
    }

    const bool use_queue = pipelined(jobs.size());
    const size_t threads = conversion_threads(jobs.size());

    if (use_queue) {
        logger_.info("Processing " + std::to_string(jobs.size()) + " comics with pipelining (" +
                     std::to_string(threads) + " conversion threads + 1 packaging thread)...");
    }

    ThreadPool pool(threads);
    ConversionDispatcher dispatcher(pool, logger_);

    std::optional<AsyncPackagingWorker> packaging;
    std::vector<std::pair<size_t, std::shared_ptr<PackagingOutcome>>> queued;
    if (use_queue) {
        packaging.emplace(*packager_, logger_);
        packaging->start();
    }

    for (size_t i = 0; i < jobs.size(); ++i) {
        if (stop_requested()) {
            report.interrupted = true;
            logger_.warning("Interrupted: " + std::to_string(jobs.size() - i) +
                            " archive(s) will not be started");
            break;
        }

        const ArchiveJob& job = jobs[i];
        ArchiveRecord& record = report.archives[i];
        logger_.on_event({EventKind::ARCHIVE_STARTED, job.source, "",
                          std::to_string(i + 1) + "/" + std::to_string(jobs.size()), true});

        auto task = prepare(job, record, dispatcher);
        if (!task) {
            continue;
        }

        if (config_.output_kind == OutputKind::FOLDER) {
            record.output_path = task->staging_dir;
            record.converted_size = fsutil::directory_size(task->staging_dir);
            complete(record, report.stats);
            continue;
        }

        record.state = ArchiveState::PACKAGING;
        record.output_path = task->output_path;

        if (use_queue) {
            // nich warten, nächstes archiv konvertiert während das hier gepackt wird
            auto slot = packaging->submit(std::move(*task));
            queued.emplace_back(i, std::move(slot));
            logger_.on_event({EventKind::PACKAGING_QUEUED, job.source, "package", "", true});
        } else {
            PackagingOutcome outcome = run_packaging(*packager_, *task, logger_);
            finalize(record, outcome, report.stats);
        }
    }

    if (packaging) {
        if (report.interrupted && !queued.empty()) {
            logger_.warning("Waiting for queued packaging to finish...");
        }
        // sentinel + join, erst danach sind die slots gültig
        packaging->finish();
        for (auto& [index, slot] : queued) {
            finalize(report.archives[index], *slot, report.stats);
        }
    }

    auto end_time = std::chrono::steady_clock::now();
    report.elapsed_seconds = std::chrono::duration<double>(end_time - start_time).count();

    if (stats_store_) {
        try {
            stats_store_->record_run(RunStats{report.stats, report.elapsed_seconds});
        } catch (const std::exception& e) {
            logger_.warning(std::string("Could not save statistics: ") + e.what());
        }
    }

    return report;
}

} // namespace cbxconv

#include "cbxconv/packaging_worker.hpp"
#include "cbxconv/archive_writer.hpp"
#include "cbxconv/errors.hpp"
#include "cbxconv/fs_utils.hpp"

namespace cbxconv {

namespace fs = std::filesystem;

PackagingOutcome ArchivePackager::package(const PackagingTask& task) {
    PackagingOutcome outcome;

    try {
        auto files = fsutil::list_files_sorted(task.staging_dir);
        if (files.empty()) {
            throw PackagingFailure("No files to archive in " + task.staging_dir.string());
        }

        logger_.debug("Creating " + std::string(to_string(task.format)) + " file: " +
                      task.output_path.string() + " (compression level: " +
                      std::to_string(task.compression_level) + ")");

        write_archive(task.staging_dir, files, task.output_path, task.format, task.compression_level);

        outcome.new_size = fs::file_size(task.output_path);
        outcome.success = true;
        logger_.debug("Added " + std::to_string(files.size()) + " files to " +
                      task.output_path.filename().string());
    } catch (const std::exception& e) {
        // staging bleibt liegen zum nachschauen / retry
        outcome.success = false;
        outcome.error_message = e.what();
        return outcome;
    }

    if (!keep_originals_) {
        std::error_code ec;
        fs::remove_all(task.staging_dir, ec);
        if (ec) {
            logger_.warning("Could not remove " + task.staging_dir.string() + ": " + ec.message());
        } else {
            logger_.debug("Removed extracted files from " + task.staging_dir.string());
        }
    }
    return outcome;
}

PackagingOutcome ArchivePackager::package(const fs::path& staging_dir,
                                          const fs::path& output_path,
                                          int compression_level,
                                          ArchiveFormat format) {
    PackagingTask task;
    task.staging_dir = staging_dir;
    task.output_path = output_path;
    task.compression_level = compression_level;
    task.format = format;
    return package(task);
}

PackagingOutcome run_packaging(Packager& packager, const PackagingTask& task, Logger& logger) {
    PackagingOutcome outcome;
    try {
        outcome = packager.package(task);
    } catch (const std::exception& e) {
        outcome.success = false;
        outcome.error_message = e.what();
    }

    if (task.result) {
        *task.result = outcome;
    }

    const fs::path& name = task.source.path.empty() ? task.staging_dir : task.source.path;
    logger.on_event({EventKind::PACKAGING_FINISHED, name, "package",
                     outcome.success ? task.output_path.string() : outcome.error_message,
                     outcome.success});
    return outcome;
}

AsyncPackagingWorker::~AsyncPackagingWorker() {
    finish();
}

void AsyncPackagingWorker::start() {
    if (running_) return;
    running_ = true;
    thread_ = std::thread([this] { worker_loop(); });
}

std::shared_ptr<PackagingOutcome> AsyncPackagingWorker::submit(PackagingTask task) {
    if (!running_) {
        start();
    }
    if (!task.result) {
        task.result = std::make_shared<PackagingOutcome>();
    }
    auto slot = task.result;
    queue_.push(std::move(task));
    return slot;
}

void AsyncPackagingWorker::finish() {
    if (!running_) return;

    // FIFO: sentinel kommt erst dran wenn alles davor durch ist
    queue_.push(std::nullopt);
    queue_.join();
    if (thread_.joinable()) {
        thread_.join();
    }
    running_ = false;
}

void AsyncPackagingWorker::worker_loop() {
    while (true) {
        std::optional<PackagingTask> item = queue_.pop();
        if (!item) {
            queue_.task_done();
            break;
        }

        PackagingOutcome outcome = run_packaging(packager_, *item, logger_);

        if (results_) {
            results_->push(PackagingReport{item->source.path, item->output_path,
                                           outcome.success, outcome.new_size});
        }
        queue_.task_done();
    }
}

} // namespace cbxconv

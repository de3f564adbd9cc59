#include "cbxconv/logger.hpp"
#include <iostream>

namespace cbxconv {

const char* to_string(EventKind kind) {
    switch (kind) {
        case EventKind::ARCHIVE_STARTED:     return "archive_started";
        case EventKind::EXTRACTION_STARTED:  return "extraction_started";
        case EventKind::CONVERSION_STARTED:  return "conversion_started";
        case EventKind::CONVERSION_FINISHED: return "conversion_finished";
        case EventKind::IMAGE_FAILED:        return "image_failed";
        case EventKind::PACKAGING_QUEUED:    return "packaging_queued";
        case EventKind::PACKAGING_FINISHED:  return "packaging_finished";
        case EventKind::ARCHIVE_COMPLETED:   return "archive_completed";
        case EventKind::ARCHIVE_FAILED:      return "archive_failed";
    }
    return "unknown";
}

void Logger::on_event(const PipelineEvent& event) {
    std::string name = event.archive.filename().string();

    switch (event.kind) {
        case EventKind::ARCHIVE_STARTED:
            info("Processing: " + event.archive.string());
            break;
        case EventKind::EXTRACTION_STARTED:
            debug("Extracting " + name + " to " + event.detail);
            break;
        case EventKind::CONVERSION_STARTED:
            debug("Converting pages of " + name + event.detail);
            break;
        case EventKind::CONVERSION_FINISHED:
            info(name + ": " + event.detail);
            break;
        case EventKind::IMAGE_FAILED:
            error("FAILED: " + name + " - " + event.detail);
            break;
        case EventKind::PACKAGING_QUEUED:
            info("Queued " + name + " for packaging");
            break;
        case EventKind::PACKAGING_FINISHED:
            if (event.success) {
                info("Packaged " + name + " successfully");
            } else {
                error("Error packaging " + name + ": " + event.detail);
            }
            break;
        case EventKind::ARCHIVE_COMPLETED:
            info("Conversion of " + name + " completed successfully!");
            break;
        case EventKind::ARCHIVE_FAILED:
            error("FAILED: " + name + " [" + event.stage + "] " + event.detail);
            break;
    }
}

void ConsoleLogger::log(LogLevel level, const std::string& message) {
    if (level == LogLevel::DEBUG && !verbose_) return;
    if (silent_ && level != LogLevel::ERROR) return;

    std::lock_guard<std::mutex> lock(output_mutex_);
    switch (level) {
        case LogLevel::DEBUG:
        case LogLevel::INFO:
            std::cout << message << "\n";
            break;
        case LogLevel::WARNING:
            std::cerr << "Warning: " << message << "\n";
            break;
        case LogLevel::ERROR:
            std::cerr << message << "\n";
            break;
    }
}

} // namespace cbxconv

#pragma once
// logging + pipeline events
// core schreibt nur hier rein, formatierung macht die implementierung

#include <filesystem>
#include <mutex>
#include <string>

namespace cbxconv {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

enum class EventKind {
    ARCHIVE_STARTED,
    EXTRACTION_STARTED,
    CONVERSION_STARTED,
    CONVERSION_FINISHED,
    IMAGE_FAILED,
    PACKAGING_QUEUED,
    PACKAGING_FINISHED,
    ARCHIVE_COMPLETED,
    ARCHIVE_FAILED
};

const char* to_string(EventKind kind);

struct PipelineEvent {
    EventKind kind = EventKind::ARCHIVE_STARTED;
    std::filesystem::path archive;
    std::string stage;    // extract/convert/package, leer wenn egal
    std::string detail;
    bool success = true;
};

class Logger {
public:
    virtual ~Logger() = default;

    virtual void log(LogLevel level, const std::string& message) = 0;

    // default: event als text loggen
    virtual void on_event(const PipelineEvent& event);

    void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    void info(const std::string& message) { log(LogLevel::INFO, message); }
    void warning(const std::string& message) { log(LogLevel::WARNING, message); }
    void error(const std::string& message) { log(LogLevel::ERROR, message); }
};

// cout/cerr, ein mutex für alles damit threads nich durcheinander schreiben
class ConsoleLogger : public Logger {
public:
    explicit ConsoleLogger(bool verbose = false, bool silent = false)
        : verbose_(verbose), silent_(silent) {}

    void log(LogLevel level, const std::string& message) override;

    bool verbose() const noexcept { return verbose_; }

private:
    std::mutex output_mutex_;
    bool verbose_;
    bool silent_;
};

// schluckt alles, für tests und library use
class NullLogger : public Logger {
public:
    void log(LogLevel, const std::string&) override {}
    void on_event(const PipelineEvent&) override {}
};

} // namespace cbxconv

#pragma once
// fertig konvertierten staging ordner -> output archiv
// sync (direkt aufrufen) oder async (ein thread, FIFO queue, sentinel zum beenden)

#include "cbxconv/archive_reader.hpp"
#include "cbxconv/blocking_queue.hpp"
#include "cbxconv/logger.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace cbxconv {

struct PackagingOutcome {
    bool success = false;
    uint64_t new_size = 0;
    std::string error_message;
};

// ein task = ein archiv. result ist der einzige shared state zwischen
// orchestrator und worker: worker schreibt einmal, orchestrator liest
// einmal nach join()
struct PackagingTask {
    std::filesystem::path staging_dir;
    std::filesystem::path output_path;
    SourceArchive source;
    std::shared_ptr<PackagingOutcome> result;
    int compression_level = 9;
    ArchiveFormat format = ArchiveFormat::ZIP;
};

// kopie vom outcome für async konsumenten
struct PackagingReport {
    std::filesystem::path archive;
    std::filesystem::path output_path;
    bool success = false;
    uint64_t new_size = 0;
};

class Packager {
public:
    virtual ~Packager() = default;

    // darf nich werfen, fehler gehen ins outcome
    virtual PackagingOutcome package(const PackagingTask& task) = 0;
};

// libarchive packager. staging ordner wird nur nach erfolg gelöscht,
// und auch dann nich wenn keep_originals gesetzt ist
class ArchivePackager : public Packager {
public:
    explicit ArchivePackager(Logger& logger, bool keep_originals = false)
        : logger_(logger), keep_originals_(keep_originals) {}

    PackagingOutcome package(const PackagingTask& task) override;

    PackagingOutcome package(const std::filesystem::path& staging_dir,
                             const std::filesystem::path& output_path,
                             int compression_level,
                             ArchiveFormat format = ArchiveFormat::ZIP);

private:
    Logger& logger_;
    bool keep_originals_;
};

// packager aufrufen, slot füllen, event loggen. sync und async nehmen beide das hier
PackagingOutcome run_packaging(Packager& packager, const PackagingTask& task, Logger& logger);

// ein langlebiger thread, arbeitet die queue strikt FIFO ab.
// submit/finish nur von einem thread aus aufrufen (dem orchestrator)
class AsyncPackagingWorker {
public:
    AsyncPackagingWorker(Packager& packager, Logger& logger,
                         BlockingQueue<PackagingReport>* results = nullptr)
        : packager_(packager), logger_(logger), results_(results) {}

    ~AsyncPackagingWorker();

    AsyncPackagingWorker(const AsyncPackagingWorker&) = delete;
    AsyncPackagingWorker& operator=(const AsyncPackagingWorker&) = delete;

    void start();

    // startet den thread falls nötig. ohne result slot wird einer angelegt
    std::shared_ptr<PackagingOutcome> submit(PackagingTask task);

    // sentinel hinter alle echten tasks, queue joinen, thread joinen
    // danach sind alle slots geschrieben
    void finish();

    bool running() const noexcept { return running_; }

private:
    void worker_loop();

    Packager& packager_;
    Logger& logger_;
    BlockingQueue<PackagingReport>* results_;
    BlockingQueue<std::optional<PackagingTask>> queue_;
    std::thread thread_;
    bool running_ = false;
};

} // namespace cbxconv

#pragma once
// statistiken pro lauf. core meldet nur, wie gespeichert wird entscheidet der store

#include <cstdint>
#include <filesystem>
#include <string>

namespace cbxconv {

// nur bestätigte archive (konvertiert UND gepackt) landen hier
struct BatchStats {
    uint64_t files_processed = 0;
    uint64_t original_bytes = 0;
    uint64_t converted_bytes = 0;

    int64_t bytes_saved() const noexcept {
        return static_cast<int64_t>(original_bytes) - static_cast<int64_t>(converted_bytes);
    }
};

struct RunStats {
    BatchStats totals;
    double elapsed_seconds = 0;
};

struct LifetimeStats {
    BatchStats totals;
    uint64_t run_count = 0;
};

class StatsStore {
public:
    virtual ~StatsStore() = default;

    virtual void record_run(const RunStats& run) = 0;
};

// eine zeile pro lauf, tab getrennt:
// timestamp  files  original_bytes  converted_bytes  seconds
class FileStatsStore : public StatsStore {
public:
    explicit FileStatsStore(std::filesystem::path path) : path_(std::move(path)) {}

    // wirft std::runtime_error wenn die datei nich schreibbar ist
    void record_run(const RunStats& run) override;

    // summiert alle zeilen, kaputte zeilen werden übersprungen
    LifetimeStats lifetime() const;

    const std::filesystem::path& path() const noexcept { return path_; }

    // ~/.cbxconv/stats.tsv, oder ./.cbxconv-stats.tsv ohne HOME
    static std::filesystem::path default_path();

private:
    std::filesystem::path path_;
};

} // namespace cbxconv

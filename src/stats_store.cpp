#include "cbxconv/stats_store.hpp"
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace cbxconv {

namespace fs = std::filesystem;

namespace {

std::string iso_timestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return out.str();
}

} // namespace

void FileStatsStore::record_run(const RunStats& run) {
    if (path_.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path_.parent_path(), ec);
    }

    std::ofstream out(path_, std::ios::app);
    if (!out) {
        throw std::runtime_error("Could not open stats file " + path_.string());
    }
    out << iso_timestamp() << '\t'
        << run.totals.files_processed << '\t'
        << run.totals.original_bytes << '\t'
        << run.totals.converted_bytes << '\t'
        << std::fixed << std::setprecision(3) << run.elapsed_seconds << '\n';
    out.flush();
    if (!out) {
        throw std::runtime_error("Could not write stats file " + path_.string());
    }
}

LifetimeStats FileStatsStore::lifetime() const {
    LifetimeStats stats;
    std::ifstream in(path_);
    if (!in) {
        return stats;  // noch kein lauf
    }

    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string timestamp;
        uint64_t files = 0, original = 0, converted = 0;
        double seconds = 0;
        if (!(fields >> timestamp >> files >> original >> converted >> seconds)) {
            continue;
        }
        stats.totals.files_processed += files;
        stats.totals.original_bytes += original;
        stats.totals.converted_bytes += converted;
        stats.run_count++;
    }
    return stats;
}

fs::path FileStatsStore::default_path() {
    if (const char* home = std::getenv("HOME")) {
        return fs::path(home) / ".cbxconv" / "stats.tsv";
    }
    return fs::path(".cbxconv-stats.tsv");
}

} // namespace cbxconv

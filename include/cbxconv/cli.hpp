#pragma once
// cli parsing und so

#include "cbxconv/batch_pipeline.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace cbxconv {

// 0 = alles ok, 1 = teilweise oder falsche argumente, 2 = nix hat geklappt
enum class ExitCode : int {
    OK = 0,
    PARTIAL = 1,
    USAGE = 1,
    ALL_FAILED = 2
};

struct CLIConfig {
    std::filesystem::path input_path;
    std::filesystem::path output_dir;   // leer = "converted" subfolder
    int quality = 80;                   // guter default
    bool lossless = false;
    int method = 4;
    int max_width = 0;                  // 0 = kein resize
    int max_height = 0;                 // 0 = kein resize
    std::string preprocessing = "none";
    bool grayscale = false;
    bool auto_contrast = false;
    bool auto_greyscale = false;
    int greyscale_pixel_threshold = 16;
    double greyscale_percent_threshold = 0.01;
    bool auto_optimize = false;
    bool sharp_yuv = false;
    std::string image_format = "webp";
    std::string output = "cbz";         // cbz, zip, cb7, 7z, folder
    int compression = 6;
    size_t threads = 0;                 // 0 = auto
    bool keep_originals = false;
    bool no_archive = false;
    bool recursive = false;
    bool preserve_structure = false;
    std::filesystem::path stats_file;   // leer = default
    bool no_stats = false;
    bool verbose = false;
    bool silent = false;
};

class CLI {
public:
    static std::optional<CLIConfig> parse(int argc, char* argv[]);
    static void print_help();
    static void print_version();
    static int run(const CLIConfig& config);
    static ExitCode exit_code(const BatchReport& report);

    // wirft ConfigurationError bei unbekannten werten
    static PipelineConfig to_pipeline_config(const CLIConfig& config);

private:
    static void print_summary(const BatchReport& report, Logger& logger);
};

} // namespace cbxconv

#include "cbxconv/cli.hpp"
#include "cbxconv/errors.hpp"
#include "cbxconv/fs_utils.hpp"
#include "cbxconv/stats_store.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

namespace cbxconv {

constexpr const char* CBXCONV_VERSION = "1.0.0";

namespace {

// signal handler darf nur lock-free atomics anfassen
std::atomic<BatchPipeline*> g_active_pipeline{nullptr};
static_assert(std::atomic<BatchPipeline*>::is_always_lock_free,
              "interrupt handler needs a lock-free pointer");

void handle_interrupt(int) {
    if (BatchPipeline* pipeline = g_active_pipeline.load()) {
        pipeline->request_stop();
    }
}

bool parse_int(const char* text, int& out) {
    try {
        size_t pos = 0;
        int value = std::stoi(text, &pos);
        if (text[pos] != '\0') return false;
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_double(const char* text, double& out) {
    try {
        size_t pos = 0;
        double value = std::stod(text, &pos);
        if (text[pos] != '\0') return false;
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::string percent(uint64_t original, uint64_t converted) {
    if (original == 0) return "0.0%";
    double saved = 100.0 * (static_cast<double>(original) - static_cast<double>(converted)) / original;
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << saved << "%";
    return out.str();
}

} // namespace

void CLI::print_version() {
    std::cout << "cbxconv " << CBXCONV_VERSION << "\n";
    std::cout << "Comic archive to WebP converter\n";
}

void CLI::print_help() {
    std::cout << R"(
  cbxconv v)" << CBXCONV_VERSION << R"(

  Converts the images inside comic archives (CBZ/CBR/CB7) to WebP
  and packs them back up.

USAGE
  cbxconv <input> [output_dir] [options]

EXAMPLES
  cbxconv book.cbz                     Convert one comic into ./converted/
  cbxconv comics/ out/ -r              Convert every archive below comics/
  cbxconv comics/ out/ -q 70 -w 1600   Quality 70, max width 1600px
  cbxconv comics/ out/ --output folder Keep converted images as folders

IMAGE OPTIONS
  -q, --quality <0-100>              WebP quality (default: 80)
  --lossless                         Lossless WebP
  --method <0-6>                     Compression effort (default: 4)
  -w, --max-width <pixels>           Max width, preserves aspect ratio
  -h, --max-height <pixels>          Max height, preserves aspect ratio
  --preprocessing <none|sharpen|denoise>
  --grayscale                        Convert every page to greyscale
  --auto-contrast                    Stretch contrast per channel
  --auto-greyscale                   Greyscale pages that are nearly colorless
  --greyscale-pixel-threshold <n>    Channel spread counted as color (default: 16)
  --greyscale-percent-threshold <f>  Max colored pixel ratio (default: 0.01)
  --auto-optimize                    Try lossy and lossless, keep the smaller
  --sharp-yuv                        Sharper RGB->YUV conversion
  --image-format <webp|png>          Image output format (default: webp)

OUTPUT OPTIONS
  --output <cbz|zip|cb7|7z|folder>   Output format (default: cbz)
  --compression <0-9>                Archive compression level (default: 6)
  --no-archive                       Same as --output folder
  --keep-originals                   Keep converted folder after packing
  -r, --recursive                    Search subdirectories for archives
  --preserve-structure               Mirror input subdirectories in output

GENERAL
  -j, --threads <n>                  Worker threads (default/0: all cores)
  --stats-file <path>                Statistics file (default: ~/.cbxconv/stats.tsv)
  --no-stats                         Do not record statistics
  -v, --verbose                      Show progress for each image
  -s, --silent                       Only print errors
  -H, --help                         Show this help message
  --version                          Show version number

SUPPORTED FORMATS
  Input:  .cbz .zip .cbr .rar .cb7 .7z
  Images: .jpg .jpeg .png .bmp .tga .gif .webp

)";
}

std::optional<CLIConfig> CLI::parse(int argc, char* argv[]) {
    if (argc < 2) {
        print_help();
        return std::nullopt;
    }

    CLIConfig config;
    std::vector<std::filesystem::path> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        // nächstes argument holen oder fehler
        auto value = [&](const char* what) -> const char* {
            if (++i >= argc) {
                std::cerr << "Error: " << arg << " requires " << what << "\n";
                return nullptr;
            }
            return argv[i];
        };
        auto int_value = [&](const char* what, int& out) -> bool {
            const char* text = value(what);
            if (!text) return false;
            if (!parse_int(text, out)) {
                std::cerr << "Error: Invalid value for " << arg << ": " << text << "\n";
                return false;
            }
            return true;
        };

        if (arg == "--help" || arg == "-H") {
            print_help();
            std::exit(0);
        }
        else if (arg == "--version") {
            print_version();
            std::exit(0);
        }
        else if (arg == "-q" || arg == "--quality") {
            if (!int_value("a number (0-100)", config.quality)) return std::nullopt;
        }
        else if (arg == "--lossless") {
            config.lossless = true;
        }
        else if (arg == "--method") {
            if (!int_value("a number (0-6)", config.method)) return std::nullopt;
        }
        else if (arg == "-w" || arg == "--max-width") {
            if (!int_value("a width in pixels", config.max_width)) return std::nullopt;
        }
        else if (arg == "-h" || arg == "--max-height") {
            if (!int_value("a height in pixels", config.max_height)) return std::nullopt;
        }
        else if (arg == "--preprocessing") {
            const char* text = value("none, sharpen or denoise");
            if (!text) return std::nullopt;
            config.preprocessing = text;
        }
        else if (arg == "--grayscale" || arg == "--greyscale") {
            config.grayscale = true;
        }
        else if (arg == "--auto-contrast") {
            config.auto_contrast = true;
        }
        else if (arg == "--auto-greyscale") {
            config.auto_greyscale = true;
        }
        else if (arg == "--greyscale-pixel-threshold") {
            if (!int_value("a number", config.greyscale_pixel_threshold)) return std::nullopt;
        }
        else if (arg == "--greyscale-percent-threshold") {
            const char* text = value("a fraction (0-1)");
            if (!text) return std::nullopt;
            if (!parse_double(text, config.greyscale_percent_threshold)) {
                std::cerr << "Error: Invalid value for " << arg << ": " << text << "\n";
                return std::nullopt;
            }
        }
        else if (arg == "--auto-optimize") {
            config.auto_optimize = true;
        }
        else if (arg == "--sharp-yuv") {
            config.sharp_yuv = true;
        }
        else if (arg == "--image-format") {
            const char* text = value("webp or png");
            if (!text) return std::nullopt;
            config.image_format = text;
        }
        else if (arg == "--output") {
            const char* text = value("cbz, zip, cb7, 7z or folder");
            if (!text) return std::nullopt;
            config.output = text;
        }
        else if (arg == "--compression") {
            if (!int_value("a level (0-9)", config.compression)) return std::nullopt;
        }
        else if (arg == "-j" || arg == "--threads") {
            int threads = 0;
            if (!int_value("a thread count", threads)) return std::nullopt;
            if (threads < 0) {
                std::cerr << "Error: Thread count must not be negative\n";
                return std::nullopt;
            }
            config.threads = static_cast<size_t>(threads);
        }
        else if (arg == "--keep-originals") {
            config.keep_originals = true;
        }
        else if (arg == "--no-archive") {
            config.no_archive = true;
        }
        else if (arg == "-r" || arg == "--recursive") {
            config.recursive = true;
        }
        else if (arg == "--preserve-structure") {
            config.preserve_structure = true;
        }
        else if (arg == "--stats-file") {
            const char* text = value("a file path");
            if (!text) return std::nullopt;
            config.stats_file = text;
        }
        else if (arg == "--no-stats") {
            config.no_stats = true;
        }
        else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        }
        else if (arg == "-s" || arg == "--silent") {
            config.silent = true;
        }
        else if (arg[0] != '-') {
            positional.emplace_back(arg);
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Use 'cbxconv --help' for usage information.\n";
            return std::nullopt;
        }
    }

    if (positional.empty()) {
        std::cerr << "Error: No input specified\n";
        std::cerr << "Use 'cbxconv --help' for usage information.\n";
        return std::nullopt;
    }
    if (positional.size() > 2) {
        std::cerr << "Error: Expected <input> [output_dir], got " << positional.size() << " paths\n";
        return std::nullopt;
    }

    config.input_path = positional[0];
    if (positional.size() == 2) {
        config.output_dir = positional[1];
    }

    // default output dir
    if (config.output_dir.empty()) {
        config.output_dir = "converted";
    }

    return config;
}

PipelineConfig CLI::to_pipeline_config(const CLIConfig& config) {
    PipelineConfig out;

    ConversionParams& params = out.params;
    params.quality = config.quality;
    params.lossless = config.lossless;
    params.method = config.method;
    params.max_width = config.max_width;
    params.max_height = config.max_height;
    params.grayscale = config.grayscale;
    params.auto_contrast = config.auto_contrast;
    params.auto_greyscale = config.auto_greyscale;
    params.greyscale_pixel_threshold = config.greyscale_pixel_threshold;
    params.greyscale_percent_threshold = config.greyscale_percent_threshold;
    params.auto_optimize = config.auto_optimize;
    params.sharp_yuv = config.sharp_yuv;

    if (config.preprocessing == "none") {
        params.preprocessing = Preprocessing::NONE;
    } else if (config.preprocessing == "sharpen") {
        params.preprocessing = Preprocessing::SHARPEN;
    } else if (config.preprocessing == "denoise") {
        params.preprocessing = Preprocessing::DENOISE;
    } else {
        throw ConfigurationError("Unknown preprocessing: " + config.preprocessing +
                                 " (expected none, sharpen or denoise)");
    }

    if (config.image_format == "webp") {
        params.format = ImageFormat::WEBP;
    } else if (config.image_format == "png") {
        params.format = ImageFormat::PNG;
    } else {
        throw ConfigurationError("Unknown image format: " + config.image_format +
                                 " (expected webp or png)");
    }

    std::string output = config.no_archive ? "folder" : config.output;
    std::transform(output.begin(), output.end(), output.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (output == "cbz" || output == "zip") {
        out.output_format = ArchiveFormat::ZIP;
        out.comic_extension = output == "cbz";
    } else if (output == "cb7" || output == "7z") {
        out.output_format = ArchiveFormat::SEVEN_ZIP;
        out.comic_extension = output == "cb7";
    } else if (output == "cbr" || output == "rar") {
        // kann libarchive nich schreiben, validate() meldet das
        out.output_format = ArchiveFormat::RAR;
        out.comic_extension = output == "cbr";
    } else if (output == "folder") {
        out.output_kind = OutputKind::FOLDER;
    } else {
        throw ConfigurationError("Unsupported output format: " + config.output +
                                 ". Supported formats are: cbz, zip, cb7, 7z, folder");
    }

    out.compression_level = config.compression;
    out.threads = config.threads;
    out.keep_originals = config.keep_originals;

    out.validate();
    return out;
}

void CLI::print_summary(const BatchReport& report, Logger& logger) {
    const BatchStats& stats = report.stats;

    // details nur wenns mehr als ein archiv war
    if (report.archives.size() > 1) {
        for (const auto& record : report.archives) {
            const std::string name = record.source.filename().string();
            if (record.succeeded()) {
                logger.info("  OK      " + name + "  " + fsutil::format_size(record.original_size) +
                            " -> " + fsutil::format_size(record.converted_size) + " (" +
                            percent(record.original_size, record.converted_size) + " saved)");
            } else if (record.state == ArchiveState::FAILED) {
                logger.info("  FAILED  " + name + "  [" + record.failed_stage + "] " +
                            record.error_message);
            } else {
                logger.info("  SKIPPED " + name);
            }
        }
    }

    std::ostringstream line;
    line << "Done! " << report.succeeded() << "/" << report.archives.size()
         << " archive(s) converted in " << std::fixed << std::setprecision(1)
         << report.elapsed_seconds << "s";
    logger.info("");
    logger.info(line.str());

    if (stats.files_processed > 0) {
        std::string savings = "  " + fsutil::format_size(stats.original_bytes) + " -> " +
                              fsutil::format_size(stats.converted_bytes);
        if (stats.bytes_saved() > 0) {
            savings += " (" + fsutil::format_size(static_cast<uint64_t>(stats.bytes_saved())) +
                       " saved, " + percent(stats.original_bytes, stats.converted_bytes) + ")";
        } else {
            savings += " (no savings)";
        }
        logger.info(savings);
    }
    if (report.failed() > 0) {
        logger.error(std::to_string(report.failed()) + " archive(s) failed");
    }
    if (report.interrupted) {
        logger.warning("Run was interrupted, remaining archives were skipped");
    }
}

int CLI::run(const CLIConfig& config) {
    ConsoleLogger logger(config.verbose, config.silent);

    PipelineConfig pipeline_config;
    std::vector<ArchiveJob> jobs;
    try {
        pipeline_config = to_pipeline_config(config);
        jobs = plan_jobs(config.input_path, config.output_dir, config.recursive,
                         config.preserve_structure);
    } catch (const ConfigurationError& e) {
        logger.error(std::string("Error: ") + e.what());
        return static_cast<int>(ExitCode::USAGE);
    }

    if (jobs.empty()) {
        logger.error("No supported archives found in " + config.input_path.string());
        logger.error("Supported formats: .cbz .zip .cbr .rar .cb7 .7z");
        return static_cast<int>(ExitCode::USAGE);
    }

    std::unique_ptr<FileStatsStore> stats;
    if (!config.no_stats) {
        stats = std::make_unique<FileStatsStore>(
            config.stats_file.empty() ? FileStatsStore::default_path() : config.stats_file);
    }

    BatchPipeline pipeline(pipeline_config, logger, stats.get());

    g_active_pipeline.store(&pipeline);
    std::signal(SIGINT, handle_interrupt);

    BatchReport report;
    try {
        report = pipeline.run(jobs);
    } catch (const ConfigurationError& e) {
        std::signal(SIGINT, SIG_DFL);
        g_active_pipeline.store(nullptr);
        logger.error(std::string("Error: ") + e.what());
        return static_cast<int>(ExitCode::USAGE);
    }

    std::signal(SIGINT, SIG_DFL);
    g_active_pipeline.store(nullptr);

    print_summary(report, logger);

    if (stats) {
        LifetimeStats lifetime = stats->lifetime();
        if (lifetime.run_count > 0) {
            logger.info("  Lifetime: " + std::to_string(lifetime.totals.files_processed) +
                        " archive(s) in " + std::to_string(lifetime.run_count) + " run(s), " +
                        fsutil::format_size(lifetime.totals.original_bytes) + " -> " +
                        fsutil::format_size(lifetime.totals.converted_bytes));
        }
    }

    return static_cast<int>(exit_code(report));
}

ExitCode CLI::exit_code(const BatchReport& report) {
    // übersprungene (stop) zählen wie fehlgeschlagene
    if (report.succeeded() == 0) return ExitCode::ALL_FAILED;
    if (report.succeeded() < report.archives.size()) return ExitCode::PARTIAL;
    return ExitCode::OK;
}

} // namespace cbxconv

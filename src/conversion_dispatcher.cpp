#include "cbxconv/conversion_dispatcher.hpp"
#include "cbxconv/fs_utils.hpp"
#include <future>
#include <iomanip>
#include <set>
#include <sstream>

namespace cbxconv {

namespace fs = std::filesystem;

DispatchReport ConversionDispatcher::convert_all(const fs::path& source_dir,
                                                 const fs::path& output_dir,
                                                 const ConversionParams& params,
                                                 const fs::path& archive) {
    DispatchReport report;
    const fs::path log_name = archive.empty() ? source_dir : archive;

    // bilder sammeln, list_files_sorted ist schon nach pfad sortiert
    std::vector<ConversionTask> tasks;
    std::set<fs::path> used_destinations;
    const std::string out_ext = ImageProcessor::output_extension(params.format);

    for (const auto& rel : fsutil::list_files_sorted(source_dir)) {
        if (!ImageProcessor::is_supported(rel)) {
            // kein bild -> unverändert mitnehmen
            fs::path dest = output_dir / rel;
            std::error_code ec;
            fs::create_directories(dest.parent_path(), ec);
            if (!ec) {
                fs::copy_file(source_dir / rel, dest, fs::copy_options::overwrite_existing, ec);
            }
            if (ec) {
                logger_.warning("Could not copy " + rel.generic_string() + ": " + ec.message());
            } else {
                report.passthrough_files++;
            }
            continue;
        }

        fs::path dest = output_dir / rel;
        dest.replace_extension(out_ext);
        // page.jpg + page.png würden beide page.webp -> zweites kriegt die alte ext im namen
        if (!used_destinations.insert(dest).second) {
            dest = output_dir / rel;
            dest.replace_filename(rel.stem().string() + "_" + rel.extension().string().substr(1) + out_ext);
            used_destinations.insert(dest);
        }
        tasks.push_back(ConversionTask{source_dir / rel, dest, params});
    }

    logger_.on_event({EventKind::CONVERSION_STARTED, log_name, "convert",
                      " (" + std::to_string(tasks.size()) + " images, " +
                      std::to_string(pool_.size()) + " threads)", true});

    // alle tasks reinhauen
    std::vector<std::future<ConversionResult>> futures;
    futures.reserve(tasks.size());
    for (const auto& task : tasks) {
        futures.push_back(pool_.enqueue([this, task]() {
            return processor_.convert(task);
        }));
    }

    // warten bis alles fertig, reihenfolge = sortierte reihenfolge
    report.results.reserve(tasks.size());
    for (size_t i = 0; i < futures.size(); ++i) {
        ConversionResult result;
        try {
            result = futures[i].get();
        } catch (const std::exception& e) {
            result.source = tasks[i].source;
            result.destination = tasks[i].destination;
            result.success = false;
            result.error_message = e.what();
        }

        fs::path rel = fs::relative(result.source, source_dir);
        if (result.success) {
            report.images_succeeded++;
            report.original_bytes += result.original_size;
            report.converted_bytes += result.converted_size;

            std::ostringstream line;
            line << "[" << (i + 1) << "/" << tasks.size() << "] " << rel.generic_string()
                 << " -> " << result.destination.filename().string();
            double ratio = result.compression_ratio() * 100;
            if (ratio > 0.5) {
                line << " (" << std::fixed << std::setprecision(0) << ratio << "% saved)";
            }
            logger_.debug(line.str());
        } else {
            report.images_failed++;
            logger_.on_event({EventKind::IMAGE_FAILED, log_name, "convert",
                              rel.generic_string() + " - " + result.error_message, false});
        }
        report.results.push_back(std::move(result));
    }

    logger_.on_event({EventKind::CONVERSION_FINISHED, log_name, "convert",
                      "converted " + std::to_string(report.images_succeeded) + "/" +
                      std::to_string(tasks.size()) + " images",
                      report.success()});
    return report;
}

DispatchReport convert_all(const fs::path& source_dir,
                           const fs::path& output_dir,
                           const ConversionParams& params,
                           size_t worker_count,
                           Logger& logger) {
    ThreadPool pool(worker_count);
    ConversionDispatcher dispatcher(pool, logger);
    return dispatcher.convert_all(source_dir, output_dir, params);
}

} // namespace cbxconv

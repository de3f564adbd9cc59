#pragma once
// das eigentliche image processing zeug
// ein bild rein, ein bild raus, kein shared state -> beliebig parallel

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cbxconv {

enum class ImageFormat {
    WEBP,
    PNG
};

enum class Preprocessing {
    NONE,
    SHARPEN,   // unsharp mask für lineart
    DENOISE    // median 3x3, danach sharpen
};

// alle optionen für ein bild, ein objekt statt 15 parameter
struct ConversionParams {
    ImageFormat format = ImageFormat::WEBP;
    int quality = 80;        // 0-100, bei lossless = effort
    bool lossless = false;
    int method = 4;          // 0-6, höher = langsamer/kleiner
    int max_width = 0;       // 0 = kein resize
    int max_height = 0;      // 0 = kein resize
    Preprocessing preprocessing = Preprocessing::NONE;
    bool grayscale = false;
    bool auto_contrast = false;
    bool auto_greyscale = false;
    int greyscale_pixel_threshold = 16;
    double greyscale_percent_threshold = 0.01;
    bool auto_optimize = false;  // lossy + lossless probieren, kleineres gewinnt
    bool sharp_yuv = false;

    // wirft ConfigurationError
    void validate() const;
};

struct ImageData {
    std::vector<uint8_t> pixels;
    int width = 0;
    int height = 0;
    int channels = 0;
};

struct ConversionTask {
    std::filesystem::path source;
    std::filesystem::path destination;
    ConversionParams params;
};

struct ConversionResult {
    std::filesystem::path source;
    std::filesystem::path destination;
    bool success = false;
    std::string error_message;
    uint64_t original_size = 0;
    uint64_t converted_size = 0;
    int width = 0;
    int height = 0;
    double processing_time_ms = 0;

    double compression_ratio() const {
        if (original_size == 0) return 0;
        return 1.0 - (static_cast<double>(converted_size) / original_size);
    }
};

class ImageProcessor {
public:
    ImageProcessor() = default;

    // wirft nie, fehler stehen im result
    ConversionResult convert(const ConversionTask& task) const;

    // bild laden, channels danach immer 1, 3 oder 4
    std::optional<ImageData> load_image(const std::filesystem::path& path,
                                        std::string* error = nullptr) const;

    ImageData resize(const ImageData& image, int new_width, int new_height) const;

    std::vector<uint8_t> encode(const ImageData& image, const ConversionParams& params) const;
    std::vector<uint8_t> encode_webp(const ImageData& image, const ConversionParams& params,
                                     bool lossless) const;
    std::vector<uint8_t> encode_png(const ImageData& image) const;

    // uniform scale = min(1, max_w/w, max_h/h), gerundet, nie größer als die grenze
    static std::pair<int, int> fit_within(int width, int height, int max_width, int max_height);

    // welche extensions gehen
    static const std::vector<std::string>& supported_extensions();
    static bool is_supported(const std::filesystem::path& path);
    static std::string output_extension(ImageFormat format);
};

} // namespace cbxconv

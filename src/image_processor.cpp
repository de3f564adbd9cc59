#include "cbxconv/image_processor.hpp"
#include "cbxconv/errors.hpp"
#include "cbxconv/fs_utils.hpp"
#include "cbxconv/image_analyzer.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <fstream>
#include <iterator>
#include <mutex>

// stb braucht die flags sonst isses lahm
#define STBI_SSE2
#define STBIR_USE_SSE2

// formate die in comics nie vorkommen
#define STBI_NO_HDR
#define STBI_NO_PIC
#define STBI_NO_PNM
#define STBI_NO_PSD

// stb zeugs
#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include "stb_image.h"
#include "stb_image_write.h"
#include "stb_image_resize2.h"

// fpng ballert
#include "fpng.h"

#include <webp/decode.h>
#include <webp/encode.h>

namespace cbxconv {

namespace fs = std::filesystem;

// stbi_failure_reason() und die stbi_write globals sind nich thread safe
static std::mutex stb_operations_mutex;

// fpng muss einmal init werden sonst crashed das
static std::once_flag fpng_init_flag;

inline void ensure_fpng_initialized() {
    std::call_once(fpng_init_flag, []() {
        fpng::fpng_init();
    });
}

namespace {

std::vector<uint8_t> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ConversionFailure("Cannot open " + path.string());
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in),
                                std::istreambuf_iterator<char>());
}

void write_file(const fs::path& path, const std::vector<uint8_t>& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw ConversionFailure("Cannot create " + path.string());
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out) {
        throw ConversionFailure("Write failed for " + path.string());
    }
}

const char* webp_error_string(WebPEncodingError code) {
    switch (code) {
        case VP8_ENC_ERROR_OUT_OF_MEMORY:            return "out of memory";
        case VP8_ENC_ERROR_BITSTREAM_OUT_OF_MEMORY:  return "bitstream out of memory";
        case VP8_ENC_ERROR_NULL_PARAMETER:           return "null parameter";
        case VP8_ENC_ERROR_INVALID_CONFIGURATION:    return "invalid configuration";
        case VP8_ENC_ERROR_BAD_DIMENSION:            return "bad dimension (max 16383px)";
        case VP8_ENC_ERROR_PARTITION0_OVERFLOW:      return "partition0 overflow";
        case VP8_ENC_ERROR_PARTITION_OVERFLOW:       return "partition overflow";
        case VP8_ENC_ERROR_BAD_WRITE:                return "bad write";
        case VP8_ENC_ERROR_FILE_TOO_BIG:             return "file too big";
        case VP8_ENC_ERROR_USER_ABORT:               return "user abort";
        default:                                     return "unknown error";
    }
}

void append_to_vector(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<uint8_t>*>(context);
    auto* bytes = static_cast<const uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

} // namespace

void ConversionParams::validate() const {
    if (quality < 0 || quality > 100) {
        throw ConfigurationError("Quality must be between 0 and 100, got " + std::to_string(quality));
    }
    if (method < 0 || method > 6) {
        throw ConfigurationError("Method must be between 0 and 6, got " + std::to_string(method));
    }
    if (max_width < 0 || max_height < 0) {
        throw ConfigurationError("Max width/height must not be negative");
    }
    if (greyscale_pixel_threshold < 0 || greyscale_pixel_threshold > 255) {
        throw ConfigurationError("Greyscale pixel threshold must be between 0 and 255");
    }
    if (greyscale_percent_threshold < 0.0 || greyscale_percent_threshold > 1.0) {
        throw ConfigurationError("Greyscale percent threshold must be between 0 and 1");
    }
    if (format == ImageFormat::PNG && auto_optimize) {
        throw ConfigurationError("auto-optimize only applies to WebP output");
    }
}

const std::vector<std::string>& ImageProcessor::supported_extensions() {
    static const std::vector<std::string> exts = {
        ".jpg", ".jpeg", ".png", ".bmp", ".tga", ".gif", ".webp"
    };
    return exts;
}

bool ImageProcessor::is_supported(const fs::path& path) {
    auto ext = fsutil::lower_extension(path);
    const auto& supported = supported_extensions();
    return std::find(supported.begin(), supported.end(), ext) != supported.end();
}

std::string ImageProcessor::output_extension(ImageFormat format) {
    return format == ImageFormat::PNG ? ".png" : ".webp";
}

std::pair<int, int> ImageProcessor::fit_within(int width, int height, int max_width, int max_height) {
    double scale = 1.0;
    if (max_width > 0 && width > max_width) {
        scale = std::min(scale, static_cast<double>(max_width) / width);
    }
    if (max_height > 0 && height > max_height) {
        scale = std::min(scale, static_cast<double>(max_height) / height);
    }
    if (scale >= 1.0) {
        return {width, height};  // nie hochskalieren
    }

    long new_width = std::lround(width * scale);
    long new_height = std::lround(height * scale);
    new_width = std::clamp(new_width, 1L, static_cast<long>(max_width > 0 ? max_width : width));
    new_height = std::clamp(new_height, 1L, static_cast<long>(max_height > 0 ? max_height : height));
    return {static_cast<int>(new_width), static_cast<int>(new_height)};
}

std::optional<ImageData> ImageProcessor::load_image(const fs::path& path, std::string* error) const {
    auto fail = [error](const std::string& msg) -> std::optional<ImageData> {
        if (error) *error = msg;
        return std::nullopt;
    };

    std::vector<uint8_t> bytes;
    try {
        bytes = read_file(path);
    } catch (const std::exception& e) {
        return fail(e.what());
    }
    if (bytes.empty()) {
        return fail("Empty image file");
    }

    ImageData image;

    if (fsutil::lower_extension(path) == ".webp") {
        // stb kann kein webp
        WebPBitstreamFeatures features;
        if (WebPGetFeatures(bytes.data(), bytes.size(), &features) != VP8_STATUS_OK) {
            return fail("Failed to decode image: invalid WebP header");
        }
        int width = 0, height = 0;
        uint8_t* data = features.has_alpha
            ? WebPDecodeRGBA(bytes.data(), bytes.size(), &width, &height)
            : WebPDecodeRGB(bytes.data(), bytes.size(), &width, &height);
        if (!data) {
            return fail("Failed to decode image: corrupt WebP data");
        }
        image.width = width;
        image.height = height;
        image.channels = features.has_alpha ? 4 : 3;
        size_t size = static_cast<size_t>(width) * height * image.channels;
        image.pixels.assign(data, data + size);
        WebPFree(data);
        return image;
    }

    int width = 0, height = 0, channels = 0;
    unsigned char* data = nullptr;
    {
        std::lock_guard<std::mutex> lock(stb_operations_mutex);
        data = stbi_load_from_memory(bytes.data(), static_cast<int>(bytes.size()),
                                     &width, &height, &channels, 0);
        if (!data) {
            return fail("Failed to decode image: " + std::string(stbi_failure_reason()));
        }
    }

    // dimensionen checken bevor wir multiplizieren
    constexpr int MAX_DIMENSION = 65535;
    constexpr uint64_t MAX_PIXELS = 200000000;
    if (width <= 0 || height <= 0 || channels <= 0 || channels > 4 ||
        width > MAX_DIMENSION || height > MAX_DIMENSION ||
        static_cast<uint64_t>(width) * static_cast<uint64_t>(height) > MAX_PIXELS) {
        stbi_image_free(data);
        return fail("Unsupported image dimensions " + std::to_string(width) + "x" + std::to_string(height));
    }

    image.width = width;
    image.height = height;
    image.channels = channels;

    size_t size = static_cast<size_t>(width) * static_cast<size_t>(height) * static_cast<size_t>(channels);
    try {
        image.pixels.assign(data, data + size);
    } catch (...) {
        stbi_image_free(data);
        throw;
    }
    stbi_image_free(data);

    // grau+alpha gibts nich im whitelist -> rgba
    if (image.channels == 2) {
        image = ImageAnalyzer::to_truecolor(image);
    }
    return image;
}

ImageData ImageProcessor::resize(const ImageData& image, int new_width, int new_height) const {
    ImageData result;
    result.width = new_width;
    result.height = new_height;
    result.channels = image.channels;
    result.pixels.resize(static_cast<size_t>(new_width) * static_cast<size_t>(new_height) *
                         static_cast<size_t>(image.channels));

    stbir_pixel_layout layout;
    switch (image.channels) {
        case 1: layout = STBIR_1CHANNEL; break;
        case 2: layout = STBIR_2CHANNEL; break;
        case 3: layout = STBIR_RGB; break;
        default: layout = STBIR_RGBA; break;
    }

    // catmull-rom ist das schärfste was stbir hat, nah genug an lanczos
    void* ok = stbir_resize(
        image.pixels.data(), image.width, image.height, 0,
        result.pixels.data(), new_width, new_height, 0,
        layout, STBIR_TYPE_UINT8_SRGB, STBIR_EDGE_CLAMP, STBIR_FILTER_CATMULLROM
    );
    if (!ok) {
        throw ConversionFailure("stbir_resize failed (likely out of memory): " +
            std::to_string(new_width) + "x" + std::to_string(new_height));
    }
    return result;
}

std::vector<uint8_t> ImageProcessor::encode_webp(const ImageData& image, const ConversionParams& params,
                                                 bool lossless) const {
    // libwebp will rgb oder rgba
    ImageData expanded;
    const ImageData* input = &image;
    if (image.channels != 3 && image.channels != 4) {
        expanded = ImageAnalyzer::to_truecolor(image);
        input = &expanded;
    }

    WebPConfig config;
    if (!WebPConfigInit(&config)) {
        throw ConversionFailure("libwebp version mismatch");
    }
    config.quality = static_cast<float>(params.quality);
    config.method = params.method;
    config.lossless = lossless ? 1 : 0;
    config.use_sharp_yuv = params.sharp_yuv ? 1 : 0;
    if (!WebPValidateConfig(&config)) {
        throw ConversionFailure("Invalid WebP configuration");
    }

    WebPPicture picture;
    if (!WebPPictureInit(&picture)) {
        throw ConversionFailure("libwebp version mismatch");
    }
    picture.use_argb = lossless ? 1 : 0;
    picture.width = input->width;
    picture.height = input->height;

    const int stride = input->width * input->channels;
    int imported = input->channels == 4
        ? WebPPictureImportRGBA(&picture, input->pixels.data(), stride)
        : WebPPictureImportRGB(&picture, input->pixels.data(), stride);
    if (!imported) {
        WebPPictureFree(&picture);
        throw ConversionFailure("WebP import failed (out of memory)");
    }

    WebPMemoryWriter writer;
    WebPMemoryWriterInit(&writer);
    picture.writer = WebPMemoryWrite;
    picture.custom_ptr = &writer;

    int ok = WebPEncode(&config, &picture);
    WebPEncodingError code = picture.error_code;
    WebPPictureFree(&picture);

    if (!ok) {
        WebPMemoryWriterClear(&writer);
        throw ConversionFailure(std::string("WebP encode failed: ") + webp_error_string(code));
    }

    std::vector<uint8_t> out(writer.mem, writer.mem + writer.size);
    WebPMemoryWriterClear(&writer);
    return out;
}

std::vector<uint8_t> ImageProcessor::encode_png(const ImageData& image) const {
    std::vector<uint8_t> out;

    // fpng geht nur mit rgb/rgba
    if (image.channels == 3 || image.channels == 4) {
        ensure_fpng_initialized();
        if (fpng::fpng_encode_image_to_memory(image.pixels.data(),
                                              static_cast<uint32_t>(image.width),
                                              static_cast<uint32_t>(image.height),
                                              static_cast<uint32_t>(image.channels), out)) {
            return out;
        }
        out.clear();
    }

    // graustufen etc über stb
    std::lock_guard<std::mutex> lock(stb_operations_mutex);
    int ok = stbi_write_png_to_func(append_to_vector, &out,
                                    image.width, image.height, image.channels,
                                    image.pixels.data(), image.width * image.channels);
    if (!ok) {
        throw ConversionFailure("PNG encode failed");
    }
    return out;
}

std::vector<uint8_t> ImageProcessor::encode(const ImageData& image, const ConversionParams& params) const {
    if (params.format == ImageFormat::PNG) {
        return encode_png(image);
    }

    if (!params.auto_optimize) {
        return encode_webp(image, params, params.lossless);
    }

    // beides probieren, kleineres gewinnt
    auto lossy = encode_webp(image, params, false);
    auto lossless = encode_webp(image, params, true);
    return lossless.size() < lossy.size() ? std::move(lossless) : std::move(lossy);
}

ConversionResult ImageProcessor::convert(const ConversionTask& task) const {
    ConversionResult result;
    result.source = task.source;
    result.destination = task.destination;

    auto start = std::chrono::steady_clock::now();
    const ConversionParams& params = task.params;

    fs::path temp_path = task.destination;
    temp_path += ".tmp";

    try {
        result.original_size = fs::file_size(task.source);

        // jetzt wirklich laden
        std::string error;
        auto image_opt = load_image(task.source, &error);
        if (!image_opt) {
            result.error_message = error;
            return result;
        }
        ImageData image = std::move(*image_opt);

        // resize wenn gewünscht
        auto [new_width, new_height] = fit_within(image.width, image.height,
                                                  params.max_width, params.max_height);
        if (new_width != image.width || new_height != image.height) {
            image = resize(image, new_width, new_height);
        }

        if (params.grayscale) {
            image = ImageAnalyzer::to_greyscale(image);
        } else if (params.auto_greyscale &&
                   ImageAnalyzer::should_convert_to_greyscale(image,
                                                              params.greyscale_pixel_threshold,
                                                              params.greyscale_percent_threshold)) {
            image = ImageAnalyzer::to_greyscale(image);
        }

        if (params.auto_contrast) {
            ImageAnalyzer::auto_contrast(image);
        }

        ImageAnalyzer::apply_preprocessing(image, params.preprocessing);

        auto encoded = encode(image, params);

        // temp file + rename damit nie halbe files rumliegen
        if (task.destination.has_parent_path()) {
            fs::create_directories(task.destination.parent_path());
        }
        write_file(temp_path, encoded);
        fs::rename(temp_path, task.destination);

        result.converted_size = encoded.size();
        result.width = image.width;
        result.height = image.height;
        result.success = true;
    } catch (const std::exception& e) {
        std::error_code ec;
        fs::remove(temp_path, ec);
        result.success = false;
        result.error_message = e.what();
    }

    auto end = std::chrono::steady_clock::now();
    result.processing_time_ms = std::chrono::duration<double, std::milli>(end - start).count();
    return result;
}

} // namespace cbxconv

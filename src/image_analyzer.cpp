#include "cbxconv/image_analyzer.hpp"
#include <algorithm>
#include <array>
#include <cmath>

namespace cbxconv {

namespace {

// alpha ist immer der letzte channel bei 2 und 4
int color_channels(int channels) {
    return (channels == 2 || channels == 4) ? channels - 1 : channels;
}

} // namespace

Colorfulness ImageAnalyzer::analyze_colorfulness(const ImageData& image, int pixel_threshold) {
    Colorfulness stats;
    const size_t total = static_cast<size_t>(image.width) * image.height;
    if (total == 0 || color_channels(image.channels) < 3) {
        return stats;  // grau hat keine farbe
    }

    uint64_t sum = 0;
    size_t colored = 0;
    const uint8_t* p = image.pixels.data();
    for (size_t i = 0; i < total; ++i, p += image.channels) {
        int hi = std::max({p[0], p[1], p[2]});
        int lo = std::min({p[0], p[1], p[2]});
        int diff = hi - lo;
        stats.max_diff = std::max(stats.max_diff, diff);
        sum += static_cast<uint64_t>(diff);
        if (diff > pixel_threshold) colored++;
    }

    stats.mean_diff = static_cast<double>(sum) / total;
    stats.colored_ratio = static_cast<double>(colored) / total;
    return stats;
}

bool ImageAnalyzer::should_convert_to_greyscale(const ImageData& image, int pixel_threshold,
                                                double percent_threshold) {
    auto stats = analyze_colorfulness(image, pixel_threshold);
    if (stats.colored_ratio == 0.0) {
        return false;
    }
    return stats.colored_ratio <= percent_threshold;
}

ImageData ImageAnalyzer::to_greyscale(const ImageData& image) {
    ImageData grey;
    grey.width = image.width;
    grey.height = image.height;
    grey.channels = 1;

    const size_t total = static_cast<size_t>(image.width) * image.height;
    grey.pixels.resize(total);

    const uint8_t* src = image.pixels.data();
    for (size_t i = 0; i < total; ++i, src += image.channels) {
        if (image.channels >= 3) {
            // ITU-R 601 luma, wie PIL "L"
            uint32_t y = (src[0] * 299u + src[1] * 587u + src[2] * 114u + 500u) / 1000u;
            grey.pixels[i] = static_cast<uint8_t>(y);
        } else {
            grey.pixels[i] = src[0];
        }
    }
    return grey;
}

ImageData ImageAnalyzer::to_truecolor(const ImageData& image) {
    if (image.channels == 3 || image.channels == 4) {
        return image;
    }

    ImageData out;
    out.width = image.width;
    out.height = image.height;
    out.channels = image.channels == 2 ? 4 : 3;

    const size_t total = static_cast<size_t>(image.width) * image.height;
    out.pixels.resize(total * out.channels);

    const uint8_t* src = image.pixels.data();
    uint8_t* dst = out.pixels.data();
    for (size_t i = 0; i < total; ++i) {
        dst[0] = dst[1] = dst[2] = src[0];
        if (out.channels == 4) dst[3] = src[1];
        src += image.channels;
        dst += out.channels;
    }
    return out;
}

void ImageAnalyzer::auto_contrast(ImageData& image) {
    const int colors = color_channels(image.channels);
    const size_t total = static_cast<size_t>(image.width) * image.height;
    if (total == 0) return;

    for (int c = 0; c < colors; ++c) {
        uint8_t lo = 255, hi = 0;
        for (size_t i = 0; i < total; ++i) {
            uint8_t v = image.pixels[i * image.channels + c];
            lo = std::min(lo, v);
            hi = std::max(hi, v);
        }
        if (hi <= lo) continue;  // flache fläche, nix zu strecken

        std::array<uint8_t, 256> lut{};
        const double scale = 255.0 / (hi - lo);
        for (int v = 0; v < 256; ++v) {
            double mapped = (v - lo) * scale;
            lut[v] = static_cast<uint8_t>(std::clamp(std::lround(mapped), 0L, 255L));
        }
        for (size_t i = 0; i < total; ++i) {
            uint8_t& v = image.pixels[i * image.channels + c];
            v = lut[v];
        }
    }
}

void ImageAnalyzer::unsharp_mask(ImageData& image, double radius, int percent, int threshold) {
    const int w = image.width;
    const int h = image.height;
    const int ch = image.channels;
    const int colors = color_channels(ch);
    if (w == 0 || h == 0 || radius <= 0) return;

    // separierbarer gauss, sigma = radius
    const int half = std::max(1, static_cast<int>(std::ceil(radius * 3)));
    std::vector<float> kernel(2 * half + 1);
    float ksum = 0;
    for (int i = -half; i <= half; ++i) {
        float v = std::exp(-(i * i) / static_cast<float>(2 * radius * radius));
        kernel[i + half] = v;
        ksum += v;
    }
    for (auto& k : kernel) k /= ksum;

    const size_t count = static_cast<size_t>(w) * h * ch;
    std::vector<float> tmp(count), blur(count);

    // horizontal
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            for (int c = 0; c < colors; ++c) {
                float acc = 0;
                for (int k = -half; k <= half; ++k) {
                    int sx = std::clamp(x + k, 0, w - 1);
                    acc += kernel[k + half] * image.pixels[(static_cast<size_t>(y) * w + sx) * ch + c];
                }
                tmp[(static_cast<size_t>(y) * w + x) * ch + c] = acc;
            }
        }
    }
    // vertikal
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            for (int c = 0; c < colors; ++c) {
                float acc = 0;
                for (int k = -half; k <= half; ++k) {
                    int sy = std::clamp(y + k, 0, h - 1);
                    acc += kernel[k + half] * tmp[(static_cast<size_t>(sy) * w + x) * ch + c];
                }
                blur[(static_cast<size_t>(y) * w + x) * ch + c] = acc;
            }
        }
    }

    const float amount = percent / 100.0f;
    for (size_t i = 0; i < static_cast<size_t>(w) * h; ++i) {
        for (int c = 0; c < colors; ++c) {
            size_t idx = i * ch + c;
            float orig = image.pixels[idx];
            float diff = orig - blur[idx];
            if (std::fabs(diff) < threshold) continue;
            float v = orig + diff * amount;
            image.pixels[idx] = static_cast<uint8_t>(std::clamp(std::lround(v), 0L, 255L));
        }
    }
}

void ImageAnalyzer::median3x3(ImageData& image) {
    const int w = image.width;
    const int h = image.height;
    const int ch = image.channels;
    const int colors = color_channels(ch);
    if (w < 3 || h < 3) return;

    std::vector<uint8_t> out = image.pixels;
    std::array<uint8_t, 9> window{};

    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            for (int c = 0; c < colors; ++c) {
                int n = 0;
                for (int dy = -1; dy <= 1; ++dy) {
                    int sy = std::clamp(y + dy, 0, h - 1);
                    for (int dx = -1; dx <= 1; ++dx) {
                        int sx = std::clamp(x + dx, 0, w - 1);
                        window[n++] = image.pixels[(static_cast<size_t>(sy) * w + sx) * ch + c];
                    }
                }
                std::nth_element(window.begin(), window.begin() + 4, window.end());
                out[(static_cast<size_t>(y) * w + x) * ch + c] = window[4];
            }
        }
    }
    image.pixels = std::move(out);
}

void ImageAnalyzer::apply_preprocessing(ImageData& image, Preprocessing mode) {
    switch (mode) {
        case Preprocessing::NONE:
            break;
        case Preprocessing::SHARPEN:
            unsharp_mask(image);
            break;
        case Preprocessing::DENOISE:
            median3x3(image);
            unsharp_mask(image, 1.0, 100, 3);
            break;
    }
}

} // namespace cbxconv

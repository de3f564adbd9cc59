#pragma once
// farb-analyse und filter die vor dem encoden laufen
// alles auf 8bit pixeln, 1/3/4 channels

#include "cbxconv/image_processor.hpp"

namespace cbxconv {

struct Colorfulness {
    int max_diff = 0;          // max(rgb)-min(rgb) über alle pixel
    double mean_diff = 0;
    double colored_ratio = 0;  // anteil pixel mit diff > threshold
};

class ImageAnalyzer {
public:
    static Colorfulness analyze_colorfulness(const ImageData& image, int pixel_threshold = 16);

    // fast-graue seiten (ein paar farbige pixel vom scanner) -> grau
    // komplett graue bilder zählen nich, die sind schon grau
    static bool should_convert_to_greyscale(const ImageData& image,
                                            int pixel_threshold = 16,
                                            double percent_threshold = 0.01);

    // 1 channel, alpha fliegt raus
    static ImageData to_greyscale(const ImageData& image);

    // grau -> rgb, grau+alpha -> rgba, rest unverändert
    static ImageData to_truecolor(const ImageData& image);

    // histogramm pro channel auf 0..255 ziehen, alpha bleibt
    static void auto_contrast(ImageData& image);

    static void unsharp_mask(ImageData& image, double radius = 2.0, int percent = 150,
                             int threshold = 3);
    static void median3x3(ImageData& image);

    static void apply_preprocessing(ImageData& image, Preprocessing mode);
};

} // namespace cbxconv

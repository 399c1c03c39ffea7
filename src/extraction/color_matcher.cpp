#include "plot_digitizer/extraction/color_matcher.hpp"
#include "plot_digitizer/core/errors.hpp"

#include <cstdio>
#include <cstdlib>

namespace plot_digitizer::extraction {

bool color_matches(RgbColor pixel, const ColorSpec& spec) {
    const int t = spec.tolerance;
    return std::abs(static_cast<int>(pixel.r) - static_cast<int>(spec.target.r)) <= t &&
           std::abs(static_cast<int>(pixel.g) - static_cast<int>(spec.target.g)) <= t &&
           std::abs(static_cast<int>(pixel.b) - static_cast<int>(spec.target.b)) <= t;
}

void validate_color_spec(const ColorSpec& spec) {
    if (spec.tolerance < 0) {
        throw ValidationError("color tolerance must be >= 0 (got " +
                              std::to_string(spec.tolerance) + ")");
    }
}

ColorSpec pick_color(const RgbImage& image, int col, int row, int tolerance) {
    if (col < 0 || row < 0 || col >= image.width() || row >= image.height()) {
        throw ValidationError("color pick (" + std::to_string(col) + ", " + std::to_string(row) +
                              ") outside image " + std::to_string(image.width()) + "x" +
                              std::to_string(image.height()));
    }
    ColorSpec spec{image.at(col, row), tolerance};
    validate_color_spec(spec);
    return spec;
}

std::string to_hex(RgbColor color) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02X%02X%02X", color.r, color.g, color.b);
    return buf;
}

} // namespace plot_digitizer::extraction

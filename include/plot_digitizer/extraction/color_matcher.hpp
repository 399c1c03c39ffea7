#pragma once

#include "plot_digitizer/core/types.hpp"

namespace plot_digitizer::extraction {

constexpr int kDefaultTolerance = 15;

// Target color plus per-channel tolerance.
struct ColorSpec {
    RgbColor target;
    int tolerance = kDefaultTolerance;
};

/**
 * Per-channel (Chebyshev) match: every channel of `pixel` lies within
 * `spec.tolerance` of the target channel. Tolerance 0 means exact equality.
 */
bool color_matches(RgbColor pixel, const ColorSpec& spec);

// Throws ValidationError for a negative tolerance.
void validate_color_spec(const ColorSpec& spec);

/**
 * Build a ColorSpec from the pixel under a click.
 * Throws ValidationError if (col, row) lies outside the image.
 */
ColorSpec pick_color(const RgbImage& image, int col, int row, int tolerance = kDefaultTolerance);

std::string to_hex(RgbColor color);

} // namespace plot_digitizer::extraction

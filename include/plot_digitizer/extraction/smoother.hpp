#pragma once

#include "plot_digitizer/core/types.hpp"

namespace plot_digitizer::extraction {

constexpr int kDefaultSmoothingWindow = 5;

/**
 * Centered moving average of width `window` (even widths act as window + 1).
 * Near the ends the window shrinks symmetrically so it never reaches outside
 * the path; the first and last samples are therefore unchanged.
 * Output length always equals input length. window <= 1 returns the input.
 */
PixelPath moving_average(const PixelPath& path, int window);

/**
 * Savitzky-Golay filter: least-squares polynomial of degree `polyorder` over an
 * odd `window`. The first and last window/2 samples are evaluated on the
 * polynomial fitted to the first and last full window.
 * Paths shorter than `window` are returned unchanged.
 * Throws ValidationError for an even window or polyorder >= window.
 */
PixelPath savitzky_golay(const PixelPath& path, int window, int polyorder);

} // namespace plot_digitizer::extraction

#pragma once

#include "plot_digitizer/core/types.hpp"
#include "plot_digitizer/extraction/color_matcher.hpp"

#include <optional>

namespace plot_digitizer::extraction {

// Binary match mask, image sized, 1 = matched pixel.
using MatchMask = Matrix2Du8;

// Rows actually examined after clamping the bounds to the image. Empty when first_row > last_row.
struct ScanRange {
    int first_row = 0;
    int last_row = -1;

    bool empty() const { return first_row > last_row; }
};

struct MaskCleanupOptions {
    bool fill_holes = true; // enclosed background regions become matches
    int kernel_size = 5;    // square closing kernel, <= 1 disables closing
};

ScanRange resolve_scan_range(const RgbImage& image, const std::optional<Bounds>& bounds);

// Rows outside the scan range are always 0.
MatchMask build_match_mask(const RgbImage& image, const ColorSpec& spec,
                           const std::optional<Bounds>& bounds);

// Morphological cleanup restricted to the scan range (OpenCV).
void clean_match_mask(MatchMask& mask, const ScanRange& range, const MaskCleanupOptions& options);

// Ascending matched rows for every image column.
ColumnMatches collect_column_matches(const MatchMask& mask);

/**
 * For every image column, the rows in the scan range whose pixel matches `spec`.
 * Result size equals the image width.
 */
ColumnMatches scan_region(const RgbImage& image, const ColorSpec& spec,
                          const std::optional<Bounds>& bounds);

std::size_t count_matches(const ColumnMatches& matches);

} // namespace plot_digitizer::extraction

#pragma once

#include "plot_digitizer/core/types.hpp"

#include <vector>

namespace plot_digitizer::extraction {

/**
 * Median of a non-empty row set, independent of order. For an even count the two
 * middle rows are averaged and rounded to the nearest row (halves away from zero).
 */
int median_row(std::vector<int> rows);

// One entry per column: the median matched row, or a hole for an empty column.
RawPath build_median_path(const ColumnMatches& matches);

int count_holes(const RawPath& path);

} // namespace plot_digitizer::extraction

#pragma once

#include "plot_digitizer/core/types.hpp"

namespace plot_digitizer::extraction {

/**
 * Resolve every hole of a raw path.
 * Interior hole runs are linearly interpolated between the bounding resolved rows;
 * leading and trailing holes hold the nearest resolved row.
 * Throws EmptyMatchError if the path has no resolved column.
 */
PixelPath fill_gaps(const RawPath& raw);

} // namespace plot_digitizer::extraction

#include "plot_digitizer/core/types.hpp"
#include "plot_digitizer/core/errors.hpp"

#include <algorithm>

namespace plot_digitizer {

Bounds Bounds::make(int upper_row, int lower_row) {
    if (upper_row < 0 || lower_row < 0) {
        throw BoundsError("rows must be >= 0 (got " + std::to_string(upper_row) + ", " +
                          std::to_string(lower_row) + ")");
    }
    if (upper_row >= lower_row) {
        throw BoundsError("upper row " + std::to_string(upper_row) +
                          " must be strictly less than lower row " + std::to_string(lower_row));
    }
    return Bounds{upper_row, lower_row};
}

Bounds Bounds::from_clicks(int row_a, int row_b) {
    return make(std::min(row_a, row_b), std::max(row_a, row_b));
}

} // namespace plot_digitizer

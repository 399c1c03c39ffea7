#include "plot_digitizer/extraction/median_path.hpp"
#include "plot_digitizer/core/errors.hpp"

#include <algorithm>
#include <cmath>

namespace plot_digitizer::extraction {

int median_row(std::vector<int> rows) {
    if (rows.empty()) {
        throw PlotDigitizerError("median_row: empty row set");
    }

    const size_t n = rows.size();
    const size_t mid = n / 2;
    std::nth_element(rows.begin(), rows.begin() + static_cast<std::ptrdiff_t>(mid), rows.end());
    const int hi = rows[mid];
    if ((n % 2) == 1) return hi;

    const int lo = *std::max_element(rows.begin(), rows.begin() + static_cast<std::ptrdiff_t>(mid));
    return static_cast<int>(std::lround(0.5 * (static_cast<double>(lo) + static_cast<double>(hi))));
}

RawPath build_median_path(const ColumnMatches& matches) {
    RawPath path;
    path.reserve(matches.size());
    for (const auto& rows : matches) {
        if (rows.empty()) {
            path.emplace_back(std::nullopt);
        } else {
            path.emplace_back(median_row(rows));
        }
    }
    return path;
}

int count_holes(const RawPath& path) {
    return static_cast<int>(std::count_if(path.begin(), path.end(),
                                          [](const std::optional<int>& r) { return !r.has_value(); }));
}

} // namespace plot_digitizer::extraction

#include "plot_digitizer/extraction/gap_filler.hpp"
#include "plot_digitizer/core/errors.hpp"

namespace plot_digitizer::extraction {

PixelPath fill_gaps(const RawPath& raw) {
    const Eigen::Index n = static_cast<Eigen::Index>(raw.size());

    Eigen::Index first = -1;
    Eigen::Index last = -1;
    for (Eigen::Index i = 0; i < n; ++i) {
        if (raw[static_cast<size_t>(i)]) {
            if (first < 0) first = i;
            last = i;
        }
    }
    if (first < 0) {
        throw EmptyMatchError("no matching pixel in " + std::to_string(n) + " scanned columns");
    }

    PixelPath out(n);
    for (Eigen::Index i = 0; i <= first; ++i) {
        out[i] = static_cast<double>(*raw[static_cast<size_t>(first)]);
    }
    for (Eigen::Index i = last; i < n; ++i) {
        out[i] = static_cast<double>(*raw[static_cast<size_t>(last)]);
    }

    Eigen::Index prev = first;
    for (Eigen::Index i = first + 1; i <= last; ++i) {
        const auto& r = raw[static_cast<size_t>(i)];
        if (!r) continue;

        const double a = static_cast<double>(*raw[static_cast<size_t>(prev)]);
        const double b = static_cast<double>(*r);
        const double span = static_cast<double>(i - prev);
        for (Eigen::Index k = prev; k <= i; ++k) {
            out[k] = a + (b - a) * static_cast<double>(k - prev) / span;
        }
        prev = i;
    }
    return out;
}

} // namespace plot_digitizer::extraction

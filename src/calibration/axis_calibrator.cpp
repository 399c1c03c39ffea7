#include "plot_digitizer/calibration/axis_calibrator.hpp"
#include "plot_digitizer/core/errors.hpp"

#include <cmath>
#include <sstream>

namespace plot_digitizer::calibration {

namespace {

// Proleptic ordinal of 1970-01-01 when 0001-01-01 is day 1.
constexpr int64_t kProlepticEpochOffset = 719163;

template <typename Anchor>
void check_anchor_pair(const std::vector<Anchor>& anchors, const char* axis) {
    if (anchors.size() != 2) {
        throw CalibrationError(std::string(axis) + " axis needs exactly two anchors (got " +
                               std::to_string(anchors.size()) + ")");
    }
    if (!std::isfinite(anchors[0].pixel) || !std::isfinite(anchors[1].pixel)) {
        throw CalibrationError(std::string(axis) + " axis anchor pixel is not finite");
    }
    if (anchors[0].pixel == anchors[1].pixel) {
        std::ostringstream oss;
        oss << axis << " axis anchors share pixel coordinate " << anchors[0].pixel;
        throw CalibrationError(oss.str());
    }
}

} // namespace

ValueAxisMap ValueAxisMap::build(const std::vector<ValueAnchor>& anchors, YScale scale) {
    check_anchor_pair(anchors, "Y");

    const ValueAnchor& a = anchors[0];
    const ValueAnchor& b = anchors[1];
    if (!std::isfinite(a.value) || !std::isfinite(b.value)) {
        throw CalibrationError("Y axis anchor value is not finite");
    }

    if (scale == YScale::LOG) {
        if (a.value <= 0.0 || b.value <= 0.0) {
            throw CalibrationError("log Y axis requires positive reference values");
        }
        const double la = std::log10(a.value);
        const double lb = std::log10(b.value);
        return ValueAxisMap(a.pixel, la, (lb - la) / (b.pixel - a.pixel), scale);
    }

    return ValueAxisMap(a.pixel, a.value, (b.value - a.value) / (b.pixel - a.pixel), scale);
}

double ValueAxisMap::to_value(double pixel_row) const {
    const double v = v1_ + slope_ * (pixel_row - p1_);
    return scale_ == YScale::LOG ? std::pow(10.0, v) : v;
}

double ValueAxisMap::to_pixel(double value) const {
    if (slope_ == 0.0) {
        throw CalibrationError("Y axis map is constant and cannot be inverted");
    }
    double v = value;
    if (scale_ == YScale::LOG) {
        if (value <= 0.0) {
            throw CalibrationError("log Y axis cannot invert non-positive value");
        }
        v = std::log10(value);
    }
    return p1_ + (v - v1_) / slope_;
}

DateAxisMap DateAxisMap::build(const std::vector<DateAnchor>& anchors) {
    check_anchor_pair(anchors, "X");

    const DateAnchor& a = anchors[0];
    const DateAnchor& b = anchors[1];
    const double da = static_cast<double>(to_day_ordinal(a.date));
    const double db = static_cast<double>(to_day_ordinal(b.date));
    return DateAxisMap(a.pixel, da, (db - da) / (b.pixel - a.pixel));
}

double DateAxisMap::to_ordinal(double pixel_col) const {
    return d1_ + slope_ * (pixel_col - p1_);
}

CalendarDate DateAxisMap::to_date(double pixel_col) const {
    // Ties go to the even day counted from 0001-01-01 (day 1), not from the 1970 epoch.
    const double proleptic = to_ordinal(pixel_col) + static_cast<double>(kProlepticEpochOffset);
    const int64_t day = static_cast<int64_t>(std::nearbyint(proleptic)) - kProlepticEpochOffset;
    return from_day_ordinal(day);
}

CalibratedSeries calibrate(const PixelPath& path, const ValueAxisMap& y_map, const DateAxisMap& x_map) {
    CalibratedSeries series;
    series.reserve(static_cast<size_t>(path.size()));
    for (Eigen::Index i = 0; i < path.size(); ++i) {
        SeriesSample s;
        s.date = x_map.to_date(static_cast<double>(i));
        s.value = y_map.to_value(path[i]);
        series.push_back(s);
    }
    return series;
}

} // namespace plot_digitizer::calibration

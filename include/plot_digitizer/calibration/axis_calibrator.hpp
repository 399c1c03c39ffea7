#pragma once

#include "plot_digitizer/calibration/date.hpp"
#include "plot_digitizer/core/types.hpp"

#include <vector>

namespace plot_digitizer::calibration {

// Y anchor: pixel row -> numeric value.
struct ValueAnchor {
    double pixel = 0.0;
    double value = 0.0;
};

// X anchor: pixel column -> calendar date.
struct DateAnchor {
    double pixel = 0.0;
    CalendarDate date;
};

/**
 * Pixel row -> value map through two anchors. Linear, or linear in log10(value).
 * build() throws CalibrationError unless there are exactly two anchors with
 * distinct pixels (and, for LOG, strictly positive values).
 */
class ValueAxisMap {
public:
    static ValueAxisMap build(const std::vector<ValueAnchor>& anchors, YScale scale);

    double to_value(double pixel_row) const;
    // Inverse of to_value. Throws CalibrationError where the map is not invertible.
    double to_pixel(double value) const;

    YScale scale() const { return scale_; }

private:
    ValueAxisMap(double p1, double v1, double slope, YScale scale)
        : p1_(p1), v1_(v1), slope_(slope), scale_(scale) {}

    double p1_;
    double v1_;    // log10 of the anchor value in LOG mode
    double slope_; // per pixel, in log10 units for LOG
    YScale scale_;
};

/**
 * Pixel column -> date through two anchors, linear over day ordinals.
 * build() throws CalibrationError unless there are exactly two anchors with distinct pixels.
 */
class DateAxisMap {
public:
    static DateAxisMap build(const std::vector<DateAnchor>& anchors);

    double to_ordinal(double pixel_col) const;
    // Rounded to the nearest whole day. Half-day ties go to the even proleptic ordinal.
    CalendarDate to_date(double pixel_col) const;

private:
    DateAxisMap(double p1, double d1, double slope) : p1_(p1), d1_(d1), slope_(slope) {}

    double p1_;
    double d1_;
    double slope_;
};

struct SeriesSample {
    CalendarDate date;
    double value = 0.0;
};

using CalibratedSeries = std::vector<SeriesSample>;

// Sample i is pixel column i of `path`.
CalibratedSeries calibrate(const PixelPath& path, const ValueAxisMap& y_map, const DateAxisMap& x_map);

} // namespace plot_digitizer::calibration

#pragma once

#include "plot_digitizer/calibration/axis_calibrator.hpp"

#include <filesystem>
#include <string>

namespace plot_digitizer::io {

namespace fs = std::filesystem;

struct CsvOptions {
    int value_precision = 4;
    bool header = true;
};

// Fixed-point, trailing zeros stripped, at least one decimal digit ("2.5", "3.0").
std::string format_value(double value, int precision);

// "date,value" rows, one per sample, in series order.
std::string format_series_csv(const calibration::CalibratedSeries& series, const CsvOptions& options = {});

// Throws IOError.
void write_series_csv(const fs::path& path, const calibration::CalibratedSeries& series,
                      const CsvOptions& options = {});

} // namespace plot_digitizer::io

#include "plot_digitizer/io/series_csv.hpp"
#include "plot_digitizer/calibration/date.hpp"
#include "plot_digitizer/core/utils.hpp"

#include <iomanip>
#include <sstream>

namespace plot_digitizer::io {

std::string format_value(double value, int precision) {
    if (precision < 0) precision = 0;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    std::string s = oss.str();

    if (s.find('.') == std::string::npos) {
        s += ".0";
    } else {
        while (s.size() > 1 && s.back() == '0') s.pop_back();
        if (s.back() == '.') s += '0';
    }
    if (s == "-0.0") s = "0.0";
    return s;
}

std::string format_series_csv(const calibration::CalibratedSeries& series, const CsvOptions& options) {
    std::ostringstream oss;
    if (options.header) {
        oss << "date,value\n";
    }
    for (const auto& sample : series) {
        oss << calibration::format_date(sample.date) << ','
            << format_value(sample.value, options.value_precision) << '\n';
    }
    return oss.str();
}

void write_series_csv(const fs::path& path, const calibration::CalibratedSeries& series,
                      const CsvOptions& options) {
    core::write_text(path, format_series_csv(series, options));
}

} // namespace plot_digitizer::io

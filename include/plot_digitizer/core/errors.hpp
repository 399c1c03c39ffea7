#pragma once

#include <stdexcept>
#include <string>

namespace plot_digitizer {

class PlotDigitizerError : public std::runtime_error {
public:
    explicit PlotDigitizerError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public PlotDigitizerError {
public:
    explicit ConfigError(const std::string& message)
        : PlotDigitizerError("Config error: " + message) {}
};

class ValidationError : public PlotDigitizerError {
public:
    explicit ValidationError(const std::string& message)
        : PlotDigitizerError("Validation error: " + message) {}
};

class IOError : public PlotDigitizerError {
public:
    explicit IOError(const std::string& message)
        : PlotDigitizerError("I/O error: " + message) {}
};

// No pixel in the scan range matched the target color.
class EmptyMatchError : public PlotDigitizerError {
public:
    explicit EmptyMatchError(const std::string& message)
        : PlotDigitizerError("Empty match: " + message) {}
};

class CalibrationError : public PlotDigitizerError {
public:
    explicit CalibrationError(const std::string& message)
        : PlotDigitizerError("Calibration error: " + message) {}
};

class BoundsError : public ValidationError {
public:
    explicit BoundsError(const std::string& message)
        : ValidationError("bounds: " + message) {}
};

} // namespace plot_digitizer

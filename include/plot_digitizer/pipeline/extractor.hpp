#pragma once

#include "plot_digitizer/calibration/axis_calibrator.hpp"
#include "plot_digitizer/config/configuration.hpp"
#include "plot_digitizer/config/job.hpp"
#include "plot_digitizer/core/events.hpp"
#include "plot_digitizer/core/types.hpp"
#include "plot_digitizer/extraction/color_matcher.hpp"

#include <optional>
#include <string>
#include <vector>

namespace plot_digitizer::pipeline {

struct CalibrationInput {
    std::vector<calibration::ValueAnchor> y_anchors;
    std::vector<config::DateAnchorText> x_anchors;
    YScale y_scale = YScale::LINEAR;
};

struct ExtractionRequest {
    extraction::ColorSpec color;
    std::optional<Bounds> bounds;
    config::ExtractionConfig options;
    std::optional<CalibrationInput> calibration;
};

struct ExtractionResult {
    RawPath raw_path;
    PixelPath pixel_path;
    std::size_t matched_pixels = 0;
    int hole_columns = 0;

    // Set only when calibration was requested and succeeded.
    std::optional<calibration::CalibratedSeries> series;
    // Non-empty when calibration was requested and failed.
    std::string calibration_error;
};

/**
 * One extraction run: scan, median path, gap fill, optional smoothing, optional calibration.
 *
 * Throws EmptyMatchError when nothing in the scan range matches, ValidationError
 * for a bad color spec or smoothing settings. A CalibrationError does not abort
 * the run: the pixel path is returned and the message kept in calibration_error.
 * Phase events go to `events` when it is non-null.
 */
ExtractionResult run_extraction(const RgbImage& image, const ExtractionRequest& request,
                                core::EventEmitter* events = nullptr,
                                const std::string& run_id = "");

YScale parse_y_scale(const std::string& name);

// Resolves color picks against `image`, applies tolerance and bounds.
ExtractionRequest build_request(const config::Job& job, const config::Config& cfg,
                                const RgbImage& image);

} // namespace plot_digitizer::pipeline

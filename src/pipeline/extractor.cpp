#include "plot_digitizer/pipeline/extractor.hpp"
#include "plot_digitizer/calibration/date.hpp"
#include "plot_digitizer/core/errors.hpp"
#include "plot_digitizer/core/utils.hpp"
#include "plot_digitizer/extraction/gap_filler.hpp"
#include "plot_digitizer/extraction/median_path.hpp"
#include "plot_digitizer/extraction/region_scanner.hpp"
#include "plot_digitizer/extraction/smoother.hpp"

namespace plot_digitizer::pipeline {

namespace {

class PhaseReporter {
public:
    PhaseReporter(core::EventEmitter* events, const std::string& run_id)
        : events_(events), run_id_(run_id) {}

    void start(Phase phase) {
        if (events_) events_->phase_start(run_id_, phase);
    }
    void end(Phase phase, const std::string& status, const core::json& extra = core::json::object()) {
        if (events_) events_->phase_end(run_id_, phase, status, extra);
    }
    void warning(const std::string& message) {
        if (events_) events_->warning(run_id_, message);
    }

private:
    core::EventEmitter* events_;
    std::string run_id_;
};

std::vector<calibration::DateAnchor> parse_date_anchors(const std::vector<config::DateAnchorText>& raw) {
    std::vector<calibration::DateAnchor> anchors;
    anchors.reserve(raw.size());
    for (const auto& a : raw) {
        anchors.push_back({a.pixel, calibration::parse_date(a.date)});
    }
    return anchors;
}

} // namespace

ExtractionResult run_extraction(const RgbImage& image, const ExtractionRequest& request,
                                core::EventEmitter* events, const std::string& run_id) {
    PhaseReporter report(events, run_id);
    ExtractionResult result;
    const auto& opts = request.options;

    // Phase 0: SCAN_REGION
    report.start(Phase::SCAN_REGION);
    const extraction::ScanRange range = extraction::resolve_scan_range(image, request.bounds);
    extraction::MatchMask mask = extraction::build_match_mask(image, request.color, request.bounds);
    if (opts.mask_cleanup.enabled) {
        extraction::MaskCleanupOptions cleanup;
        cleanup.fill_holes = opts.mask_cleanup.fill_holes;
        cleanup.kernel_size = opts.mask_cleanup.kernel_size;
        extraction::clean_match_mask(mask, range, cleanup);
    }
    const ColumnMatches matches = extraction::collect_column_matches(mask);
    result.matched_pixels = extraction::count_matches(matches);
    report.end(Phase::SCAN_REGION, "ok",
               {{"columns", matches.size()},
                {"first_row", range.first_row},
                {"last_row", range.last_row},
                {"matched_pixels", result.matched_pixels},
                {"color", extraction::to_hex(request.color.target)},
                {"tolerance", request.color.tolerance},
                {"mask_cleanup", opts.mask_cleanup.enabled}});

    // Phase 1: MEDIAN_PATH
    report.start(Phase::MEDIAN_PATH);
    result.raw_path = extraction::build_median_path(matches);
    result.hole_columns = extraction::count_holes(result.raw_path);
    report.end(Phase::MEDIAN_PATH, "ok",
               {{"columns", result.raw_path.size()}, {"hole_columns", result.hole_columns}});

    // Phase 2: GAP_FILL
    report.start(Phase::GAP_FILL);
    try {
        result.pixel_path = extraction::fill_gaps(result.raw_path);
    } catch (const EmptyMatchError& e) {
        report.end(Phase::GAP_FILL, "error", {{"error", e.what()}});
        throw;
    }
    report.end(Phase::GAP_FILL, "ok", {{"filled_columns", result.hole_columns}});

    // Phase 3: SMOOTH
    report.start(Phase::SMOOTH);
    const bool run_savgol = opts.savgol.enabled &&
                            result.pixel_path.size() >= opts.savgol.min_columns;
    if (opts.savgol.enabled && !run_savgol) {
        report.warning("savgol skipped: " + std::to_string(result.pixel_path.size()) +
                       " columns < min_columns " + std::to_string(opts.savgol.min_columns));
    }
    if (run_savgol) {
        result.pixel_path = extraction::savitzky_golay(result.pixel_path, opts.savgol.window,
                                                       opts.savgol.polyorder);
    }
    if (opts.smoothing.enabled) {
        result.pixel_path = extraction::moving_average(result.pixel_path, opts.smoothing.window);
    }
    if (run_savgol || opts.smoothing.enabled) {
        report.end(Phase::SMOOTH, "ok",
                   {{"savgol", run_savgol},
                    {"moving_average_window", opts.smoothing.enabled ? opts.smoothing.window : 0}});
    } else {
        report.end(Phase::SMOOTH, "skipped", {{"reason", "disabled"}});
    }

    // Phase 4: CALIBRATE
    report.start(Phase::CALIBRATE);
    if (!request.calibration) {
        report.end(Phase::CALIBRATE, "skipped", {{"reason", "no_anchors"}});
        return result;
    }
    try {
        const auto& cal = *request.calibration;
        const auto y_map = calibration::ValueAxisMap::build(cal.y_anchors, cal.y_scale);
        const auto x_map = calibration::DateAxisMap::build(parse_date_anchors(cal.x_anchors));
        result.series = calibration::calibrate(result.pixel_path, y_map, x_map);
    } catch (const CalibrationError& e) {
        result.calibration_error = e.what();
        report.warning(result.calibration_error);
        report.end(Phase::CALIBRATE, "error", {{"error", result.calibration_error}});
        return result;
    }
    report.end(Phase::CALIBRATE, "ok",
               {{"samples", result.series->size()},
                {"y_scale", y_scale_to_string(request.calibration->y_scale)}});

    return result;
}

YScale parse_y_scale(const std::string& name) {
    const std::string n = core::to_lower(core::trim(name));
    if (n == "linear") return YScale::LINEAR;
    if (n == "log") return YScale::LOG;
    throw ValidationError("unknown y scale '" + name + "'");
}

ExtractionRequest build_request(const config::Job& job, const config::Config& cfg,
                                const RgbImage& image) {
    ExtractionRequest request;
    request.options = cfg.extraction;

    const int tolerance = job.tolerance.value_or(cfg.extraction.tolerance);
    if (job.color_pick) {
        request.color = extraction::pick_color(image, (*job.color_pick)[0], (*job.color_pick)[1], tolerance);
    } else if (job.color) {
        request.color = extraction::ColorSpec{*job.color, tolerance};
    } else {
        throw ValidationError("job has no color");
    }

    if (job.bounds) {
        request.bounds = Bounds::from_clicks((*job.bounds)[0], (*job.bounds)[1]);
    }

    if (job.has_calibration()) {
        CalibrationInput cal;
        cal.y_anchors = job.y_anchors;
        cal.x_anchors = job.x_anchors;
        cal.y_scale = parse_y_scale(cfg.calibration.y_scale);
        request.calibration = std::move(cal);
    }

    return request;
}

} // namespace plot_digitizer::pipeline

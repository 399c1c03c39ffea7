#include "plot_digitizer/core/errors.hpp"
#include "plot_digitizer/core/events.hpp"
#include "plot_digitizer/pipeline/extractor.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <sstream>
#include <string>
#include <vector>

using plot_digitizer::Bounds;
using plot_digitizer::BoundsError;
using plot_digitizer::EmptyMatchError;
using plot_digitizer::RgbColor;
using plot_digitizer::RgbImage;
using plot_digitizer::ValidationError;
using plot_digitizer::YScale;
using plot_digitizer::calibration::CalendarDate;
using plot_digitizer::config::Config;
using plot_digitizer::config::Job;
using plot_digitizer::core::EventEmitter;
using namespace plot_digitizer::pipeline;

namespace {

const RgbColor kWhite{255, 255, 255};
const RgbColor kRed{220, 20, 20};

// 10x10 white image with a red pixel at (i, i), optionally skipping one column.
RgbImage diagonal_image(int skip_col = -1) {
  RgbImage img(10, 10, kWhite);
  for (int i = 0; i < 10; ++i) {
    if (i != skip_col) img.set(i, i, kRed);
  }
  return img;
}

CalibrationInput diagonal_calibration() {
  CalibrationInput cal;
  cal.y_anchors = {{0.0, 10.0}, {9.0, 1.0}};
  cal.x_anchors = {{0.0, "2020-01-01"}, {9.0, "2020-01-10"}};
  return cal;
}

ExtractionRequest red_request() {
  ExtractionRequest req;
  req.color = {kRed, 15};
  req.calibration = diagonal_calibration();
  return req;
}

} // namespace

TEST_CASE("diagonal_line_yields_descending_daily_series") {
  auto result = run_extraction(diagonal_image(), red_request());

  REQUIRE(result.hole_columns == 0);
  REQUIRE(result.matched_pixels == 10);
  REQUIRE(result.series.has_value());
  REQUIRE(result.calibration_error.empty());

  const auto& series = *result.series;
  REQUIRE(series.size() == 10);
  for (int i = 0; i < 10; ++i) {
    REQUIRE(result.pixel_path[i] == Catch::Approx(i));
    REQUIRE(series[i].value == Catch::Approx(10.0 - i));
    REQUIRE(series[i].date == CalendarDate{2020, 1, 1 + i});
  }
}

TEST_CASE("missing_column_is_interpolated_from_neighbors") {
  auto result = run_extraction(diagonal_image(5), red_request());

  REQUIRE(result.hole_columns == 1);
  REQUIRE_FALSE(result.raw_path[5].has_value());
  REQUIRE(result.pixel_path[5] == Catch::Approx(5.0));
  REQUIRE((*result.series)[5].value == Catch::Approx(5.0));
  REQUIRE((*result.series)[5].date == CalendarDate{2020, 1, 6});
}

TEST_CASE("no_matching_pixel_raises_empty_match") {
  RgbImage img(10, 10, kWhite);
  REQUIRE_THROWS_AS(run_extraction(img, red_request()), EmptyMatchError);
}

TEST_CASE("bounds_exclude_matches_outside_band") {
  ExtractionRequest req = red_request();
  req.bounds = Bounds::make(2, 6);
  auto result = run_extraction(diagonal_image(), req);

  REQUIRE(result.matched_pixels == 5);
  REQUIRE(result.hole_columns == 5);
  REQUIRE(result.pixel_path[0] == Catch::Approx(2.0));
  REQUIRE(result.pixel_path[9] == Catch::Approx(6.0));
}

TEST_CASE("run_without_calibration_returns_pixel_path_only") {
  ExtractionRequest req = red_request();
  req.calibration.reset();
  auto result = run_extraction(diagonal_image(), req);

  REQUIRE_FALSE(result.series.has_value());
  REQUIRE(result.calibration_error.empty());
  REQUIRE(result.pixel_path.size() == 10);
}

TEST_CASE("calibration_failure_keeps_pixel_path") {
  ExtractionRequest req = red_request();
  req.calibration->y_anchors = {{3.0, 1.0}, {3.0, 5.0}};
  auto result = run_extraction(diagonal_image(), req);

  REQUIRE_FALSE(result.series.has_value());
  REQUIRE_FALSE(result.calibration_error.empty());
  REQUIRE(result.pixel_path.size() == 10);
  REQUIRE(result.pixel_path[7] == Catch::Approx(7.0));

  req = red_request();
  req.calibration->x_anchors[1].date = "tenth of january";
  result = run_extraction(diagonal_image(), req);
  REQUIRE_FALSE(result.series.has_value());
  REQUIRE(result.calibration_error.find("tenth of january") != std::string::npos);
}

TEST_CASE("log_scale_calibration_through_pipeline") {
  ExtractionRequest req = red_request();
  req.calibration->y_anchors = {{0.0, 1000.0}, {9.0, 1.0}};
  req.calibration->y_scale = YScale::LOG;
  auto result = run_extraction(diagonal_image(), req);

  REQUIRE((*result.series)[0].value == Catch::Approx(1000.0));
  REQUIRE((*result.series)[3].value == Catch::Approx(100.0));
  REQUIRE((*result.series)[9].value == Catch::Approx(1.0));
}

TEST_CASE("smoothing_preserves_length_and_flattens_spike") {
  RgbImage img(20, 9, kWhite);
  for (int x = 0; x < 9; ++x) img.set(x, 10, kRed);
  img.set(4, 10, kWhite);
  img.set(4, 16, kRed);

  ExtractionRequest req = red_request();
  req.calibration.reset();
  req.options.smoothing.enabled = true;
  req.options.smoothing.window = 3;
  auto result = run_extraction(img, req);

  REQUIRE(result.pixel_path.size() == 9);
  REQUIRE(result.pixel_path[4] == Catch::Approx(12.0));
  REQUIRE(result.pixel_path[0] == Catch::Approx(10.0));
}

TEST_CASE("rerun_recomputes_from_scratch") {
  ExtractionRequest req = red_request();
  auto first = run_extraction(diagonal_image(5), req);
  auto second = run_extraction(diagonal_image(), req);
  REQUIRE(first.hole_columns == 1);
  REQUIRE(second.hole_columns == 0);
  REQUIRE(second.raw_path[5] == 5);
}

TEST_CASE("run_emits_phase_events_in_order") {
  std::ostringstream out;
  EventEmitter events(out);
  run_extraction(diagonal_image(), red_request(), &events, "test_run");

  std::vector<std::string> phases;
  std::istringstream lines(out.str());
  std::string line;
  while (std::getline(lines, line)) {
    auto ev = nlohmann::json::parse(line);
    REQUIRE(ev["run_id"].get<std::string>() == "test_run");
    REQUIRE(ev.contains("ts"));
    if (ev["type"].get<std::string>() == "phase_end") {
      const std::string status = ev["status"].get<std::string>();
      REQUIRE((status == "ok" || status == "skipped"));
      phases.push_back(ev["phase_name"].get<std::string>());
    }
  }
  REQUIRE(phases == std::vector<std::string>{"SCAN_REGION", "MEDIAN_PATH", "GAP_FILL", "SMOOTH",
                                             "CALIBRATE"});
}

TEST_CASE("build_request_resolves_color_pick_and_bounds") {
  Job job = Job::from_yaml(YAML::Load(R"(
color_pick: [3, 3]
bounds: [8, 1]
y_axis:
  anchors: [[0, 10], [9, 1]]
x_axis:
  anchors: [[0, "2020-01-01"], [9, "2020-01-10"]]
)"));
  Config cfg;
  cfg.calibration.y_scale = "log";
  cfg.extraction.tolerance = 4;

  ExtractionRequest req = build_request(job, cfg, diagonal_image());
  REQUIRE(req.color.target == kRed);
  REQUIRE(req.color.tolerance == 4);
  REQUIRE(req.bounds->upper_row == 1);
  REQUIRE(req.bounds->lower_row == 8);
  REQUIRE(req.calibration->y_scale == YScale::LOG);
}

TEST_CASE("build_request_rejects_bad_picks_and_bounds") {
  Config cfg;
  Job outside = Job::from_yaml(YAML::Load("color_pick: [30, 3]"));
  REQUIRE_THROWS_AS(build_request(outside, cfg, diagonal_image()), ValidationError);

  Job flat = Job::from_yaml(YAML::Load("{color: [1, 2, 3], bounds: [4, 4]}"));
  REQUIRE_THROWS_AS(build_request(flat, cfg, diagonal_image()), BoundsError);
}

TEST_CASE("mask_cleanup_bridges_gap_in_line") {
  RgbImage img(11, 9, kWhite);
  for (int x = 0; x < 9; ++x) {
    if (x != 4) img.set(x, 5, kRed);
  }

  ExtractionRequest req = red_request();
  req.calibration.reset();
  auto plain = run_extraction(img, req);
  REQUIRE(plain.hole_columns == 1);
  REQUIRE(plain.matched_pixels == 8);

  req.options.mask_cleanup.enabled = true;
  auto cleaned = run_extraction(img, req);
  REQUIRE(cleaned.hole_columns == 0);
  REQUIRE(cleaned.matched_pixels == 9);
  REQUIRE(cleaned.raw_path[4] == 5);
}

TEST_CASE("savgol_runs_when_path_is_long_enough") {
  RgbImage img(15, 15, kWhite);
  for (int i = 0; i < 15; ++i) img.set(i, i, kRed);

  std::ostringstream out;
  EventEmitter events(out);
  ExtractionRequest req = red_request();
  req.calibration.reset();
  req.options.savgol.enabled = true;
  req.options.savgol.window = 5;
  req.options.savgol.polyorder = 2;
  req.options.savgol.min_columns = 5;
  auto result = run_extraction(img, req, &events, "sg");

  for (int i = 0; i < 15; ++i) {
    REQUIRE(result.pixel_path[i] == Catch::Approx(i).margin(1e-9));
  }
  REQUIRE(out.str().find("\"savgol\":true") != std::string::npos);
}

TEST_CASE("savgol_skipped_on_short_path_emits_warning") {
  std::ostringstream out;
  EventEmitter events(out);
  ExtractionRequest req = red_request();
  req.options.savgol.enabled = true; // window 11, min_columns 11 > 10 columns
  auto result = run_extraction(diagonal_image(), req, &events, "sg_short");

  for (int i = 0; i < 10; ++i) {
    REQUIRE(result.pixel_path[i] == Catch::Approx(i));
  }

  bool warned = false;
  std::string smooth_status;
  std::istringstream lines(out.str());
  std::string line;
  while (std::getline(lines, line)) {
    auto ev = nlohmann::json::parse(line);
    const std::string type = ev["type"].get<std::string>();
    if (type == "warning" &&
        ev["message"].get<std::string>().find("savgol skipped") != std::string::npos) {
      warned = true;
    }
    if (type == "phase_end" && ev["phase_name"].get<std::string>() == "SMOOTH") {
      smooth_status = ev["status"].get<std::string>();
    }
  }
  REQUIRE(warned);
  REQUIRE(smooth_status == "skipped");
}

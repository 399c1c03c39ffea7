#pragma once

#include "plot_digitizer/calibration/axis_calibrator.hpp"
#include "plot_digitizer/core/types.hpp"

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace plot_digitizer::config {

namespace fs = std::filesystem;

// X anchor as written in the job; the date text is parsed when the map is built.
struct DateAnchorText {
  double pixel = 0.0;
  std::string date;
};

/**
 * Per-image inputs captured by the operator: color, bounds and axis anchors.
 *
 * Either axis may be given as explicit anchors or as a raw click log
 * (pixel coordinates and "undo" entries) plus the two reference values;
 * click logs are replayed through calibration::AxisClickCycle.
 */
struct Job {
  std::optional<RgbColor> color;
  std::optional<std::array<int, 2>> color_pick; // column, row
  std::optional<int> tolerance;
  std::optional<std::array<int, 2>> bounds;     // two rows, any order

  std::vector<calibration::ValueAnchor> y_anchors;
  std::vector<DateAnchorText> x_anchors;

  bool has_calibration() const { return !y_anchors.empty() || !x_anchors.empty(); }

  static Job load(const fs::path &path);
  // Throws ValidationError for malformed entries.
  static Job from_yaml(const YAML::Node &node);
};

// Replays a click log ("undo" entries revert) and returns the confirmed pair.
// An incomplete log yields fewer positions; building the axis map rejects it.
std::vector<double> replay_clicks(const YAML::Node &clicks, const std::string &axis);

} // namespace plot_digitizer::config

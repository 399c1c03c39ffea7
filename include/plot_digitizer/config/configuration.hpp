#pragma once

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace plot_digitizer::config {

namespace fs = std::filesystem;

struct SmoothingConfig {
  bool enabled = false;
  int window = 5; // odd
};

struct SavgolConfig {
  bool enabled = false;
  int window = 11;     // odd, >= 3
  int polyorder = 2;   // < window
  int min_columns = 11; // shorter paths skip the filter
};

struct MaskCleanupConfig {
  bool enabled = false;
  int kernel_size = 5; // odd
  bool fill_holes = true;
};

struct ExtractionConfig {
  int tolerance = 15;
  SmoothingConfig smoothing;
  SavgolConfig savgol;
  MaskCleanupConfig mask_cleanup;
};

struct CalibrationConfig {
  std::string y_scale = "linear"; // linear | log
};

struct OutputConfig {
  int value_precision = 4;
  bool csv_header = true;
};

struct BatchConfig {
  std::string pattern = "*.png;*.jpg;*.jpeg;*.bmp;*.tif;*.tiff";
};

struct Config {
  ExtractionConfig extraction;
  CalibrationConfig calibration;
  OutputConfig output;
  BatchConfig batch;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace plot_digitizer::config

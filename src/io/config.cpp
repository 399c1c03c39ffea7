#include "plot_digitizer/config/configuration.hpp"
#include "plot_digitizer/core/errors.hpp"

#include <fstream>

namespace plot_digitizer::config {

static bool is_odd(int v) {
    return (v % 2) != 0;
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;
    if (!node || node.IsNull()) {
        return cfg;
    }
    if (!node.IsMap()) {
        throw ConfigError("top level must be a mapping");
    }

    try {
        if (node["extraction"]) {
            auto e = node["extraction"];
            if (e["tolerance"]) cfg.extraction.tolerance = e["tolerance"].as<int>();

            if (e["smoothing"]) {
                auto s = e["smoothing"];
                if (s["enabled"]) cfg.extraction.smoothing.enabled = s["enabled"].as<bool>();
                if (s["window"]) cfg.extraction.smoothing.window = s["window"].as<int>();
            }

            if (e["savgol"]) {
                auto sg = e["savgol"];
                if (sg["enabled"]) cfg.extraction.savgol.enabled = sg["enabled"].as<bool>();
                if (sg["window"]) cfg.extraction.savgol.window = sg["window"].as<int>();
                if (sg["polyorder"]) cfg.extraction.savgol.polyorder = sg["polyorder"].as<int>();
                if (sg["min_columns"]) cfg.extraction.savgol.min_columns = sg["min_columns"].as<int>();
            }

            if (e["mask_cleanup"]) {
                auto mc = e["mask_cleanup"];
                if (mc["enabled"]) cfg.extraction.mask_cleanup.enabled = mc["enabled"].as<bool>();
                if (mc["kernel_size"]) cfg.extraction.mask_cleanup.kernel_size = mc["kernel_size"].as<int>();
                if (mc["fill_holes"]) cfg.extraction.mask_cleanup.fill_holes = mc["fill_holes"].as<bool>();
            }
        }

        if (node["calibration"]) {
            auto c = node["calibration"];
            if (c["y_scale"]) cfg.calibration.y_scale = c["y_scale"].as<std::string>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["value_precision"]) cfg.output.value_precision = o["value_precision"].as<int>();
            if (o["csv_header"]) cfg.output.csv_header = o["csv_header"].as<bool>();
        }

        if (node["batch"]) {
            auto b = node["batch"];
            if (b["pattern"]) cfg.batch.pattern = b["pattern"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("bad value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["extraction"]["tolerance"] = extraction.tolerance;
    node["extraction"]["smoothing"]["enabled"] = extraction.smoothing.enabled;
    node["extraction"]["smoothing"]["window"] = extraction.smoothing.window;
    node["extraction"]["savgol"]["enabled"] = extraction.savgol.enabled;
    node["extraction"]["savgol"]["window"] = extraction.savgol.window;
    node["extraction"]["savgol"]["polyorder"] = extraction.savgol.polyorder;
    node["extraction"]["savgol"]["min_columns"] = extraction.savgol.min_columns;
    node["extraction"]["mask_cleanup"]["enabled"] = extraction.mask_cleanup.enabled;
    node["extraction"]["mask_cleanup"]["kernel_size"] = extraction.mask_cleanup.kernel_size;
    node["extraction"]["mask_cleanup"]["fill_holes"] = extraction.mask_cleanup.fill_holes;

    node["calibration"]["y_scale"] = calibration.y_scale;

    node["output"]["value_precision"] = output.value_precision;
    node["output"]["csv_header"] = output.csv_header;

    node["batch"]["pattern"] = batch.pattern;

    return node;
}

void Config::validate() const {
    if (extraction.tolerance < 0 || extraction.tolerance > 255) {
        throw ValidationError("extraction.tolerance must be in [0,255]");
    }

    if (extraction.smoothing.window < 1 || !is_odd(extraction.smoothing.window)) {
        throw ValidationError("extraction.smoothing.window must be odd and >= 1");
    }

    if (extraction.savgol.window < 3 || !is_odd(extraction.savgol.window)) {
        throw ValidationError("extraction.savgol.window must be odd and >= 3");
    }
    if (extraction.savgol.polyorder < 0 || extraction.savgol.polyorder >= extraction.savgol.window) {
        throw ValidationError("extraction.savgol.polyorder must be in [0, window)");
    }
    if (extraction.savgol.min_columns < extraction.savgol.window) {
        throw ValidationError("extraction.savgol.min_columns must be >= extraction.savgol.window");
    }

    if (extraction.mask_cleanup.kernel_size < 1 || !is_odd(extraction.mask_cleanup.kernel_size)) {
        throw ValidationError("extraction.mask_cleanup.kernel_size must be odd and >= 1");
    }

    if (calibration.y_scale != "linear" && calibration.y_scale != "log") {
        throw ValidationError("calibration.y_scale must be 'linear' or 'log'");
    }

    if (output.value_precision < 0 || output.value_precision > 12) {
        throw ValidationError("output.value_precision must be in [0,12]");
    }

    if (batch.pattern.empty()) {
        throw ValidationError("batch.pattern must not be empty");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "extraction": {
      "type": "object",
      "properties": {
        "tolerance": {"type": "integer", "minimum": 0, "maximum": 255},
        "smoothing": {
          "type": "object",
          "properties": {
            "enabled": {"type": "boolean"},
            "window": {"type": "integer", "minimum": 1}
          }
        },
        "savgol": {
          "type": "object",
          "properties": {
            "enabled": {"type": "boolean"},
            "window": {"type": "integer", "minimum": 3},
            "polyorder": {"type": "integer", "minimum": 0},
            "min_columns": {"type": "integer", "minimum": 3}
          }
        },
        "mask_cleanup": {
          "type": "object",
          "properties": {
            "enabled": {"type": "boolean"},
            "kernel_size": {"type": "integer", "minimum": 1},
            "fill_holes": {"type": "boolean"}
          }
        }
      }
    },
    "calibration": {
      "type": "object",
      "properties": {
        "y_scale": {"type": "string", "enum": ["linear", "log"]}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "value_precision": {"type": "integer", "minimum": 0, "maximum": 12},
        "csv_header": {"type": "boolean"}
      }
    },
    "batch": {
      "type": "object",
      "properties": {
        "pattern": {"type": "string"}
      }
    }
  }
})";
}

} // namespace plot_digitizer::config

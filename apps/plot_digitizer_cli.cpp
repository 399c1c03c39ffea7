#include "plot_digitizer/config/configuration.hpp"
#include "plot_digitizer/config/job.hpp"
#include "plot_digitizer/core/errors.hpp"
#include "plot_digitizer/core/events.hpp"
#include "plot_digitizer/core/utils.hpp"
#include "plot_digitizer/extraction/color_matcher.hpp"
#include "plot_digitizer/io/image_io.hpp"
#include "plot_digitizer/io/series_csv.hpp"
#include "plot_digitizer/pipeline/extractor.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

using json = nlohmann::json;

using namespace plot_digitizer;

namespace {

constexpr int kExitInputError = 1;
constexpr int kExitUsageError = 2;

void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

int print_error(const std::string& message, int code) {
    json result;
    result["ok"] = false;
    result["error"] = message;
    print_json(result);
    return code;
}

std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

config::Config load_config_or_default(const std::string& path) {
    config::Config cfg;
    if (!path.empty()) {
        cfg = config::Config::load(path);
    }
    cfg.validate();
    return cfg;
}

io::CsvOptions csv_options(const config::Config& cfg) {
    io::CsvOptions opts;
    opts.value_precision = cfg.output.value_precision;
    opts.header = cfg.output.csv_header;
    return opts;
}

// Owns the optional log stream behind an EventEmitter.
struct EventSink {
    std::ostream discard{nullptr};
    std::unique_ptr<std::ofstream> log_file;
    std::unique_ptr<core::EventEmitter> emitter;

    EventSink(const std::string& log_path, bool quiet) {
        if (!log_path.empty()) {
            log_file = std::make_unique<std::ofstream>(log_path, std::ios::app);
            if (!*log_file) {
                throw IOError("Cannot open event log: " + log_path);
            }
        }
        emitter = std::make_unique<core::EventEmitter>(quiet ? discard : std::cout, log_file.get());
    }
};

json summarize(const pipeline::ExtractionResult& result) {
    json j;
    j["columns"] = result.raw_path.size();
    j["matched_pixels"] = result.matched_pixels;
    j["hole_columns"] = result.hole_columns;
    j["calibrated"] = result.series.has_value();
    if (!result.calibration_error.empty()) {
        j["calibration_error"] = result.calibration_error;
    }
    if (result.series && !result.series->empty()) {
        j["first_date"] = calibration::format_date(result.series->front().date);
        j["last_date"] = calibration::format_date(result.series->back().date);
    }
    return j;
}

// Runs one image and writes its CSV when calibration succeeded.
json extract_one(const fs::path& image_path, const config::Job& job, const config::Config& cfg,
                 const fs::path& csv_path, core::EventEmitter& events, const std::string& run_id) {
    const RgbImage image = io::load_rgb_image(image_path);
    const pipeline::ExtractionRequest request = pipeline::build_request(job, cfg, image);
    const pipeline::ExtractionResult result = pipeline::run_extraction(image, request, &events, run_id);

    json j = summarize(result);
    j["image"] = image_path.string();
    if (result.series) {
        io::write_series_csv(csv_path, *result.series, csv_options(cfg));
        j["csv"] = csv_path.string();
    } else {
        json rows = json::array();
        for (Eigen::Index i = 0; i < result.pixel_path.size(); ++i) {
            rows.push_back(result.pixel_path[i]);
        }
        j["pixel_path"] = rows;
    }
    return j;
}

// ============================================================================
// get-schema
// ============================================================================
int cmd_get_schema() {
    std::cout << config::get_schema_json() << std::endl;
    return 0;
}

// ============================================================================
// validate-config [<path>] [--stdin] [--strict-exit-codes]
// ============================================================================
int cmd_validate_config(const std::string& path, bool use_stdin, bool strict_exit) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    if (!path.empty()) result["path"] = path;

    try {
        config::Config cfg;
        if (use_stdin) {
            cfg = config::Config::from_yaml(YAML::Load(read_stdin()));
        } else {
            cfg = config::Config::load(path);
        }
        cfg.validate();
        result["valid"] = true;
        std::ostringstream normalized;
        normalized << cfg.to_yaml();
        result["normalized_yaml"] = normalized.str();
    } catch (const YAML::Exception& e) {
        result["errors"].push_back(std::string("Config error: ") + e.what());
    } catch (const PlotDigitizerError& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? 0 : kExitInputError;
    }
    return 0;
}

// ============================================================================
// pick-color <image> <column> <row> [--tolerance N]
// ============================================================================
int cmd_pick_color(const std::string& image_path, int col, int row, int tolerance) {
    const RgbImage image = io::load_rgb_image(image_path);
    const extraction::ColorSpec spec = extraction::pick_color(image, col, row, tolerance);

    json result;
    result["ok"] = true;
    result["color"] = {spec.target.r, spec.target.g, spec.target.b};
    result["hex"] = extraction::to_hex(spec.target);
    result["tolerance"] = spec.tolerance;
    print_json(result);
    return 0;
}

// ============================================================================
// extract <image> --job <job.yaml> [--config <cfg.yaml>] [--out <csv>]
// ============================================================================
int cmd_extract(const std::string& image_path, const std::string& job_path,
                const std::string& config_path, std::string out_path,
                const std::string& log_path, bool quiet) {
    const config::Config cfg = load_config_or_default(config_path);
    const config::Job job = config::Job::load(job_path);
    if (out_path.empty()) {
        out_path = fs::path(image_path).replace_extension(".csv").string();
    }

    EventSink sink(log_path, quiet);
    const std::string run_id = core::get_run_id();
    sink.emitter->run_start(run_id, {{"command", "extract"},
                                     {"image", image_path},
                                     {"image_sha256", core::sha256_file(image_path)},
                                     {"job", job_path}});

    json summary;
    try {
        summary = extract_one(image_path, job, cfg, out_path, *sink.emitter, run_id);
    } catch (const PlotDigitizerError& e) {
        sink.emitter->error(run_id, e.what());
        sink.emitter->run_end(run_id, false, "error");
        throw;
    }

    const bool calibrated = summary["calibrated"].get<bool>();
    sink.emitter->run_end(run_id, true, calibrated ? "ok" : "uncalibrated");

    summary["ok"] = true;
    summary["run_id"] = run_id;
    print_json(summary);
    return 0;
}

// ============================================================================
// batch <input_dir> --job <job.yaml> [--config <cfg.yaml>] [--out-dir <dir>]
// ============================================================================
int cmd_batch(const std::string& input_dir, const std::string& job_path,
              const std::string& config_path, std::string out_dir,
              const std::string& log_path, bool quiet) {
    const config::Config cfg = load_config_or_default(config_path);
    const config::Job job = config::Job::load(job_path);
    if (out_dir.empty()) out_dir = input_dir;

    if (!fs::is_directory(input_dir)) {
        throw IOError("Input directory not found: " + input_dir);
    }
    fs::create_directories(out_dir);

    const auto images = core::discover_images(input_dir, cfg.batch.pattern);

    EventSink sink(log_path, quiet);
    const std::string run_id = core::get_run_id();
    sink.emitter->run_start(run_id, {{"command", "batch"},
                                     {"input_dir", input_dir},
                                     {"images", images.size()},
                                     {"job", job_path}});

    json items = json::array();
    int failed = 0;
    for (const auto& image_path : images) {
        const fs::path csv_path = fs::path(out_dir) / (image_path.stem().string() + ".csv");
        try {
            json item = extract_one(image_path, job, cfg, csv_path, *sink.emitter, run_id);
            item["ok"] = true;
            items.push_back(item);
        } catch (const PlotDigitizerError& e) {
            ++failed;
            sink.emitter->warning(run_id, image_path.filename().string() + ": " + e.what());
            items.push_back({{"ok", false}, {"image", image_path.string()}, {"error", e.what()}});
        }
    }

    const bool success = failed == 0;
    sink.emitter->run_end(run_id, success, success ? "ok" : "partial",
                          {{"processed", images.size()}, {"failed", failed}});

    json result;
    result["ok"] = success;
    result["run_id"] = run_id;
    result["processed"] = images.size();
    result["failed"] = failed;
    result["items"] = items;
    print_json(result);
    return success ? 0 : kExitInputError;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"plot_digitizer - extract time series from chart images"};
    app.require_subcommand(1);

    bool strict_exit = false;
    bool use_stdin = false;
    std::string config_path, job_path, out_path, log_path;
    std::string image_path, input_dir, out_dir;
    int pick_col = 0;
    int pick_row = 0;
    int tolerance = extraction::kDefaultTolerance;
    bool quiet = false;

    auto schema_cmd = app.add_subcommand("get-schema", "Print the config JSON schema");

    auto validate_cmd = app.add_subcommand("validate-config", "Validate a config YAML file");
    validate_cmd->add_option("path", config_path, "Path to config.yaml");
    validate_cmd->add_flag("--stdin", use_stdin, "Read config YAML from stdin");
    validate_cmd->add_flag("--strict-exit-codes", strict_exit, "Exit non-zero when invalid");

    auto pick_cmd = app.add_subcommand("pick-color", "Read the target color under a pixel");
    pick_cmd->add_option("image", image_path, "Chart image")->required();
    pick_cmd->add_option("column", pick_col, "Pixel column")->required();
    pick_cmd->add_option("row", pick_row, "Pixel row")->required();
    pick_cmd->add_option("--tolerance", tolerance, "Per-channel tolerance");

    auto extract_cmd = app.add_subcommand("extract", "Extract one image to CSV");
    extract_cmd->add_option("image", image_path, "Chart image")->required();
    extract_cmd->add_option("--job", job_path, "Job YAML (color, bounds, anchors)")->required();
    extract_cmd->add_option("--config", config_path, "Config YAML");
    extract_cmd->add_option("--out", out_path, "Output CSV (default: image path with .csv)");
    extract_cmd->add_option("--log", log_path, "Append run events to this file");
    extract_cmd->add_flag("--quiet", quiet, "Do not print run events");

    auto batch_cmd = app.add_subcommand("batch", "Extract every image in a directory");
    batch_cmd->add_option("input_dir", input_dir, "Directory of chart images")->required();
    batch_cmd->add_option("--job", job_path, "Job YAML shared by all images")->required();
    batch_cmd->add_option("--config", config_path, "Config YAML");
    batch_cmd->add_option("--out-dir", out_dir, "Output directory (default: input_dir)");
    batch_cmd->add_option("--log", log_path, "Append run events to this file");
    batch_cmd->add_flag("--quiet", quiet, "Do not print run events");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const int code = app.exit(e);
        return code == 0 ? 0 : kExitUsageError;
    }

    try {
        if (schema_cmd->parsed()) {
            return cmd_get_schema();
        }
        if (validate_cmd->parsed()) {
            if (config_path.empty() && !use_stdin) {
                return print_error("validate-config requires a path or --stdin", kExitUsageError);
            }
            return cmd_validate_config(config_path, use_stdin, strict_exit);
        }
        if (pick_cmd->parsed()) {
            return cmd_pick_color(image_path, pick_col, pick_row, tolerance);
        }
        if (extract_cmd->parsed()) {
            return cmd_extract(image_path, job_path, config_path, out_path, log_path, quiet);
        }
        if (batch_cmd->parsed()) {
            return cmd_batch(input_dir, job_path, config_path, out_dir, log_path, quiet);
        }
    } catch (const PlotDigitizerError& e) {
        return print_error(e.what(), kExitInputError);
    } catch (const YAML::Exception& e) {
        return print_error(std::string("Config error: ") + e.what(), kExitInputError);
    } catch (const fs::filesystem_error& e) {
        return print_error(std::string("I/O error: ") + e.what(), kExitInputError);
    }

    std::cerr << app.help() << std::endl;
    return kExitUsageError;
}

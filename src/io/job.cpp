#include "plot_digitizer/config/job.hpp"
#include "plot_digitizer/calibration/click_cycle.hpp"
#include "plot_digitizer/core/errors.hpp"
#include "plot_digitizer/core/utils.hpp"

namespace plot_digitizer::config {

namespace {

std::array<int, 2> read_int_pair(const YAML::Node& n, const std::string& key) {
    if (!n.IsSequence() || n.size() != 2) {
        throw ValidationError(key + " must be a list of two integers");
    }
    return {n[0].as<int>(), n[1].as<int>()};
}

RgbColor read_color(const YAML::Node& n) {
    if (!n.IsSequence() || n.size() != 3) {
        throw ValidationError("color must be [r, g, b]");
    }
    int ch[3];
    for (size_t i = 0; i < 3; ++i) {
        ch[i] = n[i].as<int>();
        if (ch[i] < 0 || ch[i] > 255) {
            throw ValidationError("color channels must be in [0,255]");
        }
    }
    return {static_cast<uint8_t>(ch[0]), static_cast<uint8_t>(ch[1]), static_cast<uint8_t>(ch[2])};
}

void read_y_axis(const YAML::Node& y, Job& job) {
    if (y["anchors"]) {
        for (const auto& a : y["anchors"]) {
            if (!a.IsSequence() || a.size() != 2) {
                throw ValidationError("y_axis.anchors entries must be [row, value]");
            }
            job.y_anchors.push_back({a[0].as<double>(), a[1].as<double>()});
        }
        return;
    }
    if (!y["clicks"]) {
        throw ValidationError("y_axis needs anchors or clicks");
    }
    auto pixels = replay_clicks(y["clicks"], "y_axis");
    auto values = y["values"];
    if (!values || !values.IsSequence() || values.size() != 2) {
        throw ValidationError("y_axis.values must list the two reference values");
    }
    for (size_t i = 0; i < pixels.size(); ++i) {
        job.y_anchors.push_back({pixels[i], values[i].as<double>()});
    }
}

void read_x_axis(const YAML::Node& x, Job& job) {
    if (x["anchors"]) {
        for (const auto& a : x["anchors"]) {
            if (!a.IsSequence() || a.size() != 2) {
                throw ValidationError("x_axis.anchors entries must be [column, date]");
            }
            job.x_anchors.push_back({a[0].as<double>(), a[1].as<std::string>()});
        }
        return;
    }
    if (!x["clicks"]) {
        throw ValidationError("x_axis needs anchors or clicks");
    }
    auto pixels = replay_clicks(x["clicks"], "x_axis");
    auto dates = x["dates"];
    if (!dates || !dates.IsSequence() || dates.size() != 2) {
        throw ValidationError("x_axis.dates must list the two reference dates");
    }
    for (size_t i = 0; i < pixels.size(); ++i) {
        job.x_anchors.push_back({pixels[i], dates[i].as<std::string>()});
    }
}

} // namespace

std::vector<double> replay_clicks(const YAML::Node& clicks, const std::string& axis) {
    if (!clicks.IsSequence()) {
        throw ValidationError(axis + ".clicks must be a list");
    }
    calibration::AxisClickCycle cycle;
    for (const auto& c : clicks) {
        const std::string text = core::to_lower(core::trim(c.as<std::string>()));
        if (text == "undo") {
            cycle.undo();
        } else {
            cycle.click(c.as<double>());
        }
    }

    const auto& slots = cycle.positions();
    if (!slots[0]) return {};
    if (!slots[1]) return {*slots[0]};
    const auto pair = cycle.confirm();
    return {pair[0], pair[1]};
}

Job Job::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Job file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Job Job::from_yaml(const YAML::Node& node) {
    if (!node || !node.IsMap()) {
        throw ValidationError("job must be a mapping");
    }

    Job job;
    try {
        if (node["color"]) job.color = read_color(node["color"]);
        if (node["color_pick"]) job.color_pick = read_int_pair(node["color_pick"], "color_pick");
        if (job.color.has_value() == job.color_pick.has_value()) {
            throw ValidationError("job needs exactly one of color or color_pick");
        }

        if (node["tolerance"]) {
            job.tolerance = node["tolerance"].as<int>();
            if (*job.tolerance < 0) {
                throw ValidationError("tolerance must be >= 0");
            }
        }

        if (node["bounds"]) job.bounds = read_int_pair(node["bounds"], "bounds");

        if (node["y_axis"]) read_y_axis(node["y_axis"], job);
        if (node["x_axis"]) read_x_axis(node["x_axis"], job);
    } catch (const YAML::Exception& e) {
        throw ValidationError(std::string("bad job value: ") + e.what());
    }

    return job;
}

} // namespace plot_digitizer::config

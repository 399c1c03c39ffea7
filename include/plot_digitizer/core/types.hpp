#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace plot_digitizer {

namespace fs = std::filesystem;

// Matrix types
using Matrix2Du8 = Eigen::Matrix<uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXd = Eigen::VectorXd;

struct RgbColor {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const RgbColor& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const RgbColor& o) const { return !(*this == o); }
};

// Decoded 8-bit RGB image, one plane per channel. Element (row, col).
struct RgbImage {
    Matrix2Du8 R;
    Matrix2Du8 G;
    Matrix2Du8 B;

    RgbImage() = default;
    RgbImage(int height, int width, RgbColor fill = {})
        : R(Matrix2Du8::Constant(height, width, fill.r)),
          G(Matrix2Du8::Constant(height, width, fill.g)),
          B(Matrix2Du8::Constant(height, width, fill.b)) {}

    int width() const { return static_cast<int>(R.cols()); }
    int height() const { return static_cast<int>(R.rows()); }
    bool empty() const { return R.size() == 0; }

    RgbColor at(int col, int row) const { return {R(row, col), G(row, col), B(row, col)}; }
    void set(int col, int row, RgbColor c) {
        R(row, col) = c.r;
        G(row, col) = c.g;
        B(row, col) = c.b;
    }
};

// Scan constraint on pixel rows, inclusive on both ends.
struct Bounds {
    int upper_row = 0;
    int lower_row = 0;

    // Throws BoundsError unless upper_row < lower_row.
    static Bounds make(int upper_row, int lower_row);
    // Two clicked rows in any order.
    static Bounds from_clicks(int row_a, int row_b);
};

// One entry per image column. nullopt marks a hole.
using RawPath = std::vector<std::optional<int>>;

// Matched rows per image column, ascending.
using ColumnMatches = std::vector<std::vector<int>>;

// Resolved pixel row per image column, no holes.
using PixelPath = VectorXd;

// Y axis scale
enum class YScale {
    LINEAR,
    LOG
};

inline std::string y_scale_to_string(YScale scale) {
    switch (scale) {
        case YScale::LINEAR: return "linear";
        case YScale::LOG: return "log";
        default: return "unknown";
    }
}

// Extraction phases, reported through run events.
enum class Phase {
    SCAN_REGION = 0,
    MEDIAN_PATH = 1,
    GAP_FILL = 2,
    SMOOTH = 3,
    CALIBRATE = 4,
    DONE = 5
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::SCAN_REGION: return "SCAN_REGION";
        case Phase::MEDIAN_PATH: return "MEDIAN_PATH";
        case Phase::GAP_FILL: return "GAP_FILL";
        case Phase::SMOOTH: return "SMOOTH";
        case Phase::CALIBRATE: return "CALIBRATE";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace plot_digitizer

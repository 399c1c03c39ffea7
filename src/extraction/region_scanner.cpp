#include "plot_digitizer/extraction/region_scanner.hpp"

#include <algorithm>

#include <opencv2/opencv.hpp>

namespace plot_digitizer::extraction {

ScanRange resolve_scan_range(const RgbImage& image, const std::optional<Bounds>& bounds) {
    ScanRange range;
    if (image.empty()) {
        return range;
    }
    range.first_row = 0;
    range.last_row = image.height() - 1;
    if (bounds) {
        range.first_row = std::max(range.first_row, bounds->upper_row);
        range.last_row = std::min(range.last_row, bounds->lower_row);
    }
    return range;
}

MatchMask build_match_mask(const RgbImage& image, const ColorSpec& spec,
                           const std::optional<Bounds>& bounds) {
    validate_color_spec(spec);

    MatchMask mask = MatchMask::Zero(image.height(), image.width());
    const ScanRange range = resolve_scan_range(image, bounds);
    if (range.empty()) {
        return mask;
    }

    // Column-major, top to bottom.
    for (int x = 0; x < image.width(); ++x) {
        for (int y = range.first_row; y <= range.last_row; ++y) {
            if (color_matches(image.at(x, y), spec)) {
                mask(y, x) = 1;
            }
        }
    }
    return mask;
}

void clean_match_mask(MatchMask& mask, const ScanRange& range, const MaskCleanupOptions& options) {
    if (range.empty() || mask.size() == 0) {
        return;
    }

    const int w = static_cast<int>(mask.cols());
    const int h = range.last_row - range.first_row + 1;
    cv::Mat view(h, w, CV_8U, mask.data() + static_cast<std::ptrdiff_t>(range.first_row) * w);
    cv::Mat band = view > 0;

    if (options.fill_holes) {
        // Background reachable from the border stays background, the rest is a hole.
        cv::Mat padded;
        cv::copyMakeBorder(band, padded, 1, 1, 1, 1, cv::BORDER_CONSTANT, cv::Scalar(0));
        cv::floodFill(padded, cv::Point(0, 0), cv::Scalar(255));
        cv::Mat holes = padded(cv::Rect(1, 1, w, h)) == 0;
        cv::bitwise_or(band, holes, band);
    }

    if (options.kernel_size > 1) {
        const cv::Mat kernel = cv::getStructuringElement(
            cv::MORPH_RECT, cv::Size(options.kernel_size, options.kernel_size));
        cv::morphologyEx(band, band, cv::MORPH_CLOSE, kernel);
    }

    cv::Mat binary = band / 255;
    binary.copyTo(view);
}

ColumnMatches collect_column_matches(const MatchMask& mask) {
    const int w = static_cast<int>(mask.cols());
    const int h = static_cast<int>(mask.rows());
    ColumnMatches matches(static_cast<size_t>(w));
    for (int x = 0; x < w; ++x) {
        auto& rows = matches[static_cast<size_t>(x)];
        for (int y = 0; y < h; ++y) {
            if (mask(y, x) != 0) {
                rows.push_back(y);
            }
        }
    }
    return matches;
}

ColumnMatches scan_region(const RgbImage& image, const ColorSpec& spec,
                          const std::optional<Bounds>& bounds) {
    return collect_column_matches(build_match_mask(image, spec, bounds));
}

std::size_t count_matches(const ColumnMatches& matches) {
    std::size_t n = 0;
    for (const auto& rows : matches) {
        n += rows.size();
    }
    return n;
}

} // namespace plot_digitizer::extraction

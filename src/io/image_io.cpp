#include "plot_digitizer/io/image_io.hpp"
#include "plot_digitizer/core/errors.hpp"

#include <opencv2/opencv.hpp>

namespace plot_digitizer::io {

namespace {

Matrix2Du8 plane_from_mat(const cv::Mat& plane) {
    Matrix2Du8 out(plane.rows, plane.cols);
    cv::Mat view(plane.rows, plane.cols, CV_8U, out.data());
    plane.copyTo(view);
    return out;
}

} // namespace

RgbImage load_rgb_image(const fs::path& path) {
    if (!fs::exists(path)) {
        throw IOError("File not found: " + path.string());
    }

    cv::Mat bgr = cv::imread(path.string(), cv::IMREAD_COLOR);
    if (bgr.empty()) {
        throw IOError("Cannot decode image: " + path.string());
    }
    if (bgr.depth() != CV_8U) {
        bgr.convertTo(bgr, CV_8U);
    }

    std::vector<cv::Mat> planes;
    cv::split(bgr, planes);

    RgbImage image;
    image.R = plane_from_mat(planes[2]);
    image.G = plane_from_mat(planes[1]);
    image.B = plane_from_mat(planes[0]);
    return image;
}

void save_rgb_image(const fs::path& path, const RgbImage& image) {
    if (image.empty()) {
        throw IOError("Refusing to write empty image: " + path.string());
    }

    const int h = image.height();
    const int w = image.width();
    std::vector<cv::Mat> planes{
        cv::Mat(h, w, CV_8U, const_cast<uint8_t*>(image.B.data())),
        cv::Mat(h, w, CV_8U, const_cast<uint8_t*>(image.G.data())),
        cv::Mat(h, w, CV_8U, const_cast<uint8_t*>(image.R.data())),
    };
    cv::Mat bgr;
    cv::merge(planes, bgr);

    bool ok = false;
    try {
        ok = cv::imwrite(path.string(), bgr);
    } catch (const cv::Exception& e) {
        throw IOError("Cannot write image " + path.string() + ": " + e.what());
    }
    if (!ok) {
        throw IOError("Cannot write image: " + path.string());
    }
}

} // namespace plot_digitizer::io

#include "plot_digitizer/extraction/smoother.hpp"
#include "plot_digitizer/core/errors.hpp"

#include <algorithm>

namespace plot_digitizer::extraction {

PixelPath moving_average(const PixelPath& path, int window) {
    const Eigen::Index n = path.size();
    if (window <= 1 || n == 0) {
        return path;
    }

    const Eigen::Index half = window / 2;
    PixelPath out(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const Eigen::Index h = std::min({half, i, n - 1 - i});
        out[i] = path.segment(i - h, 2 * h + 1).mean();
    }
    return out;
}

namespace {

// Rows: polynomial coefficients c_0..c_k. Columns: samples at offsets -m..m.
Eigen::MatrixXd savgol_projection(int window, int polyorder) {
    const int m = window / 2;
    Eigen::MatrixXd A(window, polyorder + 1);
    for (int r = 0; r < window; ++r) {
        const double x = static_cast<double>(r - m);
        double p = 1.0;
        for (int c = 0; c <= polyorder; ++c) {
            A(r, c) = p;
            p *= x;
        }
    }
    const Eigen::MatrixXd AtA = A.transpose() * A;
    return AtA.ldlt().solve(A.transpose());
}

double eval_poly(const Eigen::VectorXd& coeffs, double x) {
    double v = 0.0;
    for (Eigen::Index j = coeffs.size() - 1; j >= 0; --j) {
        v = v * x + coeffs[j];
    }
    return v;
}

} // namespace

PixelPath savitzky_golay(const PixelPath& path, int window, int polyorder) {
    if (window < 1 || (window % 2) == 0) {
        throw ValidationError("savgol window must be odd and >= 1 (got " + std::to_string(window) + ")");
    }
    if (polyorder < 0 || polyorder >= window) {
        throw ValidationError("savgol polyorder must be in [0, window) (got " +
                              std::to_string(polyorder) + ")");
    }

    const Eigen::Index n = path.size();
    if (n < window || window == 1) {
        return path;
    }

    const int m = window / 2;
    const Eigen::MatrixXd proj = savgol_projection(window, polyorder);
    const Eigen::VectorXd center = proj.row(0).transpose();

    PixelPath out(n);
    for (Eigen::Index i = m; i < n - m; ++i) {
        out[i] = center.dot(path.segment(i - m, window));
    }

    const Eigen::VectorXd head = proj * path.head(window);
    const Eigen::VectorXd tail = proj * path.tail(window);
    for (int k = 0; k < m; ++k) {
        out[k] = eval_poly(head, static_cast<double>(k - m));
        out[n - m + k] = eval_poly(tail, static_cast<double>(k + 1));
    }
    return out;
}

} // namespace plot_digitizer::extraction

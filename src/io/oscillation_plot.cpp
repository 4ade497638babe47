#include "grating_reduce/io/oscillation_plot.hpp"
#include "grating_reduce/core/errors.hpp"

#include <opencv2/opencv.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace grating_reduce::io {

namespace {

constexpr int kPanelHeight = 300;
constexpr int kCurveWidth = 600;
constexpr int kMargin = 30;

cv::Mat frame_to_gray8(const Frame& frame) {
    const int rows = static_cast<int>(frame.rows());
    const int cols = static_cast<int>(frame.cols());
    cv::Mat img(rows, cols, CV_64F);
    cv::Mat finite_mask(rows, cols, CV_8U);
    for (int y = 0; y < rows; ++y) {
        for (int x = 0; x < cols; ++x) {
            const double v = frame(y, x);
            img.at<double>(y, x) = v;
            finite_mask.at<uchar>(y, x) = std::isfinite(v) ? 255 : 0;
        }
    }

    // Stretch over finite pixels only; NaN and +-inf render as the minimum
    double vmin = 0.0, vmax = 0.0;
    cv::minMaxLoc(img, &vmin, &vmax, nullptr, nullptr, finite_mask);
    img.setTo(vmin, ~finite_mask);

    cv::Mat out;
    const double range = vmax > vmin ? vmax - vmin : 1.0;
    img.convertTo(out, CV_8U, 255.0 / range, -vmin * 255.0 / range);
    return out;
}

void draw_curve(cv::Mat& canvas, const std::vector<double>& values, size_t n_points,
                double vmin, double vmax, const cv::Scalar& color, bool star_marker) {
    const int plot_w = canvas.cols - 2 * kMargin;
    const int plot_h = canvas.rows - 2 * kMargin;
    const double range = vmax > vmin ? vmax - vmin : 1.0;
    // x axis spans index 0..n+2 like the frame numbering 1..n with padding
    const double x_scale = static_cast<double>(plot_w) / static_cast<double>(n_points + 2);

    std::vector<cv::Point> pts;
    for (size_t i = 0; i < values.size(); ++i) {
        if (!std::isfinite(values[i])) continue;
        const int px = kMargin + static_cast<int>(std::lround((i + 1) * x_scale));
        const int py = kMargin + plot_h -
                       static_cast<int>(std::lround((values[i] - vmin) / range * plot_h));
        pts.emplace_back(px, py);
    }
    if (pts.size() > 1) {
        cv::polylines(canvas, pts, false, color, 1, cv::LINE_AA);
    }
    for (const auto& p : pts) {
        if (star_marker) {
            cv::drawMarker(canvas, p, color, cv::MARKER_STAR, 8, 1, cv::LINE_AA);
        } else {
            cv::circle(canvas, p, 3, color, cv::FILLED, cv::LINE_AA);
        }
    }
}

} // namespace

void render_oscillation_plot(const fs::path& path, const Frame& frame,
                             const std::optional<image::Roi>& roi,
                             const std::vector<double>& sample_oscillation,
                             const std::vector<double>& ob_oscillation) {
    if (frame.size() == 0) {
        throw MissingDataError("no frame to plot the oscillation on");
    }

    cv::Mat gray = frame_to_gray8(frame);
    cv::Mat left;
    cv::cvtColor(gray, left, cv::COLOR_GRAY2BGR);
    const cv::Rect rect = roi ? cv::Rect(roi->x0(), roi->y0(), roi->width(), roi->height())
                              : cv::Rect(0, 0, left.cols, left.rows);
    cv::rectangle(left, rect, cv::Scalar(255, 0, 255), 1);

    const double scale = static_cast<double>(kPanelHeight) / static_cast<double>(left.rows);
    const int left_w = std::max(1, static_cast<int>(std::lround(left.cols * scale)));
    cv::resize(left, left, cv::Size(left_w, kPanelHeight), 0, 0, cv::INTER_NEAREST);

    cv::Mat right(kPanelHeight, kCurveWidth, CV_8UC3, cv::Scalar(255, 255, 255));
    double vmin = std::numeric_limits<double>::infinity();
    double vmax = -std::numeric_limits<double>::infinity();
    for (const auto* seq : {&sample_oscillation, &ob_oscillation}) {
        for (double v : *seq) {
            if (!std::isfinite(v)) continue;
            vmin = std::min(vmin, v);
            vmax = std::max(vmax, v);
        }
    }
    if (!std::isfinite(vmin)) {
        vmin = 0.0;
        vmax = 1.0;
    }

    cv::rectangle(right, cv::Point(kMargin, kMargin),
                  cv::Point(right.cols - kMargin, right.rows - kMargin),
                  cv::Scalar(200, 200, 200), 1);
    const size_t n_points = std::max(sample_oscillation.size(), ob_oscillation.size());
    draw_curve(right, sample_oscillation, n_points, vmin, vmax, cv::Scalar(0, 128, 0), true);
    draw_curve(right, ob_oscillation, n_points, vmin, vmax, cv::Scalar(255, 0, 0), false);
    cv::putText(right, "Oscillation Plot", cv::Point(kMargin, kMargin - 10),
                cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(0, 0, 0), 1, cv::LINE_AA);
    cv::putText(right, "sample", cv::Point(right.cols - 110, kMargin + 15),
                cv::FONT_HERSHEY_SIMPLEX, 0.45, cv::Scalar(0, 128, 0), 1, cv::LINE_AA);
    cv::putText(right, "ob", cv::Point(right.cols - 110, kMargin + 32),
                cv::FONT_HERSHEY_SIMPLEX, 0.45, cv::Scalar(255, 0, 0), 1, cv::LINE_AA);

    cv::Mat canvas;
    cv::hconcat(left, right, canvas);
    if (!cv::imwrite(path.string(), canvas)) {
        throw IOError("Cannot write oscillation plot: " + path.string());
    }
}

} // namespace grating_reduce::io

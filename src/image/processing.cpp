#include "grating_reduce/image/processing.hpp"
#include "grating_reduce/core/errors.hpp"
#include "grating_reduce/core/utils.hpp"

namespace grating_reduce::image {

Frame average_frames(const std::vector<Frame>& frames) {
    if (frames.empty()) {
        throw MissingDataError("No frames to average");
    }
    if (frames.size() == 1) {
        return frames.front();
    }

    const Shape s = Shape::of(frames.front());
    Frame mean = Frame::Zero(s.height, s.width);
    for (const auto& frame : frames) {
        if (Shape::of(frame) != s) {
            throw ShapeMismatchError("cannot average " + shape_to_string(Shape::of(frame)) +
                                     " with " + shape_to_string(s));
        }
        mean += frame;
    }
    mean /= static_cast<double>(frames.size());
    return mean;
}

Frame extract_roi(const Frame& img, const Roi& roi) {
    if (!roi.fits_into(Shape::of(img))) {
        throw InvalidRoiError(roi.to_string() + " does not fit into " +
                              shape_to_string(Shape::of(img)) + " frame");
    }
    return img.block(roi.y0(), roi.x0(), roi.height(), roi.width());
}

double roi_mean(const Frame& img, const std::optional<Roi>& roi) {
    if (!roi) {
        return core::compute_mean(img);
    }
    return core::compute_mean(extract_roi(img, *roi));
}

Frame bin_frame(const Frame& img, int bin_size) {
    if (bin_size < 1) {
        throw InvalidArgumentError("bin size must be a positive integer, got " +
                                   std::to_string(bin_size));
    }
    const int out_h = static_cast<int>(img.rows()) / bin_size;
    const int out_w = static_cast<int>(img.cols()) / bin_size;
    const double norm = 1.0 / static_cast<double>(bin_size * bin_size);

    Frame out(out_h, out_w);
    for (int y = 0; y < out_h; ++y) {
        for (int x = 0; x < out_w; ++x) {
            out(y, x) = img.block(y * bin_size, x * bin_size, bin_size, bin_size).sum() * norm;
        }
    }
    return out;
}

} // namespace grating_reduce::image

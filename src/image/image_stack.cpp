#include "grating_reduce/image/image_stack.hpp"
#include "grating_reduce/core/errors.hpp"

namespace grating_reduce::image {

void ImageStack::append(Frame frame, std::string source_name) {
    const Shape s = Shape::of(frame);
    if (!shape_.is_known()) {
        shape_ = s;
    } else if (s != shape_) {
        throw ShapeMismatchError("frame " + source_name + " is " + shape_to_string(s) +
                                 ", previously loaded frames are " +
                                 shape_to_string(shape_));
    }
    frames_.push_back(std::move(frame));
    source_names_.push_back(std::move(source_name));
}

void ImageStack::replace_frames(std::vector<Frame> frames) {
    if (frames.size() != frames_.size()) {
        throw CountMismatchError("replacement has " + std::to_string(frames.size()) +
                                 " frames, stack has " + std::to_string(frames_.size()));
    }
    Shape s;
    for (const auto& f : frames) {
        const Shape fs = Shape::of(f);
        if (!s.is_known()) {
            s = fs;
        } else if (fs != s) {
            throw ShapeMismatchError("replacement frames disagree: " + shape_to_string(s) +
                                     " vs " + shape_to_string(fs));
        }
    }
    frames_ = std::move(frames);
    if (!frames_.empty()) {
        shape_ = s;
    }
}

} // namespace grating_reduce::image

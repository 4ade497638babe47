#pragma once

#include "grating_reduce/core/types.hpp"

#include <string>
#include <vector>

namespace grating_reduce::image {

// Ordered frames of one dataset role. Insertion order is acquisition order.
class ImageStack {
public:
    ImageStack() = default;

    // Records the shape on the first append; later frames must match it.
    void append(Frame frame, std::string source_name);

    // Swaps in the output of a destructive stage. The new frames must share
    // one shape, which becomes the stack shape. Source names are kept.
    void replace_frames(std::vector<Frame> frames);

    bool is_empty() const { return frames_.empty(); }
    size_t size() const { return frames_.size(); }
    const Shape& shape() const { return shape_; }

    const std::vector<Frame>& frames() const { return frames_; }
    const std::vector<std::string>& source_names() const { return source_names_; }

    const Frame& operator[](size_t i) const { return frames_[i]; }

private:
    std::vector<Frame> frames_;
    std::vector<std::string> source_names_;
    Shape shape_;
};

} // namespace grating_reduce::image

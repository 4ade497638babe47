#pragma once

#include "grating_reduce/core/types.hpp"

#include <string>

namespace grating_reduce::image {

// Rectangular region with inclusive bounds: columns x0..x1, rows y0..y1.
class Roi {
public:
    Roi(int x0, int y0, int x1, int y1);

    int x0() const { return x0_; }
    int y0() const { return y0_; }
    int x1() const { return x1_; }
    int y1() const { return y1_; }

    int width() const { return x1_ - x0_ + 1; }
    int height() const { return y1_ - y0_ + 1; }

    // True when the rectangle lies inside a frame of the given shape.
    bool fits_into(const Shape& shape) const;

    bool operator==(const Roi& other) const {
        return x0_ == other.x0_ && y0_ == other.y0_ &&
               x1_ == other.x1_ && y1_ == other.y1_;
    }

    std::string to_string() const;

private:
    int x0_;
    int y0_;
    int x1_;
    int y1_;
};

} // namespace grating_reduce::image

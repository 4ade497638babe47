#include "grating_reduce/image/roi.hpp"
#include "grating_reduce/core/errors.hpp"

#include <sstream>

namespace grating_reduce::image {

Roi::Roi(int x0, int y0, int x1, int y1) : x0_(x0), y0_(y0), x1_(x1), y1_(y1) {
    if (x0 < 0 || y0 < 0) {
        throw InvalidRoiError("negative origin in " + to_string());
    }
    if (x1 < x0 || y1 < y0) {
        throw InvalidRoiError("end before start in " + to_string());
    }
}

bool Roi::fits_into(const Shape& shape) const {
    if (!shape.is_known()) return false;
    if (x0_ < 0 || x1_ >= shape.width) return false;
    if (y0_ < 0 || y1_ >= shape.height) return false;
    return true;
}

std::string Roi::to_string() const {
    std::ostringstream oss;
    oss << "(x0=" << x0_ << ", y0=" << y0_ << ", x1=" << x1_ << ", y1=" << y1_ << ")";
    return oss.str();
}

} // namespace grating_reduce::image

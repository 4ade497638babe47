#pragma once

#include "grating_reduce/core/types.hpp"
#include "grating_reduce/image/roi.hpp"

#include <optional>
#include <vector>

namespace grating_reduce::image {

// Pixel-wise mean of equally shaped frames (a lone frame is returned as is).
Frame average_frames(const std::vector<Frame>& frames);

// Inclusive sub-block of a frame. The ROI must fit into the frame.
Frame extract_roi(const Frame& img, const Roi& roi);

// Mean over the ROI, or over the whole frame when no ROI is given.
double roi_mean(const Frame& img, const std::optional<Roi>& roi);

// Block-mean rebinning. Trailing rows/columns that do not fill a complete
// bin are dropped, so the output is (rows / bin_size, cols / bin_size).
Frame bin_frame(const Frame& img, int bin_size);

} // namespace grating_reduce::image

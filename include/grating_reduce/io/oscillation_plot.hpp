#pragma once

#include "grating_reduce/core/types.hpp"
#include "grating_reduce/image/roi.hpp"

#include <optional>
#include <vector>

namespace grating_reduce::io {

// Two-panel PNG: the frame with the oscillation ROI outlined, and the sample
// and open-beam oscillation curves over the frame index.
void render_oscillation_plot(const fs::path& path, const Frame& frame,
                             const std::optional<image::Roi>& roi,
                             const std::vector<double>& sample_oscillation,
                             const std::vector<double>& ob_oscillation);

} // namespace grating_reduce::io

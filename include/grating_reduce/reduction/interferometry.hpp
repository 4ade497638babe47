#pragma once

#include "grating_reduce/core/types.hpp"

namespace grating_reduce::reduction {

// Combine sample and open-beam reductions into the four interferometric maps.
// Non-finite offsets are zeroed first; divisions follow IEEE semantics, so
// degenerate pixels come out as inf/NaN instead of raising.
InterferometryMaps derive_interferometry(const ReductionResult& sample,
                                         const ReductionResult& ob);

} // namespace grating_reduce::reduction

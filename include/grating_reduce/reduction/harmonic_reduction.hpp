#pragma once

#include "grating_reduce/core/types.hpp"

#include <vector>

namespace grating_reduce::reduction {

// N x 3 design matrix with columns {1, cos(2*pi*i*p/(N-1)), sin(2*pi*i*p/(N-1))}
// for the N phase steps i = 0..N-1 covering p grating periods.
Eigen::MatrixXd build_design_matrix(int n_steps, double number_periods);

// Least-squares fit of offset + c*cos + s*sin to every pixel's oscillation
// (Marathe et al. 2014, doi:10.1063/1.4861199). amplitude = sqrt(c^2 + s^2),
// phase = atan(s / c); pixels with c == 0 get a NaN phase.
ReductionResult reduce_harmonic(const std::vector<Frame>& stack,
                                double number_periods = 1.0);

} // namespace grating_reduce::reduction

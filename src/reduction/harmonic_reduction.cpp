#include "grating_reduce/reduction/harmonic_reduction.hpp"
#include "grating_reduce/core/errors.hpp"

#include <cmath>
#include <limits>

namespace grating_reduce::reduction {

Eigen::MatrixXd build_design_matrix(int n_steps, double number_periods) {
    if (n_steps < 3) {
        throw InvalidArgumentError("harmonic reduction needs at least 3 phase steps, got " +
                                   std::to_string(n_steps));
    }
    Eigen::MatrixXd B(n_steps, 3);
    const double step = 2.0 * M_PI * number_periods / static_cast<double>(n_steps - 1);
    for (int i = 0; i < n_steps; ++i) {
        B(i, 0) = 1.0;
        B(i, 1) = std::cos(step * i);
        B(i, 2) = std::sin(step * i);
    }
    return B;
}

ReductionResult reduce_harmonic(const std::vector<Frame>& stack, double number_periods) {
    if (stack.empty()) {
        throw MissingDataError("harmonic reduction of an empty stack");
    }
    const int n = static_cast<int>(stack.size());
    const Eigen::Index h = stack.front().rows();
    const Eigen::Index w = stack.front().cols();
    const Eigen::Index npix = h * w;

    const Eigen::MatrixXd B = build_design_matrix(n, number_periods);
    const Eigen::Matrix3d BtB = B.transpose() * B;
    Eigen::FullPivLU<Eigen::Matrix3d> lu(BtB);
    if (!lu.isInvertible()) {
        throw InvalidArgumentError("design matrix is singular for " + std::to_string(n) +
                                   " steps over " + std::to_string(number_periods) +
                                   " periods");
    }
    const Eigen::MatrixXd G = lu.inverse() * B.transpose();  // 3 x N

    // One row per phase step, one column per pixel
    Eigen::MatrixXd data(n, npix);
    for (int i = 0; i < n; ++i) {
        const Frame& f = stack[static_cast<size_t>(i)];
        if (f.rows() != h || f.cols() != w) {
            throw ShapeMismatchError("frame " + std::to_string(i) + " is " +
                                     shape_to_string(Shape::of(f)) + ", expected " +
                                     shape_to_string(Shape::of(stack.front())));
        }
        data.row(i) = Eigen::Map<const Eigen::RowVectorXd>(f.data(), npix);
    }

    const Eigen::MatrixXd A = G * data;  // 3 x npix

    Eigen::ArrayXd cos_coef = A.row(1).transpose().array();
    const Eigen::ArrayXd sin_coef = A.row(2).transpose().array();
    const Eigen::ArrayXd amplitude = (cos_coef.square() + sin_coef.square()).sqrt();
    cos_coef = (cos_coef == 0.0).select(std::numeric_limits<double>::quiet_NaN(), cos_coef);
    const Eigen::ArrayXd phase = (sin_coef / cos_coef).atan();

    ReductionResult out;
    out.offset = Eigen::Map<const Matrix2Dd>(A.row(0).eval().data(), h, w);
    out.amplitude = Eigen::Map<const Matrix2Dd>(amplitude.data(), h, w);
    out.phase = Eigen::Map<const Matrix2Dd>(phase.data(), h, w);
    return out;
}

} // namespace grating_reduce::reduction

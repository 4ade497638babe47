#include "grating_reduce/core/errors.hpp"
#include "grating_reduce/reduction/harmonic_reduction.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <vector>

using grating_reduce::Frame;
using grating_reduce::reduction::build_design_matrix;
using grating_reduce::reduction::reduce_harmonic;

namespace {

// Per-pixel offset/cos/sin coefficients vary across the frame so that the
// fit is checked pixel by pixel.
std::vector<Frame> synthetic_stack(int n, double periods, int h, int w) {
    std::vector<Frame> stack;
    for (int i = 0; i < n; ++i) {
        const double theta = 2.0 * M_PI * i * periods / (n - 1);
        Frame f(h, w);
        for (int y = 0; y < h; ++y) {
            for (int x = 0; x < w; ++x) {
                const double offset = 100.0 + 10.0 * y + x;
                const double a = 5.0 + x;
                const double b = 2.0 + 0.5 * y;
                f(y, x) = offset + a * std::cos(theta) + b * std::sin(theta);
            }
        }
        stack.push_back(f);
    }
    return stack;
}

} // namespace

TEST_CASE("design_matrix_columns_are_constant_cos_sin") {
    const Eigen::MatrixXd B = build_design_matrix(5, 1.0);
    REQUIRE(B.rows() == 5);
    REQUIRE(B.cols() == 3);
    for (int i = 0; i < 5; ++i) {
        const double theta = 2.0 * M_PI * i / 4.0;
        REQUIRE(B(i, 0) == 1.0);
        REQUIRE(B(i, 1) == Catch::Approx(std::cos(theta)).margin(1e-12));
        REQUIRE(B(i, 2) == Catch::Approx(std::sin(theta)).margin(1e-12));
    }
}

TEST_CASE("harmonic_reduction_recovers_offset_amplitude_phase") {
    for (int n : {5, 8, 16}) {
        const auto stack = synthetic_stack(n, 1.0, 3, 4);
        const auto r = reduce_harmonic(stack, 1.0);

        REQUIRE(r.offset.rows() == 3);
        REQUIRE(r.offset.cols() == 4);
        for (int y = 0; y < 3; ++y) {
            for (int x = 0; x < 4; ++x) {
                const double a = 5.0 + x;
                const double b = 2.0 + 0.5 * y;
                REQUIRE(r.offset(y, x) == Catch::Approx(100.0 + 10.0 * y + x).epsilon(1e-9));
                REQUIRE(r.amplitude(y, x) == Catch::Approx(std::sqrt(a * a + b * b)).epsilon(1e-9));
                REQUIRE(r.phase(y, x) == Catch::Approx(std::atan(b / a)).epsilon(1e-9));
            }
        }
    }
}

TEST_CASE("harmonic_reduction_handles_fractional_periods") {
    const auto stack = synthetic_stack(9, 0.75, 2, 2);
    const auto r = reduce_harmonic(stack, 0.75);
    REQUIRE(r.offset(1, 1) == Catch::Approx(111.0).epsilon(1e-9));
    REQUIRE(r.amplitude(0, 0) == Catch::Approx(std::sqrt(29.0)).epsilon(1e-9));
}

TEST_CASE("harmonic_reduction_phase_is_nan_where_cos_coefficient_is_zero") {
    std::vector<Frame> stack(5, Frame::Zero(2, 2));
    const auto r = reduce_harmonic(stack, 1.0);

    REQUIRE(r.amplitude(0, 0) == 0.0);
    REQUIRE(std::isnan(r.phase(0, 0)));
    REQUIRE(std::isnan(r.phase(1, 1)));
}

TEST_CASE("harmonic_reduction_rejects_underdetermined_stacks") {
    REQUIRE_THROWS_AS(reduce_harmonic({}, 1.0), grating_reduce::MissingDataError);
    REQUIRE_THROWS_AS(reduce_harmonic(std::vector<Frame>(2, Frame::Ones(2, 2)), 1.0),
                      grating_reduce::InvalidArgumentError);
    // Four periods over five steps samples the same grating position every time
    REQUIRE_THROWS_AS(reduce_harmonic(std::vector<Frame>(5, Frame::Ones(2, 2)), 4.0),
                      grating_reduce::InvalidArgumentError);
}

TEST_CASE("harmonic_reduction_rejects_mixed_shapes") {
    std::vector<Frame> stack(4, Frame::Ones(2, 2));
    stack[2] = Frame::Ones(2, 3);
    REQUIRE_THROWS_AS(reduce_harmonic(stack, 1.0), grating_reduce::ShapeMismatchError);
}

#include "grating_reduce/core/errors.hpp"
#include "grating_reduce/reduction/interferometry.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>

using grating_reduce::Matrix2Dd;
using grating_reduce::ReductionResult;
using grating_reduce::reduction::derive_interferometry;

namespace {

ReductionResult make_reduction(double offset, double amplitude, double phase) {
    ReductionResult r;
    r.offset = Matrix2Dd::Constant(2, 3, offset);
    r.amplitude = Matrix2Dd::Constant(2, 3, amplitude);
    r.phase = Matrix2Dd::Constant(2, 3, phase);
    return r;
}

} // namespace

TEST_CASE("identical_reductions_give_unit_transmission_and_dark_field") {
    const auto r = make_reduction(50.0, 10.0, 0.3);
    const auto maps = derive_interferometry(r, r);

    REQUIRE(maps.transmission.rows() == 2);
    REQUIRE(maps.transmission.cols() == 3);
    REQUIRE((maps.transmission.array() == 1.0).all());
    REQUIRE((maps.diff_phase_contrast.array().abs() < 1e-12).all());
    REQUIRE((maps.dark_field.array() == 1.0).all());
    REQUIRE(maps.visibility_map(0, 0) == Catch::Approx(0.2));
}

TEST_CASE("derived_maps_follow_offset_amplitude_ratios") {
    const auto sample = make_reduction(25.0, 2.0, 0.4);
    const auto ob = make_reduction(100.0, 20.0, 0.1);
    const auto maps = derive_interferometry(sample, ob);

    REQUIRE(maps.transmission(1, 1) == Catch::Approx(0.25));
    REQUIRE(maps.diff_phase_contrast(1, 1) == Catch::Approx(0.3));
    // (2/25) / (20/100)
    REQUIRE(maps.dark_field(1, 1) == Catch::Approx(0.4));
    REQUIRE(maps.visibility_map(1, 1) == Catch::Approx(0.2));
}

TEST_CASE("phase_difference_is_wrapped_to_principal_range") {
    const auto sample = make_reduction(1.0, 1.0, 1.4);
    const auto ob = make_reduction(1.0, 1.0, -1.4);
    const auto maps = derive_interferometry(sample, ob);

    // 2.8 rad wraps to 2.8 - pi
    REQUIRE(maps.diff_phase_contrast(0, 0) == Catch::Approx(2.8 - M_PI));
}

TEST_CASE("non_finite_offsets_are_zeroed_and_divisions_do_not_throw") {
    auto sample = make_reduction(10.0, 1.0, 0.0);
    auto ob = make_reduction(10.0, 1.0, 0.0);
    sample.offset(0, 0) = std::numeric_limits<double>::quiet_NaN();
    sample.offset(0, 1) = std::numeric_limits<double>::infinity();
    ob.offset(1, 0) = 0.0;
    ob.offset(1, 1) = std::numeric_limits<double>::quiet_NaN();

    const auto maps = derive_interferometry(sample, ob);

    REQUIRE(maps.transmission(0, 0) == 0.0);
    REQUIRE(maps.transmission(0, 1) == 0.0);
    REQUIRE(std::isinf(maps.transmission(1, 0)));
    REQUIRE(std::isinf(maps.transmission(1, 1)));
    REQUIRE(std::isinf(maps.visibility_map(1, 0)));
    REQUIRE(maps.transmission(0, 2) == Catch::Approx(1.0));
}

TEST_CASE("mismatched_reductions_are_rejected") {
    const auto sample = make_reduction(1.0, 1.0, 0.0);
    ReductionResult ob;
    ob.offset = Matrix2Dd::Ones(3, 3);
    ob.amplitude = Matrix2Dd::Ones(3, 3);
    ob.phase = Matrix2Dd::Zero(3, 3);
    REQUIRE_THROWS_AS(derive_interferometry(sample, ob), grating_reduce::ShapeMismatchError);
}

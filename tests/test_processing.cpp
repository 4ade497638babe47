#include "grating_reduce/core/errors.hpp"
#include "grating_reduce/image/processing.hpp"
#include "grating_reduce/image/roi.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using grating_reduce::Frame;
using grating_reduce::Shape;
using grating_reduce::image::Roi;

namespace {

Frame ramp(int h, int w) {
    Frame f(h, w);
    for (int y = 0; y < h; ++y)
        for (int x = 0; x < w; ++x)
            f(y, x) = y * w + x;
    return f;
}

} // namespace

TEST_CASE("roi_fits_into_requires_bounds_inside_frame") {
    const Shape s{4, 6};
    REQUIRE(Roi(0, 0, 5, 3).fits_into(s));
    REQUIRE_FALSE(Roi(0, 0, 6, 3).fits_into(s));
    REQUIRE_FALSE(Roi(0, 0, 5, 4).fits_into(s));
    REQUIRE_FALSE(Roi(0, 0, 0, 0).fits_into(Shape{}));
}

TEST_CASE("roi_rejects_reversed_or_negative_bounds") {
    REQUIRE_THROWS_AS(Roi(2, 0, 1, 1), grating_reduce::InvalidRoiError);
    REQUIRE_THROWS_AS(Roi(0, 2, 1, 1), grating_reduce::InvalidRoiError);
    REQUIRE_THROWS_AS(Roi(-1, 0, 1, 1), grating_reduce::InvalidRoiError);
}

TEST_CASE("extract_roi_is_inclusive") {
    const Frame f = ramp(4, 4);
    const Frame out = grating_reduce::image::extract_roi(f, Roi(1, 1, 2, 2));

    REQUIRE(out.rows() == 2);
    REQUIRE(out.cols() == 2);
    REQUIRE(out(0, 0) == 5.0);
    REQUIRE(out(0, 1) == 6.0);
    REQUIRE(out(1, 0) == 9.0);
    REQUIRE(out(1, 1) == 10.0);
}

TEST_CASE("roi_mean_uses_whole_frame_without_roi") {
    const Frame f = ramp(2, 2); // 0 1 / 2 3
    REQUIRE(grating_reduce::image::roi_mean(f, std::nullopt) == Catch::Approx(1.5));
    REQUIRE(grating_reduce::image::roi_mean(f, Roi(1, 0, 1, 1)) == Catch::Approx(2.0));
}

TEST_CASE("average_frames_is_pixelwise_mean") {
    const Frame a = Frame::Constant(2, 3, 1.0);
    const Frame b = Frame::Constant(2, 3, 3.0);

    const Frame m = grating_reduce::image::average_frames({a, b});
    REQUIRE((m.array() == 2.0).all());

    const Frame lone = grating_reduce::image::average_frames({b});
    REQUIRE((lone.array() == 3.0).all());

    REQUIRE_THROWS_AS(grating_reduce::image::average_frames({}),
                      grating_reduce::MissingDataError);
    REQUIRE_THROWS_AS(grating_reduce::image::average_frames({a, Frame::Zero(3, 3)}),
                      grating_reduce::ShapeMismatchError);
}

TEST_CASE("bin_frame_averages_blocks") {
    const Frame uniform = Frame::Constant(4, 4, 7.5);
    const Frame out = grating_reduce::image::bin_frame(uniform, 2);
    REQUIRE(out.rows() == 2);
    REQUIRE(out.cols() == 2);
    REQUIRE((out.array() == 7.5).all());

    const Frame r = ramp(4, 4);
    const Frame rb = grating_reduce::image::bin_frame(r, 2);
    // top-left block: 0 1 4 5
    REQUIRE(rb(0, 0) == Catch::Approx(2.5));
    // bottom-right block: 10 11 14 15
    REQUIRE(rb(1, 1) == Catch::Approx(12.5));
}

TEST_CASE("bin_frame_drops_incomplete_trailing_bins") {
    const Frame r = ramp(5, 5);
    const Frame out = grating_reduce::image::bin_frame(r, 2);
    REQUIRE(out.rows() == 2);
    REQUIRE(out.cols() == 2);
    // block rows 2..3, cols 2..3: 12 13 17 18
    REQUIRE(out(1, 1) == Catch::Approx(15.0));

    REQUIRE_THROWS_AS(grating_reduce::image::bin_frame(r, 0),
                      grating_reduce::InvalidArgumentError);
}

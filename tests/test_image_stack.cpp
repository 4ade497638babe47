#include "grating_reduce/core/errors.hpp"
#include "grating_reduce/image/image_stack.hpp"

#include <catch2/catch_test_macros.hpp>

using grating_reduce::Frame;
using grating_reduce::Shape;
using grating_reduce::image::ImageStack;

TEST_CASE("image_stack_records_shape_of_first_frame") {
    ImageStack stack;
    REQUIRE(stack.is_empty());
    REQUIRE_FALSE(stack.shape().is_known());

    stack.append(Frame::Zero(3, 5), "a.fits");

    REQUIRE_FALSE(stack.is_empty());
    REQUIRE(stack.size() == 1);
    REQUIRE(stack.shape() == Shape{3, 5});
    REQUIRE(stack.source_names().front() == "a.fits");
}

TEST_CASE("image_stack_rejects_frame_with_different_shape") {
    ImageStack stack;
    stack.append(Frame::Zero(4, 4), "a.fits");

    REQUIRE_THROWS_AS(stack.append(Frame::Zero(4, 5), "b.fits"),
                      grating_reduce::ShapeMismatchError);
    REQUIRE_THROWS_AS(stack.append(Frame::Zero(3, 4), "c.fits"),
                      grating_reduce::ShapeMismatchError);

    // Rejected frames leave no trace
    REQUIRE(stack.size() == 1);
    REQUIRE(stack.source_names().size() == 1);
    REQUIRE(stack.shape() == Shape{4, 4});
}

TEST_CASE("image_stack_keeps_acquisition_order") {
    ImageStack stack;
    for (int i = 0; i < 4; ++i) {
        stack.append(Frame::Constant(2, 2, static_cast<double>(i)),
                     "step_" + std::to_string(i));
    }

    for (size_t i = 0; i < stack.size(); ++i) {
        REQUIRE(stack[i](0, 0) == static_cast<double>(i));
        REQUIRE(stack.source_names()[i] == "step_" + std::to_string(i));
    }
}

TEST_CASE("image_stack_replace_frames_updates_shape") {
    ImageStack stack;
    stack.append(Frame::Zero(4, 4), "a");
    stack.append(Frame::Zero(4, 4), "b");

    stack.replace_frames({Frame::Ones(2, 3), Frame::Ones(2, 3)});

    REQUIRE(stack.shape() == Shape{2, 3});
    REQUIRE(stack.source_names().size() == 2);

    REQUIRE_THROWS_AS(stack.replace_frames({Frame::Ones(2, 3), Frame::Ones(3, 3)}),
                      grating_reduce::ShapeMismatchError);
    REQUIRE_THROWS_AS(stack.replace_frames({Frame::Ones(2, 3)}),
                      grating_reduce::CountMismatchError);
    REQUIRE(stack.shape() == Shape{2, 3});
}

#include "grating_reduce/core/errors.hpp"
#include "grating_reduce/core/utils.hpp"
#include "grating_reduce/io/image_io.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>

namespace fs = std::filesystem;

using grating_reduce::Matrix2Dd;
using grating_reduce::io::ImageFormat;
using grating_reduce::io::detect_image_format;

TEST_CASE("image_format_is_detected_from_extension") {
    REQUIRE(detect_image_format("a/b/frame.fits") == ImageFormat::FITS);
    REQUIRE(detect_image_format("frame.FIT") == ImageFormat::FITS);
    REQUIRE(detect_image_format("frame.tif") == ImageFormat::TIFF);
    REQUIRE(detect_image_format("frame.TIFF") == ImageFormat::TIFF);
    REQUIRE(detect_image_format("frame.h5") == ImageFormat::HDF5);
    REQUIRE(detect_image_format("frame.hdf5") == ImageFormat::HDF5);
    REQUIRE(detect_image_format("frame.hdf") == ImageFormat::HDF4);
    REQUIRE(detect_image_format("frame.png") == ImageFormat::UNKNOWN);
    REQUIRE(detect_image_format("frame") == ImageFormat::UNKNOWN);
}

TEST_CASE("list_images_returns_sorted_supported_files") {
    const fs::path dir = fs::temp_directory_path() / "grating_reduce_list_test";
    fs::remove_all(dir);
    fs::create_directories(dir / "nested.fits");
    for (const char* name : {"step_03.tif", "step_01.tif", "notes.txt", "step_02.tif"}) {
        std::ofstream(dir / name) << "x";
    }

    const auto images = grating_reduce::io::list_images(dir);
    REQUIRE(images.size() == 3);
    REQUIRE(images[0].filename() == "step_01.tif");
    REQUIRE(images[1].filename() == "step_02.tif");
    REQUIRE(images[2].filename() == "step_03.tif");

    REQUIRE_THROWS_AS(grating_reduce::io::list_images(dir / "missing"),
                      grating_reduce::NotFoundError);
    fs::remove_all(dir);
}

TEST_CASE("load_image_errors") {
    REQUIRE_THROWS_AS(grating_reduce::io::load_image("/nonexistent/frame.tif"),
                      grating_reduce::NotFoundError);

    const fs::path dir = fs::temp_directory_path() / "grating_reduce_load_image_test";
    fs::create_directories(dir);
    std::ofstream(dir / "frame.bmp") << "x";
    std::ofstream(dir / "frame.hdf") << "x";
    REQUIRE_THROWS_AS(grating_reduce::io::load_image(dir / "frame.bmp"),
                      grating_reduce::UnsupportedFormatError);
    REQUIRE_THROWS_AS(grating_reduce::io::load_image(dir / "frame.hdf"),
                      grating_reduce::UnsupportedFormatError);
    fs::remove_all(dir);
}

TEST_CASE("replace_non_finite_zeroes_nan_and_inf") {
    Matrix2Dd m(1, 4);
    m << 1.0, std::numeric_limits<double>::quiet_NaN(),
        std::numeric_limits<double>::infinity(), -std::numeric_limits<double>::infinity();

    const Matrix2Dd out = grating_reduce::core::replace_non_finite(m);
    REQUIRE(out(0, 0) == 1.0);
    REQUIRE(out(0, 1) == 0.0);
    REQUIRE(out(0, 2) == 0.0);
    REQUIRE(out(0, 3) == 0.0);
}

TEST_CASE("to_lower_handles_mixed_case") {
    REQUIRE(grating_reduce::core::to_lower("FrAmE.FITS") == "frame.fits");
}

TEST_CASE("compute_mean_of_empty_matrix_is_nan") {
    REQUIRE(std::isnan(grating_reduce::core::compute_mean(Matrix2Dd())));
    REQUIRE(grating_reduce::core::compute_mean(Matrix2Dd::Constant(2, 2, 3.0)) == 3.0);
}

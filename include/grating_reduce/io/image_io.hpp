#pragma once

#include "grating_reduce/core/types.hpp"

#include <string>
#include <vector>

namespace grating_reduce::io {

enum class ImageFormat {
    UNKNOWN,
    FITS,
    TIFF,
    HDF4,
    HDF5
};

std::string image_format_to_string(ImageFormat format);

// Format by lower-cased file extension.
ImageFormat detect_image_format(const fs::path& path);

struct LoadOptions {
    // Dataset read from HDF5 files; a 3D dataset contributes its first slice.
    std::string hdf5_dataset = "/entry/instrument/detector/data";
};

// Load the first 2D image of a FITS, TIFF or HDF5 file.
// Throws NotFoundError for a missing file and UnsupportedFormatError for an
// extension none of the readers handle.
Frame load_image(const fs::path& path, const LoadOptions& options = {});

// Regular files in a folder with a loadable extension, sorted by path.
std::vector<fs::path> list_images(const fs::path& folder);

Frame read_tiff(const fs::path& path);
Frame read_hdf5(const fs::path& path, const std::string& dataset);

} // namespace grating_reduce::io

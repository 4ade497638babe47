#include "grating_reduce/io/image_io.hpp"
#include "grating_reduce/core/errors.hpp"
#include "grating_reduce/core/utils.hpp"
#include "grating_reduce/io/fits_io.hpp"

#include <hdf5.h>
#include <opencv2/opencv.hpp>

#include <algorithm>
#include <vector>

namespace grating_reduce::io {

namespace {

// Closes an HDF5 identifier with the matching H5*close call.
class H5Handle {
public:
    H5Handle(hid_t id, herr_t (*close_fn)(hid_t)) : id_(id), close_fn_(close_fn) {}
    ~H5Handle() {
        if (id_ >= 0) close_fn_(id_);
    }
    H5Handle(const H5Handle&) = delete;
    H5Handle& operator=(const H5Handle&) = delete;

    hid_t get() const { return id_; }
    bool valid() const { return id_ >= 0; }

private:
    hid_t id_;
    herr_t (*close_fn_)(hid_t);
};

} // namespace

std::string image_format_to_string(ImageFormat format) {
    switch (format) {
        case ImageFormat::FITS: return "FITS";
        case ImageFormat::TIFF: return "TIFF";
        case ImageFormat::HDF4: return "HDF4";
        case ImageFormat::HDF5: return "HDF5";
        default: return "UNKNOWN";
    }
}

ImageFormat detect_image_format(const fs::path& path) {
    if (is_fits_image_path(path)) return ImageFormat::FITS;

    const std::string ext = core::to_lower(path.extension().string());
    if (ext == ".tif" || ext == ".tiff") return ImageFormat::TIFF;
    if (ext == ".h5" || ext == ".hdf5" || ext == ".he5") return ImageFormat::HDF5;
    if (ext == ".hdf" || ext == ".h4" || ext == ".hdf4" || ext == ".he2") return ImageFormat::HDF4;
    return ImageFormat::UNKNOWN;
}

Frame load_image(const fs::path& path, const LoadOptions& options) {
    if (!fs::is_regular_file(path)) {
        throw NotFoundError("The file name does not exist: " + path.string());
    }

    const ImageFormat format = detect_image_format(path);
    switch (format) {
        case ImageFormat::FITS:
            return read_fits(path);
        case ImageFormat::TIFF:
            return read_tiff(path);
        case ImageFormat::HDF5:
            return read_hdf5(path, options.hdf5_dataset);
        case ImageFormat::HDF4:
            throw UnsupportedFormatError(image_format_to_string(format) +
                                         " files are not readable: " + path.string());
        default:
            throw UnsupportedFormatError("file extension not recognized: " + path.string());
    }
}

std::vector<fs::path> list_images(const fs::path& folder) {
    if (!fs::is_directory(folder)) {
        throw NotFoundError("Folder does not exist: " + folder.string());
    }

    std::vector<fs::path> images;
    for (const auto& entry : fs::directory_iterator(folder)) {
        if (!entry.is_regular_file()) continue;
        const ImageFormat f = detect_image_format(entry.path());
        if (f == ImageFormat::FITS || f == ImageFormat::TIFF || f == ImageFormat::HDF5) {
            images.push_back(entry.path());
        }
    }

    std::sort(images.begin(), images.end());
    return images;
}

Frame read_tiff(const fs::path& path) {
    cv::Mat img = cv::imread(path.string(), cv::IMREAD_UNCHANGED | cv::IMREAD_ANYDEPTH);
    if (img.empty()) {
        throw TiffError("Cannot read TIFF file: " + path.string());
    }
    if (img.channels() > 1) {
        cv::Mat grey;
        cv::cvtColor(img, grey, img.channels() == 4 ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
        img = grey;
    }

    cv::Mat img64;
    img.convertTo(img64, CV_64F);

    Frame data(img64.rows, img64.cols);
    for (int y = 0; y < img64.rows; ++y) {
        const double* row = img64.ptr<double>(y);
        for (int x = 0; x < img64.cols; ++x) {
            data(y, x) = row[x];
        }
    }
    return data;
}

Frame read_hdf5(const fs::path& path, const std::string& dataset) {
    H5Handle file(H5Fopen(path.string().c_str(), H5F_ACC_RDONLY, H5P_DEFAULT), H5Fclose);
    if (!file.valid()) {
        throw Hdf5Error("Cannot open HDF5 file: " + path.string());
    }

    H5Handle dset(H5Dopen2(file.get(), dataset.c_str(), H5P_DEFAULT), H5Dclose);
    if (!dset.valid()) {
        throw Hdf5Error("Dataset " + dataset + " not found in " + path.string());
    }

    H5Handle space(H5Dget_space(dset.get()), H5Sclose);
    const int ndims = H5Sget_simple_extent_ndims(space.get());
    if (ndims != 2 && ndims != 3) {
        throw Hdf5Error("Dataset " + dataset + " must be 2D or 3D, has " +
                        std::to_string(ndims) + " dimensions");
    }

    hsize_t dims[3] = {0, 0, 0};
    H5Sget_simple_extent_dims(space.get(), dims, nullptr);

    hsize_t height = ndims == 3 ? dims[1] : dims[0];
    hsize_t width = ndims == 3 ? dims[2] : dims[1];

    // Select the first image of an image series
    hsize_t start[3] = {0, 0, 0};
    hsize_t count[3] = {1, height, width};
    if (ndims == 2) {
        count[0] = height;
        count[1] = width;
    }
    if (H5Sselect_hyperslab(space.get(), H5S_SELECT_SET, start, nullptr, count, nullptr) < 0) {
        throw Hdf5Error("Cannot select first image of " + dataset);
    }

    hsize_t mem_dims[2] = {height, width};
    H5Handle mem_space(H5Screate_simple(2, mem_dims, nullptr), H5Sclose);

    Frame data(static_cast<Eigen::Index>(height), static_cast<Eigen::Index>(width));
    if (H5Dread(dset.get(), H5T_NATIVE_DOUBLE, mem_space.get(), space.get(), H5P_DEFAULT,
                data.data()) < 0) {
        throw Hdf5Error("Cannot read dataset " + dataset + " from " + path.string());
    }
    return data;
}

} // namespace grating_reduce::io

#include "grating_reduce/io/fits_io.hpp"
#include "grating_reduce/core/errors.hpp"
#include "grating_reduce/core/utils.hpp"

#include <fitsio.h>
#include <vector>

namespace grating_reduce::io {

void FitsHeader::set(const std::string& key, const std::string& value) {
    string_values[key] = value;
}

void FitsHeader::set(const std::string& key, double value) {
    numeric_values[key] = value;
}

bool is_fits_image_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".fit" || ext == ".fits" || ext == ".fts";
}

Frame read_fits(const fs::path& path) {
    fitsfile* fptr = nullptr;
    int status = 0;

    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    int naxis = 0;
    long naxes[3] = {0, 0, 0};
    int bitpix = 0;

    fits_get_img_param(fptr, 3, &bitpix, &naxis, naxes, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot read FITS image parameters: " + path.string());
    }

    if (naxis < 2) {
        fits_close_file(fptr, &status);
        throw FitsError("FITS file has less than 2 dimensions: " + path.string());
    }

    long width = naxes[0];
    long height = naxes[1];
    long npixels = width * height;

    // FITS stores the first axis fastest, which is the row-major layout of Frame
    Frame data(height, width);
    long fpixel[3] = {1, 1, 1};

    fits_read_pix(fptr, TDOUBLE, fpixel, npixels, nullptr, data.data(), nullptr, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot read FITS pixel data: " + path.string());
    }

    fits_close_file(fptr, &status);
    return data;
}

void write_fits(const fs::path& path, const Frame& data, const FitsHeader& header) {
    fitsfile* fptr = nullptr;
    int status = 0;

    std::string filepath = "!" + path.string();

    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }

    long naxes[2] = {static_cast<long>(data.cols()), static_cast<long>(data.rows())};

    fits_create_img(fptr, DOUBLE_IMG, 2, naxes, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot create FITS image: " + path.string());
    }

    for (const auto& [key, value] : header.string_values) {
        if (key.size() <= 8) {
            fits_update_key(fptr, TSTRING, key.c_str(),
                           const_cast<char*>(value.c_str()), nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.numeric_values) {
        if (key.size() <= 8) {
            double val = value;
            fits_update_key(fptr, TDOUBLE, key.c_str(), &val, nullptr, &status);
        }
    }
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot write FITS header: " + path.string());
    }

    std::vector<double> buffer(data.data(), data.data() + data.size());
    long fpixel[2] = {1, 1};
    fits_write_pix(fptr, TDOUBLE, fpixel, static_cast<LONGLONG>(buffer.size()),
                   buffer.data(), &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot write FITS pixel data: " + path.string());
    }

    fits_close_file(fptr, &status);
}

} // namespace grating_reduce::io

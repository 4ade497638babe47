#pragma once

#include "grating_reduce/core/types.hpp"
#include <map>
#include <string>

namespace grating_reduce::io {

struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, double value);
};

bool is_fits_image_path(const fs::path& path);

// First image plane of the primary HDU as double.
Frame read_fits(const fs::path& path);

void write_fits(const fs::path& path, const Frame& data, const FitsHeader& header);

} // namespace grating_reduce::io

#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace grating_reduce::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
void write_text(const fs::path& path, const std::string& text);

// Math utilities
Matrix2Dd replace_non_finite(const Matrix2Dd& data, double value = 0.0);
double compute_mean(const Matrix2Dd& data);

// String utilities
std::string to_lower(const std::string& s);

} // namespace grating_reduce::core

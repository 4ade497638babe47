#include "grating_reduce/core/utils.hpp"
#include "grating_reduce/core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <limits>
#include <random>
#include <sstream>

namespace grating_reduce::core {

std::string get_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string get_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_';

    const char* hex = "0123456789abcdef";
    for (int i = 0; i < 8; ++i) {
        oss << hex[dis(gen)];
    }

    return oss.str();
}

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream file(path);
    if (!file) {
        throw IOError("Cannot create file: " + path.string());
    }
    file << text;
}

Matrix2Dd replace_non_finite(const Matrix2Dd& data, double value) {
    Matrix2Dd out = data;
    for (Eigen::Index i = 0; i < out.size(); ++i) {
        if (!std::isfinite(out.data()[i])) {
            out.data()[i] = value;
        }
    }
    return out;
}

double compute_mean(const Matrix2Dd& data) {
    if (data.size() == 0) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return data.mean();
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace grating_reduce::core

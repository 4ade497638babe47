#pragma once

#include <Eigen/Dense>
#include <filesystem>
#include <string>
#include <vector>

namespace grating_reduce {

namespace fs = std::filesystem;

// Matrix types (NumPy equivalents)
using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// One detector image
using Frame = Matrix2Dd;

// Frame dimensions; both -1 until the first frame of a role is known
struct Shape {
    int height = -1;
    int width = -1;

    bool is_known() const { return height >= 0 && width >= 0; }

    bool operator==(const Shape& other) const {
        return height == other.height && width == other.width;
    }
    bool operator!=(const Shape& other) const { return !(*this == other); }

    static Shape of(const Frame& frame) {
        return {static_cast<int>(frame.rows()), static_cast<int>(frame.cols())};
    }
};

inline std::string shape_to_string(const Shape& s) {
    if (!s.is_known()) return "unknown";
    return std::to_string(s.height) + "x" + std::to_string(s.width);
}

// Dataset role enumeration
enum class DatasetRole {
    SAMPLE,
    OB,   // open beam
    DF    // dark field (detector background)
};

inline std::string dataset_role_to_string(DatasetRole role) {
    switch (role) {
        case DatasetRole::SAMPLE: return "sample";
        case DatasetRole::OB: return "ob";
        case DatasetRole::DF: return "df";
        default: return "unknown";
    }
}

// Destructive pipeline stages already executed on the in-memory data
struct ProcessStatus {
    bool df_correction = false;
    bool normalization = false;
    bool crop = false;
    bool oscillation = false;
    bool bin = false;

    bool any() const {
        return df_correction || normalization || crop || oscillation || bin;
    }
};

// Per-pixel harmonic decomposition of one stack
struct ReductionResult {
    Matrix2Dd offset;
    Matrix2Dd amplitude;
    Matrix2Dd phase;
};

struct InterferometryMaps {
    Matrix2Dd transmission;
    Matrix2Dd diff_phase_contrast;
    Matrix2Dd dark_field;
    Matrix2Dd visibility_map;
};

// Pipeline stage enumeration
enum class Stage {
    LOAD = 0,
    DF_CORRECTION = 1,
    NORMALIZATION = 2,
    CROP = 3,
    BINNING = 4,
    OSCILLATION = 5,
    REDUCTION = 6,
    WRITE_OUTPUT = 7,
    DONE = 8
};

inline std::string stage_to_string(Stage stage) {
    switch (stage) {
        case Stage::LOAD: return "LOAD";
        case Stage::DF_CORRECTION: return "DF_CORRECTION";
        case Stage::NORMALIZATION: return "NORMALIZATION";
        case Stage::CROP: return "CROP";
        case Stage::BINNING: return "BINNING";
        case Stage::OSCILLATION: return "OSCILLATION";
        case Stage::REDUCTION: return "REDUCTION";
        case Stage::WRITE_OUTPUT: return "WRITE_OUTPUT";
        case Stage::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int stage_to_int(Stage stage) {
    return static_cast<int>(stage);
}

} // namespace grating_reduce

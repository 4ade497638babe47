#include "grating_reduce/pipeline/grating_interferometer.hpp"
#include "grating_reduce/core/errors.hpp"
#include "grating_reduce/image/processing.hpp"
#include "grating_reduce/reduction/harmonic_reduction.hpp"
#include "grating_reduce/reduction/interferometry.hpp"

namespace grating_reduce::pipeline {

GratingInterferometer::GratingInterferometer(std::ostream* event_stream, std::string run_id)
    : event_stream_(event_stream), run_id_(std::move(run_id)) {}

GratingInterferometer::RoleData& GratingInterferometer::role_data(DatasetRole role) {
    switch (role) {
        case DatasetRole::SAMPLE: return sample_;
        case DatasetRole::OB: return ob_;
        case DatasetRole::DF: return df_;
    }
    throw InvalidArgumentError("unknown dataset role");
}

const GratingInterferometer::RoleData& GratingInterferometer::role_data(DatasetRole role) const {
    switch (role) {
        case DatasetRole::SAMPLE: return sample_;
        case DatasetRole::OB: return ob_;
        case DatasetRole::DF: return df_;
    }
    throw InvalidArgumentError("unknown dataset role");
}

const image::ImageStack& GratingInterferometer::stack(DatasetRole role) const {
    return role_data(role).stack;
}

const std::vector<double>& GratingInterferometer::oscillation_values(DatasetRole role) const {
    if (role == DatasetRole::DF) {
        throw InvalidArgumentError("df frames have no oscillation");
    }
    return role_data(role).oscillation;
}

// ---------------------------------------------------------------------------
// Loading

void GratingInterferometer::require_not_processed() const {
    if (status_.any()) {
        throw OperationNotAllowedError("this data set has already been processed");
    }
}

void GratingInterferometer::load(const fs::path& file, const fs::path& folder,
                                 DatasetRole role) {
    require_not_processed();

    if (!file.empty()) {
        load_file(file, role);
    }
    if (!folder.empty()) {
        for (const auto& path : io::list_images(folder)) {
            load_file(path, role);
        }
    }
}

void GratingInterferometer::load_file(const fs::path& file, DatasetRole role) {
    require_not_processed();
    add_frame(io::load_image(file, load_options_), file.string(), role);
}

void GratingInterferometer::add_frame(Frame frame, const std::string& source_name,
                                      DatasetRole role) {
    require_not_processed();
    RoleData& rd = role_data(role);
    rd.stack.append(std::move(frame), source_name);
    rd.loaded_shape = rd.stack.shape();
    if (role == DatasetRole::DF) {
        averaged_df_.reset();
    }
}

// ---------------------------------------------------------------------------
// Shared checks

void GratingInterferometer::require_sample_and_ob(const std::string& stage) const {
    if (sample_.stack.is_empty()) {
        throw MissingDataError("no " + stage + " available as no sample data have been loaded");
    }
    if (ob_.stack.is_empty()) {
        throw MissingDataError("no " + stage + " available as no ob data have been loaded");
    }
}

void GratingInterferometer::require_roi_fits(const image::Roi& roi) const {
    const Shape& s = sample_.stack.is_empty() ? ob_.stack.shape() : sample_.stack.shape();
    if (!roi.fits_into(s)) {
        throw InvalidRoiError(roi.to_string() + " does not fit into the " +
                              shape_to_string(s) + " sample image");
    }
}

bool GratingInterferometer::shapes_match() const {
    if (sample_.stack.shape() != ob_.stack.shape()) {
        return false;
    }
    // crop and binning never touch df, so it is compared at load geometry
    if (!df_.stack.is_empty() && df_.loaded_shape != sample_.loaded_shape) {
        return false;
    }
    return true;
}

const Frame& GratingInterferometer::averaged_df_frame() {
    if (!averaged_df_) {
        averaged_df_ = image::average_frames(df_.stack.frames());
    }
    return *averaged_df_;
}

// ---------------------------------------------------------------------------
// Stages

bool GratingInterferometer::df_correction(bool force) {
    if (!force && status_.df_correction) {
        stage_end(Stage::DF_CORRECTION, "skipped");
        return false;
    }
    stage_start(Stage::DF_CORRECTION);

    if (df_.stack.is_empty()) {
        status_.df_correction = true;
        warn("df correction requested but no df data loaded");
        stage_end(Stage::DF_CORRECTION, "ok", {{"df_frames", 0}});
        return true;
    }

    try {
        for (const RoleData* rd : {&sample_, &ob_}) {
            if (!rd->stack.is_empty() && rd->stack.shape() != df_.stack.shape()) {
                throw ShapeMismatchError(
                    std::string(rd == &sample_ ? "sample" : "ob") + " frames are " +
                    shape_to_string(rd->stack.shape()) + " but df frames are " +
                    shape_to_string(df_.stack.shape()));
            }
        }

        const Frame& df = averaged_df_frame();
        for (RoleData* rd : {&sample_, &ob_}) {
            if (rd->stack.is_empty()) continue;
            std::vector<Frame> corrected;
            corrected.reserve(rd->stack.size());
            for (const auto& frame : rd->stack.frames()) {
                corrected.push_back(frame - df);
            }
            rd->stack.replace_frames(std::move(corrected));
        }
    } catch (const std::exception& e) {
        stage_failed(Stage::DF_CORRECTION, e);
        throw;
    }

    status_.df_correction = true;
    stage_end(Stage::DF_CORRECTION, "ok",
              {{"df_frames", df_.stack.size()}, {"forced", force}});
    return true;
}

bool GratingInterferometer::normalization(const std::optional<image::Roi>& roi, bool force) {
    if (!force && status_.normalization) {
        stage_end(Stage::NORMALIZATION, "skipped");
        return false;
    }
    stage_start(Stage::NORMALIZATION);

    try {
        require_sample_and_ob("normalization");
        if (sample_.stack.size() != ob_.stack.size()) {
            throw CountMismatchError("number of sample (" + std::to_string(sample_.stack.size()) +
                                     ") and ob (" + std::to_string(ob_.stack.size()) +
                                     ") frames do not match");
        }
        if (!shapes_match()) {
            throw ShapeMismatchError("data loaded do not have the same shape (sample " +
                                     shape_to_string(sample_.loaded_shape) + ", ob " +
                                     shape_to_string(ob_.loaded_shape) + ", df " +
                                     shape_to_string(df_.loaded_shape) + ")");
        }
        if (roi) {
            require_roi_fits(*roi);
        }

        for (RoleData* rd : {&sample_, &ob_}) {
            std::vector<Frame> normalized;
            normalized.reserve(rd->stack.size());
            for (const auto& frame : rd->stack.frames()) {
                normalized.push_back(frame / image::roi_mean(frame, roi));
            }
            rd->stack.replace_frames(std::move(normalized));
        }
    } catch (const std::exception& e) {
        stage_failed(Stage::NORMALIZATION, e);
        throw;
    }

    status_.normalization = true;
    core::json extra = {{"frames", sample_.stack.size()}, {"forced", force}};
    if (roi) extra["roi"] = roi->to_string();
    stage_end(Stage::NORMALIZATION, "ok", extra);
    return true;
}

bool GratingInterferometer::crop(const std::optional<image::Roi>& roi, bool force) {
    if (!force && status_.crop) {
        stage_end(Stage::CROP, "skipped");
        return false;
    }
    stage_start(Stage::CROP);

    try {
        require_sample_and_ob("crop");
        if (!roi) {
            throw InvalidRoiError("crop requires a region of interest");
        }
        require_roi_fits(*roi);
        if (!roi->fits_into(ob_.stack.shape())) {
            throw InvalidRoiError(roi->to_string() + " does not fit into the " +
                                  shape_to_string(ob_.stack.shape()) + " ob image");
        }

        for (RoleData* rd : {&sample_, &ob_}) {
            std::vector<Frame> cropped;
            cropped.reserve(rd->stack.size());
            for (const auto& frame : rd->stack.frames()) {
                cropped.push_back(image::extract_roi(frame, *roi));
            }
            rd->stack.replace_frames(std::move(cropped));
        }
    } catch (const std::exception& e) {
        stage_failed(Stage::CROP, e);
        throw;
    }

    status_.crop = true;
    stage_end(Stage::CROP, "ok",
              {{"roi", roi->to_string()}, {"shape", shape_to_string(sample_.stack.shape())}});
    return true;
}

void GratingInterferometer::oscillation(const std::optional<image::Roi>& roi, bool plot) {
    stage_start(Stage::OSCILLATION);

    try {
        if (roi) {
            for (const RoleData* rd : {&sample_, &ob_}) {
                if (!rd->stack.is_empty() && !roi->fits_into(rd->stack.shape())) {
                    throw InvalidRoiError(roi->to_string() + " does not fit into the " +
                                          shape_to_string(rd->stack.shape()) + " images");
                }
            }
        }

        for (RoleData* rd : {&sample_, &ob_}) {
            std::vector<double> means;
            means.reserve(rd->stack.size());
            for (const auto& frame : rd->stack.frames()) {
                means.push_back(image::roi_mean(frame, roi));
            }
            rd->oscillation = std::move(means);
        }
        status_.oscillation = true;

        if (plot) {
            if (!plotter_) {
                warn("oscillation plot requested but no plotter is configured");
            } else if (sample_.stack.is_empty()) {
                warn("oscillation plot requested but no sample data loaded");
            } else {
                plotter_(sample_.stack[0], roi, sample_.oscillation, ob_.oscillation);
            }
        }
    } catch (const std::exception& e) {
        stage_failed(Stage::OSCILLATION, e);
        throw;
    }

    stage_end(Stage::OSCILLATION, "ok",
              {{"sample", sample_.oscillation}, {"ob", ob_.oscillation}});
}

bool GratingInterferometer::binning(int bin_size, bool force) {
    if (!force && status_.bin) {
        stage_end(Stage::BINNING, "skipped");
        return false;
    }
    stage_start(Stage::BINNING);

    try {
        if (bin_size < 1) {
            throw InvalidArgumentError("bin argument needs to be a positive integer, got " +
                                       std::to_string(bin_size));
        }
        require_sample_and_ob("binning");
        for (const RoleData* rd : {&sample_, &ob_}) {
            const Shape& s = rd->stack.shape();
            if (bin_size > s.height || bin_size > s.width) {
                throw InvalidArgumentError("bin size " + std::to_string(bin_size) +
                                           " exceeds the " + shape_to_string(s) + " frames");
            }
        }

        for (RoleData* rd : {&sample_, &ob_}) {
            std::vector<Frame> binned;
            binned.reserve(rd->stack.size());
            for (const auto& frame : rd->stack.frames()) {
                binned.push_back(image::bin_frame(frame, bin_size));
            }
            rd->stack.replace_frames(std::move(binned));
        }
    } catch (const std::exception& e) {
        stage_failed(Stage::BINNING, e);
        throw;
    }

    status_.bin = true;
    stage_end(Stage::BINNING, "ok",
              {{"bin", bin_size}, {"shape", shape_to_string(sample_.stack.shape())}});
    return true;
}

const InterferometryMaps&
GratingInterferometer::create_interferometry_images(double number_periods) {
    stage_start(Stage::REDUCTION);

    try {
        require_sample_and_ob("interferometry");
        if (sample_.stack.shape() != ob_.stack.shape()) {
            throw ShapeMismatchError("sample frames are " + shape_to_string(sample_.stack.shape()) +
                                     ", ob frames are " + shape_to_string(ob_.stack.shape()));
        }
        if (!(number_periods > 0.0)) {
            throw InvalidArgumentError("number of periods must be positive");
        }

        const ReductionResult sample_red =
            reduction::reduce_harmonic(sample_.stack.frames(), number_periods);
        const ReductionResult ob_red =
            reduction::reduce_harmonic(ob_.stack.frames(), number_periods);
        interferometry_ = reduction::derive_interferometry(sample_red, ob_red);
    } catch (const std::exception& e) {
        stage_failed(Stage::REDUCTION, e);
        throw;
    }

    stage_end(Stage::REDUCTION, "ok",
              {{"number_periods", number_periods},
               {"sample_steps", sample_.stack.size()},
               {"ob_steps", ob_.stack.size()},
               {"shape", shape_to_string(sample_.stack.shape())}});
    return *interferometry_;
}

// ---------------------------------------------------------------------------
// Events

void GratingInterferometer::stage_start(Stage stage) {
    if (event_stream_) {
        emitter_.stage_start(run_id_, stage, *event_stream_);
    }
}

void GratingInterferometer::stage_end(Stage stage, const std::string& status,
                                      const core::json& extra) {
    if (event_stream_) {
        emitter_.stage_end(run_id_, stage, status, extra, *event_stream_);
    }
}

void GratingInterferometer::stage_failed(Stage stage, const std::exception& e) {
    stage_end(stage, "error", {{"error", e.what()}});
}

void GratingInterferometer::warn(const std::string& message) {
    if (event_stream_) {
        emitter_.warning(run_id_, message, *event_stream_);
    }
}

} // namespace grating_reduce::pipeline

#pragma once

#include "grating_reduce/core/events.hpp"
#include "grating_reduce/core/types.hpp"
#include "grating_reduce/image/image_stack.hpp"
#include "grating_reduce/image/roi.hpp"
#include "grating_reduce/io/image_io.hpp"

#include <exception>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace grating_reduce::pipeline {

// Renders the oscillation of the first sample frame inside the ROI.
using OscillationPlotter =
    std::function<void(const Frame& frame, const std::optional<image::Roi>& roi,
                       const std::vector<double>& sample_oscillation,
                       const std::vector<double>& ob_oscillation)>;

/**
 * Owns the sample, open-beam and dark-field stacks of one acquisition and
 * applies the corrections to them in place.
 *
 * Every destructive stage runs at most once unless forced; a repeated call
 * returns false without touching the data. Stages validate all of their
 * preconditions before mutating anything. Loading is refused once any stage
 * has run, so a fresh instance is needed to start over.
 */
class GratingInterferometer {
public:
    GratingInterferometer() = default;

    // Stage events are written as JSON lines to event_stream when it is set.
    GratingInterferometer(std::ostream* event_stream, std::string run_id);

    void set_load_options(const io::LoadOptions& options) { load_options_ = options; }
    void set_oscillation_plotter(OscillationPlotter plotter) { plotter_ = std::move(plotter); }

    // Load a single file and/or every image of a folder (sorted) into role.
    void load(const fs::path& file, const fs::path& folder, DatasetRole role);
    void load_file(const fs::path& file, DatasetRole role);
    void add_frame(Frame frame, const std::string& source_name, DatasetRole role);

    // sample -= mean(df), ob -= mean(df)
    bool df_correction(bool force = false);

    // Divide each sample and ob frame by its own mean over roi (whole frame
    // without roi).
    bool normalization(const std::optional<image::Roi>& roi = std::nullopt,
                       bool force = false);

    bool crop(const std::optional<image::Roi>& roi, bool force = false);

    // Mean of every sample and ob frame over roi. Always recomputed.
    void oscillation(const std::optional<image::Roi>& roi = std::nullopt, bool plot = false);

    bool binning(int bin_size, bool force = false);

    const InterferometryMaps& create_interferometry_images(double number_periods = 1.0);

    const image::ImageStack& stack(DatasetRole role) const;
    const std::vector<double>& oscillation_values(DatasetRole role) const;
    const std::optional<Frame>& averaged_df() const { return averaged_df_; }
    const ProcessStatus& status() const { return status_; }
    const std::optional<InterferometryMaps>& interferometry() const { return interferometry_; }

private:
    struct RoleData {
        image::ImageStack stack;
        Shape loaded_shape;  // as loaded, before crop/binning
        std::vector<double> oscillation;
    };

    RoleData& role_data(DatasetRole role);
    const RoleData& role_data(DatasetRole role) const;

    void require_not_processed() const;
    void require_sample_and_ob(const std::string& stage) const;
    void require_roi_fits(const image::Roi& roi) const;
    bool shapes_match() const;
    const Frame& averaged_df_frame();

    void stage_start(Stage stage);
    void stage_end(Stage stage, const std::string& status,
                   const core::json& extra = core::json::object());
    void stage_failed(Stage stage, const std::exception& e);
    void warn(const std::string& message);

    RoleData sample_;
    RoleData ob_;
    RoleData df_;
    std::optional<Frame> averaged_df_;

    ProcessStatus status_;
    std::optional<InterferometryMaps> interferometry_;

    io::LoadOptions load_options_;
    OscillationPlotter plotter_;

    std::ostream* event_stream_ = nullptr;
    std::string run_id_;
    core::EventEmitter emitter_;
};

} // namespace grating_reduce::pipeline

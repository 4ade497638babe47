#include "grating_reduce/config/configuration.hpp"
#include "grating_reduce/core/errors.hpp"

#include <fstream>

namespace grating_reduce::config {

static std::optional<RoiBounds> read_roi(const YAML::Node& n, const std::string& where) {
    if (!n || n.IsNull()) {
        return std::nullopt;
    }
    if (!n.IsSequence() || n.size() != 4) {
        throw ConfigError(where + ".roi must be a sequence [x0, y0, x1, y1]");
    }
    return RoiBounds{n[0].as<int>(), n[1].as<int>(), n[2].as<int>(), n[3].as<int>()};
}

static void write_roi(YAML::Node n, const std::optional<RoiBounds>& roi) {
    if (!roi) return;
    YAML::Node seq;
    for (int v : *roi) seq.push_back(v);
    seq.SetStyle(YAML::EmitterStyle::Flow);
    n["roi"] = seq;
}

static void read_string_list(const YAML::Node& n, std::vector<std::string>& out) {
    if (n && n.IsSequence()) {
        out.clear();
        for (const auto& item : n) {
            out.push_back(item.as<std::string>());
        }
    }
}

static void check_roi(const std::optional<RoiBounds>& roi, const std::string& where) {
    if (!roi) return;
    const auto& r = *roi;
    if (r[0] < 0 || r[1] < 0) {
        throw ValidationError(where + ".roi must not have negative coordinates");
    }
    if (r[2] < r[0] || r[3] < r[1]) {
        throw ValidationError(where + ".roi must satisfy x0 <= x1 and y0 <= y1");
    }
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["input"]) {
            auto i = node["input"];
            if (i["sample_dir"]) cfg.input.sample_dir = i["sample_dir"].as<std::string>();
            if (i["ob_dir"]) cfg.input.ob_dir = i["ob_dir"].as<std::string>();
            if (i["df_dir"]) cfg.input.df_dir = i["df_dir"].as<std::string>();
            read_string_list(i["sample_files"], cfg.input.sample_files);
            read_string_list(i["ob_files"], cfg.input.ob_files);
            read_string_list(i["df_files"], cfg.input.df_files);
            if (i["hdf5_dataset"]) cfg.input.hdf5_dataset = i["hdf5_dataset"].as<std::string>();
        }

        if (node["corrections"]) {
            auto c = node["corrections"];
            if (c["df_correction"]) cfg.corrections.df_correction = c["df_correction"].as<bool>();

            if (c["normalization"]) {
                auto n = c["normalization"];
                if (n["enabled"]) cfg.corrections.normalization.enabled = n["enabled"].as<bool>();
                cfg.corrections.normalization.roi = read_roi(n["roi"], "corrections.normalization");
            }
            if (c["crop"]) {
                auto n = c["crop"];
                if (n["enabled"]) cfg.corrections.crop.enabled = n["enabled"].as<bool>();
                cfg.corrections.crop.roi = read_roi(n["roi"], "corrections.crop");
            }
            if (c["binning"]) {
                auto n = c["binning"];
                if (n["enabled"]) cfg.corrections.binning.enabled = n["enabled"].as<bool>();
                if (n["size"]) cfg.corrections.binning.size = n["size"].as<int>();
            }
            if (c["oscillation"]) {
                auto n = c["oscillation"];
                if (n["enabled"]) cfg.corrections.oscillation.enabled = n["enabled"].as<bool>();
                cfg.corrections.oscillation.roi = read_roi(n["roi"], "corrections.oscillation");
                if (n["plot"]) cfg.corrections.oscillation.plot = n["plot"].as<bool>();
            }
        }

        if (node["reduction"]) {
            auto r = node["reduction"];
            if (r["number_periods"]) cfg.reduction.number_periods = r["number_periods"].as<double>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["dir"]) cfg.output.dir = o["dir"].as<std::string>();
            if (o["write_transmission"]) cfg.output.write_transmission = o["write_transmission"].as<bool>();
            if (o["write_diff_phase_contrast"]) {
                cfg.output.write_diff_phase_contrast = o["write_diff_phase_contrast"].as<bool>();
            }
            if (o["write_dark_field"]) cfg.output.write_dark_field = o["write_dark_field"].as<bool>();
            if (o["write_visibility_map"]) cfg.output.write_visibility_map = o["write_visibility_map"].as<bool>();
            if (o["write_oscillation"]) cfg.output.write_oscillation = o["write_oscillation"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["input"]["sample_dir"] = input.sample_dir;
    node["input"]["ob_dir"] = input.ob_dir;
    node["input"]["df_dir"] = input.df_dir;
    node["input"]["sample_files"] = input.sample_files;
    node["input"]["ob_files"] = input.ob_files;
    node["input"]["df_files"] = input.df_files;
    node["input"]["hdf5_dataset"] = input.hdf5_dataset;

    node["corrections"]["df_correction"] = corrections.df_correction;
    node["corrections"]["normalization"]["enabled"] = corrections.normalization.enabled;
    write_roi(node["corrections"]["normalization"], corrections.normalization.roi);
    node["corrections"]["crop"]["enabled"] = corrections.crop.enabled;
    write_roi(node["corrections"]["crop"], corrections.crop.roi);
    node["corrections"]["binning"]["enabled"] = corrections.binning.enabled;
    node["corrections"]["binning"]["size"] = corrections.binning.size;
    node["corrections"]["oscillation"]["enabled"] = corrections.oscillation.enabled;
    write_roi(node["corrections"]["oscillation"], corrections.oscillation.roi);
    node["corrections"]["oscillation"]["plot"] = corrections.oscillation.plot;

    node["reduction"]["number_periods"] = reduction.number_periods;

    node["output"]["dir"] = output.dir;
    node["output"]["write_transmission"] = output.write_transmission;
    node["output"]["write_diff_phase_contrast"] = output.write_diff_phase_contrast;
    node["output"]["write_dark_field"] = output.write_dark_field;
    node["output"]["write_visibility_map"] = output.write_visibility_map;
    node["output"]["write_oscillation"] = output.write_oscillation;

    return node;
}

void Config::validate() const {
    if (input.sample_dir.empty() && input.sample_files.empty()) {
        throw ValidationError("input.sample_dir or input.sample_files is required");
    }
    if (input.ob_dir.empty() && input.ob_files.empty()) {
        throw ValidationError("input.ob_dir or input.ob_files is required");
    }
    if (input.hdf5_dataset.empty()) {
        throw ValidationError("input.hdf5_dataset must not be empty");
    }

    check_roi(corrections.normalization.roi, "corrections.normalization");
    check_roi(corrections.crop.roi, "corrections.crop");
    check_roi(corrections.oscillation.roi, "corrections.oscillation");

    if (corrections.crop.enabled && !corrections.crop.roi) {
        throw ValidationError("corrections.crop.roi is required when crop is enabled");
    }
    if (corrections.binning.size < 1) {
        throw ValidationError("corrections.binning.size must be >= 1");
    }
    if (!(reduction.number_periods > 0.0)) {
        throw ValidationError("reduction.number_periods must be > 0");
    }
    if (output.dir.empty()) {
        throw ValidationError("output.dir must not be empty");
    }
}

} // namespace grating_reduce::config

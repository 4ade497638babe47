#pragma once

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace grating_reduce::config {

namespace fs = std::filesystem;

// Inclusive rectangle as [x0, y0, x1, y1]
using RoiBounds = std::array<int, 4>;

struct InputConfig {
  std::string sample_dir;
  std::string ob_dir;
  std::string df_dir;
  std::vector<std::string> sample_files;
  std::vector<std::string> ob_files;
  std::vector<std::string> df_files;
  std::string hdf5_dataset = "/entry/instrument/detector/data";
};

struct NormalizationConfig {
  bool enabled = true;
  std::optional<RoiBounds> roi;
};

struct CropConfig {
  bool enabled = false;
  std::optional<RoiBounds> roi;
};

struct BinningConfig {
  bool enabled = false;
  int size = 2;
};

struct OscillationConfig {
  bool enabled = true;
  std::optional<RoiBounds> roi;
  bool plot = false;
};

struct CorrectionsConfig {
  bool df_correction = true;
  NormalizationConfig normalization;
  CropConfig crop;
  BinningConfig binning;
  OscillationConfig oscillation;
};

struct ReductionConfig {
  double number_periods = 1.0; // number (or fraction) of stepped grating periods
};

struct OutputConfig {
  std::string dir = "grating_out";
  bool write_transmission = true;
  bool write_diff_phase_contrast = true;
  bool write_dark_field = true;
  bool write_visibility_map = true;
  bool write_oscillation = true;
};

struct Config {
  InputConfig input;
  CorrectionsConfig corrections;
  ReductionConfig reduction;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

} // namespace grating_reduce::config

#include "grating_reduce/config/configuration.hpp"
#include "grating_reduce/core/errors.hpp"
#include "grating_reduce/core/events.hpp"
#include "grating_reduce/core/types.hpp"
#include "grating_reduce/core/utils.hpp"
#include "grating_reduce/image/roi.hpp"
#include "grating_reduce/io/fits_io.hpp"
#include "grating_reduce/io/image_io.hpp"
#include "grating_reduce/io/oscillation_plot.hpp"
#include "grating_reduce/pipeline/grating_interferometer.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using grating_reduce::DatasetRole;
using grating_reduce::Frame;
using grating_reduce::Stage;
using json = nlohmann::json;

namespace config = grating_reduce::config;
namespace core = grating_reduce::core;
namespace image = grating_reduce::image;
namespace io = grating_reduce::io;
namespace pipeline = grating_reduce::pipeline;

class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

protected:
  int overflow(int c) override {
    if (c == EOF)
      return EOF;
    const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
    const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
    return (ra == EOF || rb == EOF) ? EOF : c;
  }

  int sync() override {
    int ra = a_ ? a_->pubsync() : 0;
    int rb = b_ ? b_->pubsync() : 0;
    return (ra == 0 && rb == 0) ? 0 : -1;
  }

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

std::optional<image::Roi> to_roi(const std::optional<config::RoiBounds> &b) {
  if (!b)
    return std::nullopt;
  return image::Roi((*b)[0], (*b)[1], (*b)[2], (*b)[3]);
}

struct RoleInputs {
  DatasetRole role;
  std::string dir;
  std::vector<std::string> files;
};

std::vector<RoleInputs> role_inputs(const config::Config &cfg) {
  return {{DatasetRole::SAMPLE, cfg.input.sample_dir, cfg.input.sample_files},
          {DatasetRole::OB, cfg.input.ob_dir, cfg.input.ob_files},
          {DatasetRole::DF, cfg.input.df_dir, cfg.input.df_files}};
}

void write_map(const fs::path &path, const Frame &map, const std::string &name,
               const std::string &run_id, double number_periods) {
  io::FitsHeader header;
  header.set("MAPTYPE", name);
  header.set("RUNID", run_id);
  header.set("NPERIODS", number_periods);
  io::write_fits(path, map, header);
  std::cout << "[WRITE_OUTPUT] " << name << " -> " << path.string()
            << std::endl;
}

int run_command(const std::string &config_path, const std::string &output_dir,
                bool dry_run) {
  config::Config cfg;
  try {
    cfg = config::Config::load(config_path);
    if (!output_dir.empty()) {
      cfg.output.dir = output_dir;
    }
    cfg.validate();
  } catch (const grating_reduce::GratingReduceError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  const std::string run_id = core::get_run_id();
  const fs::path out_dir(cfg.output.dir);
  try {
    fs::create_directories(out_dir);
    cfg.save(out_dir / "config.yaml");
  } catch (const grating_reduce::GratingReduceError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const fs::filesystem_error &e) {
    std::cerr << "Error: cannot create output directory: " << e.what()
              << std::endl;
    return 1;
  }

  std::ofstream event_log_file(out_dir / "events.jsonl");
  TeeBuf tee_buf(std::cout.rdbuf(), event_log_file.rdbuf());
  std::ostream log_file(&tee_buf);

  core::EventEmitter emitter;
  emitter.run_start(run_id,
                    {{"config_path", config_path},
                     {"output_dir", out_dir.string()},
                     {"dry_run", dry_run}},
                    log_file);

  std::cout << "Run ID: " << run_id << std::endl;
  std::cout << "Output: " << out_dir.string() << std::endl;

  try {
    pipeline::GratingInterferometer gi(&log_file, run_id);
    io::LoadOptions load_options;
    load_options.hdf5_dataset = cfg.input.hdf5_dataset;
    gi.set_load_options(load_options);

    const fs::path plot_path = out_dir / "oscillation.png";
    gi.set_oscillation_plotter(
        [&plot_path](const Frame &frame, const std::optional<image::Roi> &roi,
                     const std::vector<double> &sample_osc,
                     const std::vector<double> &ob_osc) {
          io::render_oscillation_plot(plot_path, frame, roi, sample_osc, ob_osc);
        });

    emitter.stage_start(run_id, Stage::LOAD, log_file);
    for (const auto &in : role_inputs(cfg)) {
      if (dry_run) {
        size_t n = in.files.size();
        if (!in.dir.empty())
          n += io::list_images(in.dir).size();
        std::cout << "[LOAD] " << grating_reduce::dataset_role_to_string(in.role)
                  << ": " << n << " files" << std::endl;
        continue;
      }
      if (!in.dir.empty()) {
        gi.load("", in.dir, in.role);
      }
      for (const auto &f : in.files) {
        gi.load(f, "", in.role);
      }
      std::cout << "[LOAD] " << grating_reduce::dataset_role_to_string(in.role)
                << ": " << gi.stack(in.role).size() << " frames ("
                << grating_reduce::shape_to_string(gi.stack(in.role).shape())
                << ")" << std::endl;
    }
    emitter.stage_end(run_id, Stage::LOAD, dry_run ? "skipped" : "ok",
                      {{"sample", gi.stack(DatasetRole::SAMPLE).size()},
                       {"ob", gi.stack(DatasetRole::OB).size()},
                       {"df", gi.stack(DatasetRole::DF).size()}},
                      log_file);

    if (dry_run) {
      std::cout << "Dry run - no processing" << std::endl;
      emitter.run_end(run_id, true, "dry_run", log_file);
      return 0;
    }

    const auto &corr = cfg.corrections;
    if (corr.df_correction) {
      gi.df_correction();
    }
    if (corr.normalization.enabled) {
      gi.normalization(to_roi(corr.normalization.roi));
    }
    if (corr.crop.enabled) {
      gi.crop(to_roi(corr.crop.roi));
    }
    if (corr.binning.enabled) {
      gi.binning(corr.binning.size);
    }
    if (corr.oscillation.enabled) {
      gi.oscillation(to_roi(corr.oscillation.roi), corr.oscillation.plot);
    }

    const auto &maps =
        gi.create_interferometry_images(cfg.reduction.number_periods);

    emitter.stage_start(run_id, Stage::WRITE_OUTPUT, log_file);
    const double np = cfg.reduction.number_periods;
    if (cfg.output.write_transmission)
      write_map(out_dir / "transmission.fits", maps.transmission,
                "transmission", run_id, np);
    if (cfg.output.write_diff_phase_contrast)
      write_map(out_dir / "diff_phase_contrast.fits", maps.diff_phase_contrast,
                "diff_phase_contrast", run_id, np);
    if (cfg.output.write_dark_field)
      write_map(out_dir / "dark_field.fits", maps.dark_field, "dark_field",
                run_id, np);
    if (cfg.output.write_visibility_map)
      write_map(out_dir / "visibility_map.fits", maps.visibility_map,
                "visibility_map", run_id, np);
    if (cfg.output.write_oscillation && gi.status().oscillation) {
      json osc = {{"sample", gi.oscillation_values(DatasetRole::SAMPLE)},
                  {"ob", gi.oscillation_values(DatasetRole::OB)},
                  {"sample_files",
                   gi.stack(DatasetRole::SAMPLE).source_names()},
                  {"ob_files", gi.stack(DatasetRole::OB).source_names()}};
      core::write_text(out_dir / "oscillation.json", osc.dump(2));
    }
    emitter.stage_end(run_id, Stage::WRITE_OUTPUT, "ok",
                      {{"output_dir", out_dir.string()}}, log_file);
  } catch (const grating_reduce::GratingReduceError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    emitter.error(run_id, e.what(), log_file);
    emitter.run_end(run_id, false, "error", log_file);
    return 1;
  } catch (const fs::filesystem_error &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    emitter.error(run_id, e.what(), log_file);
    emitter.run_end(run_id, false, "error", log_file);
    return 1;
  }

  emitter.run_end(run_id, true, "ok", log_file);
  return 0;
}

int validate_config_command(const std::string &config_path) {
  try {
    config::Config cfg = config::Config::load(config_path);
    cfg.validate();
    YAML::Emitter yaml_out;
    yaml_out << cfg.to_yaml();
    std::cout << yaml_out.c_str() << std::endl;
    std::cout << json({{"valid", true}, {"config_path", config_path}}).dump()
              << std::endl;
    return 0;
  } catch (const grating_reduce::GratingReduceError &e) {
    std::cout << json({{"valid", false},
                       {"config_path", config_path},
                       {"error", e.what()}})
                     .dump()
              << std::endl;
    return 1;
  }
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"Grating interferometry reduction runner"};

  std::string config_path, output_dir;
  bool dry_run = false;

  auto run_cmd = app.add_subcommand("run", "Run corrections and reduction");
  run_cmd->add_option("--config", config_path, "Path to config.yaml")
      ->required();
  run_cmd->add_option("--output-dir", output_dir,
                      "Output directory (overrides output.dir)");
  run_cmd->add_flag("--dry-run", dry_run, "List inputs without processing");

  auto validate_cmd =
      app.add_subcommand("validate-config", "Load and validate a config file");
  validate_cmd->add_option("--config", config_path, "Path to config.yaml")
      ->required();

  app.require_subcommand(1);

  CLI11_PARSE(app, argc, argv);

  if (run_cmd->parsed()) {
    return run_command(config_path, output_dir, dry_run);
  }
  if (validate_cmd->parsed()) {
    return validate_config_command(config_path);
  }
  return 1;
}

#pragma once
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "mandelgrid/core.hpp"
#include "mandelgrid/render.hpp"

namespace mandelgrid {

struct RunConfig {
  Params params = default_cli_params();
  std::string out_prefix = "mandelbrot";
  std::vector<Colormap> colormaps{Colormap::hot, Colormap::viridis,
                                  Colormap::twilight};
  std::optional<std::string> csv_path{};
  int threads = 0; // 0 = hardware concurrency
  std::string log_level = "info";
  bool show_help = false;
  std::optional<std::string> config_path{};

  static Params default_cli_params() {
    Params p;
    p.width = 1024;
    p.height = 1024;
    return p;
  }
};

// Load defaults from a .json, .toml, .yaml/.yml or .xml file into cfg.
// Throws std::runtime_error on I/O, parse or extension errors.
void apply_config_file(const std::string &path, RunConfig &cfg);

// Parse command line: --config first, then flags override it. Validates
// the result. Throws std::runtime_error (or InvalidArgument) on bad input.
RunConfig parse_args(int argc, const char *const *argv);

// Comma-separated colormap names, e.g. "hot,viridis".
std::vector<Colormap> parse_colormap_list(const std::string &list);

void print_help(std::ostream &os, const char *argv0);

} // namespace mandelgrid

#include "mandelgrid/config.hpp"
#include "mandelgrid/core.hpp"
#include "mandelgrid/render.hpp"

#include <chrono>
#include <exception>
#include <iostream>

#include <spdlog/spdlog.h>

int main(int argc, char **argv) {
  try {
    auto args = mandelgrid::parse_args(argc, argv);
    if (args.show_help) {
      mandelgrid::print_help(std::cout, argv[0]);
      return 0;
    }
    spdlog::set_level(spdlog::level::from_str(args.log_level));

    const auto &p = args.params;
    spdlog::info("Computing Mandelbrot grid {}x{} (max_iter={}) ...", p.width,
                 p.height, p.max_iter);
    const auto t0 = std::chrono::steady_clock::now();
    const auto grid =
        mandelgrid::mandelbrot_grid(p, static_cast<unsigned>(args.threads));
    const std::chrono::duration<double> elapsed =
        std::chrono::steady_clock::now() - t0;
    spdlog::info("Computation took {:.3f} seconds", elapsed.count());
    spdlog::info("Grid size: {}x{}, max iteration in grid: {}", grid.height(),
                 grid.width(), mandelgrid::max_iteration(grid));

    if (args.csv_path) {
      mandelgrid::write_csv(*args.csv_path, grid, p);
      spdlog::info("Wrote {}", *args.csv_path);
    }
    for (auto cmap : args.colormaps) {
      const auto path = mandelgrid::image_filename(args.out_prefix, cmap);
      mandelgrid::write_png(path, mandelgrid::render(grid, cmap));
      spdlog::info("Wrote {}", path);
    }
    return 0;
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    std::cerr << "Use --help for usage.\n";
    return 1;
  }
}

#include "mandelgrid/core.hpp"
#include <algorithm>
#include <fstream>
#include <functional>
#include <iomanip>
#include <limits>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace mandelgrid {

namespace {

// Inner loop shared by the checked entry point and the grid evaluators.
int escape_count(double cx, double cy, int max_iter) {
  double zr = 0.0, zi = 0.0;
  for (int n = 0; n < max_iter; ++n) {
    const double zr2 = zr * zr - zi * zi + cx;
    const double zi2 = 2.0 * zr * zi + cy;
    zr = zr2;
    zi = zi2;
    if (zr * zr + zi * zi > 4.0)
      return n;
  }
  return max_iter;
}

void check_max_iter(int max_iter) {
  if (max_iter < 0)
    throw InvalidArgument("max_iter must be >= 0, got " +
                          std::to_string(max_iter));
}

void fill_rows(IterationGrid &grid, const std::vector<double> &xs,
               const std::vector<double> &ys, int max_iter, int row_begin,
               int row_end) {
  for (int j = row_begin; j < row_end; ++j) {
    int *out = grid.row(j);
    const double cy = ys[static_cast<std::size_t>(j)];
    for (int i = 0; i < grid.width(); ++i)
      out[i] = escape_count(xs[static_cast<std::size_t>(i)], cy, max_iter);
  }
}

} // namespace

IterationGrid::IterationGrid(int height, int width)
    : height_(height), width_(width) {
  if (height < 1 || width < 1)
    throw InvalidArgument("grid dimensions must be positive, got " +
                          std::to_string(height) + "x" +
                          std::to_string(width));
  cells_.assign(static_cast<std::size_t>(height) *
                    static_cast<std::size_t>(width),
                0);
}

std::vector<double> sample_axis(double start, double stop, int count) {
  if (count < 1)
    throw InvalidArgument("sample count must be >= 1, got " +
                          std::to_string(count));
  if (count == 1)
    return {start};

  const double step = (stop - start) / static_cast<double>(count - 1);
  std::vector<double> axis;
  axis.reserve(static_cast<std::size_t>(count));
  for (int i = 0; i < count; ++i)
    axis.push_back(start + static_cast<double>(i) * step);
  return axis;
}

int escape_iterations(std::complex<double> c, int max_iter) {
  check_max_iter(max_iter);
  return escape_count(c.real(), c.imag(), max_iter);
}

IterationGrid mandelbrot_grid(const Params &p) {
  const auto xs = sample_axis(p.xmin, p.xmax, p.width);
  const auto ys = sample_axis(p.ymin, p.ymax, p.height);
  check_max_iter(p.max_iter);

  IterationGrid grid(p.height, p.width);
  fill_rows(grid, xs, ys, p.max_iter, 0, p.height);
  return grid;
}

IterationGrid mandelbrot_grid(const Params &p, unsigned threads) {
  const auto xs = sample_axis(p.xmin, p.xmax, p.width);
  const auto ys = sample_axis(p.ymin, p.ymax, p.height);
  check_max_iter(p.max_iter);

  if (threads == 0)
    threads = std::max(1u, std::thread::hardware_concurrency());
  const int workers =
      static_cast<int>(std::min<unsigned>(threads, static_cast<unsigned>(
                                                       p.height)));

  IterationGrid grid(p.height, p.width);
  if (workers == 1) {
    fill_rows(grid, xs, ys, p.max_iter, 0, p.height);
    return grid;
  }

  // Contiguous row slices; the first (height % workers) slices get one
  // extra row.
  const int base = p.height / workers;
  const int extra = p.height % workers;
  std::vector<std::thread> pool;
  pool.reserve(static_cast<std::size_t>(workers));
  int begin = 0;
  try {
    for (int w = 0; w < workers; ++w) {
      const int end = begin + base + (w < extra ? 1 : 0);
      pool.emplace_back(fill_rows, std::ref(grid), std::cref(xs),
                        std::cref(ys), p.max_iter, begin, end);
      begin = end;
    }
  } catch (...) {
    // Joinable threads must not be destroyed; wait for the started ones.
    for (auto &t : pool)
      t.join();
    throw;
  }
  for (auto &t : pool)
    t.join();
  return grid;
}

int max_iteration(const IterationGrid &grid) {
  return *std::max_element(grid.cells().begin(), grid.cells().end());
}

void write_csv(const std::string &path, const IterationGrid &grid,
               const Params &p) {
  const auto xs = sample_axis(p.xmin, p.xmax, grid.width());
  const auto ys = sample_axis(p.ymin, p.ymax, grid.height());

  std::ofstream ofs(path, std::ios::out | std::ios::trunc);
  if (!ofs) {
    throw std::runtime_error("Failed to open CSV for writing: " + path);
  }
  // Enough digits for the coordinates to read back exactly.
  ofs << std::setprecision(std::numeric_limits<double>::max_digits10);
  ofs << "row,col,re,im,iterations\n";
  for (int j = 0; j < grid.height(); ++j) {
    for (int i = 0; i < grid.width(); ++i) {
      ofs << j << ',' << i << ',' << xs[static_cast<std::size_t>(i)] << ','
          << ys[static_cast<std::size_t>(j)] << ',' << grid(j, i) << '\n';
    }
  }
  if (!ofs) {
    throw std::runtime_error("I/O error while writing CSV: " + path);
  }
}

} // namespace mandelgrid

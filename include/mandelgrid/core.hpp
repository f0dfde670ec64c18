#pragma once
#include <complex>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace mandelgrid {

// Raised for out-of-range arguments (sample counts, iteration budgets,
// unknown colormap names).
class InvalidArgument : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

struct Params {
  double xmin = -2.0;
  double xmax = 1.0;
  double ymin = -1.5;
  double ymax = 1.5;
  int width = 100;
  int height = 100;
  int max_iter = 80;
};

// Row-major height x width grid of escape counts. Row j corresponds to the
// imaginary-axis sample ys[j], column i to the real-axis sample xs[i].
class IterationGrid {
public:
  IterationGrid(int height, int width);

  int height() const { return height_; }
  int width() const { return width_; }

  int operator()(int row, int col) const {
    return cells_[index(row, col)];
  }
  int &operator()(int row, int col) { return cells_[index(row, col)]; }

  // Pointer to the first cell of a row; cells are contiguous per row.
  const int *row(int r) const { return cells_.data() + index(r, 0); }
  int *row(int r) { return cells_.data() + index(r, 0); }

  const std::vector<int> &cells() const { return cells_; }

  bool operator==(const IterationGrid &other) const {
    return height_ == other.height_ && width_ == other.width_ &&
           cells_ == other.cells_;
  }
  bool operator!=(const IterationGrid &other) const {
    return !(*this == other);
  }

private:
  std::size_t index(int row, int col) const {
    return static_cast<std::size_t>(row) * static_cast<std::size_t>(width_) +
           static_cast<std::size_t>(col);
  }

  int height_;
  int width_;
  std::vector<int> cells_;
};

// Return count evenly spaced values from start to stop inclusive. For
// count == 1 the single value is start.
// Throws InvalidArgument if count < 1.
std::vector<double> sample_axis(double start, double stop, int count);

// Number of iterations of z_{n+1} = z_n^2 + c (z0 = 0) before |z|^2 > 4,
// or max_iter if the point never escapes.
// Throws InvalidArgument if max_iter < 0.
int escape_iterations(std::complex<double> c, int max_iter);

// Evaluate every sample of the grid described by p. Deterministic,
// single-threaded.
IterationGrid mandelbrot_grid(const Params &p);

// Same result as the single-threaded overload, with rows split into
// contiguous slices across worker threads. threads == 0 picks the hardware
// concurrency.
IterationGrid mandelbrot_grid(const Params &p, unsigned threads);

// Largest value in the grid.
int max_iteration(const IterationGrid &grid);

// Write the grid to CSV path with header: row,col,re,im,iterations
// Throws on file I/O errors.
void write_csv(const std::string &path, const IterationGrid &grid,
               const Params &p);

} // namespace mandelgrid

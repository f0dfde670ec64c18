#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "mandelgrid/core.hpp"

namespace mandelgrid {

enum class Colormap { hot, viridis, twilight };

struct Rgb {
  std::uint8_t r;
  std::uint8_t g;
  std::uint8_t b;

  bool operator==(const Rgb &o) const {
    return r == o.r && g == o.g && b == o.b;
  }
  bool operator!=(const Rgb &o) const { return !(*this == o); }
};

// 8-bit RGB raster, row 0 at the top.
struct Image {
  int width = 0;
  int height = 0;
  std::vector<std::uint8_t> pixels; // width * height * 3

  Rgb at(int x, int y) const {
    const std::size_t i = (static_cast<std::size_t>(y) *
                               static_cast<std::size_t>(width) +
                           static_cast<std::size_t>(x)) *
                          3;
    return Rgb{pixels[i], pixels[i + 1], pixels[i + 2]};
  }
};

// Case-insensitive lookup; throws InvalidArgument for unknown names.
Colormap colormap_from_name(std::string_view name);
const char *colormap_name(Colormap cmap);

// Color at position t in [0, 1]; t outside the range is clamped.
Rgb sample_colormap(Colormap cmap, double t);

// Map grid values linearly from [min, max] of the grid onto the colormap.
// The image uses lower-origin orientation: the bottom image row shows grid
// row 0 (ymin).
Image render(const IterationGrid &grid, Colormap cmap);

// Write an 8-bit RGB PNG. Throws std::runtime_error on failure.
void write_png(const std::string &path, const Image &image);

// "<prefix>_<colormap>.png"
std::string image_filename(const std::string &prefix, Colormap cmap);

} // namespace mandelgrid

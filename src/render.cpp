#include "mandelgrid/render.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>

#include <png.h>
#include <spdlog/spdlog.h>

namespace mandelgrid {

namespace {

struct Anchor {
  double t;
  Rgb color;
};

// Sampled from the matplotlib tables of the same name.
constexpr std::array<Anchor, 5> kViridis{{
    {0.00, {68, 1, 84}},
    {0.25, {59, 82, 139}},
    {0.50, {33, 145, 140}},
    {0.75, {94, 201, 98}},
    {1.00, {253, 231, 37}},
}};

// Cyclic: both ends share the same color.
constexpr std::array<Anchor, 7> kTwilight{{
    {0.000, {226, 217, 226}},
    {0.167, {134, 164, 195}},
    {0.333, {94, 87, 171}},
    {0.500, {47, 20, 54}},
    {0.667, {150, 60, 82}},
    {0.833, {200, 142, 121}},
    {1.000, {226, 217, 226}},
}};

std::uint8_t to_byte(double v) {
  return static_cast<std::uint8_t>(
      std::lround(std::clamp(v, 0.0, 1.0) * 255.0));
}

template <std::size_t N>
Rgb interpolate(const std::array<Anchor, N> &table, double t) {
  for (std::size_t k = 1; k < N; ++k) {
    if (t <= table[k].t) {
      const Anchor &lo = table[k - 1];
      const Anchor &hi = table[k];
      const double f = (t - lo.t) / (hi.t - lo.t);
      auto mix = [f](std::uint8_t a, std::uint8_t b) {
        return static_cast<std::uint8_t>(
            std::lround(a + f * (static_cast<double>(b) - a)));
      };
      return Rgb{mix(lo.color.r, hi.color.r), mix(lo.color.g, hi.color.g),
                 mix(lo.color.b, hi.color.b)};
    }
  }
  return table[N - 1].color;
}

// Black -> red -> yellow -> white.
Rgb hot(double t) {
  return Rgb{to_byte(t / 0.375), to_byte((t - 0.375) / 0.375),
             to_byte((t - 0.75) / 0.25)};
}

std::string to_lower(std::string_view s) {
  std::string out(s);
  for (char &c : out)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

// libpng reports fatal errors through this callback; the message is kept in
// the error pointer and control returns to the setjmp in emit_png().
void png_error_fn(png_structp png, png_const_charp msg) {
  if (auto *out = static_cast<std::string *>(png_get_error_ptr(png)))
    *out = msg;
  png_longjmp(png, 1);
}

void png_warning_fn(png_structp, png_const_charp msg) {
  spdlog::warn("libpng: {}", msg);
}

struct PngWriteStruct {
  png_structp png = nullptr;
  png_infop info = nullptr;

  ~PngWriteStruct() {
    if (png)
      png_destroy_write_struct(&png, info ? &info : nullptr);
  }
};

// Deletes a partially written output file unless released.
struct PartialFile {
  std::string path;
  bool armed = false;

  ~PartialFile() {
    if (armed)
      std::remove(path.c_str());
  }
};

// No objects with destructors may live in this frame: a libpng error
// longjmps back to the setjmp below.
bool emit_png(png_structp png, png_infop info, std::FILE *fp,
              const Image &image, png_bytepp rows) {
  if (setjmp(png_jmpbuf(png)))
    return false;
  png_init_io(png, fp);
  png_set_IHDR(png, info, static_cast<png_uint_32>(image.width),
               static_cast<png_uint_32>(image.height), 8, PNG_COLOR_TYPE_RGB,
               PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT,
               PNG_FILTER_TYPE_DEFAULT);
  png_write_info(png, info);
  png_write_image(png, rows);
  png_write_end(png, nullptr);
  return true;
}

} // namespace

Colormap colormap_from_name(std::string_view name) {
  const auto key = to_lower(name);
  if (key == "hot")
    return Colormap::hot;
  if (key == "viridis")
    return Colormap::viridis;
  if (key == "twilight")
    return Colormap::twilight;
  throw InvalidArgument("Unknown colormap: " + std::string(name) +
                        " (expected hot, viridis, twilight)");
}

const char *colormap_name(Colormap cmap) {
  switch (cmap) {
  case Colormap::hot:
    return "hot";
  case Colormap::viridis:
    return "viridis";
  case Colormap::twilight:
    return "twilight";
  }
  return "unknown";
}

Rgb sample_colormap(Colormap cmap, double t) {
  t = std::isnan(t) ? 0.0 : std::clamp(t, 0.0, 1.0);
  switch (cmap) {
  case Colormap::hot:
    return hot(t);
  case Colormap::viridis:
    return interpolate(kViridis, t);
  case Colormap::twilight:
    return interpolate(kTwilight, t);
  }
  return Rgb{0, 0, 0};
}

Image render(const IterationGrid &grid, Colormap cmap) {
  const auto [lo_it, hi_it] =
      std::minmax_element(grid.cells().begin(), grid.cells().end());
  const double lo = *lo_it;
  const double span = static_cast<double>(*hi_it) - lo;

  Image image;
  image.width = grid.width();
  image.height = grid.height();
  image.pixels.resize(static_cast<std::size_t>(image.width) *
                      static_cast<std::size_t>(image.height) * 3);

  for (int j = 0; j < grid.height(); ++j) {
    const int y = grid.height() - 1 - j;
    std::uint8_t *out = image.pixels.data() +
                        static_cast<std::size_t>(y) *
                            static_cast<std::size_t>(image.width) * 3;
    const int *in = grid.row(j);
    for (int i = 0; i < grid.width(); ++i) {
      const double t = span > 0.0 ? (in[i] - lo) / span : 0.0;
      const Rgb c = sample_colormap(cmap, t);
      *out++ = c.r;
      *out++ = c.g;
      *out++ = c.b;
    }
  }
  return image;
}

void write_png(const std::string &path, const Image &image) {
  if (image.width < 1 || image.height < 1 ||
      image.pixels.size() != static_cast<std::size_t>(image.width) *
                                 static_cast<std::size_t>(image.height) * 3)
    throw std::runtime_error("Invalid image buffer for PNG: " + path);

  // Declared before fp so the file is closed before it is removed.
  PartialFile partial{path};
  std::unique_ptr<std::FILE, int (*)(std::FILE *)> fp(
      std::fopen(path.c_str(), "wb"), &std::fclose);
  if (!fp)
    throw std::runtime_error("Failed to open PNG for writing: " + path);
  partial.armed = true;

  std::string error;
  PngWriteStruct s;
  s.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, &error,
                                  png_error_fn, png_warning_fn);
  if (!s.png)
    throw std::runtime_error("png_create_write_struct failed");
  s.info = png_create_info_struct(s.png);
  if (!s.info)
    throw std::runtime_error("png_create_info_struct failed");

  std::vector<png_bytep> rows(static_cast<std::size_t>(image.height));
  const std::size_t stride = static_cast<std::size_t>(image.width) * 3;
  for (std::size_t y = 0; y < rows.size(); ++y)
    rows[y] = const_cast<png_bytep>(image.pixels.data() + y * stride);

  if (!emit_png(s.png, s.info, fp.get(), image, rows.data()))
    throw std::runtime_error("PNG write error for " + path + ": " + error);
  if (std::fclose(fp.release()) != 0)
    throw std::runtime_error("I/O error while writing PNG: " + path);
  partial.armed = false;
  spdlog::debug("wrote {}x{} PNG to {}", image.width, image.height, path);
}

std::string image_filename(const std::string &prefix, Colormap cmap) {
  return prefix + "_" + colormap_name(cmap) + ".png";
}

} // namespace mandelgrid

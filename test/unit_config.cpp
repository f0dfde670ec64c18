#include <doctest/doctest.h>

#include "mandelgrid/config.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using mandelgrid::Colormap;
using mandelgrid::RunConfig;

namespace {

// Writes a config file into the temp directory and removes it on scope
// exit.
struct TempFile {
  std::string path;

  TempFile(const std::string &name, const std::string &contents)
      : path((std::filesystem::temp_directory_path() / name).string()) {
    std::ofstream out(path, std::ios::trunc);
    out << contents;
  }
  ~TempFile() { std::remove(path.c_str()); }
};

RunConfig parse(std::vector<const char *> args) {
  args.insert(args.begin(), "mandelgrid_cli");
  return mandelgrid::parse_args(static_cast<int>(args.size()), args.data());
}

} // namespace

TEST_CASE("parse_args: defaults") {
  const auto cfg = parse({});
  CHECK(cfg.params.xmin == -2.0);
  CHECK(cfg.params.xmax == 1.0);
  CHECK(cfg.params.ymin == -1.5);
  CHECK(cfg.params.ymax == 1.5);
  CHECK(cfg.params.width == 1024);
  CHECK(cfg.params.height == 1024);
  CHECK(cfg.params.max_iter == 80);
  CHECK(cfg.out_prefix == "mandelbrot");
  CHECK(cfg.colormaps == std::vector<Colormap>{Colormap::hot,
                                               Colormap::viridis,
                                               Colormap::twilight});
  CHECK_FALSE(cfg.csv_path);
  CHECK(cfg.threads == 0);
  CHECK_FALSE(cfg.show_help);
}

TEST_CASE("parse_args: flags in both forms") {
  const auto cfg =
      parse({"--xmin", "-0.8", "--xmax=-0.7", "--ymin=0.05", "--ymax", "0.15",
             "--width", "320", "--height=240", "--max-iter", "500",
             "--colormaps=viridis", "--out", "zoom", "--csv=grid.csv",
             "--threads", "4", "--log-level=WARN"});
  CHECK(cfg.params.xmin == doctest::Approx(-0.8));
  CHECK(cfg.params.xmax == doctest::Approx(-0.7));
  CHECK(cfg.params.ymin == doctest::Approx(0.05));
  CHECK(cfg.params.ymax == doctest::Approx(0.15));
  CHECK(cfg.params.width == 320);
  CHECK(cfg.params.height == 240);
  CHECK(cfg.params.max_iter == 500);
  CHECK(cfg.colormaps == std::vector<Colormap>{Colormap::viridis});
  CHECK(cfg.out_prefix == "zoom");
  REQUIRE(cfg.csv_path);
  CHECK(*cfg.csv_path == "grid.csv");
  CHECK(cfg.threads == 4);
  CHECK(cfg.log_level == "warn");
}

TEST_CASE("parse_args: help") {
  CHECK(parse({"-h"}).show_help);
  CHECK(parse({"--help"}).show_help);

  std::ostringstream os;
  mandelgrid::print_help(os, "mandelgrid_cli");
  CHECK(os.str().find("--max-iter") != std::string::npos);
}

TEST_CASE("parse_args: rejects bad input") {
  CHECK_THROWS_AS(parse({"--bogus"}), std::runtime_error);
  CHECK_THROWS_AS(parse({"--width"}), std::runtime_error);
  CHECK_THROWS_AS(parse({"--width", "abc"}), std::runtime_error);
  CHECK_THROWS_AS(parse({"--width=12px"}), std::runtime_error);
  CHECK_THROWS_AS(parse({"--xmin", "left"}), std::runtime_error);
  CHECK_THROWS_AS(parse({"--width", "0"}), std::runtime_error);
  CHECK_THROWS_AS(parse({"--height=-2"}), std::runtime_error);
  CHECK_THROWS_AS(parse({"--max-iter", "-1"}), std::runtime_error);
  CHECK_THROWS_AS(parse({"--threads", "-1"}), std::runtime_error);
  CHECK_THROWS_AS(parse({"--colormaps", ""}), std::runtime_error);
  CHECK_THROWS_AS(parse({"--log-level", "verbose"}), std::runtime_error);
  CHECK_THROWS_AS(parse({"--colormaps", "hot,jet"}),
                  mandelgrid::InvalidArgument);
}

TEST_CASE("parse_args: zero iteration budget is allowed") {
  CHECK(parse({"--max-iter=0"}).params.max_iter == 0);
}

TEST_CASE("parse_colormap_list") {
  CHECK(mandelgrid::parse_colormap_list(" hot , Twilight ") ==
        std::vector<Colormap>{Colormap::hot, Colormap::twilight});
  CHECK(mandelgrid::parse_colormap_list("viridis,,") ==
        std::vector<Colormap>{Colormap::viridis});
  CHECK(mandelgrid::parse_colormap_list("").empty());
}

TEST_CASE("config: JSON") {
  TempFile f("mandelgrid_unit.json",
             R"({"xmin": -1.0, "width": 64, "max-iter": 50,
                 "colormaps": "viridis", "csv": "out.csv"})");
  RunConfig cfg;
  mandelgrid::apply_config_file(f.path, cfg);
  CHECK(cfg.params.xmin == -1.0);
  CHECK(cfg.params.width == 64);
  CHECK(cfg.params.height == 1024);
  CHECK(cfg.params.max_iter == 50);
  CHECK(cfg.colormaps == std::vector<Colormap>{Colormap::viridis});
  REQUIRE(cfg.csv_path);
  CHECK(*cfg.csv_path == "out.csv");
}

TEST_CASE("config: TOML") {
  TempFile f("mandelgrid_unit.toml",
             "xmin = -1.0\nheight = 32\nmax_iter = 10\nout = \"run\"\n");
  RunConfig cfg;
  mandelgrid::apply_config_file(f.path, cfg);
  CHECK(cfg.params.xmin == -1.0);
  CHECK(cfg.params.height == 32);
  CHECK(cfg.params.max_iter == 10);
  CHECK(cfg.out_prefix == "run");
  CHECK(cfg.colormaps.size() == 3);
}

TEST_CASE("config: YAML") {
  TempFile f("mandelgrid_unit.yaml",
             "width: 16\nymax: 2.0\ncsv: grid.csv\nthreads: 2\n");
  RunConfig cfg;
  mandelgrid::apply_config_file(f.path, cfg);
  CHECK(cfg.params.width == 16);
  CHECK(cfg.params.ymax == 2.0);
  CHECK(cfg.threads == 2);
  REQUIRE(cfg.csv_path);
  CHECK(*cfg.csv_path == "grid.csv");
}

TEST_CASE("config: XML attributes and elements") {
  TempFile f("mandelgrid_unit.xml",
             "<config width=\"20\" ymin=\"-1.0\">"
             "<max_iter>7</max_iter><colormaps>twilight,hot</colormaps>"
             "</config>");
  RunConfig cfg;
  mandelgrid::apply_config_file(f.path, cfg);
  CHECK(cfg.params.width == 20);
  CHECK(cfg.params.ymin == -1.0);
  CHECK(cfg.params.max_iter == 7);
  CHECK(cfg.colormaps ==
        std::vector<Colormap>{Colormap::twilight, Colormap::hot});
  CHECK_FALSE(cfg.csv_path);
}

TEST_CASE("config: XML numbers tolerate surrounding whitespace") {
  TempFile f("mandelgrid_unit_ws.xml",
             "<config><max_iter>\n  12\n</max_iter></config>");
  RunConfig cfg;
  mandelgrid::apply_config_file(f.path, cfg);
  CHECK(cfg.params.max_iter == 12);
}

TEST_CASE("config: log level is case-insensitive in files") {
  TempFile f("mandelgrid_unit_level.yaml", "log_level: INFO\n");
  const auto path = f.path;
  const auto cfg = parse({"--config", path.c_str()});
  CHECK(cfg.log_level == "info");
}

TEST_CASE("config: flags override file values") {
  TempFile f("mandelgrid_unit_override.json",
             R"({"width": 64, "height": 48, "out": "from_file"})");
  const auto path = f.path;
  const auto cfg = parse({"--width=128", "--config", path.c_str()});
  CHECK(cfg.params.width == 128);
  CHECK(cfg.params.height == 48);
  CHECK(cfg.out_prefix == "from_file");
  REQUIRE(cfg.config_path);
  CHECK(*cfg.config_path == path);
}

TEST_CASE("config: errors") {
  RunConfig cfg;
  CHECK_THROWS_AS(mandelgrid::apply_config_file("settings.ini", cfg),
                  std::runtime_error);
  CHECK_THROWS_AS(mandelgrid::apply_config_file("no_extension", cfg),
                  std::runtime_error);
  CHECK_THROWS_AS(
      mandelgrid::apply_config_file("/nonexistent-dir/cfg.json", cfg),
      std::runtime_error);

  TempFile bad_json("mandelgrid_unit_bad.json", "{\"width\": ");
  CHECK_THROWS_AS(mandelgrid::apply_config_file(bad_json.path, cfg),
                  std::runtime_error);

  TempFile wrong_type("mandelgrid_unit_type.json", R"({"width": "wide"})");
  CHECK_THROWS_AS(mandelgrid::apply_config_file(wrong_type.path, cfg),
                  std::runtime_error);

  TempFile toml_type("mandelgrid_unit_type.toml", "max_iter = \"eighty\"\n");
  CHECK_THROWS_AS(mandelgrid::apply_config_file(toml_type.path, cfg),
                  std::runtime_error);

  TempFile toml_csv("mandelgrid_unit_csv.toml", "csv = 5\n");
  RunConfig csv_cfg;
  CHECK_THROWS_AS(mandelgrid::apply_config_file(toml_csv.path, csv_cfg),
                  std::runtime_error);
  CHECK_FALSE(csv_cfg.csv_path);

  TempFile xml_attr("mandelgrid_unit_attr.xml",
                    "<config max_iter=\"eighty\"/>");
  CHECK_THROWS_AS(mandelgrid::apply_config_file(xml_attr.path, cfg),
                  std::runtime_error);

  TempFile xml_child("mandelgrid_unit_child.xml",
                     "<config><threads>x</threads></config>");
  CHECK_THROWS_AS(mandelgrid::apply_config_file(xml_child.path, cfg),
                  std::runtime_error);

  TempFile xml_real("mandelgrid_unit_real.xml", "<config xmin=\"-1.5x\"/>");
  CHECK_THROWS_AS(mandelgrid::apply_config_file(xml_real.path, cfg),
                  std::runtime_error);

  TempFile bad_toml("mandelgrid_unit_bad.toml", "width = = 3\n");
  CHECK_THROWS_AS(mandelgrid::apply_config_file(bad_toml.path, cfg),
                  std::runtime_error);

  TempFile bad_xml("mandelgrid_unit_bad.xml", "<config width=\"3\"");
  CHECK_THROWS_AS(mandelgrid::apply_config_file(bad_xml.path, cfg),
                  std::runtime_error);

  TempFile list_yaml("mandelgrid_unit_list.yaml", "- 1\n- 2\n");
  CHECK_THROWS_AS(mandelgrid::apply_config_file(list_yaml.path, cfg),
                  std::runtime_error);
}

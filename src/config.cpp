#include "mandelgrid/config.hpp"

#include <cctype> // tolower
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <pugixml.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

using std::string;
using std::string_view;

namespace mandelgrid {

namespace {

bool starts_with(string_view s, string_view prefix) {
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

std::optional<string_view> value_for(string_view arg, string_view name) {
  if (starts_with(arg, name) && arg.size() > name.size() &&
      arg[name.size()] == '=')
    return arg.substr(name.size() + 1);
  return std::nullopt;
}

std::string to_lower(std::string s) {
  for (char &c : s)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

// Checked conversions shared by flags and XML text.
int parse_int(string_view sv, const char *name) {
  try {
    std::size_t used = 0;
    const int v = std::stoi(string(sv), &used);
    if (used != sv.size())
      throw std::invalid_argument("trailing characters");
    return v;
  } catch (const std::logic_error &) {
    throw std::runtime_error(string("Invalid integer for ") + name + ": " +
                             string(sv));
  }
}
double parse_double(string_view sv, const char *name) {
  try {
    std::size_t used = 0;
    const double v = std::stod(string(sv), &used);
    if (used != sv.size())
      throw std::invalid_argument("trailing characters");
    return v;
  } catch (const std::logic_error &) {
    throw std::runtime_error(string("Invalid floating value for ") + name +
                             ": " + string(sv));
  }
}

// Fields read from any config format. Colormaps arrive as a list string
// and are resolved once the file has been read.
template <class Setter>
void for_each_key(Setter &&set, RunConfig &a, std::optional<string> &cmaps,
                  std::optional<string> &csv) {
  set("xmin", "xmin", a.params.xmin);
  set("xmax", "xmax", a.params.xmax);
  set("ymin", "ymin", a.params.ymin);
  set("ymax", "ymax", a.params.ymax);
  set("width", "width", a.params.width);
  set("height", "height", a.params.height);
  set("max_iter", "max-iter", a.params.max_iter);
  set("threads", "threads", a.threads);
  set("out", "out", a.out_prefix);
  set("log_level", "log-level", a.log_level);
  string tmp;
  bool have = false;
  set.optional("colormaps", "colormaps", tmp, have);
  if (have)
    cmaps = tmp;
  have = false;
  set.optional("csv", "csv", tmp, have);
  if (have)
    csv = tmp;
}

void finish_config(RunConfig &a, const std::optional<string> &cmaps,
                   const std::optional<string> &csv) {
  if (cmaps)
    a.colormaps = parse_colormap_list(*cmaps);
  if (csv)
    a.csv_path = *csv;
  a.log_level = to_lower(a.log_level);
}

// ---------- JSON helpers ----------
struct JsonSetter {
  const nlohmann::json &j;

  template <class T>
  void operator()(const char *k1, const char *k2, T &dst) const {
    if (j.contains(k1))
      dst = j.at(k1).get<T>();
    else if (j.contains(k2))
      dst = j.at(k2).get<T>();
  }
  void optional(const char *k1, const char *k2, string &dst,
                bool &found) const {
    found = j.contains(k1) || j.contains(k2);
    (*this)(k1, k2, dst);
  }
};

void apply_json_config(const nlohmann::json &j, RunConfig &a) {
  if (!j.is_object())
    throw std::runtime_error("Config root must be a JSON object");
  std::optional<string> cmaps, csv;
  try {
    for_each_key(JsonSetter{j}, a, cmaps, csv);
  } catch (const nlohmann::json::exception &e) {
    throw std::runtime_error(string("JSON config error: ") + e.what());
  }
  finish_config(a, cmaps, csv);
}

nlohmann::json load_json_file(const string &path) {
  std::ifstream f(path);
  if (!f)
    throw std::runtime_error("Failed to open config: " + path);
  try {
    nlohmann::json j;
    f >> j;
    return j;
  } catch (const nlohmann::json::parse_error &e) {
    throw std::runtime_error(string("JSON parse error: ") + e.what());
  }
}

// ---------- TOML helpers ----------
struct TomlSetter {
  const toml::table &t;

  // A key that is present with the wrong type is an error, not a default.
  template <class T>
  void operator()(const char *k1, const char *k2, T &dst) const {
    for (const char *key : {k1, k2}) {
      auto node = t[key];
      if (!node)
        continue;
      if (auto v = node.template value<T>()) {
        dst = *v;
        return;
      }
      throw std::runtime_error(string("TOML config error: ") + key +
                               " has wrong type");
    }
  }
  void optional(const char *k1, const char *k2, string &dst,
                bool &found) const {
    found = t.contains(k1) || t.contains(k2);
    (*this)(k1, k2, dst);
  }
};

void apply_toml_config(const toml::table &t, RunConfig &a) {
  std::optional<string> cmaps, csv;
  for_each_key(TomlSetter{t}, a, cmaps, csv);
  finish_config(a, cmaps, csv);
}

toml::table load_toml_file(const string &path) {
  try {
    return toml::parse_file(path);
  } catch (const toml::parse_error &e) {
    throw std::runtime_error(string("TOML parse error: ") +
                             string(e.description()));
  }
}

// ---------- YAML helpers ----------
struct YamlSetter {
  const YAML::Node &n;

  template <class T>
  void operator()(const char *k1, const char *k2, T &dst) const {
    if (auto v = n[k1])
      dst = v.as<T>();
    else if (auto v2 = n[k2])
      dst = v2.as<T>();
  }
  void optional(const char *k1, const char *k2, string &dst,
                bool &found) const {
    found = n[k1] || n[k2];
    (*this)(k1, k2, dst);
  }
};

void apply_yaml_config(const YAML::Node &n, RunConfig &a) {
  if (!n || !n.IsMap())
    throw std::runtime_error("YAML config root must be a mapping/object");
  std::optional<string> cmaps, csv;
  try {
    for_each_key(YamlSetter{n}, a, cmaps, csv);
  } catch (const YAML::BadConversion &e) {
    throw std::runtime_error(string("YAML config error: ") + e.what());
  }
  finish_config(a, cmaps, csv);
}

YAML::Node load_yaml_file(const string &path) {
  try {
    return YAML::LoadFile(path);
  } catch (const YAML::ParserException &e) {
    throw std::runtime_error(string("YAML parse error: ") + e.what());
  } catch (const YAML::BadFile &e) {
    throw std::runtime_error(string("YAML file error: ") + e.what());
  }
}

// ---------- XML helpers (pugixml) ----------
inline pugi::xml_node load_xml_root(const string &path,
                                    pugi::xml_document &doc) {
  pugi::xml_parse_result r = doc.load_file(path.c_str());
  if (!r)
    throw std::runtime_error(string("XML parse error: ") + r.description());
  pugi::xml_node root = doc.document_element();
  if (!root)
    throw std::runtime_error("XML missing document element");
  return root;
}

inline bool xml_get(const pugi::xml_node &root, const char *key,
                    string &out) {
  if (auto a = root.attribute(key)) {
    out = a.as_string();
    return true;
  }
  if (auto n = root.child(key)) {
    out = n.text().as_string();
    return true;
  }
  return false;
}
inline string trim(const string &s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == string::npos)
    return string();
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}
inline bool xml_get(const pugi::xml_node &root, const char *key, int &out) {
  string text;
  if (!xml_get(root, key, text))
    return false;
  out = parse_int(trim(text), key);
  return true;
}
inline bool xml_get(const pugi::xml_node &root, const char *key,
                    double &out) {
  string text;
  if (!xml_get(root, key, text))
    return false;
  out = parse_double(trim(text), key);
  return true;
}

struct XmlSetter {
  const pugi::xml_node &root;

  // Accept either attributes on root or child elements:
  // <config width="320" .../>  OR  <config><width>320</width>...</config>
  template <class T>
  bool operator()(const char *k1, const char *k2, T &dst) const {
    T tmp{};
    if (xml_get(root, k1, tmp) || xml_get(root, k2, tmp)) {
      dst = tmp;
      return true;
    }
    return false;
  }
  void optional(const char *k1, const char *k2, string &dst,
                bool &found) const {
    found = (*this)(k1, k2, dst);
  }
};

void apply_xml_config(const pugi::xml_node &root, RunConfig &a) {
  std::optional<string> cmaps, csv;
  for_each_key(XmlSetter{root}, a, cmaps, csv);
  finish_config(a, cmaps, csv);
}

// ---------- CLI parsing ----------
void validate(const RunConfig &a) {
  if (a.params.width <= 0 || a.params.height <= 0)
    throw std::runtime_error("width/height must be positive.");
  if (a.params.max_iter < 0)
    throw std::runtime_error("max-iter must be non-negative.");
  if (a.threads < 0)
    throw std::runtime_error("threads must be non-negative.");
  if (a.colormaps.empty())
    throw std::runtime_error("at least one colormap is required.");
  if (spdlog::level::from_str(a.log_level) == spdlog::level::off &&
      a.log_level != "off")
    throw std::runtime_error("Unknown log level: " + a.log_level);
}

} // namespace

std::vector<Colormap> parse_colormap_list(const string &list) {
  std::vector<Colormap> out;
  std::size_t pos = 0;
  while (pos <= list.size()) {
    auto comma = list.find(',', pos);
    if (comma == string::npos)
      comma = list.size();
    auto name = list.substr(pos, comma - pos);
    const auto first = name.find_first_not_of(" \t");
    const auto last = name.find_last_not_of(" \t");
    if (first != string::npos)
      out.push_back(colormap_from_name(name.substr(first, last - first + 1)));
    pos = comma + 1;
  }
  return out;
}

void apply_config_file(const string &path, RunConfig &a) {
  auto dot = path.find_last_of('.');
  if (dot == string::npos)
    throw std::runtime_error("Missing extension for --config: " + path);
  auto ext = to_lower(path.substr(dot + 1));
  if (ext == "json") {
    apply_json_config(load_json_file(path), a);
  } else if (ext == "toml") {
    apply_toml_config(load_toml_file(path), a);
  } else if (ext == "yaml" || ext == "yml") {
    apply_yaml_config(load_yaml_file(path), a);
  } else if (ext == "xml") {
    pugi::xml_document doc;
    auto root = load_xml_root(path, doc);
    apply_xml_config(root, a);
  } else {
    throw std::runtime_error("Unsupported --config extension: " + path +
                             " (expected .json, .toml, .yaml, .yml, .xml)");
  }
  spdlog::debug("loaded config {}", path);
}

void print_help(std::ostream &os, const char *argv0) {
  os << "mandelgrid_cli - Mandelbrot escape-time grid renderer\n\n"
        "Usage:\n"
        "  "
     << argv0
     << " [--config file.{json,toml,yaml,yml,xml}]\n"
        "                 [--xmin X] [--xmax X] [--ymin Y] [--ymax Y]\n"
        "                 [--width N] [--height N] [--max-iter N]\n"
        "                 [--colormaps hot,viridis,twilight]\n"
        "                 [--out PREFIX] [--csv PATH] [--threads N]\n"
        "                 [--log-level LEVEL]\n\n"
        "Notes:\n"
        "  Config values provide defaults; CLI flags override them.\n"
        "  One image PREFIX_<colormap>.png is written per colormap.\n\n"
        "Defaults:\n"
        "  --xmin -2.0  --xmax 1.0  --ymin -1.5  --ymax 1.5\n"
        "  --width 1024  --height 1024  --max-iter 80\n"
        "  --colormaps hot,viridis,twilight  --out mandelbrot\n"
        "  --threads 0 (all cores)  --log-level info\n";
}

RunConfig parse_args(int argc, const char *const *argv) {
  RunConfig a;

  // Pass 1: --config
  for (int i = 1; i < argc; ++i) {
    string_view cur(argv[i]);
    auto take_next = [&](const char *name) -> string {
      if (i + 1 >= argc)
        throw std::runtime_error(string("Missing value for ") + name);
      return string(argv[++i]);
    };
    if (cur == "--config")
      a.config_path = take_next("--config");
    else if (auto v = value_for(cur, "--config"))
      a.config_path = string(*v);
  }
  if (a.config_path)
    apply_config_file(*a.config_path, a);

  // Pass 2: CLI overrides
  for (int i = 1; i < argc; ++i) {
    string_view cur(argv[i]);
    if (cur == "--help" || cur == "-h") {
      a.show_help = true;
      continue;
    }
    if (cur == "--config" || starts_with(cur, "--config=")) {
      if (cur == "--config")
        ++i; // skip value
      continue;
    }
    auto need_next = [&](const char *name) -> string_view {
      if (i + 1 >= argc)
        throw std::runtime_error(string("Missing value for ") + name);
      return string_view(argv[++i]);
    };
    auto parse_opt = [&](string_view name, auto setter) {
      if (auto v = value_for(cur, name)) {
        setter(*v);
        return true;
      }
      if (cur == name) {
        setter(need_next(string(name).c_str()));
        return true;
      }
      return false;
    };
    auto double_opt = [&](const char *name, double &dst) {
      return parse_opt(name, [&](string_view v) {
        dst = parse_double(v, name + 2);
      });
    };
    auto int_opt = [&](const char *name, int &dst) {
      return parse_opt(name,
                       [&](string_view v) { dst = parse_int(v, name + 2); });
    };

    if (double_opt("--xmin", a.params.xmin) ||
        double_opt("--xmax", a.params.xmax) ||
        double_opt("--ymin", a.params.ymin) ||
        double_opt("--ymax", a.params.ymax) ||
        int_opt("--width", a.params.width) ||
        int_opt("--height", a.params.height) ||
        int_opt("--max-iter", a.params.max_iter) ||
        int_opt("--threads", a.threads))
      continue;
    if (parse_opt("--colormaps", [&](string_view v) {
          a.colormaps = parse_colormap_list(string(v));
        }))
      continue;
    if (parse_opt("--out", [&](string_view v) { a.out_prefix = string(v); }))
      continue;
    if (parse_opt("--csv", [&](string_view v) { a.csv_path = string(v); }))
      continue;
    if (parse_opt("--log-level",
                  [&](string_view v) { a.log_level = to_lower(string(v)); }))
      continue;

    throw std::runtime_error("Unknown argument: " + string(cur));
  }

  validate(a);
  return a;
}

} // namespace mandelgrid

// Copyright (C) 2024 Mark van de Ruit, Delft University of Technology.
// Copyright (C) 2024 The pigmix authors.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#include <pigmix/core/json.hpp>
#include <pigmix/core/mixing.hpp>
#include <pigmix/core/pigment.hpp>
#include <pigmix/core/search.hpp>
#include <nlohmann/json.hpp>

namespace pmx {
  namespace io {
    json load_json(const fs::path &path) {
      pmx_trace();
      try {
        return json::parse(load_string(path));
      } catch (const json::parse_error &e) {
        debug::check_expr(false,
          fmt::format("failed to parse json in \"{}\": {}", path.string(), e.what()));
        return {};
      }
    }

    void save_json(const fs::path &path, const json &js, uint indent) {
      save_string(path, js.dump(indent));
    }

    Catalog load_catalog(const fs::path &path) {
      pmx_trace();
      try {
        return load_json(path).get<Catalog>();
      } catch (const json::exception &e) {
        debug::check_expr(false,
          fmt::format("malformed catalog \"{}\": {}", path.string(), e.what()));
        return {};
      }
    }

    void save_catalog(const fs::path &path, const Catalog &catalog) {
      save_json(path, catalog);
    }

    SearchSettings load_settings(const fs::path &path) {
      pmx_trace();
      try {
        return load_json(path).get<SearchSettings>();
      } catch (const json::exception &e) {
        debug::check_expr(false,
          fmt::format("malformed search settings \"{}\": {}", path.string(), e.what()));
        return {};
      }
    }
  } // namespace io

  void from_json(const json &js, Medium &m) {
    auto name   = js.get<std::string>();
    auto medium = parse_medium(name);
    debug::check_expr(medium.has_value(), fmt::format("unknown medium \"{}\"", name));
    m = *medium;
  }

  void to_json(json &js, const Medium &m) {
    js = std::string(to_string(m));
  }

  void from_json(const json &js, Pigment &p) {
    p.id      = js.at("id").get<std::string>();
    p.name    = js.value("name", p.id);
    p.brand   = js.value("brand", std::string());
    p.code    = js.value("code", std::string());
    p.medium  = js.at("medium").get<Medium>();
    p.opacity = js.value("opacity", 1.f);

    // Swatch is given as hex; otherwise it is rendered from the pigment itself
    if (js.contains("swatch")) {
      auto hex    = js.at("swatch").get<std::string>();
      auto swatch = parse_hex(hex);
      debug::check_expr(swatch.has_value(), 
        fmt::format("pigment \"{}\" has malformed swatch \"{}\"", p.id, hex));
      p.swatch = *swatch;
    }

    // Spectral data is given either as K/S ratios or as reflectances
    debug::check_expr(js.contains("ratio") != js.contains("reflectance"),
      fmt::format("pigment \"{}\" requires exactly one of \"ratio\" or \"reflectance\"", p.id));
    if (js.contains("ratio")) {
      p.ratio = js.at("ratio").get<Spec>();
    } else {
      Spec r = js.at("reflectance").get<Spec>();
      debug::check_expr((r >= 0.f).all() && (r <= 1.f).all(),
        fmt::format("pigment \"{}\" has reflectances outside [0, 1]", p.id));
      p.ratio = reflectance_to_ratio(r);
    }

    if (!js.contains("swatch"))
      p.swatch = reflectance_to_display(p.reflectance()).srgb8;
  }

  void to_json(json &js, const Pigment &p) {
    js["id"]      = p.id;
    js["name"]    = p.name;
    js["brand"]   = p.brand;
    js["code"]    = p.code;
    js["medium"]  = p.medium;
    js["swatch"]  = format_hex(p.swatch);
    js["opacity"] = p.opacity;
    js["ratio"]   = p.ratio;
  }

  void from_json(const json &js, Catalog &c) {
    debug::check_expr(js.is_object() && js.contains("pigments") && js.at("pigments").is_array(),
      "catalog requires a \"pigments\" array");
    c = Catalog(js.at("pigments").get<std::vector<Pigment>>());
  }

  void to_json(json &js, const Catalog &c) {
    js["pigments"] = c.pigments();
  }

  void from_json(const json &js, SearchSettings &s) {
    s = SearchSettings();
    if (js.contains("medium") && !js.at("medium").is_null())
      s.medium = js.at("medium").get<Medium>();
    for (auto key : { "max_pigments", "n_results" })
      if (js.contains(key))
        debug::check_expr(js.at(key).is_number_unsigned(),
          fmt::format("expected a non-negative integer for \"{}\", got {}", key, js.at(key).dump()));
    s.max_pigments = js.value("max_pigments", s.max_pigments);
    s.n_results    = js.value("n_results",    s.n_results);
  }

  void to_json(json &js, const SearchSettings &s) {
    js["medium"]       = s.medium ? json(*s.medium) : json(nullptr);
    js["max_pigments"] = s.max_pigments;
    js["n_results"]    = s.n_results;
  }

  void to_json(json &js, const Recipe &r) {
    for (const auto &layer : r.layers)
      js["pigments"].push_back(json { { "id", layer.pigment->id }, { "percentage", layer.percentage } });
    js["swatch"]   = r.colr.hex();
    js["distance"] = r.distance;
    js["grade"]    = std::string(to_string(r.grade));
  }
} // namespace pmx

namespace Eigen {
  void from_json(const pmx::json &js, pmx::Spec &v) {
    pmx::debug::check_expr(js.is_array() && js.size() == pmx::wavelength_samples,
      fmt::format("expected an array of {} values, got {}", pmx::wavelength_samples, js.dump()));
    std::ranges::transform(js, v.begin(), [](const pmx::json &e) { return e.get<float>(); });
  }

  void to_json(pmx::json &js, const pmx::Spec &v) {
    js = std::vector<pmx::Spec::value_type>(v.begin(), v.end());
  }
} // namespace Eigen

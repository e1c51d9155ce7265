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

#pragma once

#include <pigmix/core/fwd.hpp>
#include <pigmix/core/io.hpp>
#include <nlohmann/json_fwd.hpp>

namespace pmx {
  // namespace/typename shorthand inside pmx namespace
  using json = nlohmann::json;

  namespace io {
    /* json load/save to/from file */
    json load_json(const fs::path &path);
    void save_json(const fs::path &path, const json &js, uint indent = 2);

    /* Catalog load/save; format is { "pigments": [ { ... }, ... ] } */
    Catalog load_catalog(const fs::path &path);
    void    save_catalog(const fs::path &path, const Catalog &catalog);

    /* Search settings load; every key is optional */
    SearchSettings load_settings(const fs::path &path);
  } // namespace io

  /* json (de)serialization for medium names */
  void from_json(const json &js, Medium &m);
  void to_json(json &js, const Medium &m);

  /* json (de)serialization for pigment entries; a "reflectance" array may replace "ratio" */
  void from_json(const json &js, Pigment &p);
  void to_json(json &js, const Pigment &p);

  /* json (de)serialization for catalogs; validated on load */
  void from_json(const json &js, Catalog &c);
  void to_json(json &js, const Catalog &c);

  /* json (de)serialization for search settings */
  void from_json(const json &js, SearchSettings &s);
  void to_json(json &js, const SearchSettings &s);

  /* json serialization for search output */
  void to_json(json &js, const Recipe &r);
} // namespace pmx

/* json (de)serializations for specific Eigen types must be declared in Eigen scope */
namespace Eigen {
  void from_json(const pmx::json &js, pmx::Spec &v);
  void to_json(pmx::json &js, const pmx::Spec &v);
} // namespace Eigen

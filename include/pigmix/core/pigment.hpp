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
#include <pigmix/core/utility.hpp>
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pmx {
  /* Pigment vehicle classification; closed set */
  enum class Medium {
    eWatercolor,
    eOil,
    eAcrylic,
    eGouache
  };

  // All media, in enumeration order
  constexpr std::array<Medium, 4> media_all = {
    Medium::eWatercolor, Medium::eOil, Medium::eAcrylic, Medium::eGouache
  };

  std::string_view to_string(Medium medium);

  // Case-insensitive parse of a medium name; returns nothing on unknown names
  std::optional<Medium> parse_medium(std::string_view name);

  /* Pigment entry; an immutable record of a single paint and its
     per-band absorption/scattering (K/S) ratios */
  struct Pigment {
    std::string  id;            // Unique identifier, e.g. 'titanium-white'
    std::string  name;          // Display name
    std::string  brand;         // Manufacturer label, may be empty
    std::string  code;          // Colour Index name, e.g. 'PW6', may be empty
    Medium       medium;
    eig::Array3u swatch;        // Approximate swatch color, 8-bit sRGB
    float        opacity = 1.f; // 0 is transparent, 1 is opaque
    Spec         ratio;         // K/S per band, non-negative

  public:
    // Reflectance of this pigment applied alone
    Spec reflectance() const;

  public: // Boilerplate
    bool operator==(const Pigment &o) const {
      return id == o.id && name == o.name && brand == o.brand && code == o.code 
          && medium == o.medium && (swatch == o.swatch).all() && opacity == o.opacity 
          && ratio.isApprox(o.ratio);
    }
  };

  /* Immutable table of pigments; validated once at construction, after
     which pointers into the table remain stable for the catalog's lifetime */
  class Catalog {
    std::vector<Pigment> m_pigments;

  public:
    Catalog() = default;

    // Throws detail::Exception on empty or duplicate ids, opacity outside [0, 1],
    // or non-finite/negative ratios
    explicit Catalog(std::vector<Pigment> pigments);

    const std::vector<Pigment> &pigments() const { return m_pigments; }
    size_t size()  const { return m_pigments.size();  }
    bool   empty() const { return m_pigments.empty(); }

    auto begin() const { return m_pigments.begin(); }
    auto end()   const { return m_pigments.end();   }

    // Pigment lookup by id; nullptr if no such pigment exists
    const Pigment *find(std::string_view id) const;

    // Pigments of a given medium in catalog order, or all pigments if no medium is given
    std::vector<const Pigment *> filter(std::optional<Medium> medium = {}) const;

    // Media present in the catalog, in enumeration order
    std::vector<Medium> media() const;

    bool operator==(const Catalog &o) const { return m_pigments == o.m_pigments; }
  };

  namespace models {
    // Built-in reference table of artist pigments
    Catalog load_catalog_builtin();
  } // namespace models
} // namespace pmx

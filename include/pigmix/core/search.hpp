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
#include <pigmix/core/display.hpp>
#include <pigmix/core/pigment.hpp>
#include <optional>
#include <string>
#include <vector>

namespace pmx {
  // Weighted squared distance between two reflectances; bands are weighted
  // by 1 + 2 * the CIE 1931 luminance response at that band
  float spectral_distance(const Spec &a, const Spec &b);

  /* Search settings; also loadable from json */
  struct SearchSettings {
    std::optional<Medium> medium;           // Restrict candidates to one medium, or use all
    uint                  max_pigments = 3; // Largest nr. of pigments per recipe; values above 3 act as 3
    uint                  n_results    = 3; // Nr. of recipes returned, at most

    bool operator==(const SearchSettings &o) const = default;
  };

  /* Info object for recipe search */
  struct RecipeSearchInfo {
    const Catalog &catalog;  // Candidate pigments
    Colr           target;   // Target color, linear sRGB in [0, 1]
    SearchSettings settings; 
  };

  /* Pigment at an integer share of a recipe */
  struct RecipeLayer {
    const Pigment *pigment;
    uint           percentage;
  };

  /* Ranked search result */
  struct Recipe {
    std::vector<RecipeLayer> layers;   // Shares sum to 100
    DisplayColr              colr;     // Rendered color of the mixture
    float                    distance; // Spectral distance to the target
    MatchGrade               grade;    // Coarse match quality against the target

  public:
    // Sorted pigment ids; identifies recipes sharing the same pigment set
    std::vector<std::string> key() const;
  };

  // Bounded combinatorial search over single pigments, pairs and triples;
  // results are ordered by non-decreasing distance, with one recipe per pigment set
  std::vector<Recipe> search_recipes(const RecipeSearchInfo &info);
} // namespace pmx

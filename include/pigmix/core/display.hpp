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

#include <pigmix/core/spectrum.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace pmx {
  /* Displayable form of a color signal; obtained from linear sRGB by clamping
     into [0, 1], applying the sRGB transfer function, and quantizing to 8 bits */
  struct DisplayColr {
    Colr         lrgb;  // Clamped linear sRGB
    Colr         srgb;  // Gamma-encoded sRGB in [0, 1]
    eig::Array3u srgb8; // Gamma-encoded sRGB in [0, 255]

  public:
    std::string hex() const; // Formatted as '#rrggbb'

  public: // Boilerplate
    bool operator==(const DisplayColr &o) const { return (srgb8 == o.srgb8).all(); }
  };

  // Clamp, encode and quantize a linear sRGB color; never fails, only saturates
  DisplayColr lrgb_to_display(const Colr &lrgb);

  // Integrate a reflectance under the CIE 1931 observer and D65 into a displayable color
  DisplayColr reflectance_to_display(const Spec &reflectance);

  // Integrate a reflectance under the CIE 1931 observer and D65 into XYZ
  Colr reflectance_to_xyz(const Spec &reflectance);

  // Decode 8-bit sRGB into linear sRGB
  Colr srgb8_to_lrgb(const eig::Array3u &srgb8);

  // Parse '#rrggbb' or 'rrggbb' into 8-bit sRGB; returns nothing on malformed input
  std::optional<eig::Array3u> parse_hex(std::string_view hex);

  // Format 8-bit sRGB as '#rrggbb'; channels above 255 saturate
  std::string format_hex(const eig::Array3u &srgb8);

  /* Coarse grading of how well a result color reproduces a target color,
     from the euclidean distance between their 8-bit sRGB values */
  enum class MatchGrade {
    eExcellent,   // distance < 15
    eGood,        // distance < 30
    eFair,        // distance < 55
    eApproximate, // distance < 80
    eRough        // anything further apart
  };

  // Euclidean distance between two 8-bit sRGB colors
  float srgb8_distance(const eig::Array3u &a, const eig::Array3u &b);

  MatchGrade match_grade(const DisplayColr &target, const DisplayColr &result);

  std::string_view to_string(MatchGrade grade);
} // namespace pmx

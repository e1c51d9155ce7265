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

#include <pigmix/core/display.hpp>
#include <charconv>
#include <cmath>

namespace pmx {
  std::string DisplayColr::hex() const {
    return format_hex(srgb8);
  }

  DisplayColr lrgb_to_display(const Colr &lrgb) {
    DisplayColr colr;

    // Clamp in linear space, then encode; NaN inputs fall to black
    colr.lrgb  = lrgb.unaryExpr([](float f) { return std::isnan(f) ? 0.f : std::clamp(f, 0.f, 1.f); });
    colr.srgb  = lrgb_to_srgb(colr.lrgb).max(0.f).min(1.f);
    colr.srgb8 = colr.srgb.unaryExpr([](float f) { return std::floor(f * 255.f + .5f); }).cast<uint>();

    return colr;
  }

  Colr reflectance_to_xyz(const Spec &reflectance) {
    pmx_trace();
    return models::csys_cie_d65(reflectance, false);
  }

  DisplayColr reflectance_to_display(const Spec &reflectance) {
    pmx_trace();
    return lrgb_to_display(xyz_to_lrgb(reflectance_to_xyz(reflectance)));
  }

  Colr srgb8_to_lrgb(const eig::Array3u &srgb8) {
    Colr srgb = srgb8.min(255u).cast<float>() / 255.f;
    return srgb_to_lrgb(srgb);
  }

  std::optional<eig::Array3u> parse_hex(std::string_view hex) {
    if (hex.starts_with('#'))
      hex.remove_prefix(1);
    guard(hex.size() == 6, {});

    eig::Array3u srgb8;
    for (uint i = 0; i < 3; ++i) {
      auto digits = hex.substr(2 * i, 2);
      uint value  = 0;
      auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, 16);
      guard(ec == std::errc() && ptr == digits.data() + digits.size(), {});
      srgb8[i] = value;
    }

    return srgb8;
  }

  std::string format_hex(const eig::Array3u &srgb8) {
    eig::Array3u c = srgb8.min(255u);
    return fmt::format("#{:02x}{:02x}{:02x}", c[0], c[1], c[2]);
  }

  float srgb8_distance(const eig::Array3u &a, const eig::Array3u &b) {
    return (a.cast<float>() - b.cast<float>()).matrix().norm();
  }

  MatchGrade match_grade(const DisplayColr &target, const DisplayColr &result) {
    float d = srgb8_distance(target.srgb8, result.srgb8);
    if (d < 15.f) return MatchGrade::eExcellent;
    if (d < 30.f) return MatchGrade::eGood;
    if (d < 55.f) return MatchGrade::eFair;
    if (d < 80.f) return MatchGrade::eApproximate;
    return MatchGrade::eRough;
  }

  std::string_view to_string(MatchGrade grade) {
    switch (grade) {
      case MatchGrade::eExcellent:   return "excellent";
      case MatchGrade::eGood:        return "good";
      case MatchGrade::eFair:        return "fair";
      case MatchGrade::eApproximate: return "approximate";
      default:                       return "rough";
    }
  }
} // namespace pmx

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
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace pmx {
  /* Kubelka-Munk single-constant conversions */

  // R = 1 + k - sqrt(k^2 + 2k), clamped to [0, 1]; k <= 0 yields full reflectance
  inline
  float ratio_to_reflectance(float k) {
    guard(k > 0.f, 1.f);
    return std::clamp(1.f + k - std::sqrt(k * k + 2.f * k), 0.f, 1.f);
  }

  // k = (1 - R)^2 / 2R; reflectances at or below 0.001 yield a fixed ratio of 100
  inline
  float reflectance_to_ratio(float r) {
    guard(r > 0.001f, 100.f);
    return (1.f - r) * (1.f - r) / (2.f * r);
  }

  // Per-band forms of the above
  Spec ratio_to_reflectance(const Spec &k);
  Spec reflectance_to_ratio(const Spec &r);

  // Upper bound on the nr. of layers in a single mixture
  constexpr static uint max_mix_layers = 4;

  /* Single pigment at a relative concentration; concentrations are
     weights, normalized over a mixture before use */
  struct MixLayer {
    const Pigment *pigment;
    float          concentration;
  };

  // Concentration-weighted K/S ratio of a mixture; returns nothing for an
  // empty or oversized mixture, a negative or missing layer, or a non-positive total
  std::optional<Spec> mix_ratio(std::span<const MixLayer> layers);

  // Reflectance of a mixture; returns nothing under the same conditions as mix_ratio
  std::optional<Spec> mix(std::span<const MixLayer> layers);

  /* Direct mixing of catalog pigments by identifier */
  struct MixRequest {
    std::string id;         // Catalog pigment id
    float       percentage; // Share in [0, 100]
  };

  struct MixResult {
    Spec        reflectance;
    Colr        xyz;  // CIE XYZ under D65, normalized to Y = 1 for a perfect reflector
    DisplayColr colr;
  };

  // Resolve requests against a catalog, dropping unknown ids and non-positive
  // shares, and mix the remainder; returns nothing if no valid layer remains
  std::optional<MixResult> simulate_mix(const Catalog &catalog, std::span<const MixRequest> requests);
} // namespace pmx

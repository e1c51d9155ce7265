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

#include <pigmix/core/mixing.hpp>
#include <pigmix/core/pigment.hpp>
#include <pigmix/core/ranges.hpp>
#include <functional>
#include <numeric>

namespace pmx {
  Spec ratio_to_reflectance(const Spec &k) {
    return k.unaryExpr([](float f) { return ratio_to_reflectance(f); });
  }

  Spec reflectance_to_ratio(const Spec &r) {
    return r.unaryExpr([](float f) { return reflectance_to_ratio(f); });
  }

  std::optional<Spec> mix_ratio(std::span<const MixLayer> layers) {
    pmx_trace();

    guard(!layers.empty() && layers.size() <= max_mix_layers, {});
    guard(rng::all_of(layers, [](const MixLayer &l) { 
      return l.pigment && l.concentration >= 0.f && std::isfinite(l.concentration); 
    }), {});

    float total = std::transform_reduce(range_iter(layers), 0.f, std::plus<float>(), 
      [](const MixLayer &l) { return l.concentration; });
    guard(total > 0.f, {});

    // K/S is linear in concentration under the single-constant model
    Spec k = Spec::Zero();
    for (const auto &l : layers)
      k += (l.concentration / total) * l.pigment->ratio;

    return k;
  }

  std::optional<Spec> mix(std::span<const MixLayer> layers) {
    auto k = mix_ratio(layers);
    guard(k, {});
    return ratio_to_reflectance(*k);
  }

  std::optional<MixResult> simulate_mix(const Catalog &catalog, std::span<const MixRequest> requests) {
    pmx_trace();

    std::vector<MixLayer> layers;
    for (const auto &req : requests) {
      guard_continue(req.percentage > 0.f);
      const Pigment *p = catalog.find(req.id);
      guard_continue(p);
      layers.push_back({ .pigment = p, .concentration = req.percentage / 100.f });
    }

    auto reflectance = mix(layers);
    guard(reflectance, {});

    return MixResult { .reflectance = *reflectance,
                       .xyz         = reflectance_to_xyz(*reflectance),
                       .colr        = reflectance_to_display(*reflectance) };
  }
} // namespace pmx

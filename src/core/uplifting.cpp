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

#include <pigmix/core/uplifting.hpp>
#include <pigmix/core/mixing.hpp>

namespace pmx {
  namespace detail {
    // Triangular band weights for the blue, green and red channels
    Colr uplift_weights(uint i) {
      float t  = static_cast<float>(i) / static_cast<float>(wavelength_samples - 1);
      float rw = std::max(0.f, 1.f - std::abs(t - 0.9f) * 5.f);
      float gw = std::max(0.f, 1.f - std::abs(t - 0.5f) * 4.f);
      float bw = std::max(0.f, 1.f - std::abs(t - 0.1f) * 5.f);
      return { rw, gw, bw };
    }
  } // namespace detail

  Spec uplift_reflectance(const Colr &lrgb) {
    pmx_trace();

    Spec r;
    for (uint i = 0; i < wavelength_samples; ++i) {
      Colr  w     = detail::uplift_weights(i);
      float total = w.sum();
      if (total == 0.f)
        total = 1.f;
      r[i] = std::clamp((lrgb * w).sum() / total, 0.01f, 0.99f);
    }
    
    return r;
  }

  Spec approximate_ratio(const Colr &lrgb) {
    return reflectance_to_ratio(uplift_reflectance(lrgb));
  }

  Spec approximate_reflectance(const Colr &lrgb) {
    return ratio_to_reflectance(approximate_ratio(lrgb));
  }
} // namespace pmx

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

namespace pmx {
  /* Heuristic spectral uplifting of a linear sRGB color.
  
     Each band blends the three channels under triangular weights centered at
     normalized band positions 0.1 (blue), 0.5 (green) and 0.9 (red), with 
     slopes 5, 4 and 5 respectively. The blend is clamped into [0.01, 0.99] and 
     converted to a K/S ratio. This is lossy; metameric spectra map to the same 
     color, and the result is only meant as a search target. */

  // Blended, clamped per-band reflectance before the ratio round trip
  Spec uplift_reflectance(const Colr &lrgb);

  // K/S ratio approximating a linear sRGB color
  Spec approximate_ratio(const Colr &lrgb);

  // Reflectance approximating a linear sRGB color; the ratio above taken back
  // through the forward Kubelka-Munk conversion
  Spec approximate_reflectance(const Colr &lrgb);
} // namespace pmx

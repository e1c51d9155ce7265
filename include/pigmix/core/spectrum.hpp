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

#include <pigmix/core/math.hpp>
#include <pigmix/core/utility.hpp>
#include <cmath>
#include <span>

namespace pmx {
  /*
    Spectrum/color/color system data
  */

  /* Define pigmix's spectral range layout; bands are point samples, endpoints included */
  constexpr static float wavelength_min     = PMX_WAVELENGTH_MIN;
  constexpr static float wavelength_max     = PMX_WAVELENGTH_MAX;
  constexpr static uint  wavelength_samples = PMX_WAVELENGTH_SAMPLES;

  /* Define derived variables from pigmix's spectral range layout */
  constexpr static float wavelength_range = wavelength_max - wavelength_min;
  constexpr static float wavelength_ssize = wavelength_range / static_cast<float>(wavelength_samples - 1);

  static_assert(wavelength_samples > 1, "Spectral layout requires at least two bands");

  /* Define program's underlying spectrum/cmfs/color types as renamed Eigen types */
  using CMFS = eig::Matrix<float, wavelength_samples, 3>; // Color matching function matrix
  using Spec = eig::Array<float, wavelength_samples, 1>;  // Discrete spectrum matrix
  using Colr = eig::Array<float,  3, 1>;                  // Color signal matrix

  /* Object defining how a reflectance-to-color conversion is performed */
  struct ColrSystem {
    CMFS cmfs;       // Observer color matching functions
    Spec illuminant; // Illuminant under which observation is performed

  public:
    CMFS finalize(bool as_rgb = true) const;             // Simplify the CMFS/illuminant into color system spectra
    Colr apply(const Spec &s, bool as_rgb = true) const; // Obtain a color from a reflectance in this color system

  public: // Boilerplate
    auto operator()(const Spec &s, bool as_rgb = true) const { return apply(s, as_rgb); }
  };

  /*
    Hardcoded model data.
  */

  /* Define pre-included color matching functions, SPD models, etc. */
  namespace models {
    // Linear color space transformations, D65 white
    extern const eig::Matrix3f xyz_to_srgb_transform;
    extern const eig::Matrix3f srgb_to_xyz_transform;

    // Color matching functions
    extern const CMFS cmfs_cie_xyz; // CIE 1931 2 deg. color matching functions

    // Illuminant spectra
    extern const Spec emitter_cie_d65; // CIE standard illuminant D65, noon daylight

    // Color systems
    extern const ColrSystem csys_cie_d65; // CIE 1931 2 deg. observer under D65
  } // namespace models

  /*
    Color space conversion functions
  */

  // Convert a value in sRGB to linear sRGB
  inline
  float srgb_to_lrgb_f(float f) {
    return f <= 0.04045f
      ? f / 12.92f
      : std::pow((f + 0.055f) / 1.055f, 2.4f);
  }

  // Convert a value in linear sRGB to sRGB
  inline
  float lrgb_to_srgb_f(float f) {
    return f <= 0.0031308f
      ? f * 12.92f
      : std::pow(f, 1.0f / 2.4f) * 1.055f - 0.055f;
  }

  // sRGB/linear sRGB/XYZ conversion shorthands
  Colr   srgb_to_lrgb(Colr c);
  Colr   lrgb_to_srgb(Colr c);
  inline Colr xyz_to_lrgb(Colr c) { return (models::xyz_to_srgb_transform * c.matrix()).array(); }
  inline Colr lrgb_to_xyz(Colr c) { return (models::srgb_to_xyz_transform * c.matrix()).array(); }

  /*
    Spectrum helper functions
  */

  // Given a spectral band, obtain the wavelength at which it is sampled
  constexpr inline
  float wavelength_at_index(size_t i) {
    return wavelength_min + wavelength_ssize * static_cast<float>(i);
  }

  // Given a wavelength, obtain the nearest spectral band's index
  inline
  size_t index_at_wavelength(float wvl) {
    float v = std::clamp((wvl - wavelength_min) / wavelength_ssize,
                         0.f, static_cast<float>(wavelength_samples - 1));
    return static_cast<size_t>(std::lround(v));
  }

  // Copy a flat range of per-band values into a spectrum
  inline
  Spec spectrum_from_values(std::span<const float, wavelength_samples> values) {
    Spec s;
    std::copy(range_iter(values), s.begin());
    return s;
  }
} // namespace pmx

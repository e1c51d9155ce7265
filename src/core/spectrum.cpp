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

#include <pigmix/core/spectrum.hpp>
#include <algorithm>
#include <array>

namespace pmx {
  namespace models {
    #include <pigmix/core/detail/spectrum_models.ext>

    namespace {
      CMFS cmfs_from_values(std::span<const float, wavelength_samples> values_x,
                            std::span<const float, wavelength_samples> values_y,
                            std::span<const float, wavelength_samples> values_z) {
        CMFS cmfs;
        cmfs.col(0) = spectrum_from_values(values_x).matrix();
        cmfs.col(1) = spectrum_from_values(values_y).matrix();
        cmfs.col(2) = spectrum_from_values(values_z).matrix();
        return cmfs;
      }
    } // namespace

    // Linear color space transformations
    const eig::Matrix3f xyz_to_srgb_transform {{ 3.2404542f, -1.5371385f, -0.4985314f },
                                               {-0.9692660f,  1.8760108f,  0.0415560f },
                                               { 0.0556434f, -0.2040259f,  1.0572252f }};
    const eig::Matrix3f srgb_to_xyz_transform = xyz_to_srgb_transform.inverse().eval();

    // Color matching functions
    const CMFS cmfs_cie_xyz = cmfs_from_values(cie_xyz_values_x, cie_xyz_values_y, cie_xyz_values_z);

    // Illuminant spectra
    const Spec emitter_cie_d65 = spectrum_from_values(cie_d65_values);

    // Color systems
    const ColrSystem csys_cie_d65 = { .cmfs = cmfs_cie_xyz, .illuminant = emitter_cie_d65 };
  } // namespace models

  Colr srgb_to_lrgb(Colr c) { std::transform(range_iter(c), c.begin(), srgb_to_lrgb_f); return c; }
  Colr lrgb_to_srgb(Colr c) { std::transform(range_iter(c), c.begin(), lrgb_to_srgb_f); return c; }

  CMFS ColrSystem::finalize(bool as_rgb) const {
    pmx_trace();
    CMFS csys = ((cmfs.array().colwise() * illuminant)
              / (cmfs.array().col(1)    * illuminant).sum()).matrix();
    if (as_rgb)
      csys = (models::xyz_to_srgb_transform * csys.transpose()).transpose().eval();
    return csys;
  }

  Colr ColrSystem::apply(const Spec &s, bool as_rgb) const {
    pmx_trace();
    return (finalize(as_rgb).transpose() * s.matrix()).array().eval();
  }
} // namespace pmx

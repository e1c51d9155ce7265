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

#include <pigmix/core/pigment.hpp>
#include <pigmix/core/display.hpp>
#include <array>
#include <string_view>

namespace pmx::models {
  namespace {
    #include <pigmix/core/detail/catalog_models.ext>
  } // namespace

  Catalog load_catalog_builtin() {
    pmx_trace();

    std::vector<Pigment> pigments;
    pigments.reserve(pigment_data.size());
    for (const auto &data : pigment_data) {
      auto swatch = parse_hex(data.swatch);
      debug::check_expr(swatch.has_value(),
        fmt::format("built-in pigment \"{}\" has malformed swatch \"{}\"", data.id, data.swatch));
      pigments.push_back({ .id      = std::string(data.id),
                           .name    = std::string(data.name),
                           .brand   = std::string(data.brand),
                           .code    = std::string(data.code),
                           .medium  = data.medium,
                           .swatch  = *swatch,
                           .opacity = data.opacity,
                           .ratio   = spectrum_from_values(data.ratio) });
    }

    return Catalog(std::move(pigments));
  }
} // namespace pmx::models

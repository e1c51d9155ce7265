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
#include <pigmix/core/mixing.hpp>
#include <pigmix/core/ranges.hpp>
#include <unordered_set>

namespace pmx {
  std::string_view to_string(Medium medium) {
    switch (medium) {
      case Medium::eWatercolor: return "watercolor";
      case Medium::eOil:        return "oil";
      case Medium::eAcrylic:    return "acrylic";
      case Medium::eGouache:    return "gouache";
      default:                  return "unknown";
    }
  }

  std::optional<Medium> parse_medium(std::string_view name) {
    std::string lower = to_lower(name);
    for (Medium m : media_all)
      if (lower == to_string(m))
        return m;
    return {};
  }

  Spec Pigment::reflectance() const {
    return ratio_to_reflectance(ratio);
  }

  Catalog::Catalog(std::vector<Pigment> pigments)
  : m_pigments(std::move(pigments)) {
    pmx_trace();

    std::unordered_set<std::string_view> ids;
    for (const auto &p : m_pigments) {
      debug::check_expr(!p.id.empty(),
        fmt::format("pigment \"{}\" has an empty id", p.name));
      debug::check_expr(ids.insert(p.id).second,
        fmt::format("pigment id \"{}\" occurs more than once", p.id));
      debug::check_expr(p.opacity >= 0.f && p.opacity <= 1.f,
        fmt::format("pigment \"{}\" has opacity {} outside [0, 1]", p.id, p.opacity));
      debug::check_expr(p.ratio.isFinite().all() && (p.ratio >= 0.f).all(),
        fmt::format("pigment \"{}\" has negative or non-finite K/S ratios", p.id));
    }
  }

  const Pigment *Catalog::find(std::string_view id) const {
    auto it = rng::find_if(m_pigments, [id](const Pigment &p) { return p.id == id; });
    guard(it != m_pigments.end(), nullptr);
    return &(*it);
  }

  std::vector<const Pigment *> Catalog::filter(std::optional<Medium> medium) const {
    pmx_trace();
    return m_pigments
      | vws::filter([&](const Pigment &p) { return !medium || p.medium == *medium; })
      | vws::transform([](const Pigment &p) { return &p; })
      | view_to<std::vector<const Pigment *>>();
  }

  std::vector<Medium> Catalog::media() const {
    std::vector<Medium> media;
    for (Medium m : media_all)
      if (rng::any_of(m_pigments, [m](const Pigment &p) { return p.medium == m; }))
        media.push_back(m);
    return media;
  }
} // namespace pmx

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

#include <pigmix/core/search.hpp>
#include <pigmix/core/mixing.hpp>
#include <pigmix/core/ranges.hpp>
#include <pigmix/core/uplifting.hpp>
#include <array>
#include <numeric>
#include <set>

namespace pmx {
  namespace detail {
    // Pruning sizes over candidates ranked by their individual distance
    constexpr uint n_pair_candidates   = 12;
    constexpr uint n_triple_candidates_i = 6;
    constexpr uint n_triple_candidates_j = 8;
    constexpr uint n_triple_candidates_k = 10;

    // Sampled concentration splits for pairs and the single split for triples
    constexpr std::array<float, 5> pair_splits   = { 0.2f, 0.33f, 0.5f, 0.67f, 0.8f };
    constexpr std::array<float, 3> triple_splits = { 0.5f, 0.3f, 0.2f };
    constexpr std::array<uint, 3>  triple_shares = { 50, 30, 20 };

    // Shared state of a single search
    struct SearchState {
      Spec                 target;  // Approximated target reflectance
      DisplayColr          colr;    // Displayed target
      std::vector<Recipe> &recipes; // Output, unordered
    };

    void push_recipe(SearchState &state, std::vector<RecipeLayer> layers, const Spec &reflectance) {
      Recipe recipe = { .layers   = std::move(layers),
                        .colr     = reflectance_to_display(reflectance),
                        .distance = spectral_distance(state.target, reflectance) };
      recipe.grade = match_grade(state.colr, recipe.colr);
      state.recipes.push_back(std::move(recipe));
    }

    void push_mixture(SearchState &state, std::span<const MixLayer> mixture, std::vector<RecipeLayer> layers) {
      auto reflectance = mix(mixture);
      guard(reflectance); // Invalid mixtures are skipped
      push_recipe(state, std::move(layers), *reflectance);
    }
  } // namespace detail

  float spectral_distance(const Spec &a, const Spec &b) {
    Spec weights = 1.f + 2.f * models::cmfs_cie_xyz.col(1).array();
    return (weights * (a - b).square()).sum();
  }

  std::vector<std::string> Recipe::key() const {
    auto ids = layers 
             | vws::transform([](const RecipeLayer &l) { return l.pigment->id; }) 
             | view_to<std::vector<std::string>>();
    rng::sort(ids);
    return ids;
  }

  std::vector<Recipe> search_recipes(const RecipeSearchInfo &info) {
    pmx_trace();
    using namespace detail;

    uint max_pigments = std::min(info.settings.max_pigments, 3u);
    guard(max_pigments > 0 && info.settings.n_results > 0, {});

    auto pool = info.catalog.filter(info.settings.medium);
    guard(!pool.empty(), {});

    std::vector<Recipe> recipes;
    SearchState state = { .target  = approximate_reflectance(info.target),
                          .colr    = lrgb_to_display(info.target),
                          .recipes = recipes };

    // Single pass; every candidate alone
    std::vector<float> pool_distances(pool.size());
    for (uint i = 0; i < pool.size(); ++i) {
      Spec reflectance = pool[i]->reflectance();
      pool_distances[i] = spectral_distance(state.target, reflectance);
      push_recipe(state, { { pool[i], 100 } }, reflectance);
    }

    // Rank candidates by individual distance; ties keep catalog order
    std::vector<uint> order(pool.size());
    std::iota(range_iter(order), 0u);
    rng::stable_sort(order, {}, [&](uint i) { return pool_distances[i]; });
    auto ranked = order
                | vws::take(n_pair_candidates)
                | vws::transform([&](uint i) { return pool[i]; })
                | pmx::view_to<std::vector<const Pigment *>>();
    
    // Pair pass; every unordered pair of the ranked prefix at sampled splits
    if (max_pigments >= 2) {
      for (uint i = 0; i < ranked.size(); ++i) {
        for (uint j = i + 1; j < ranked.size(); ++j) {
          for (float split : pair_splits) {
            uint share = static_cast<uint>(std::lround(split * 100.f));
            std::array<MixLayer, 2> mixture = {{ { ranked[i], split }, { ranked[j], 1.f - split } }};
            push_mixture(state, mixture, { { ranked[i], share }, { ranked[j], 100 - share } });
          }
        }
      }
    }

    // Triple pass; nested, narrower prefixes at a single split
    if (max_pigments >= 3 && ranked.size() >= 3) {
      uint n_i = std::min<uint>(n_triple_candidates_i, ranked.size());
      uint n_j = std::min<uint>(n_triple_candidates_j, ranked.size());
      uint n_k = std::min<uint>(n_triple_candidates_k, ranked.size());
      for (uint i = 0; i < n_i; ++i) {
        for (uint j = i + 1; j < n_j; ++j) {
          for (uint k = j + 1; k < n_k; ++k) {
            std::array<MixLayer, 3> mixture = {{ { ranked[i], triple_splits[0] }, 
                                                 { ranked[j], triple_splits[1] }, 
                                                 { ranked[k], triple_splits[2] } }};
            push_mixture(state, mixture, { { ranked[i], triple_shares[0] }, 
                                           { ranked[j], triple_shares[1] }, 
                                           { ranked[k], triple_shares[2] } });
          }
        }
      }
    }

    // Rank all recipes, then keep the first occurrence of each pigment set
    rng::stable_sort(recipes, {}, &Recipe::distance);
    std::set<std::vector<std::string>> seen;
    std::vector<Recipe> output;
    for (auto &recipe : recipes) {
      guard_break(output.size() < info.settings.n_results);
      guard_continue(seen.insert(recipe.key()).second);
      output.push_back(std::move(recipe));
    }

    return output;
  }
} // namespace pmx

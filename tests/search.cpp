#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <pigmix/core/display.hpp>
#include <pigmix/core/pigment.hpp>
#include <pigmix/core/search.hpp>
#include <algorithm>
#include <numeric>
#include <set>

using namespace pmx;

namespace {
  Colr lrgb_from_hex(std::string_view hex) {
    auto srgb8 = parse_hex(hex);
    REQUIRE(srgb8.has_value());
    return srgb8_to_lrgb(*srgb8);
  }

  uint total_percentage(const Recipe &recipe) {
    return std::accumulate(range_iter(recipe.layers), 0u, 
      [](uint v, const RecipeLayer &l) { return v + l.percentage; });
  }

  Catalog make_small_catalog() {
    auto make = [](std::string id, float k_short, float k_long) {
      return Pigment { .id = id, .name = id, .medium = Medium::eGouache, 
                       .swatch = eig::Array3u(0, 0, 0), .ratio = Spec::LinSpaced(k_short, k_long) };
    };
    return Catalog({ make("red", 4.f, 0.05f), make("blue", 0.05f, 4.f), make("gray", 0.5f, 0.5f) });
  }
} // namespace

TEST_CASE("Spectral distance") {
  Spec a = Spec::Constant(0.5f);
  CHECK(spectral_distance(a, a) == 0.f);

  // Every band is weighted by at least one
  Spec b = Spec::Constant(0.6f);
  CHECK(spectral_distance(a, b) >= 0.01f * static_cast<float>(wavelength_samples) - 1e-5f);
  REQUIRE_THAT(spectral_distance(a, b), Catch::Matchers::WithinAbs(spectral_distance(b, a), 1e-6f));

  // Bands near the luminance peak weigh more than those at the edges
  Spec c = a, d = a;
  c[16] += 0.1f;
  d[0]  += 0.1f;
  CHECK(spectral_distance(a, c) > spectral_distance(a, d));
} // TEST_CASE

TEST_CASE("Recipe search") {
  Catalog catalog = models::load_catalog_builtin();

  SECTION("Black target") {
    auto recipes = search_recipes({ .catalog = catalog, .target = lrgb_from_hex("#000000") });
    REQUIRE(recipes.size() == 3);
    REQUIRE(recipes[0].layers.size() == 1);
    CHECK(recipes[0].layers[0].pigment->id == "carbon-black");
    CHECK(recipes[0].layers[0].percentage == 100);
    REQUIRE_THAT(recipes[0].distance, Catch::Matchers::WithinAbs(0.00723f, 1e-3f));
    CHECK(recipes[0].colr.hex() == "#282929");
    CHECK(recipes[0].grade == MatchGrade::eApproximate);
  } // SECTION

  SECTION("White target") {
    auto recipes = search_recipes({ .catalog = catalog, .target = lrgb_from_hex("#ffffff") });
    REQUIRE(!recipes.empty());
    CHECK(recipes[0].key() == std::vector<std::string> { "titanium-white" });
    CHECK(recipes[0].grade <= MatchGrade::eGood);
  } // SECTION

  SECTION("Rendered pigment color finds that pigment") {
    for (auto id : { "carbon-black", "titanium-white", "ivory-black" }) {
      const Pigment *p = catalog.find(id);
      REQUIRE(p);
      auto target  = reflectance_to_display(p->reflectance());
      auto recipes = search_recipes({ .catalog  = catalog, 
                                      .target   = target.lrgb, 
                                      .settings = { .max_pigments = 1 } });
      REQUIRE(!recipes.empty());
      CHECK(recipes[0].layers[0].pigment == p);
      CHECK(recipes[0].distance < 0.005f);
      CHECK(recipes[0].grade == MatchGrade::eExcellent);
    }
  } // SECTION

  SECTION("Single pigments only") {
    auto recipes = search_recipes({ .catalog  = catalog, 
                                    .target   = lrgb_from_hex("#2050a0"), 
                                    .settings = { .max_pigments = 1, .n_results = 10 } });
    REQUIRE(recipes.size() == 10);
    for (const auto &recipe : recipes) {
      REQUIRE(recipe.layers.size() == 1);
      CHECK(recipe.layers[0].percentage == 100);
    }
  } // SECTION

  SECTION("Medium filter") {
    auto recipes = search_recipes({ .catalog  = catalog, 
                                    .target   = lrgb_from_hex("#000000"), 
                                    .settings = { .medium = Medium::eOil, .max_pigments = 2, .n_results = 4 } });
    REQUIRE(recipes.size() == 4);
    CHECK(recipes[0].layers[0].pigment->id == "ivory-black");
    for (const auto &recipe : recipes)
      for (const auto &layer : recipe.layers)
        CHECK(layer.pigment->medium == Medium::eOil);
  } // SECTION

  SECTION("Empty pool") {
    auto recipes = search_recipes({ .catalog  = catalog, 
                                    .target   = lrgb_from_hex("#808080"), 
                                    .settings = { .medium = Medium::eGouache } });
    CHECK(recipes.empty());

    Catalog empty;
    CHECK(search_recipes({ .catalog = empty, .target = Colr(0.5f) }).empty());
  } // SECTION

  SECTION("Degenerate settings") {
    Colr target = lrgb_from_hex("#c82020");
    CHECK(search_recipes({ .catalog = catalog, .target = target, .settings = { .max_pigments = 0 } }).empty());
    CHECK(search_recipes({ .catalog = catalog, .target = target, .settings = { .n_results = 0 } }).empty());

    auto capped  = search_recipes({ .catalog = catalog, .target = target, .settings = { .max_pigments = 5, .n_results = 20 } });
    auto uncapped = search_recipes({ .catalog = catalog, .target = target, .settings = { .max_pigments = 3, .n_results = 20 } });
    REQUIRE(capped.size() == uncapped.size());
    for (uint i = 0; i < capped.size(); ++i)
      CHECK(capped[i].key() == uncapped[i].key());
  } // SECTION

  SECTION("Result invariants") {
    for (auto hex : { "#000000", "#808080", "#c82020", "#2050a0", "#e8d28a" }) {
      auto recipes = search_recipes({ .catalog  = catalog, 
                                      .target   = lrgb_from_hex(hex), 
                                      .settings = { .n_results = 25 } });
      REQUIRE(recipes.size() == 25);

      // Distances are non-decreasing
      CHECK(std::is_sorted(range_iter(recipes), 
        [](const Recipe &a, const Recipe &b) { return a.distance < b.distance; }));

      // No two recipes share a pigment set
      std::set<std::vector<std::string>> keys;
      for (const auto &recipe : recipes)
        CHECK(keys.insert(recipe.key()).second);

      // Shares are whole percentages summing to 100, from the sampled splits
      for (const auto &recipe : recipes) {
        CHECK(total_percentage(recipe) == 100);
        CHECK(recipe.layers.size() <= 3);
        if (recipe.layers.size() == 2) {
          uint share = recipe.layers[0].percentage;
          CHECK((share == 20 || share == 33 || share == 50 || share == 67 || share == 80));
        } else if (recipe.layers.size() == 3) {
          CHECK(recipe.layers[0].percentage == 50);
          CHECK(recipe.layers[1].percentage == 30);
          CHECK(recipe.layers[2].percentage == 20);
        }
      }
    }
  } // SECTION

  SECTION("Deterministic") {
    RecipeSearchInfo info = { .catalog  = catalog, 
                              .target   = lrgb_from_hex("#2050a0"), 
                              .settings = { .n_results = 12 } };
    auto a = search_recipes(info);
    auto b = search_recipes(info);
    REQUIRE(a.size() == b.size());
    for (uint i = 0; i < a.size(); ++i) {
      CHECK(a[i].key() == b[i].key());
      CHECK(a[i].distance == b[i].distance);
      CHECK(a[i].colr == b[i].colr);
    }
  } // SECTION
} // TEST_CASE

TEST_CASE("Recipe search passes") {
  Catalog catalog = make_small_catalog();
  Colr    target  = Colr(0.3f);

  // Three candidates give three singles, three pairs and a single triple
  auto count = [&](uint max_pigments) {
    return search_recipes({ .catalog  = catalog, 
                            .target   = target, 
                            .settings = { .max_pigments = max_pigments, .n_results = 100 } }).size();
  };
  CHECK(count(1) == 3);
  CHECK(count(2) == 6);
  CHECK(count(3) == 7);

  SECTION("Triple is ordered by individual rank") {
    auto recipes = search_recipes({ .catalog = catalog, .target = target, .settings = { .n_results = 100 } });
    auto it = std::find_if(range_iter(recipes), [](const Recipe &r) { return r.layers.size() == 3; });
    REQUIRE(it != recipes.end());

    // Gray is closest to a gray target on its own, so it leads the triple
    CHECK(it->layers[0].pigment->id == "gray");
  } // SECTION
} // TEST_CASE

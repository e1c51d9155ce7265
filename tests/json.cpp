#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <nlohmann/json.hpp>
#include <pigmix/core/json.hpp>
#include <pigmix/core/mixing.hpp>
#include <pigmix/core/pigment.hpp>
#include <pigmix/core/search.hpp>

using namespace pmx;

namespace {
  const fs::path data_dir = PMX_TEST_DATA_DIR;
} // namespace

TEST_CASE("Catalog json") {
  SECTION("Load") {
    Catalog catalog = io::load_catalog(data_dir / "catalog.json");
    REQUIRE(catalog.size() == 2);

    const Pigment *white = catalog.find("test-white");
    REQUIRE(white);
    CHECK(white->name   == "Test White");
    CHECK(white->brand  == "Studio");
    CHECK(white->medium == Medium::eGouache);
    CHECK((white->swatch == eig::Array3u(248, 248, 245)).all());
    REQUIRE_THAT(white->opacity,  Catch::Matchers::WithinAbs(0.9f, 1e-6f));
    REQUIRE_THAT(white->ratio[10], Catch::Matchers::WithinAbs(0.003f, 1e-6f));
  } // SECTION

  SECTION("Defaults and reflectance input") {
    Catalog catalog = io::load_catalog(data_dir / "catalog.json");
    const Pigment *gray = catalog.find("test-gray");
    REQUIRE(gray);
    CHECK(gray->brand.empty());
    CHECK(gray->code.empty());
    CHECK(gray->medium == Medium::eOil);
    REQUIRE_THAT(gray->opacity, Catch::Matchers::WithinAbs(1.f, 1e-6f));

    // Reflectances are stored as ratios, and the swatch is rendered
    for (uint i = 0; i < wavelength_samples; ++i) {
      REQUIRE_THAT(gray->ratio[i], Catch::Matchers::WithinAbs(0.25f, 1e-6f));
      REQUIRE_THAT(gray->reflectance()[i], Catch::Matchers::WithinAbs(0.5f, 1e-5f));
    }
    CHECK((gray->swatch == reflectance_to_display(Spec::Constant(0.5f)).srgb8).all());
  } // SECTION

  SECTION("Built-in round trip") {
    Catalog catalog = models::load_catalog_builtin();
    json js = catalog;
    REQUIRE(js.at("pigments").size() == catalog.size());
    CHECK(js.at("pigments")[0].at("id") == "titanium-white");
    CHECK(js.at("pigments")[0].at("medium") == "acrylic");
    CHECK(js.at("pigments")[0].at("swatch") == "#f8f8f5");
    CHECK(js.get<Catalog>() == catalog);
  } // SECTION

  SECTION("Save and load") {
    Catalog  catalog = io::load_catalog(data_dir / "catalog.json");
    fs::path path    = fs::temp_directory_path() / "pigmix_test_catalog.json";
    io::save_catalog(path, catalog);
    CHECK(io::load_catalog(path) == catalog);
    fs::remove(path);
  } // SECTION

  SECTION("Malformed input") {
    CHECK_THROWS_AS(io::load_catalog(data_dir / "catalog_broken.json"), detail::Exception);
    CHECK_THROWS_AS(io::load_catalog(data_dir / "catalog_short.json"),  detail::Exception);
    CHECK_THROWS_AS(io::load_catalog(data_dir / "catalog_medium.json"), detail::Exception);
    CHECK_THROWS_AS(io::load_catalog(data_dir / "no_such_file.json"),   detail::Exception);
  } // SECTION

  SECTION("Missing or duplicate fields") {
    json js = json::parse(R"({ "pigments": [ { "name": "No id", "medium": "oil", "ratio": [] } ] })");
    CHECK_THROWS(js.get<Catalog>());

    json both = json::parse(R"({ "id": "x", "medium": "oil", "ratio": [], "reflectance": [] })");
    CHECK_THROWS_AS(both.get<Pigment>(), detail::Exception);

    CHECK_THROWS_AS(json::parse(R"({ "colors": [] })").get<Catalog>(), detail::Exception);
  } // SECTION
} // TEST_CASE

TEST_CASE("Search settings json") {
  SECTION("Load with defaults") {
    SearchSettings settings = io::load_settings(data_dir / "settings.json");
    CHECK(settings.medium == Medium::eWatercolor);
    CHECK(settings.max_pigments == 3);
    CHECK(settings.n_results == 5);
  } // SECTION

  SECTION("Null medium") {
    auto settings = json::parse(R"({ "medium": null, "max_pigments": 2 })").get<SearchSettings>();
    CHECK(!settings.medium.has_value());
    CHECK(settings.max_pigments == 2);
    CHECK(settings.n_results == 3);
  } // SECTION

  SECTION("Negative or fractional counts") {
    CHECK_THROWS_AS(json::parse(R"({ "n_results": -1 })").get<SearchSettings>(),    detail::Exception);
    CHECK_THROWS_AS(json::parse(R"({ "max_pigments": -2 })").get<SearchSettings>(), detail::Exception);
    CHECK_THROWS_AS(json::parse(R"({ "n_results": 2.5 })").get<SearchSettings>(),   detail::Exception);
    CHECK_THROWS_AS(json::parse(R"({ "n_results": "4" })").get<SearchSettings>(),   detail::Exception);
    CHECK(json::parse(R"({ "n_results": 0 })").get<SearchSettings>().n_results == 0);
  } // SECTION

  SECTION("Round trip") {
    SearchSettings settings = { .medium = Medium::eAcrylic, .max_pigments = 1, .n_results = 7 };
    json js = settings;
    CHECK(js.get<SearchSettings>() == settings);
  } // SECTION
} // TEST_CASE

TEST_CASE("Recipe json") {
  Catalog catalog = models::load_catalog_builtin();
  auto recipes = search_recipes({ .catalog  = catalog, 
                                  .target   = Colr(0.f), 
                                  .settings = { .max_pigments = 2, .n_results = 2 } });
  REQUIRE(recipes.size() == 2);

  json js = recipes;
  REQUIRE(js.is_array());
  CHECK(js[0].at("pigments")[0].at("id") == "carbon-black");
  CHECK(js[0].at("pigments")[0].at("percentage") == 100);
  CHECK(js[0].at("swatch") == recipes[0].colr.hex());
  CHECK(js[0].at("grade") == "approximate");
  CHECK(js[1].at("pigments").size() == 2);
} // TEST_CASE

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <pigmix/core/pigment.hpp>
#include <pigmix/core/utility.hpp>
#include <limits>

using namespace pmx;

namespace {
  Pigment make_pigment(std::string id, Medium medium = Medium::eAcrylic) {
    return { .id = id, .name = id, .medium = medium, .swatch = eig::Array3u(0, 0, 0), .ratio = Spec::Constant(0.5f) };
  }
} // namespace

TEST_CASE("Medium names") {
  CHECK(to_string(Medium::eWatercolor) == "watercolor");
  CHECK(to_string(Medium::eGouache)    == "gouache");
  CHECK(parse_medium("oil")       == Medium::eOil);
  CHECK(parse_medium("Acrylic")   == Medium::eAcrylic);
  CHECK(parse_medium("GOUACHE")   == Medium::eGouache);
  CHECK(!parse_medium("pastel").has_value());
  CHECK(!parse_medium("").has_value());
} // TEST_CASE

TEST_CASE("Built-in catalog") {
  Catalog catalog = models::load_catalog_builtin();

  SECTION("Contents") {
    CHECK(catalog.size() == 34);
    CHECK(catalog.filter(Medium::eOil).size()        == 13);
    CHECK(catalog.filter(Medium::eAcrylic).size()    == 11);
    CHECK(catalog.filter(Medium::eWatercolor).size() == 10);
    CHECK(catalog.filter(Medium::eGouache).empty());
    CHECK(catalog.filter().size() == catalog.size());
  } // SECTION

  SECTION("Lookup") {
    const Pigment *p = catalog.find("titanium-white");
    REQUIRE(p);
    CHECK(p->name   == "Titanium White");
    CHECK(p->brand  == "Golden");
    CHECK(p->code   == "PW6");
    CHECK(p->medium == Medium::eAcrylic);
    CHECK((p->swatch == eig::Array3u(248, 248, 245)).all());
    REQUIRE_THAT(p->opacity, Catch::Matchers::WithinAbs(1.f, 1e-6f));
    REQUIRE_THAT(p->ratio[0], Catch::Matchers::WithinAbs(0.003f, 1e-6f));
    
    CHECK(catalog.find("no-such-pigment") == nullptr);
    CHECK(catalog.find("") == nullptr);
  } // SECTION

  SECTION("Filter keeps catalog order") {
    auto oils = catalog.filter(Medium::eOil);
    REQUIRE(oils.size() >= 2);
    CHECK(oils[0]->id == "zinc-white");
    CHECK(oils[1]->id == "ivory-black");
  } // SECTION

  SECTION("Media") {
    std::vector<Medium> expected = { Medium::eWatercolor, Medium::eOil, Medium::eAcrylic };
    CHECK(catalog.media() == expected);
  } // SECTION

  SECTION("Ratios and reflectances are valid") {
    for (const auto &p : catalog) {
      CHECK((p.ratio >= 0.f).all());
      CHECK((p.opacity >= 0.f && p.opacity <= 1.f));
      Spec r = p.reflectance();
      CHECK((r >= 0.f).all());
      CHECK((r <= 1.f).all());
    }
  } // SECTION
} // TEST_CASE

TEST_CASE("Catalog validation") {
  SECTION("Valid") {
    Catalog catalog({ make_pigment("a"), make_pigment("b", Medium::eGouache) });
    CHECK(catalog.size() == 2);
    std::vector<Medium> expected = { Medium::eAcrylic, Medium::eGouache };
    CHECK(catalog.media() == expected);
  } // SECTION

  SECTION("Empty id") {
    CHECK_THROWS_AS(Catalog({ make_pigment("") }), detail::Exception);
  } // SECTION

  SECTION("Duplicate id") {
    CHECK_THROWS_AS(Catalog({ make_pigment("a"), make_pigment("b"), make_pigment("a") }), detail::Exception);
  } // SECTION

  SECTION("Opacity out of range") {
    Pigment p = make_pigment("a");
    p.opacity = 1.5f;
    CHECK_THROWS_AS(Catalog({ p }), detail::Exception);
    p.opacity = -0.1f;
    CHECK_THROWS_AS(Catalog({ p }), detail::Exception);
  } // SECTION

  SECTION("Negative or non-finite ratio") {
    Pigment p = make_pigment("a");
    p.ratio[4] = -0.1f;
    CHECK_THROWS_AS(Catalog({ p }), detail::Exception);
    p.ratio[4] = std::numeric_limits<float>::quiet_NaN();
    CHECK_THROWS_AS(Catalog({ p }), detail::Exception);
    p.ratio[4] = std::numeric_limits<float>::infinity();
    CHECK_THROWS_AS(Catalog({ p }), detail::Exception);
  } // SECTION
} // TEST_CASE

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

#include <pigmix/cli/cli.hpp>
#include <pigmix/core/json.hpp>
#include <pigmix/core/utility.hpp>
#include <nlohmann/json.hpp>
#include <libHX/option.h>
#include <charconv>
#include <cstdlib>
#include <exception>
#include <iterator>
#include <system_error>
#include <vector>

namespace pmx::cli {
  namespace {
    constexpr std::string_view usage_text =
R"(usage: pigmix [--catalog file.json] <command> [args]

commands:
  list [medium]                       list catalog pigments, optionally of one medium
  mix <id>:<percent> ...              mix pigments at given shares
  match <#rrggbb> [options]           find pigment recipes for a target color
    --medium <medium>                   restrict to watercolor, oil, acrylic or gouache
    --pigments <n>                      largest nr. of pigments per recipe (1-3)
    --results <n>                       nr. of recipes to return
    --settings <file.json>              load the above from a json file
    --json                              print recipes as json
)";

    // Target of a HXTYPE_STRING option; libHX stores a duplicate of the argument
    struct OptString {
      char *ptr = nullptr;

      OptString() = default;
      OptString(const OptString &) = delete;
      ~OptString() { std::free(ptr); }

      std::optional<std::string> get() const {
        guard(ptr, {});
        return std::string(ptr);
      }
    };

    // Run HX_getopt6 over a copy of args, program name first; returns the
    // remaining positional arguments, or nothing if libHX reported an error
    std::optional<std::vector<std::string>> get_options(const HXoption         *table,
                                                        std::vector<std::string> args,
                                                        unsigned int             flags = 0) {
      std::vector<char *> argv;
      for (auto &arg : args)
        argv.push_back(arg.data());
      argv.push_back(nullptr);

      HXopt6_auto_result argp;
      guard(HX_getopt6(table, static_cast<int>(args.size()), argv.data(), &argp,
        flags | HXOPT_USAGEONERR | HXOPT_ITER_ARGS) == HXOPT_ERR_SUCCESS, {});
      return std::vector<std::string>(argp.uarg, argp.uarg + argp.nargs);
    }

    std::optional<uint> get_count(std::string_view flag, const OptString &opt) {
      guard(opt.ptr, {});
      return parse_count(flag, opt.ptr);
    }

    int run_list(const Catalog &catalog, std::span<const std::string> args, fmt::memory_buffer &out) {
      debug::check_expr(args.size() <= 1, "list takes at most one medium");

      std::optional<Medium> medium;
      if (!args.empty())
        medium = parse_medium_arg(args.front());

      for (const Pigment *p : catalog.filter(medium))
        fmt::format_to(std::back_inserter(out), "{:<24} {:<10} {}  {}\n",
          p->id, to_string(p->medium), format_hex(p->swatch), p->name);
      return EXIT_SUCCESS;
    }

    int run_mix(const Catalog &catalog, std::span<const std::string> args, fmt::memory_buffer &out) {
      debug::check_expr(!args.empty(), "mix requires at least one <id>:<percent> pair");

      std::vector<MixRequest> requests;
      for (const auto &arg : args) {
        auto request = parse_mix_request(arg);
        if (!catalog.find(request.id))
          fmt::print(stderr, "warning: unknown pigment \"{}\" is ignored\n", request.id);
        requests.push_back(std::move(request));
      }

      auto result = simulate_mix(catalog, requests);
      if (!result) {
        fmt::print(stderr, "error: no valid mixture could be formed\n");
        return EXIT_FAILURE;
      }

      fmt::format_to(std::back_inserter(out), "color  {}\n", result->colr.hex());
      fmt::format_to(std::back_inserter(out), "xyz    {:.4f} {:.4f} {:.4f}\n",
        result->xyz.x(), result->xyz.y(), result->xyz.z());
      return EXIT_SUCCESS;
    }

    int run_match(const Catalog &catalog, std::span<const std::string> args, fmt::memory_buffer &out) {
      OptString medium, pigments, results, settings;
      int       as_json = 0;
      const HXoption options_table[] = {
        {"medium",   0, HXTYPE_STRING, &medium.ptr,   {}, {}, {}, "Restrict to watercolor, oil, acrylic or gouache", "NAME"},
        {"pigments", 0, HXTYPE_STRING, &pigments.ptr, {}, {}, {}, "Largest nr. of pigments per recipe (1-3)",        "N"},
        {"results",  0, HXTYPE_STRING, &results.ptr,  {}, {}, {}, "Nr. of recipes to return",                        "N"},
        {"settings", 0, HXTYPE_STRING, &settings.ptr, {}, {}, {}, "Load search settings from a json file",           "FILE"},
        {"json",     0, HXTYPE_NONE,   &as_json,      {}, {}, {}, "Print recipes as json"},
        HXOPT_AUTOHELP,
        HXOPT_TABLEEND,
      };

      std::vector<std::string> argv = { "pigmix match" };
      argv.insert(argv.end(), range_iter(args));
      auto positional = get_options(options_table, std::move(argv));
      guard(positional, EXIT_FAILURE);
      debug::check_expr(positional->size() == 1, "match requires exactly one target color");

      MatchOptions opts = { .target        = positional->front(),
                            .medium        = medium.get(),
                            .settings_path = settings.get(),
                            .max_pigments  = get_count("--pigments", pigments),
                            .n_results     = get_count("--results", results),
                            .as_json       = as_json != 0 };

      auto target  = lrgb_to_display(srgb8_to_lrgb(parse_target(opts.target)));
      auto recipes = search_recipes({ .catalog  = catalog,
                                      .target   = target.lrgb,
                                      .settings = resolve_settings(opts) });

      if (opts.as_json) {
        fmt::format_to(std::back_inserter(out), "{}\n", json(recipes).dump(2));
        return EXIT_SUCCESS;
      }

      fmt::format_to(std::back_inserter(out), "target {}\n", target.hex());
      if (recipes.empty())
        fmt::format_to(std::back_inserter(out), "no recipes found\n");
      for (uint i = 0; i < recipes.size(); ++i) {
        const auto &recipe = recipes[i];
        fmt::format_to(std::back_inserter(out), "{}. {} ({}, distance {:.4f})\n",
          i + 1, recipe.colr.hex(), to_string(recipe.grade), recipe.distance);
        for (const auto &layer : recipe.layers)
          fmt::format_to(std::back_inserter(out), "   {:>3}%  {}\n", layer.percentage, layer.pigment->name);
      }
      return EXIT_SUCCESS;
    }
  } // namespace

  uint parse_count(std::string_view flag, std::string_view value) {
    uint v = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), v);
    debug::check_expr(ec == std::errc() && ptr == value.data() + value.size(),
      fmt::format("expected a non-negative integer for \"{}\", got \"{}\"", flag, value));
    return v;
  }

  Medium parse_medium_arg(std::string_view value) {
    auto medium = parse_medium(value);
    debug::check_expr(medium.has_value(), fmt::format("unknown medium \"{}\"", value));
    return *medium;
  }

  eig::Array3u parse_target(std::string_view hex) {
    auto srgb8 = parse_hex(hex);
    debug::check_expr(srgb8.has_value(), fmt::format("malformed color \"{}\"", hex));
    return *srgb8;
  }

  MixRequest parse_mix_request(std::string_view arg) {
    auto sep = arg.rfind(':');
    debug::check_expr(sep != std::string_view::npos,
      fmt::format("expected <id>:<percent>, got \"{}\"", arg));

    // The share must be a plain number, with nothing trailing it
    auto  pct   = arg.substr(sep + 1);
    float value = 0.f;
    auto [ptr, ec] = std::from_chars(pct.data(), pct.data() + pct.size(), value);
    debug::check_expr(!pct.empty() && ec == std::errc() && ptr == pct.data() + pct.size(),
      fmt::format("malformed percentage in \"{}\"", arg));

    return { .id = std::string(arg.substr(0, sep)), .percentage = value };
  }

  SearchSettings resolve_settings(const MatchOptions &opts) {
    SearchSettings settings;
    if (opts.settings_path)
      settings = io::load_settings(*opts.settings_path);
    if (opts.medium)
      settings.medium = parse_medium_arg(*opts.medium);
    if (opts.max_pigments)
      settings.max_pigments = *opts.max_pigments;
    if (opts.n_results)
      settings.n_results = *opts.n_results;
    return settings;
  }

  int run(std::span<const std::string> args, fmt::memory_buffer &out) {
    try {
      // Global options precede the command
      OptString catalog_path;
      const HXoption options_table[] = {
        {"catalog", 0, HXTYPE_STRING, &catalog_path.ptr, {}, {}, {}, "Load pigments from a json catalog", "FILE"},
        HXOPT_AUTOHELP,
        HXOPT_TABLEEND,
      };

      auto command_args = get_options(options_table, { range_iter(args) }, HXOPT_RQ_ORDER);
      guard(command_args, EXIT_FAILURE);
      if (command_args->empty()) {
        fmt::print(stderr, "{}", usage_text);
        return EXIT_FAILURE;
      }

      const Catalog catalog = catalog_path.ptr
                            ? io::load_catalog(catalog_path.ptr)
                            : models::load_catalog_builtin();

      auto command = command_args->front();
      auto rest    = std::span<const std::string>(*command_args).subspan(1);
      if (command == "list")
        return run_list(catalog, rest, out);
      if (command == "mix")
        return run_mix(catalog, rest, out);
      if (command == "match")
        return run_match(catalog, rest, out);

      fmt::print(stderr, "error: unknown command \"{}\"\n{}", command, usage_text);
      return EXIT_FAILURE;
    } catch (const detail::Exception &e) {
      fmt::print(stderr, "error: {}", e.get());
      return EXIT_FAILURE;
    } catch (const std::exception &e) {
      fmt::print(stderr, "error: {}\n", e.what());
      return EXIT_FAILURE;
    }
  }
} // namespace pmx::cli

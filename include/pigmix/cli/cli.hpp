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

#include <pigmix/core/display.hpp>
#include <pigmix/core/mixing.hpp>
#include <pigmix/core/pigment.hpp>
#include <pigmix/core/search.hpp>
#include <fmt/format.h>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace pmx::cli {
  /* Options of the 'match' command as given on the command line; anything
     left unset falls back to the settings file, then to the defaults */
  struct MatchOptions {
    std::string                target;
    std::optional<std::string> medium;
    std::optional<std::string> settings_path;
    std::optional<uint>        max_pigments;
    std::optional<uint>        n_results;
    bool                       as_json = false;
  };

  // Strict argument parsers; each throws detail::Exception on malformed input
  uint         parse_count(std::string_view flag, std::string_view value);
  Medium       parse_medium_arg(std::string_view value);
  eig::Array3u parse_target(std::string_view hex);
  MixRequest   parse_mix_request(std::string_view arg); // '<id>:<percent>'

  // Load the settings file if one is given, then apply explicit options over it
  SearchSettings resolve_settings(const MatchOptions &opts);

  /* Run pigmix on a full argument list, program name first. Regular output is
     appended to out, diagnostics go to stderr. Returns the process exit code. */
  int run(std::span<const std::string> args, fmt::memory_buffer &out);
} // namespace pmx::cli

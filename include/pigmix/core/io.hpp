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

#include <pigmix/core/fwd.hpp>
#include <filesystem>
#include <string>

namespace pmx {
  namespace fs = std::filesystem;

  namespace io {
    // Simple string load/save to/from file; throws detail::Exception if the file cannot be opened
    std::string load_string(const fs::path &path);
    void        save_string(const fs::path &path, const std::string &string);
  } // namespace io
} // namespace pmx

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

// Insert Tracy scope statements if tracing is enabled
#ifndef PMX_ENABLE_TRACY
  #define pmx_trace()
#else // PMX_ENABLE_TRACY
  #ifndef TRACY_ENABLE
    #define TRACY_ENABLE
  #endif // TRACY_ENABLE
  #ifndef TRACY_ON_DEMAND
    #define TRACY_ON_DEMAND
  #endif // TRACY_ON_DEMAND

  #include <tracy/Tracy.hpp>

  // Insert CPU event trace
  #define pmx_trace() ZoneScoped;
#endif // PMX_ENABLE_TRACY

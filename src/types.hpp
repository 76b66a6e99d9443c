/*
  This file is part of the haplo-lib haplogroup classification
  software suite.
  Copyright (C) 2025 haplo-lib Developers.

  This program is free software: you can redistribute it and/or modify
  it under the terms of the GNU General Public License as published by
  the Free Software Foundation, either version 3 of the License, or
  (at your option) any later version.

  This program is distributed in the hope that it will be useful,
  but WITHOUT ANY WARRANTY; without even the implied warranty of
  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
  GNU General Public License for more details.

  You should have received a copy of the GNU General Public License
  along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef HAPLO_LIB_TYPES_H
#define HAPLO_LIB_TYPES_H

#include <cstdint>
#include <string>
#include <unordered_map>

// Scores and other real-valued quantities
typedef double hap_real_t;

// Coordinate on a reference assembly (1-based)
typedef int64_t genome_pos_t;

// Observed allele at each coordinate, produced by an external variant caller
typedef std::unordered_map<genome_pos_t, std::string> CallMap;

#endif // HAPLO_LIB_TYPES_H

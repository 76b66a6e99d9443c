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

#ifndef HAPLO_LIB_HAPLOGROUP_RESULT_H
#define HAPLO_LIB_HAPLOGROUP_RESULT_H

#include "types.hpp"

#include <iostream>
#include <string>

/**
 * @class HaplogroupResult
 * @brief Evidence and score of one candidate haplogroup for one sample.
 *
 * The marker counts (matching_snps, ancestral_matches, no_calls, unknown_calls) accumulate along the
 * whole root-to-node path. total_snps is the number of markers on the node itself and cumulative_snps the
 * number on the path.
 */
class HaplogroupResult {
public:
  std::string name;
  hap_real_t score = 0;
  int matching_snps = 0;
  int ancestral_matches = 0;
  int no_calls = 0;
  int unknown_calls = 0;
  int total_snps = 0;
  int cumulative_snps = 0;
  int depth = 0;

  friend std::ostream& operator<<(std::ostream& os, const HaplogroupResult& result);
};

/**
 * @brief Result ranking: higher score first, then deeper node, then name.
 */
bool result_precedes(const HaplogroupResult& lhs, const HaplogroupResult& rhs);

#endif // HAPLO_LIB_HAPLOGROUP_RESULT_H

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

#include "haplogroup_result.hpp"

std::ostream& operator<<(std::ostream& os, const HaplogroupResult& result) {
  os << result.name << " score=" << result.score << " depth=" << result.depth << " derived=" << result.matching_snps
     << " ancestral=" << result.ancestral_matches << " no_calls=" << result.no_calls
     << " unknown=" << result.unknown_calls << " snps=" << result.total_snps << "/" << result.cumulative_snps;
  return os;
}

bool result_precedes(const HaplogroupResult& lhs, const HaplogroupResult& rhs) {
  if (lhs.score != rhs.score) {
    return lhs.score > rhs.score;
  }
  if (lhs.depth != rhs.depth) {
    return lhs.depth > rhs.depth;
  }
  return lhs.name < rhs.name;
}

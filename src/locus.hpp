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

#ifndef HAPLO_LIB_LOCUS_H
#define HAPLO_LIB_LOCUS_H

#include "types.hpp"

#include <iostream>
#include <string>

/**
 * @class Locus
 * @brief A defining marker of a haplogroup, placed on one reference build.
 */
class Locus {
public:
  /**
   * @brief The coordinate of the marker on the build the tree was reconciled to.
   */
  genome_pos_t position;

  /**
   * @brief The marker label, e.g. "M269".
   */
  std::string name;

  /**
   * @brief The ancestral allele.
   */
  std::string ref;

  /**
   * @brief The derived allele.
   */
  std::string alt;

  /**
   * @brief Construct a new Locus object.
   * @param _position Coordinate of the marker.
   * @param _name Marker label.
   * @param _ref Ancestral allele.
   * @param _alt Derived allele.
   */
  Locus(genome_pos_t _position, std::string _name, std::string _ref, std::string _alt);

  bool operator==(const Locus& other) const;
  bool operator!=(const Locus& other) const;

  /**
   * @brief Orders by position, then name, then alleles.
   */
  bool operator<(const Locus& other) const;

  friend std::ostream& operator<<(std::ostream& os, const Locus& locus);
};

/**
 * @class MarkerCoordinate
 * @brief Placement of a marker on one particular reference build.
 */
class MarkerCoordinate {
public:
  genome_pos_t position = 0;
  std::string chromosome;
  std::string ref;
  std::string alt;

  MarkerCoordinate() = default;
  MarkerCoordinate(genome_pos_t _position, std::string _chromosome, std::string _ref, std::string _alt);
};

/**
 * @brief State of an observed call relative to a marker.
 */
enum class CallState { DERIVED, ANCESTRAL, UNKNOWN, NO_CALL };

/**
 * @brief Classify the observed call at a locus.
 *
 * No entry, an empty allele or "-" is a no-call. Allele comparison ignores case.
 *
 * @param locus The marker to evaluate.
 * @param calls Observed alleles keyed by coordinate.
 * @return The call state of the marker.
 */
CallState classify_call(const Locus& locus, const CallMap& calls);

std::string call_state_name(CallState state);

#endif // HAPLO_LIB_LOCUS_H

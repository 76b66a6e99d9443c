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

#include "locus.hpp"

#include "utils.hpp"

#include <tuple>
#include <utility>

Locus::Locus(genome_pos_t _position, std::string _name, std::string _ref, std::string _alt)
    : position(_position), name(std::move(_name)), ref(std::move(_ref)), alt(std::move(_alt)) {
}

bool Locus::operator==(const Locus& other) const {
  return position == other.position && name == other.name && ref == other.ref && alt == other.alt;
}

bool Locus::operator!=(const Locus& other) const {
  return !(*this == other);
}

bool Locus::operator<(const Locus& other) const {
  return std::tie(position, name, ref, alt) < std::tie(other.position, other.name, other.ref, other.alt);
}

std::ostream& operator<<(std::ostream& os, const Locus& locus) {
  os << locus.name << "@" << locus.position << " " << locus.ref << ">" << locus.alt;
  return os;
}

MarkerCoordinate::MarkerCoordinate(genome_pos_t _position, std::string _chromosome, std::string _ref,
                                   std::string _alt)
    : position(_position), chromosome(std::move(_chromosome)), ref(std::move(_ref)), alt(std::move(_alt)) {
}

CallState classify_call(const Locus& locus, const CallMap& calls) {
  auto search = calls.find(locus.position);
  if (search == calls.end()) {
    return CallState::NO_CALL;
  }
  const std::string& called = search->second;
  if (called.empty() || called == "-") {
    return CallState::NO_CALL;
  }
  if (utils::equals_ignore_case(called, locus.alt)) {
    return CallState::DERIVED;
  }
  if (utils::equals_ignore_case(called, locus.ref)) {
    return CallState::ANCESTRAL;
  }
  return CallState::UNKNOWN;
}

std::string call_state_name(CallState state) {
  switch (state) {
  case CallState::DERIVED:
    return "Derived";
  case CallState::ANCESTRAL:
    return "Ancestral";
  case CallState::UNKNOWN:
    return "Unknown";
  case CallState::NO_CALL:
    return "No Call";
  }
  return "Unknown";
}

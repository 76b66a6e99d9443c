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

#ifndef HAPLO_LIB_UTILS_H
#define HAPLO_LIB_UTILS_H

#include "types.hpp"

#include <string>
#include <vector>

// Utility for exceptions
#define THROW_LINE(a) (std::string(__FILE__) + ":" + std::to_string(__LINE__) + ": " + a)

namespace utils {

std::string current_time_string();

// Throws std::invalid_argument unless the whole argument is an integer greater than zero
int arg_to_positive_int(char* arg);

// ASCII-only; alleles and build names never need more
bool equals_ignore_case(const std::string& a, const std::string& b);

// Splits on runs of spaces and tabs, dropping empty fields
std::vector<std::string> split_whitespace(const std::string& s);

// Splits on every occurrence of delim, keeping empty fields
std::vector<std::string> split(const std::string& s, char delim);

} // namespace utils

#endif // HAPLO_LIB_UTILS_H

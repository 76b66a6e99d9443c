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

#ifndef HAPLO_LIB_CALLS_IO_H
#define HAPLO_LIB_CALLS_IO_H

#include "types.hpp"

#include <string>

namespace calls_io {

/**
 * @brief Read the observed alleles of one sample.
 *
 * Lines starting with '#' are skipped. A line with two whitespace-separated columns is read as
 * "position allele". A line with ten or more tab-separated columns is read as a single-sample VCF record, the
 * allele being chosen by the first index of its GT field; records with a missing genotype are skipped.
 * Files ending in ".gz" are decompressed.
 *
 * @param path Path of the calls file.
 * @return observed alleles keyed by position.
 * @throws std::runtime_error naming the file and line of a malformed record.
 */
CallMap read_calls(const std::string& path);

} // namespace calls_io

#endif // HAPLO_LIB_CALLS_IO_H

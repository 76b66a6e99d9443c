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

// The gzip-aware stream wrappers below are modified from the Eagle software
// file https://github.com/poruloh/Eagle/blob/master/src/FileUtils.hpp
// developed by Po-Ru Loh and released under the GNU General Public
// License v3.0 (GPLv3).

#ifndef HAPLO_LIB_FILE_UTILS_H
#define HAPLO_LIB_FILE_UTILS_H

#include <fstream>
#include <string>

#include <boost/iostreams/filtering_stream.hpp>

namespace file_utils {

// Output stream that gzip-compresses when the file name ends in ".gz"
class AutoGzOfstream {

  boost::iostreams::filtering_ostream boost_out;
  std::ofstream fout;

public:
  void openOrThrow(const std::string& file, std::ios_base::openmode mode = std::ios::out);
  void close();
  template <class T> AutoGzOfstream& operator<<(const T& x) {
    boost_out << x;
    return *this;
  }

  AutoGzOfstream& operator<<(std::ostream& (*manip)(std::ostream&) );
  std::ostream& stream();
  operator bool() const;
};

// Input stream that transparently gunzips when the file name ends in ".gz"
class AutoGzIfstream {

  boost::iostreams::filtering_istream boost_in;
  std::ifstream fin;

public:
  void openOrThrow(const std::string& file, std::ios_base::openmode mode = std::ios::in);
  void close();
  bool getline(std::string& line);
  operator bool() const;
};

bool has_gz_suffix(const std::string& file);

} // namespace file_utils

#endif // HAPLO_LIB_FILE_UTILS_H

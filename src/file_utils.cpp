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

// Modified from the Eagle software file
// https://github.com/poruloh/Eagle/blob/master/src/FileUtils.cpp
// developed by Po-Ru Loh and released under the GNU General Public
// License v3.0 (GPLv3).

#include "file_utils.hpp"
#include "utils.hpp"

#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include <stdexcept>

namespace file_utils {

bool has_gz_suffix(const std::string& file) {
  return file.length() > 3 && file.substr(file.length() - 3) == ".gz";
}

/***** AutoGzOfstream class implementation *****/

void AutoGzOfstream::openOrThrow(const std::string& file, std::ios_base::openmode mode) {
  if (has_gz_suffix(file)) {
    mode |= std::ios::binary;
  }
  fout.open(file.c_str(), mode);
  if (!fout) {
    throw std::runtime_error(THROW_LINE("Unable to open file for writing: " + file));
  }
  if (has_gz_suffix(file)) {
    boost_out.push(boost::iostreams::gzip_compressor());
  }
  boost_out.push(fout);
}

void AutoGzOfstream::close() {
  boost_out.reset();
  fout.close();
}

AutoGzOfstream& AutoGzOfstream::operator<<(std::ostream& (*manip)(std::ostream&) ) {
  manip(boost_out);
  return *this;
}

std::ostream& AutoGzOfstream::stream() {
  return boost_out;
}

AutoGzOfstream::operator bool() const {
  return !boost_out.fail();
}

/***** AutoGzIfstream class implementation *****/

void AutoGzIfstream::openOrThrow(const std::string& file, std::ios_base::openmode mode) {
  if (has_gz_suffix(file)) {
    mode |= std::ios::binary;
  }
  fin.open(file.c_str(), mode);
  if (!fin) {
    throw std::runtime_error(THROW_LINE("Unable to open file for reading: " + file));
  }
  if (has_gz_suffix(file)) {
    boost_in.push(boost::iostreams::gzip_decompressor());
  }
  boost_in.push(fin);
}

void AutoGzIfstream::close() {
  boost_in.reset();
  fin.close();
}

bool AutoGzIfstream::getline(std::string& line) {
  if (!std::getline(boost_in, line)) {
    return false;
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return true;
}

AutoGzIfstream::operator bool() const {
  return !boost_in.fail();
}

} // namespace file_utils

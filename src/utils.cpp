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

#include "utils.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <stdexcept>
#include <string>
#include <vector>

using std::string;
using std::vector;

namespace utils {

string current_time_string() {
  auto now = std::chrono::system_clock::now();
  std::time_t curr_time = std::chrono::system_clock::to_time_t(now);

  char output[100];
  if (std::strftime(output, sizeof(output), "%Y-%m-%d %X", std::localtime(&curr_time))) {
    string my_string(output);
    return my_string;
  }
  else {
    throw std::runtime_error(THROW_LINE("Trying to get time failed."));
  }
}

int arg_to_positive_int(char* arg) {
  const string s(arg);
  size_t end = 0;
  int value = 0;
  try {
    value = std::stoi(s, &end);
  } catch (const std::logic_error&) {
    throw std::invalid_argument(THROW_LINE("Expected a positive integer, got `" + s + "`"));
  }
  if (end != s.size() || value <= 0) {
    throw std::invalid_argument(THROW_LINE("Expected a positive integer, got `" + s + "`"));
  }
  return value;
}

bool equals_ignore_case(const string& a, const string& b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::toupper(static_cast<unsigned char>(a[i])) != std::toupper(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

vector<string> split_whitespace(const string& s) {
  vector<string> fields;
  size_t pos = 0;
  while (pos < s.size()) {
    size_t start = s.find_first_not_of(" \t\r\n", pos);
    if (start == string::npos) {
      break;
    }
    size_t end = s.find_first_of(" \t\r\n", start);
    if (end == string::npos) {
      end = s.size();
    }
    fields.push_back(s.substr(start, end - start));
    pos = end;
  }
  return fields;
}

vector<string> split(const string& s, char delim) {
  vector<string> fields;
  size_t start = 0;
  while (true) {
    size_t end = s.find(delim, start);
    if (end == string::npos) {
      fields.push_back(s.substr(start));
      break;
    }
    fields.push_back(s.substr(start, end - start));
    start = end + 1;
  }
  return fields;
}

} // namespace utils

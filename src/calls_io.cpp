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

#include "calls_io.hpp"

#include "file_utils.hpp"
#include "utils.hpp"

#include <stdexcept>
#include <vector>

using std::string;
using std::vector;

namespace {

constexpr size_t vcf_num_columns = 10;
constexpr size_t vcf_pos_col = 1;
constexpr size_t vcf_ref_col = 3;
constexpr size_t vcf_alt_col = 4;
constexpr size_t vcf_format_col = 8;
constexpr size_t vcf_sample_col = 9;

string where(const string& path, size_t line_number) {
  return path + ":" + std::to_string(line_number);
}

genome_pos_t parse_position(const string& field, const string& path, size_t line_number) {
  size_t consumed = 0;
  long long value = 0;
  try {
    value = std::stoll(field, &consumed);
  } catch (const std::logic_error&) {
    consumed = 0;
  }
  if (consumed == 0 || consumed != field.size() || value <= 0) {
    throw std::runtime_error(THROW_LINE("Invalid position '" + field + "' at " + where(path, line_number)));
  }
  return static_cast<genome_pos_t>(value);
}

// Returns false when the genotype is missing
bool read_vcf_record(const vector<string>& fields, const string& path, size_t line_number, genome_pos_t& position,
                     string& allele) {
  position = parse_position(fields[vcf_pos_col], path, line_number);

  const vector<string> format = utils::split(fields[vcf_format_col], ':');
  const vector<string> sample = utils::split(fields[vcf_sample_col], ':');
  size_t gt_index = format.size();
  for (size_t i = 0; i < format.size(); ++i) {
    if (format[i] == "GT") {
      gt_index = i;
      break;
    }
  }
  if (gt_index == format.size()) {
    throw std::runtime_error(THROW_LINE("No GT field in FORMAT at " + where(path, line_number)));
  }
  if (gt_index >= sample.size()) {
    return false;
  }

  const string& gt = sample[gt_index];
  const size_t separator = gt.find_first_of("/|");
  const string first = gt.substr(0, separator);
  if (first.empty() || first == ".") {
    return false;
  }
  for (char c : first) {
    if (c < '0' || c > '9' || first.size() > 6) {
      throw std::runtime_error(THROW_LINE("Invalid genotype '" + gt + "' at " + where(path, line_number)));
    }
  }

  const size_t index = std::stoul(first);
  if (index == 0) {
    allele = fields[vcf_ref_col];
    return true;
  }
  const vector<string> alts = utils::split(fields[vcf_alt_col], ',');
  if (index > alts.size() || alts[index - 1] == ".") {
    throw std::runtime_error(
        THROW_LINE("Genotype '" + gt + "' has no matching ALT allele at " + where(path, line_number)));
  }
  allele = alts[index - 1];
  return true;
}

} // namespace

namespace calls_io {

CallMap read_calls(const string& path) {
  file_utils::AutoGzIfstream fin;
  fin.openOrThrow(path);

  CallMap calls;
  string line;
  size_t line_number = 0;
  while (fin.getline(line)) {
    ++line_number;
    if (line.empty() || line[0] == '#') {
      continue;
    }

    genome_pos_t position = 0;
    string allele;
    const vector<string> tab_fields = utils::split(line, '\t');
    if (tab_fields.size() >= vcf_num_columns) {
      if (!read_vcf_record(tab_fields, path, line_number, position, allele)) {
        continue;
      }
    }
    else {
      const vector<string> fields = utils::split_whitespace(line);
      if (fields.empty()) {
        continue;
      }
      if (fields.size() != 2) {
        throw std::runtime_error(THROW_LINE("Expected 'position allele' but found " + std::to_string(fields.size()) +
                                            " columns at " + where(path, line_number)));
      }
      position = parse_position(fields[0], path, line_number);
      allele = fields[1];
    }
    calls[position] = allele;
  }
  fin.close();
  return calls;
}

} // namespace calls_io

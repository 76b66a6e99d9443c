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

#ifndef HAPLO_LIB_REPORT_WRITER_H
#define HAPLO_LIB_REPORT_WRITER_H

#include "haplogroup_result.hpp"
#include "haplogroup_tree.hpp"
#include "tree_source.hpp"
#include "types.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

struct ReportSummary {
  // Distinct markers over all nodes
  size_t markers_in_tree = 0;
  // Distinct tree markers for which the sample has a call
  size_t markers_with_calls = 0;
  size_t candidates_evaluated = 0;
  // Markers on the path of the top result, 0 without a result
  size_t markers_on_path = 0;
};

/**
 * @class ReportInput
 * @brief Everything a report is assembled from. Holds references, which must outlive it.
 */
class ReportInput {
public:
  std::string title;
  const std::vector<HaplogroupResult>& results;
  const HaplogroupTree& tree;
  const CallMap& calls;
  std::optional<std::string> sample_name;
  size_t top_n;

  ReportInput(std::string _title, const std::vector<HaplogroupResult>& _results, const HaplogroupTree& _tree,
              const CallMap& _calls, std::optional<std::string> _sample_name = std::nullopt, size_t _top_n = 10);
};

std::string report_title(TreeKind kind);

ReportSummary summarize(const std::vector<HaplogroupResult>& results, const HaplogroupTree& tree,
                        const CallMap& calls);

/**
 * @brief Write a plain-text haplogroup report.
 *
 * The report has a header, the predicted haplogroup, a table of the top candidates, the path to the
 * prediction with the derived markers gained at each step, the markers along that path ordered by position,
 * and summary statistics.
 */
void write_report(std::ostream& os, const ReportInput& input);

// As write_report, to a file that is gzipped when its name ends in ".gz"
void write_report_file(const std::string& path, const ReportInput& input);

#endif // HAPLO_LIB_REPORT_WRITER_H

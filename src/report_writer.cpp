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

#include "report_writer.hpp"

#include "file_utils.hpp"
#include "locus.hpp"
#include "path_resolver.hpp"
#include "utils.hpp"

#include <algorithm>
#include <iomanip>
#include <set>
#include <unordered_map>
#include <utility>

using std::string;
using std::vector;

namespace {

const string heavy_rule(80, '=');
const string light_rule(80, '-');

void write_section_header(std::ostream& os, const string& name) {
  os << light_rule << "\n" << name << "\n" << light_rule << "\n";
}

bool has_prediction(const vector<HaplogroupResult>& results) {
  return !results.empty() && results.front().matching_snps > 0;
}

} // namespace

ReportInput::ReportInput(string _title, const vector<HaplogroupResult>& _results, const HaplogroupTree& _tree,
                         const CallMap& _calls, std::optional<string> _sample_name, size_t _top_n)
    : title(std::move(_title)), results(_results), tree(_tree), calls(_calls),
      sample_name(std::move(_sample_name)), top_n(_top_n) {
}

string report_title(TreeKind kind) {
  return tree_kind_name(kind) + " Haplogroup Analysis Report";
}

ReportSummary summarize(const vector<HaplogroupResult>& results, const HaplogroupTree& tree,
                        const CallMap& calls) {
  ReportSummary summary;
  std::set<Locus> distinct;
  for (const HaplogroupNode& node : tree.all_nodes()) {
    distinct.insert(node.loci.begin(), node.loci.end());
  }
  summary.markers_in_tree = distinct.size();
  summary.markers_with_calls = static_cast<size_t>(
      std::count_if(distinct.begin(), distinct.end(), [&calls](const Locus& locus) {
        return classify_call(locus, calls) != CallState::NO_CALL;
      }));
  summary.candidates_evaluated = results.size();
  if (!results.empty()) {
    for (const PathStep& step : resolve_path(tree, results.front().name)) {
      summary.markers_on_path += step.node->loci.size();
    }
  }
  return summary;
}

void write_report(std::ostream& os, const ReportInput& input) {
  const vector<HaplogroupResult>& results = input.results;
  const bool determined = has_prediction(results);

  os << heavy_rule << "\n  " << input.title << "\n" << heavy_rule << "\n\n";
  os << "Generated: " << utils::current_time_string() << "\n";
  if (input.sample_name) {
    os << "Sample: " << *input.sample_name << "\n";
  }
  os << "\n";

  write_section_header(os, "HAPLOGROUP PREDICTION");
  if (determined) {
    const HaplogroupResult& top = results.front();
    os << "  Predicted Haplogroup: " << top.name << "\n";
    os << "  Score: " << top.score << "\n";
    os << "  Derived SNPs: " << top.matching_snps << "\n";
    os << "  Ancestral SNPs: " << top.ancestral_matches << "\n";
    os << "  No Calls: " << top.no_calls << "\n";
    os << "  Tree Depth: " << top.depth << "\n";
  }
  else {
    os << "  No haplogroup could be determined.\n";
  }
  os << "\n";

  write_section_header(os, "TOP " + std::to_string(input.top_n) + " CANDIDATES");
  os << std::right << std::setw(5) << "Rank" << "  " << std::left << std::setw(25) << "Haplogroup" << "  "
     << std::right << std::setw(8) << "Score" << "  " << std::setw(8) << "Derived" << "  " << std::setw(10)
     << "Ancestral" << "  " << std::setw(6) << "Depth" << "\n";
  os << light_rule << "\n";
  const size_t shown = std::min(input.top_n, results.size());
  for (size_t i = 0; i < shown; ++i) {
    const HaplogroupResult& result = results[i];
    os << std::right << std::setw(5) << (i + 1) << "  " << std::left << std::setw(25) << result.name << "  "
       << std::right << std::fixed << std::setprecision(1) << std::setw(8) << result.score << "  "
       << std::setw(8) << result.matching_snps << "  " << std::setw(10) << result.ancestral_matches << "  "
       << std::setw(6) << result.depth << "\n";
    os.unsetf(std::ios_base::floatfield);
    os << std::setprecision(6);
  }
  os << "\n";

  if (determined) {
    const vector<PathStep> path = resolve_path(input.tree, results.front().name);
    std::unordered_map<string, const HaplogroupResult*> by_name;
    for (const HaplogroupResult& result : results) {
      by_name.emplace(result.name, &result);
    }

    write_section_header(os, "HAPLOGROUP PATH");
    int parent_derived = 0;
    for (const PathStep& step : path) {
      os << string(2 * step.depth, ' ') << step.node->name;
      auto search = by_name.find(step.node->name);
      if (search != by_name.end()) {
        os << " [+" << (search->second->matching_snps - parent_derived) << " derived]";
        parent_derived = search->second->matching_snps;
      }
      os << "\n";
    }
    os << "\n";

    write_section_header(os, "SNP DETAILS (along predicted path)");
    os << std::right << std::setw(12) << "Position" << "  " << std::left << std::setw(20) << "SNP Name" << "  "
       << std::right << std::setw(10) << "Ancestral" << "  " << std::setw(10) << "Derived" << "  "
       << std::setw(10) << "Called" << "  " << std::setw(10) << "State" << "\n";
    os << light_rule << "\n";
    vector<Locus> path_loci;
    for (const PathStep& step : path) {
      path_loci.insert(path_loci.end(), step.node->loci.begin(), step.node->loci.end());
    }
    std::stable_sort(path_loci.begin(), path_loci.end(),
                     [](const Locus& lhs, const Locus& rhs) { return lhs.position < rhs.position; });
    for (const Locus& locus : path_loci) {
      const CallState state = classify_call(locus, input.calls);
      auto call = input.calls.find(locus.position);
      const string called = call == input.calls.end() || call->second.empty() ? "-" : call->second;
      os << std::right << std::setw(12) << locus.position << "  " << std::left << std::setw(20) << locus.name
         << "  " << std::right << std::setw(10) << locus.ref << "  " << std::setw(10) << locus.alt << "  "
         << std::setw(10) << called << "  " << std::setw(10) << call_state_name(state) << "\n";
    }
    os << "\n";
  }

  const ReportSummary summary = summarize(results, input.tree, input.calls);
  write_section_header(os, "SUMMARY STATISTICS");
  os << "  Total SNPs in tree: " << summary.markers_in_tree << "\n";
  os << "  SNPs with calls: " << summary.markers_with_calls << "\n";
  os << "  Haplogroups evaluated: " << summary.candidates_evaluated << "\n";
  if (determined) {
    os << "  SNPs on predicted path: " << summary.markers_on_path << "\n";
  }
  os << "\n" << heavy_rule << std::endl;
}

void write_report_file(const string& path, const ReportInput& input) {
  file_utils::AutoGzOfstream out;
  out.openOrThrow(path);
  write_report(out.stream(), input);
  out.close();
}

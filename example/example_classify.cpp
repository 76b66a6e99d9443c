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
#include "classifier.hpp"
#include "report_writer.hpp"
#include "tree_parser.hpp"
#include "tree_source.hpp"
#include "utils.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
  std::string payload_file = HAPLO_LIB_TESTDATA_DIR "/ftdna_ytree.json";
  std::string calls_file = HAPLO_LIB_TESTDATA_DIR "/calls.vcf";
  unsigned num_tasks = 2;
  if (argc > 2) {
    payload_file = argv[1];
    calls_file = argv[2];
  }
  if (argc > 3) {
    try {
      num_tasks = static_cast<unsigned>(utils::arg_to_positive_int(argv[3]));
    } catch (const std::invalid_argument& e) {
      std::cerr << "num_tasks: " << e.what() << std::endl;
      return 1;
    }
  }

  std::ifstream in(payload_file);
  std::stringstream buffer;
  buffer << in.rdbuf();
  const TreeSourceConfig config = tree_sources::ftdna_ytree();
  const HaplogroupTree tree =
      tree_parser::build_tree(tree_parser::parse_tree_payload(buffer.str(), config), config, config.native_build);

  const CallMap calls = calls_io::read_calls(calls_file);
  std::cout << "Read " << calls.size() << " calls from " << calls_file << std::endl;

  const std::vector<HaplogroupResult> results = classifier::classify(tree, calls);
  std::cout << "Confidence: " << classifier::compute_confidence(tree, results) << std::endl;
  write_report(std::cout, ReportInput(report_title(config.kind), results, tree, calls, calls_file));

  // The same sample with alleles knocked out one at a time
  std::vector<CallMap> samples;
  for (const auto& call : calls) {
    CallMap sample = calls;
    sample.erase(call.first);
    samples.push_back(sample);
  }
  const auto all = classifier::classify_samples(tree, samples, ScoringParams(), num_tasks);
  for (size_t i = 0; i < all.size(); ++i) {
    std::cout << "sample " << i << ": " << all[i].front() << std::endl;
  }

  return 0;
}

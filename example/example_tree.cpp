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

#include "haplogroup_tree.hpp"
#include "path_resolver.hpp"
#include "tree_parser.hpp"
#include "tree_source.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

int main(int argc, char* argv[]) {
  // Read a tree payload from a file
  std::string payload_file = HAPLO_LIB_TESTDATA_DIR "/decodingus_ytree.json";
  if (argc > 1) {
    payload_file = argv[1];
  }
  std::ifstream in(payload_file);
  if (!in) {
    std::cerr << "Unable to open " << payload_file << std::endl;
    return 1;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  const TreeSourceConfig config = tree_sources::decodingus_ytree();
  const ParsedTree parsed = tree_parser::parse_tree_payload(buffer.str(), config);
  std::cout << parsed.nodes.size() << " haplogroups, " << parsed.num_markers() << " markers" << std::endl;

  for (const std::string build : {"GRCh38", "GRCh37", "T2T-CHM13v2.0"}) {
    ReconciliationStats stats;
    HaplogroupTree tree = tree_parser::build_tree(parsed, config, build, &stats);
    tree.check();
    std::cout << build << ": " << tree << " (" << stats.markers_dropped << " markers dropped)" << std::endl;
    for (const HaplogroupNode& node : tree.all_nodes()) {
      std::cout << "  " << node << std::endl;
    }
  }

  HaplogroupTree tree = tree_parser::build_tree(parsed, config, "GRCh38");
  for (const PathStep& step : resolve_path(tree, "R1b")) {
    std::cout << std::string(2 * step.depth, ' ') << step.node->name << std::endl;
  }

  return 0;
}

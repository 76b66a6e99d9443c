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

#ifndef HAPLO_LIB_TREE_PARSER_H
#define HAPLO_LIB_TREE_PARSER_H

#include "haplogroup_tree.hpp"
#include "locus.hpp"
#include "tree_source.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief A marker as it appears in the payload, with its coordinate on every build the payload lists.
 */
struct ParsedMarker {
  std::string name;
  // canonical build name -> coordinate
  std::map<std::string, MarkerCoordinate> coordinates;
};

struct ParsedNode {
  std::string name;
  std::optional<std::string> parent;
  std::vector<ParsedMarker> markers;
  // indices into ParsedTree::nodes, in declaration order
  std::vector<int> children;
};

/**
 * @brief Build-independent form of a tree payload. Validated: unique names, every node reachable from exactly
 * one root path.
 */
struct ParsedTree {
  std::vector<ParsedNode> nodes;
  std::vector<int> roots;

  size_t num_markers() const;
};

struct ReconciliationStats {
  size_t markers_kept = 0;
  size_t markers_dropped = 0;
};

namespace tree_parser {

/**
 * @brief Parse a raw tree payload in the layout named by the source configuration.
 *
 * @param payload The raw payload text as downloaded.
 * @param config The source the payload came from.
 * @return the parsed tree.
 * @throws std::runtime_error if the payload is not a valid tree.
 */
ParsedTree parse_tree_payload(const std::string& payload, const TreeSourceConfig& config);

ParsedTree parse_ftdna_payload(const std::string& payload, const TreeSourceConfig& config);

ParsedTree parse_decodingus_payload(const std::string& payload, const TreeSourceConfig& config);

/**
 * @brief Build the immutable tree for one reference build.
 *
 * Coordinates are taken from the native build when the target is the native build or one of the source's
 * identity builds, and from each marker's own coordinate table otherwise. Markers with no coordinate for the
 * target are left out of the node's loci.
 *
 * @param parsed The parsed payload.
 * @param config The source the payload came from.
 * @param target_build Requested build, any alias.
 * @param stats If not null, receives the number of markers kept and dropped.
 * @return the tree with loci on the target build.
 */
HaplogroupTree build_tree(const ParsedTree& parsed, const TreeSourceConfig& config, const std::string& target_build,
                          ReconciliationStats* stats = nullptr);

} // namespace tree_parser

#endif // HAPLO_LIB_TREE_PARSER_H

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

#ifndef HAPLO_LIB_PATH_RESOLVER_H
#define HAPLO_LIB_PATH_RESOLVER_H

#include "haplogroup_node.hpp"
#include "haplogroup_tree.hpp"

#include <string>
#include <vector>

// One node on a root-to-node path, depth counted from the root
struct PathStep {
  const HaplogroupNode* node;
  int depth;
};

/**
 * @brief Root-to-node path of a haplogroup.
 *
 * Roots are searched in declaration order, and children in declaration order, depth first.
 * The returned pointers are valid as long as the tree is.
 *
 * @param tree The tree to search.
 * @param target_name Haplogroup name.
 * @return the path from the root to the named node inclusive, empty if no node has this name.
 */
std::vector<PathStep> resolve_path(const HaplogroupTree& tree, const std::string& target_name);

std::vector<std::string> path_names(const std::vector<PathStep>& path);

#endif // HAPLO_LIB_PATH_RESOLVER_H

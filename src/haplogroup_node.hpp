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

#ifndef HAPLO_LIB_HAPLOGROUP_NODE_H
#define HAPLO_LIB_HAPLOGROUP_NODE_H

#include "locus.hpp"

#include <iostream>
#include <string>
#include <vector>

class HaplogroupNode {
public:
  int ID;
  std::string name;
  // Index of the parent in the owning tree's arena, -1 for roots
  int parent_id;
  // Distance from the root of this node's subtree
  int depth;
  std::vector<Locus> loci;
  // Arena indices, in declaration order
  std::vector<int> children;

  HaplogroupNode(int _ID, std::string _name, int _parent_id, int _depth, std::vector<Locus> _loci);
  bool is_root() const;
  bool is_leaf() const;
  friend std::ostream& operator<<(std::ostream& os, const HaplogroupNode& node);
};

#endif // HAPLO_LIB_HAPLOGROUP_NODE_H

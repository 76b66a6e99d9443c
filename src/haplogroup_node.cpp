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

#include "haplogroup_node.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

using std::ostream;
using std::string;
using std::vector;

HaplogroupNode::HaplogroupNode(int _ID, string _name, int _parent_id, int _depth, vector<Locus> _loci)
    : ID(_ID), name(std::move(_name)), parent_id(_parent_id), depth(_depth), loci(std::move(_loci)) {
  assert(ID >= 0);
  assert(parent_id < ID);
  assert(depth >= 0);
}

bool HaplogroupNode::is_root() const {
  return parent_id < 0;
}

bool HaplogroupNode::is_leaf() const {
  return children.empty();
}

ostream& operator<<(ostream& os, const HaplogroupNode& node) {
  os << "Haplogroup " << node.ID << " (" << node.name << "), depth: " << node.depth;
  if (!node.is_root()) {
    os << ", parent: " << node.parent_id;
  }
  os << ", loci: {";

  string subset = "";
  for (auto const& locus : node.loci) {
    subset += locus.name + ", ";
  }
  os << subset.substr(0, subset.size() >= 2 ? subset.size() - 2 : 0);

  os << "}";
  return os;
}

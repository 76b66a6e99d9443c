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
#include "utils.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using std::string;
using std::vector;

int HaplogroupTree::add_node(const string& name, int parent_id, vector<Locus> loci) {
  if (name.empty()) {
    throw std::invalid_argument(THROW_LINE("Haplogroup name must not be empty."));
  }
  if (name_to_id.find(name) != name_to_id.end()) {
    throw std::invalid_argument(THROW_LINE("Duplicate haplogroup name: " + name));
  }
  int depth = 0;
  if (parent_id >= 0) {
    depth = node(parent_id).depth + 1;
  }
  int id = static_cast<int>(nodes.size());
  num_loci_cnt += loci.size();
  nodes.emplace_back(id, name, parent_id, depth, std::move(loci));
  name_to_id.insert({name, id});
  if (parent_id >= 0) {
    nodes[parent_id].children.push_back(id);
  }
  else {
    root_ids.push_back(id);
  }
  return id;
}

int HaplogroupTree::add_root(const string& name, vector<Locus> loci) {
  return add_node(name, -1, std::move(loci));
}

int HaplogroupTree::add_child(int parent_id, const string& name, vector<Locus> loci) {
  if (parent_id < 0 || parent_id >= static_cast<int>(nodes.size())) {
    throw std::out_of_range(THROW_LINE("Parent ID " + std::to_string(parent_id) + " is not in the tree."));
  }
  return add_node(name, parent_id, std::move(loci));
}

const HaplogroupNode& HaplogroupTree::node(int id) const {
  if (id < 0 || id >= static_cast<int>(nodes.size())) {
    throw std::out_of_range(THROW_LINE("Node ID " + std::to_string(id) + " is not in the tree."));
  }
  return nodes[id];
}

const vector<HaplogroupNode>& HaplogroupTree::all_nodes() const {
  return nodes;
}

const vector<int>& HaplogroupTree::roots() const {
  return root_ids;
}

const HaplogroupNode* HaplogroupTree::find(const string& name) const {
  auto search = name_to_id.find(name);
  if (search == name_to_id.end()) {
    return nullptr;
  }
  return &nodes[search->second];
}

bool HaplogroupTree::contains(const string& name) const {
  return name_to_id.find(name) != name_to_id.end();
}

std::optional<string> HaplogroupTree::parent_name(int id) const {
  const HaplogroupNode& n = node(id);
  if (n.is_root()) {
    return std::nullopt;
  }
  return nodes[n.parent_id].name;
}

bool HaplogroupTree::is_ancestor(int ancestor_id, int id) const {
  // parents always have smaller IDs, so we can stop as soon as we pass ancestor_id
  int current = node(id).parent_id;
  while (current >= ancestor_id && current >= 0) {
    if (current == ancestor_id) {
      return true;
    }
    current = nodes[current].parent_id;
  }
  return false;
}

size_t HaplogroupTree::num_nodes() const {
  return nodes.size();
}

size_t HaplogroupTree::num_loci() const {
  return num_loci_cnt;
}

bool HaplogroupTree::empty() const {
  return nodes.empty();
}

void HaplogroupTree::check() const {
  size_t loci_seen = 0;
  size_t roots_seen = 0;
  for (const HaplogroupNode& n : nodes) {
    if (n.ID < 0 || n.ID >= static_cast<int>(nodes.size()) || &nodes[n.ID] != &n) {
      throw std::logic_error(THROW_LINE("Node " + n.name + " has an inconsistent ID."));
    }
    if (n.is_root()) {
      ++roots_seen;
      if (n.depth != 0) {
        throw std::logic_error(THROW_LINE("Root " + n.name + " must have depth 0."));
      }
    }
    else {
      if (n.parent_id >= n.ID) {
        throw std::logic_error(THROW_LINE("Node " + n.name + " is not preceded by its parent."));
      }
      const HaplogroupNode& parent = nodes[n.parent_id];
      if (n.depth != parent.depth + 1) {
        throw std::logic_error(THROW_LINE("Node " + n.name + " has a depth inconsistent with its parent."));
      }
      size_t listed = 0;
      for (int child : parent.children) {
        if (child == n.ID) {
          ++listed;
        }
      }
      if (listed != 1) {
        throw std::logic_error(THROW_LINE("Node " + n.name + " must be listed exactly once by its parent."));
      }
    }
    for (int child : n.children) {
      if (child <= n.ID || child >= static_cast<int>(nodes.size()) || nodes[child].parent_id != n.ID) {
        throw std::logic_error(THROW_LINE("Node " + n.name + " lists a child that does not point back."));
      }
    }
    auto search = name_to_id.find(n.name);
    if (search == name_to_id.end() || search->second != n.ID) {
      throw std::logic_error(THROW_LINE("Name index is out of date for " + n.name));
    }
    loci_seen += n.loci.size();
  }
  if (roots_seen != root_ids.size() || name_to_id.size() != nodes.size() || loci_seen != num_loci_cnt) {
    throw std::logic_error(THROW_LINE("Tree summary counts are out of date."));
  }
}

std::ostream& operator<<(std::ostream& os, const HaplogroupTree& tree) {
  os << "HaplogroupTree with " << tree.num_nodes() << " nodes, " << tree.roots().size() << " roots and "
     << tree.num_loci() << " loci";
  return os;
}

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

#include "path_resolver.hpp"

#include <utility>

using std::string;
using std::vector;

vector<PathStep> resolve_path(const HaplogroupTree& tree, const string& target_name) {
  vector<PathStep> path;
  // (node ID, depth); children are pushed in reverse so the first child is visited first
  vector<std::pair<int, int>> stack;
  for (auto it = tree.roots().rbegin(); it != tree.roots().rend(); ++it) {
    stack.emplace_back(*it, 0);
  }

  while (!stack.empty()) {
    const std::pair<int, int> top = stack.back();
    stack.pop_back();
    const HaplogroupNode& node = tree.node(top.first);

    path.resize(top.second);
    path.push_back(PathStep{&node, top.second});
    if (node.name == target_name) {
      return path;
    }
    for (auto it = node.children.rbegin(); it != node.children.rend(); ++it) {
      stack.emplace_back(*it, top.second + 1);
    }
  }
  return {};
}

vector<string> path_names(const vector<PathStep>& path) {
  vector<string> names;
  names.reserve(path.size());
  for (const PathStep& step : path) {
    names.push_back(step.node->name);
  }
  return names;
}

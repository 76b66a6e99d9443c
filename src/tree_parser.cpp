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

#include "tree_parser.hpp"
#include "utils.hpp"

#include "nlohmann/json.hpp"

#include <algorithm>
#include <iostream>
#include <stack>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

using nlohmann::json;
using std::string;
using std::vector;

namespace
{

const json& require_field(const json& obj, const string& key, const string& context)
{
  auto search = obj.find(key);
  if (search == obj.end() || search->is_null()) {
    throw std::runtime_error(THROW_LINE(context + " is missing required field `" + key + "`"));
  }
  return *search;
}

string optional_string(const json& obj, const string& key)
{
  auto search = obj.find(key);
  if (search == obj.end() || search->is_null()) {
    return "";
  }
  return search->get<string>();
}

// Checks that every node hangs off exactly one root path and that names are unique
void validate_parsed_tree(const ParsedTree& parsed)
{
  if (parsed.roots.empty()) {
    throw std::runtime_error(THROW_LINE("Tree payload contains no root node"));
  }
  std::unordered_map<string, int> names;
  for (size_t i = 0; i < parsed.nodes.size(); ++i) {
    if (parsed.nodes[i].name.empty()) {
      throw std::runtime_error(THROW_LINE("Tree payload contains a node without a name"));
    }
    if (!names.insert({parsed.nodes[i].name, static_cast<int>(i)}).second) {
      throw std::runtime_error(THROW_LINE("Tree payload contains duplicate haplogroup `" + parsed.nodes[i].name + "`"));
    }
  }

  vector<bool> visited(parsed.nodes.size(), false);
  std::stack<int> to_process;
  for (int root : parsed.roots) {
    to_process.push(root);
  }
  while (!to_process.empty()) {
    int index = to_process.top();
    to_process.pop();
    if (visited[index]) {
      throw std::runtime_error(
          THROW_LINE("Haplogroup `" + parsed.nodes[index].name + "` is reachable along more than one path"));
    }
    visited[index] = true;
    for (int child : parsed.nodes[index].children) {
      to_process.push(child);
    }
  }
  for (size_t i = 0; i < parsed.nodes.size(); ++i) {
    if (!visited[i]) {
      throw std::runtime_error(
          THROW_LINE("Haplogroup `" + parsed.nodes[i].name + "` is not reachable from any root"));
    }
  }
}

} // namespace

size_t ParsedTree::num_markers() const
{
  size_t count = 0;
  for (const ParsedNode& node : nodes) {
    count += node.markers.size();
  }
  return count;
}

namespace tree_parser {

ParsedTree parse_tree_payload(const string& payload, const TreeSourceConfig& config)
{
  try {
    switch (config.format) {
    case TreeFormat::FTDNA:
      return parse_ftdna_payload(payload, config);
    case TreeFormat::DECODING_US:
      return parse_decodingus_payload(payload, config);
    }
  } catch (const json::exception& e) {
    throw std::runtime_error("Invalid " + config.source_id + " payload: " + e.what());
  }
  throw std::logic_error(THROW_LINE("Unhandled tree format for " + config.source_id));
}

ParsedTree parse_ftdna_payload(const string& payload, const TreeSourceConfig& config)
{
  const json doc = json::parse(payload);
  if (!doc.is_object()) {
    throw std::runtime_error(THROW_LINE("FTDNA payload must be a JSON object"));
  }
  const json& all_nodes = require_field(doc, "allNodes", "FTDNA payload");
  if (!all_nodes.is_object()) {
    throw std::runtime_error(THROW_LINE("FTDNA payload field `allNodes` must be an object"));
  }

  const string native = canonical_build(config.native_build);
  struct Entry {
    long long haplogroup_id;
    bool is_root;
    vector<long long> child_ids;
    ParsedNode node;
  };
  vector<Entry> entries;
  entries.reserve(all_nodes.size());

  for (const auto& item : all_nodes.items()) {
    const json& value = item.value();
    const string context = "FTDNA node `" + item.key() + "`";
    Entry entry;
    entry.haplogroup_id = require_field(value, "haplogroupId", context).get<long long>();
    entry.node.name = require_field(value, "name", context).get<string>();
    auto root_flag = value.find("isRoot");
    entry.is_root = root_flag != value.end() && !root_flag->is_null() && root_flag->get<bool>();

    auto variants = value.find("variants");
    if (variants != value.end() && !variants->is_null()) {
      for (const json& variant : *variants) {
        ParsedMarker marker;
        marker.name = require_field(variant, "variant", context + " variant").get<string>();
        auto position = variant.find("position");
        if (position != variant.end() && !position->is_null()) {
          marker.coordinates.insert(
              {native, MarkerCoordinate(position->get<genome_pos_t>(), default_chromosome(config.kind, native),
                                        optional_string(variant, "ancestral"), optional_string(variant, "derived"))});
        }
        entry.node.markers.push_back(std::move(marker));
      }
    }
    auto children = value.find("children");
    if (children != value.end() && !children->is_null()) {
      entry.child_ids = children->get<vector<long long>>();
    }
    entries.push_back(std::move(entry));
  }

  // JSON object order is by key string; the numeric ID gives a stable, meaningful order
  std::stable_sort(entries.begin(), entries.end(),
                   [](const Entry& a, const Entry& b) { return a.haplogroup_id < b.haplogroup_id; });

  std::unordered_map<long long, int> id_to_index;
  for (size_t i = 0; i < entries.size(); ++i) {
    if (!id_to_index.insert({entries[i].haplogroup_id, static_cast<int>(i)}).second) {
      throw std::runtime_error(
          THROW_LINE("FTDNA payload has duplicate haplogroupId " + std::to_string(entries[i].haplogroup_id)));
    }
  }

  ParsedTree parsed;
  parsed.nodes.reserve(entries.size());
  for (size_t i = 0; i < entries.size(); ++i) {
    ParsedNode node = std::move(entries[i].node);
    for (long long child_id : entries[i].child_ids) {
      auto search = id_to_index.find(child_id);
      if (search == id_to_index.end()) {
        throw std::runtime_error(THROW_LINE("FTDNA node `" + node.name + "` lists unknown child " +
                                            std::to_string(child_id)));
      }
      node.children.push_back(search->second);
    }
    if (entries[i].is_root) {
      parsed.roots.push_back(static_cast<int>(i));
    }
    parsed.nodes.push_back(std::move(node));
  }
  for (const ParsedNode& node : parsed.nodes) {
    for (int child : node.children) {
      parsed.nodes[child].parent = node.name;
    }
  }

  validate_parsed_tree(parsed);
  return parsed;
}

ParsedTree parse_decodingus_payload(const string& payload, const TreeSourceConfig& config)
{
  const json doc = json::parse(payload);
  if (!doc.is_array()) {
    throw std::runtime_error(THROW_LINE("Decoding-Us payload must be a JSON array"));
  }

  ParsedTree parsed;
  parsed.nodes.reserve(doc.size());
  for (const json& value : doc) {
    ParsedNode node;
    node.name = require_field(value, "name", "Decoding-Us node").get<string>();
    const string context = "Decoding-Us node `" + node.name + "`";
    string parent = optional_string(value, "parentName");
    if (!parent.empty()) {
      node.parent = parent;
    }

    auto variants = value.find("variants");
    if (variants != value.end() && !variants->is_null()) {
      for (const json& variant : *variants) {
        ParsedMarker marker;
        marker.name = require_field(variant, "name", context + " variant").get<string>();
        auto coordinates = variant.find("coordinates");
        if (coordinates != variant.end() && !coordinates->is_null()) {
          for (const auto& coordinate : coordinates->items()) {
            const string build = canonical_build(coordinate.key());
            const json& c = coordinate.value();
            const string coordinate_context = context + " variant `" + marker.name + "`";
            marker.coordinates.insert(
                {build, MarkerCoordinate(require_field(c, "start", coordinate_context).get<genome_pos_t>(),
                                         default_chromosome(config.kind, build), optional_string(c, "anc"),
                                         optional_string(c, "der"))});
          }
        }
        node.markers.push_back(std::move(marker));
      }
    }
    parsed.nodes.push_back(std::move(node));
  }

  std::unordered_map<string, int> name_to_index;
  for (size_t i = 0; i < parsed.nodes.size(); ++i) {
    if (!name_to_index.insert({parsed.nodes[i].name, static_cast<int>(i)}).second) {
      throw std::runtime_error(
          THROW_LINE("Tree payload contains duplicate haplogroup `" + parsed.nodes[i].name + "`"));
    }
    if (!parsed.nodes[i].parent) {
      parsed.roots.push_back(static_cast<int>(i));
    }
  }
  if (parsed.roots.empty()) {
    throw std::runtime_error(THROW_LINE("Tree payload contains no root node"));
  }

  for (size_t i = 0; i < parsed.nodes.size(); ++i) {
    ParsedNode& node = parsed.nodes[i];
    if (!node.parent) {
      continue;
    }
    auto search = name_to_index.find(*node.parent);
    int parent_index = parsed.roots.front();
    if (search == name_to_index.end()) {
      std::cerr << "Warning: parent `" << *node.parent << "` of `" << node.name << "` not found in "
                << config.source_id << ", attaching to root `" << parsed.nodes[parent_index].name << "`\n";
      node.parent = parsed.nodes[parent_index].name;
    }
    else {
      parent_index = search->second;
    }
    parsed.nodes[parent_index].children.push_back(static_cast<int>(i));
  }

  validate_parsed_tree(parsed);
  return parsed;
}

HaplogroupTree build_tree(const ParsedTree& parsed, const TreeSourceConfig& config, const string& target_build,
                          ReconciliationStats* stats)
{
  const bool pass_through = config.is_identity_build(target_build);
  const string lookup_build = pass_through ? canonical_build(config.native_build) : canonical_build(target_build);

  ReconciliationStats local_stats;
  HaplogroupTree tree;

  // Preorder from each root; children pushed in reverse so they come off the stack in declaration order
  std::stack<std::pair<int, int>> to_process;
  for (auto it = parsed.roots.rbegin(); it != parsed.roots.rend(); ++it) {
    to_process.push({*it, -1});
  }
  while (!to_process.empty()) {
    auto [index, tree_parent] = to_process.top();
    to_process.pop();
    const ParsedNode& node = parsed.nodes[index];

    vector<Locus> loci;
    loci.reserve(node.markers.size());
    for (const ParsedMarker& marker : node.markers) {
      auto coordinate = marker.coordinates.find(lookup_build);
      if (coordinate == marker.coordinates.end()) {
        ++local_stats.markers_dropped;
        continue;
      }
      loci.emplace_back(coordinate->second.position, marker.name, coordinate->second.ref, coordinate->second.alt);
      ++local_stats.markers_kept;
    }

    int id = tree_parent < 0 ? tree.add_root(node.name, std::move(loci))
                             : tree.add_child(tree_parent, node.name, std::move(loci));
    for (auto it = node.children.rbegin(); it != node.children.rend(); ++it) {
      to_process.push({*it, id});
    }
  }

  if (stats != nullptr) {
    *stats = local_stats;
  }
  return tree;
}

} // namespace tree_parser

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

#ifndef HAPLO_LIB_HAPLOGROUP_TREE_H
#define HAPLO_LIB_HAPLOGROUP_TREE_H

#include "haplogroup_node.hpp"
#include "locus.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @class HaplogroupTree
 * @brief Arena of haplogroup nodes forming one or more rooted trees.
 *
 * Nodes are only ever appended, and a child can only be added under an existing node, so every parent
 * has a smaller ID than its children. Once fully built a tree is shared read-only, typically as a
 * std::shared_ptr<const HaplogroupTree>.
 */
class HaplogroupTree
{
private:
    std::vector<HaplogroupNode> nodes;
    std::vector<int> root_ids;
    std::unordered_map<std::string, int> name_to_id;
    size_t num_loci_cnt = 0;

    int add_node(const std::string& name, int parent_id, std::vector<Locus> loci);

public:
    HaplogroupTree() = default;

    // copying is not allowed, trees are large and meant to be shared
    HaplogroupTree(HaplogroupTree const&) = delete;
    HaplogroupTree& operator=(HaplogroupTree const&) = delete;
    HaplogroupTree(HaplogroupTree&&) = default;
    HaplogroupTree& operator=(HaplogroupTree&&) = default;

    /**
     * @brief Add a new root node.
     *
     * @param name Haplogroup name, unique within the tree.
     * @param loci Defining markers of the node.
     * @return the ID of the new node.
     */
    int add_root(const std::string& name, std::vector<Locus> loci = {});

    /**
     * @brief Add a node as the last child of an existing node.
     *
     * @param parent_id ID of the parent node.
     * @param name Haplogroup name, unique within the tree.
     * @param loci Defining markers of the node.
     * @return the ID of the new node.
     */
    int add_child(int parent_id, const std::string& name, std::vector<Locus> loci = {});

    const HaplogroupNode& node(int id) const;
    const std::vector<HaplogroupNode>& all_nodes() const;
    const std::vector<int>& roots() const;

    // Returns nullptr if no node has this name
    const HaplogroupNode* find(const std::string& name) const;
    bool contains(const std::string& name) const;
    std::optional<std::string> parent_name(int id) const;

    // Strict ancestry: a node is not its own ancestor
    bool is_ancestor(int ancestor_id, int id) const;

    size_t num_nodes() const;
    size_t num_loci() const;
    bool empty() const;

    // Verifies the structural invariants, throws std::logic_error on violation
    void check() const;

    friend std::ostream& operator<<(std::ostream& os, const HaplogroupTree& tree);
};

#endif // HAPLO_LIB_HAPLOGROUP_TREE_H

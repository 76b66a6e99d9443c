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
#include "locus.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_exception.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <sstream>
#include <stdexcept>
#include <vector>

TEST_CASE("Tree construction", "[tree]") {
  HaplogroupTree tree;
  REQUIRE(tree.empty());

  int a = tree.add_root("A");
  int a1 = tree.add_child(a, "A1", {Locus(1000, "M1", "C", "T")});
  int a2 = tree.add_child(a, "A2", {Locus(3000, "M3", "G", "A")});
  int a1a = tree.add_child(a1, "A1a", {Locus(2000, "M2", "A", "G"), Locus(2500, "M4", "T", "C")});
  int b = tree.add_root("B");

  SECTION("IDs and counts") {
    CHECK(a == 0);
    CHECK(a1 == 1);
    CHECK(a2 == 2);
    CHECK(a1a == 3);
    CHECK(b == 4);
    CHECK(tree.num_nodes() == 5);
    CHECK(tree.num_loci() == 4);
    CHECK(tree.roots() == std::vector<int>{a, b});
    CHECK_NOTHROW(tree.check());
  }

  SECTION("children in declaration order") {
    CHECK(tree.node(a).children == std::vector<int>{a1, a2});
    CHECK(tree.node(a1).children == std::vector<int>{a1a});
    CHECK(tree.node(a2).is_leaf());
    CHECK(tree.node(b).is_root());
    CHECK(tree.node(b).is_leaf());
  }

  SECTION("depth and parents") {
    CHECK(tree.node(a).depth == 0);
    CHECK(tree.node(a1).depth == 1);
    CHECK(tree.node(a1a).depth == 2);
    CHECK(tree.node(b).depth == 0);
    CHECK(!tree.parent_name(a).has_value());
    CHECK(tree.parent_name(a1a).value() == "A1");
    for (const HaplogroupNode& node : tree.all_nodes()) {
      CHECK(node.parent_id < node.ID);
    }
  }

  SECTION("lookup by name") {
    REQUIRE(tree.find("A1a") != nullptr);
    CHECK(tree.find("A1a")->ID == a1a);
    CHECK(tree.find("R1b") == nullptr);
    CHECK(tree.contains("A2"));
    CHECK(!tree.contains("a2"));
  }

  SECTION("ancestry is strict") {
    CHECK(tree.is_ancestor(a, a1a));
    CHECK(tree.is_ancestor(a1, a1a));
    CHECK(!tree.is_ancestor(a1a, a1a));
    CHECK(!tree.is_ancestor(a2, a1a));
    CHECK(!tree.is_ancestor(a1a, a));
    CHECK(!tree.is_ancestor(a, b));
  }

  SECTION("printing") {
    std::ostringstream oss;
    oss << tree;
    CHECK(oss.str() == "HaplogroupTree with 5 nodes, 2 roots and 4 loci");
    std::ostringstream node_oss;
    node_oss << tree.node(a1a);
    CHECK(node_oss.str() == "Haplogroup 3 (A1a), depth: 2, parent: 1, loci: {M2, M4}");
  }

  SECTION("invalid additions") {
    CHECK_THROWS_AS(tree.add_root("A1"), std::invalid_argument);
    CHECK_THROWS_AS(tree.add_child(a, ""), std::invalid_argument);
    CHECK_THROWS_AS(tree.add_child(42, "C"), std::out_of_range);
    CHECK_THROWS_AS(tree.add_child(-1, "C"), std::out_of_range);
    CHECK_THROWS_AS(tree.node(5), std::out_of_range);
    CHECK_THROWS_WITH(tree.add_root("A"), Catch::Matchers::ContainsSubstring("Duplicate haplogroup name: A"));
    // failed additions leave the tree untouched
    CHECK(tree.num_nodes() == 5);
    CHECK_NOTHROW(tree.check());
  }
}

TEST_CASE("Trees are movable", "[tree]") {
  HaplogroupTree tree;
  tree.add_child(tree.add_root("A"), "A1", {Locus(1000, "M1", "C", "T")});
  HaplogroupTree moved(std::move(tree));
  CHECK(moved.num_nodes() == 2);
  CHECK(moved.find("A1")->loci.front() == Locus(1000, "M1", "C", "T"));
  CHECK_NOTHROW(moved.check());
}

TEST_CASE("Call classification", "[locus]") {
  const Locus locus(1000, "M1", "C", "T");

  SECTION("derived and ancestral, ignoring case") {
    CHECK(classify_call(locus, CallMap{{1000, "T"}}) == CallState::DERIVED);
    CHECK(classify_call(locus, CallMap{{1000, "t"}}) == CallState::DERIVED);
    CHECK(classify_call(locus, CallMap{{1000, "C"}}) == CallState::ANCESTRAL);
    CHECK(classify_call(locus, CallMap{{1000, "c"}}) == CallState::ANCESTRAL);
  }

  SECTION("no calls") {
    CHECK(classify_call(locus, CallMap{}) == CallState::NO_CALL);
    CHECK(classify_call(locus, CallMap{{1001, "T"}}) == CallState::NO_CALL);
    CHECK(classify_call(locus, CallMap{{1000, ""}}) == CallState::NO_CALL);
    CHECK(classify_call(locus, CallMap{{1000, "-"}}) == CallState::NO_CALL);
  }

  SECTION("unexpected allele") {
    CHECK(classify_call(locus, CallMap{{1000, "G"}}) == CallState::UNKNOWN);
    CHECK(call_state_name(CallState::UNKNOWN) == "Unknown");
    CHECK(call_state_name(CallState::NO_CALL) == "No Call");
  }

  SECTION("locus ordering") {
    CHECK(Locus(999, "Z", "A", "G") < locus);
    CHECK(Locus(1000, "M0", "C", "T") < locus);
    CHECK(locus != Locus(1000, "M1", "C", "G"));
  }
}

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

#include "calls_io.hpp"
#include "classifier.hpp"
#include "constants.hpp"
#include "fetcher.hpp"
#include "haplogroup_node.hpp"
#include "haplogroup_result.hpp"
#include "haplogroup_tree.hpp"
#include "locus.hpp"
#include "path_resolver.hpp"
#include "report_writer.hpp"
#include "source_cache.hpp"
#include "tree_provider.hpp"
#include "tree_source.hpp"
#include "types.hpp"

#include <pybind11/iostream.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace py = pybind11;
using std::string;
using std::vector;

namespace {

// Owns the collaborators of a TreeProvider so Python sees a single object
class OwningTreeProvider {
public:
  ParsedTreeCache tree_cache;
  DiskPayloadCache payload_cache;
  CurlFetcher fetcher;
  TreeProvider provider;

  OwningTreeProvider(const string& cache_dir, long timeout_seconds, bool verbose)
      : payload_cache(cache_dir), fetcher(timeout_seconds), provider(tree_cache, payload_cache, fetcher, verbose) {
    provider.register_builtin_sources();
  }

  std::shared_ptr<HaplogroupTree> load_tree(const string& source_id, const string& build) {
    TreeLoadResult result = provider.load_tree(source_id, build);
    if (!result.ok()) {
      throw std::runtime_error(tree_load_error_kind_name(result.error().kind) + ": " + result.error().message);
    }
    // The bound HaplogroupTree class exposes no mutators, so the shared tree stays read-only
    return std::const_pointer_cast<HaplogroupTree>(result.tree());
  }

  void register_source(const TreeSourceConfig& config) {
    provider.register_source(config);
  }
};

// Assembles a tree from Python; build() hands the tree over and starts a fresh one
class TreeBuilder {
public:
  int add_root(const string& name, vector<Locus> loci) {
    return tree->add_root(name, std::move(loci));
  }

  int add_child(int parent_id, const string& name, vector<Locus> loci) {
    return tree->add_child(parent_id, name, std::move(loci));
  }

  size_t num_nodes() const {
    return tree->num_nodes();
  }

  std::shared_ptr<HaplogroupTree> build() {
    tree->check();
    std::shared_ptr<HaplogroupTree> built = std::move(tree);
    tree = std::make_shared<HaplogroupTree>();
    return built;
  }

private:
  std::shared_ptr<HaplogroupTree> tree = std::make_shared<HaplogroupTree>();
};

} // namespace

PYBIND11_MODULE(haplo_lib_pybind, m) {
  py::class_<Locus>(m, "Locus")
      .def(py::init<genome_pos_t, string, string, string>(), py::arg("position"), py::arg("name"), py::arg("ref"),
           py::arg("alt"))
      .def_readonly("position", &Locus::position)
      .def_readonly("name", &Locus::name)
      .def_readonly("ref", &Locus::ref)
      .def_readonly("alt", &Locus::alt)
      .def("__repr__", [](const Locus& locus) {
        std::ostringstream oss;
        oss << locus;
        return oss.str();
      });

  py::class_<HaplogroupNode>(m, "HaplogroupNode")
      .def_readonly("ID", &HaplogroupNode::ID)
      .def_readonly("name", &HaplogroupNode::name)
      .def_readonly("parent_id", &HaplogroupNode::parent_id)
      .def_readonly("depth", &HaplogroupNode::depth)
      .def_readonly("loci", &HaplogroupNode::loci)
      .def_readonly("children", &HaplogroupNode::children)
      .def("is_root", &HaplogroupNode::is_root)
      .def("is_leaf", &HaplogroupNode::is_leaf)
      .def("__repr__", [](const HaplogroupNode& node) {
        std::ostringstream oss;
        oss << node;
        return oss.str();
      });

  // Read-only: trees come from TreeProvider.load_tree or TreeBuilder.build
  py::class_<HaplogroupTree, std::shared_ptr<HaplogroupTree>>(m, "HaplogroupTree")
      .def("node", &HaplogroupTree::node, py::arg("id"), py::return_value_policy::reference_internal)
      .def("find", &HaplogroupTree::find, py::arg("name"), py::return_value_policy::reference_internal)
      .def("roots", &HaplogroupTree::roots)
      .def("parent_name", &HaplogroupTree::parent_name, py::arg("id"))
      .def("is_ancestor", &HaplogroupTree::is_ancestor, py::arg("ancestor_id"), py::arg("id"))
      .def("check", &HaplogroupTree::check)
      .def_property_readonly("num_nodes", &HaplogroupTree::num_nodes)
      .def_property_readonly("num_loci", &HaplogroupTree::num_loci)
      .def("__contains__", &HaplogroupTree::contains)
      .def("__len__", &HaplogroupTree::num_nodes)
      .def("__repr__", [](const HaplogroupTree& tree) {
        std::ostringstream oss;
        oss << tree;
        return oss.str();
      });

  py::class_<TreeBuilder>(m, "TreeBuilder")
      .def(py::init<>())
      .def("add_root", &TreeBuilder::add_root, py::arg("name"), py::arg("loci") = vector<Locus>())
      .def("add_child", &TreeBuilder::add_child, py::arg("parent_id"), py::arg("name"),
           py::arg("loci") = vector<Locus>())
      .def_property_readonly("num_nodes", &TreeBuilder::num_nodes)
      .def("build", &TreeBuilder::build, "Check and return the tree; the builder starts over empty");

  py::class_<TreeSourceConfig>(m, "TreeSourceConfig")
      .def_readwrite("source_id", &TreeSourceConfig::source_id)
      .def_readwrite("url", &TreeSourceConfig::url)
      .def_readwrite("cache_prefix", &TreeSourceConfig::cache_prefix)
      .def_readonly("native_build", &TreeSourceConfig::native_build)
      .def_readonly("supported_builds", &TreeSourceConfig::supported_builds)
      .def("supports_build", &TreeSourceConfig::supports_build, py::arg("build"));
  m.def("ftdna_ytree", &tree_sources::ftdna_ytree);
  m.def("ftdna_mttree", &tree_sources::ftdna_mttree);
  m.def("decodingus_ytree", &tree_sources::decodingus_ytree);

  py::class_<HaplogroupResult>(m, "HaplogroupResult")
      .def_readonly("name", &HaplogroupResult::name)
      .def_readonly("score", &HaplogroupResult::score)
      .def_readonly("matching_snps", &HaplogroupResult::matching_snps)
      .def_readonly("ancestral_matches", &HaplogroupResult::ancestral_matches)
      .def_readonly("no_calls", &HaplogroupResult::no_calls)
      .def_readonly("unknown_calls", &HaplogroupResult::unknown_calls)
      .def_readonly("total_snps", &HaplogroupResult::total_snps)
      .def_readonly("cumulative_snps", &HaplogroupResult::cumulative_snps)
      .def_readonly("depth", &HaplogroupResult::depth)
      .def("__repr__", [](const HaplogroupResult& result) {
        std::ostringstream oss;
        oss << result;
        return oss.str();
      });

  py::class_<ScoringParams>(m, "ScoringParams")
      .def(py::init<>())
      .def_readwrite("derived_weight", &ScoringParams::derived_weight)
      .def_readwrite("ancestral_weight", &ScoringParams::ancestral_weight);

  py::class_<OwningTreeProvider>(m, "TreeProvider")
      .def(py::init<const string&, long, bool>(), py::arg("cache_dir") = hgl::default_cache_dir(),
           py::arg("timeout_seconds") = 300, py::arg("verbose") = true)
      .def("load_tree", &OwningTreeProvider::load_tree, py::arg("source_id"), py::arg("build"),
           py::call_guard<py::scoped_ostream_redirect, py::scoped_estream_redirect>(),
           "Load a tree, from cache when possible; raises RuntimeError on failure")
      .def("register_source", &OwningTreeProvider::register_source, py::arg("config"));

  m.def("classify", &classifier::classify, py::arg("tree"), py::arg("calls"),
        py::arg("params") = ScoringParams(), "Score every haplogroup against a sample, best first");
  m.def("classify_samples", &classifier::classify_samples, py::arg("tree"), py::arg("samples"),
        py::arg("params") = ScoringParams(), py::arg("num_tasks") = std::nullopt,
        py::call_guard<py::gil_scoped_release>(), "Classify several samples concurrently");
  m.def("compute_confidence", &classifier::compute_confidence, py::arg("tree"), py::arg("results"),
        py::arg("max_cap") = 1.0);
  m.def(
      "resolve_path",
      [](const HaplogroupTree& tree, const string& name) {
        vector<std::pair<string, int>> steps;
        for (const PathStep& step : resolve_path(tree, name)) {
          steps.emplace_back(step.node->name, step.depth);
        }
        return steps;
      },
      py::arg("tree"), py::arg("name"), "List of (name, depth) from the root to the named haplogroup");
  m.def("read_calls", &calls_io::read_calls, py::arg("path"));
  m.def(
      "report",
      [](const string& title, const vector<HaplogroupResult>& results, const HaplogroupTree& tree,
         const CallMap& calls, std::optional<string> sample_name, size_t top_n) {
        std::ostringstream oss;
        write_report(oss, ReportInput(title, results, tree, calls, std::move(sample_name), top_n));
        return oss.str();
      },
      py::arg("title"), py::arg("results"), py::arg("tree"), py::arg("calls"),
      py::arg("sample_name") = std::nullopt, py::arg("top_n") = 10, "Plain-text haplogroup report");
  m.def("default_cache_dir", &hgl::default_cache_dir);
}

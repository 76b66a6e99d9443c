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

#include "fetcher.hpp"
#include "source_cache.hpp"
#include "tree_provider.hpp"
#include "tree_source.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::string read_file(const std::string& path) {
  std::ifstream in(path);
  REQUIRE(in.good());
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

class TempDir {
public:
  fs::path path;

  explicit TempDir(const std::string& name) {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path = fs::temp_directory_path() / ("haplo_lib_" + name + "_" + std::to_string(stamp));
    fs::create_directories(path);
  }

  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
};

// Serves canned payloads by URL and counts requests
class CountingFetcher : public Fetcher {
public:
  std::map<std::string, std::string> bodies;
  std::atomic<int> num_fetches{0};

  FetchResult fetch(const std::string& url) override {
    ++num_fetches;
    auto search = bodies.find(url);
    if (search == bodies.end()) {
      return FetchResult::failure("HTTP status 404");
    }
    return FetchResult::success(search->second);
  }
};

class ReadOnlyPayloadCache : public PayloadCache {
public:
  std::optional<std::string> get(const std::string&) const override {
    return std::nullopt;
  }
  void put(const std::string& source_id, const std::string&) override {
    throw std::runtime_error("read-only cache, cannot store " + source_id);
  }
  bool contains(const std::string&) const override {
    return false;
  }
};

std::vector<std::string> node_names(const HaplogroupTree& tree) {
  std::vector<std::string> names;
  for (const HaplogroupNode& node : tree.all_nodes()) {
    names.push_back(node.name + "/" + std::to_string(node.parent_id));
  }
  return names;
}

std::vector<Locus> all_loci(const HaplogroupTree& tree) {
  std::vector<Locus> loci;
  for (const HaplogroupNode& node : tree.all_nodes()) {
    loci.insert(loci.end(), node.loci.begin(), node.loci.end());
  }
  return loci;
}

} // namespace

TEST_CASE("Tree provider tiers", "[provider]") {
  TempDir dir("provider");
  ParsedTreeCache tree_cache;
  DiskPayloadCache payload_cache(dir.path.string());
  CountingFetcher fetcher;
  fetcher.bodies[tree_sources::ftdna_ytree().url] = read_file(HAPLO_LIB_TESTDATA_DIR "/ftdna_ytree.json");
  fetcher.bodies[tree_sources::decodingus_ytree().url] = read_file(HAPLO_LIB_TESTDATA_DIR "/decodingus_ytree.json");

  TreeProvider provider(tree_cache, payload_cache, fetcher, false);
  provider.register_builtin_sources();
  REQUIRE(provider.has_source("ftdna-ytree"));
  REQUIRE(!provider.has_source("yfull"));

  SECTION("unknown source") {
    TreeLoadResult result = provider.load_tree("yfull", "GRCh38");
    REQUIRE(!result.ok());
    CHECK(result.error().kind == TreeLoadErrorKind::UNKNOWN_SOURCE);
    CHECK(tree_load_error_kind_name(result.error().kind) == "UnknownSource");
    CHECK(fetcher.num_fetches.load() == 0);
    CHECK_THROWS_AS(result.tree(), std::logic_error);
    CHECK_THROWS_AS(provider.source("yfull"), std::out_of_range);
  }

  SECTION("repeated loads fetch once") {
    TreeLoadResult first = provider.load_tree("ftdna-ytree", "GRCh38");
    REQUIRE(first.ok());
    CHECK(first.tier() == TreeSourceTier::NETWORK);
    CHECK(first.reconciliation().markers_kept == 3);
    CHECK(first.reconciliation().markers_dropped == 1);
    CHECK_THROWS_AS(first.error(), std::logic_error);
    CHECK(payload_cache.contains("ftdna-ytree"));

    TreeLoadResult second = provider.load_tree("ftdna-ytree", "hg38");
    REQUIRE(second.ok());
    CHECK(second.tier() == TreeSourceTier::MEMORY);
    CHECK(second.tree() == first.tree());
    CHECK(fetcher.num_fetches.load() == 1);
    CHECK(tree_cache.size() == 1);
  }

  SECTION("other builds are built from the stored payload") {
    TreeLoadResult grch38 = provider.load_tree("decodingus-ytree", "GRCh38");
    TreeLoadResult grch37 = provider.load_tree("decodingus-ytree", "GRCh37");
    REQUIRE(grch38.ok());
    REQUIRE(grch37.ok());
    CHECK(grch37.tier() == TreeSourceTier::DISK);
    CHECK(fetcher.num_fetches.load() == 1);
    CHECK(node_names(*grch38.tree()) == node_names(*grch37.tree()));
    CHECK(grch38.tree()->find("R1b")->loci.size() == 1);
    CHECK(grch37.tree()->find("R1b")->loci.empty());
    CHECK(tree_cache.size() == 2);
  }

  SECTION("a new process reuses the disk tier") {
    REQUIRE(provider.load_tree("ftdna-ytree", "GRCh38").ok());

    ParsedTreeCache fresh_tree_cache;
    DiskPayloadCache fresh_payload_cache(dir.path.string());
    TreeProvider fresh(fresh_tree_cache, fresh_payload_cache, fetcher, false);
    fresh.register_builtin_sources();
    TreeLoadResult result = fresh.load_tree("ftdna-ytree", "GRCh38");
    REQUIRE(result.ok());
    CHECK(result.tier() == TreeSourceTier::DISK);
    CHECK(fetcher.num_fetches.load() == 1);

    TreeLoadResult original = provider.load_tree("ftdna-ytree", "GRCh38");
    CHECK(node_names(*result.tree()) == node_names(*original.tree()));
    CHECK(all_loci(*result.tree()) == all_loci(*original.tree()));
  }

  SECTION("fetch failure") {
    TreeLoadResult result = provider.load_tree("ftdna-mttree", "rCRS");
    REQUIRE(!result.ok());
    CHECK(result.error().kind == TreeLoadErrorKind::FETCH_FAILURE);
    CHECK_THAT(result.error().source, Catch::Matchers::ContainsSubstring(tree_sources::ftdna_mttree().url));
    CHECK_THAT(result.error().message, Catch::Matchers::ContainsSubstring("HTTP status 404"));
    CHECK(!payload_cache.contains("ftdna-mttree"));
    CHECK(tree_cache.size() == 0);

    // failures are not cached, the next call tries again
    CHECK(!provider.load_tree("ftdna-mttree", "rCRS").ok());
    CHECK(fetcher.num_fetches.load() == 2);
  }

  SECTION("parse failure keeps the payload") {
    TreeSourceConfig broken = tree_sources::ftdna_ytree();
    broken.source_id = "broken-tree";
    broken.url = "test://broken";
    provider.register_source(broken);
    fetcher.bodies[broken.url] = read_file(HAPLO_LIB_TESTDATA_DIR "/invalid_payload.json");

    TreeLoadResult result = provider.load_tree("broken-tree", "GRCh38");
    REQUIRE(!result.ok());
    CHECK(result.error().kind == TreeLoadErrorKind::PARSE_FAILURE);
    CHECK(result.error().source == "broken-tree");
    CHECK(payload_cache.contains("broken-tree"));

    TreeLoadResult again = provider.load_tree("broken-tree", "GRCh38");
    CHECK(again.error().kind == TreeLoadErrorKind::PARSE_FAILURE);
    CHECK(fetcher.num_fetches.load() == 1);
  }

  SECTION("invalid registrations") {
    TreeSourceConfig nameless;
    nameless.native_build = "GRCh38";
    CHECK_THROWS_AS(provider.register_source(nameless), std::invalid_argument);
    TreeSourceConfig no_build;
    no_build.source_id = "no-build";
    CHECK_THROWS_AS(provider.register_source(no_build), std::invalid_argument);
  }

  SECTION("concurrent loads") {
    std::vector<std::thread> loaders;
    std::vector<std::shared_ptr<const HaplogroupTree>> trees(4);
    for (size_t i = 0; i < trees.size(); ++i) {
      loaders.emplace_back([&provider, &trees, i]() {
        TreeLoadResult result = provider.load_tree("decodingus-ytree", "GRCh38");
        if (result.ok()) {
          trees[i] = result.tree();
        }
      });
    }
    for (auto& loader : loaders) {
      loader.join();
    }
    for (const auto& tree : trees) {
      REQUIRE(tree != nullptr);
      CHECK(node_names(*tree) == node_names(*trees[0]));
      CHECK(all_loci(*tree) == all_loci(*trees[0]));
    }
    CHECK(fetcher.num_fetches.load() >= 1);
  }
}

TEST_CASE("Tree provider logging", "[provider]") {
  ParsedTreeCache tree_cache;
  ReadOnlyPayloadCache payload_cache;
  CountingFetcher fetcher;
  fetcher.bodies[tree_sources::ftdna_ytree().url] = read_file(HAPLO_LIB_TESTDATA_DIR "/ftdna_ytree.json");
  TreeProvider provider(tree_cache, payload_cache, fetcher);
  provider.register_builtin_sources();

  std::stringstream out_buffer;
  std::stringstream err_buffer;
  std::streambuf* prevCoutBuffer = std::cout.rdbuf(out_buffer.rdbuf());
  std::streambuf* prevCerrBuffer = std::cerr.rdbuf(err_buffer.rdbuf());
  TreeLoadResult result = provider.load_tree("ftdna-ytree", "GRCh38");
  TreeLoadResult unsupported = provider.load_tree("ftdna-ytree", "GRCh37");
  std::cout.rdbuf(prevCoutBuffer);
  std::cerr.rdbuf(prevCerrBuffer);

  SECTION("a failing payload cache does not fail the load") {
    REQUIRE(result.ok());
    CHECK(result.tier() == TreeSourceTier::NETWORK);
    CHECK_THAT(err_buffer.str(), Catch::Matchers::ContainsSubstring("Warning: unable to cache payload for ftdna-ytree"));
  }

  SECTION("progress messages") {
    CHECK_THAT(out_buffer.str(), Catch::Matchers::ContainsSubstring("Downloading ftdna-ytree"));
    CHECK_THAT(out_buffer.str(), Catch::Matchers::ContainsSubstring("1 without a GRCh38 coordinate dropped"));
  }

  SECTION("unsupported builds warn but load") {
    REQUIRE(unsupported.ok());
    CHECK(unsupported.tree()->num_loci() == 0);
    CHECK_THAT(err_buffer.str(), Catch::Matchers::ContainsSubstring("does not list GRCh37 as a supported build"));
    CHECK(fetcher.num_fetches.load() == 2);
  }
}

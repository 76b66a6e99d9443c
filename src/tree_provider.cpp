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

#include "tree_provider.hpp"

#include "utils.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

using std::string;

string tree_load_error_kind_name(TreeLoadErrorKind kind) {
  switch (kind) {
  case TreeLoadErrorKind::UNKNOWN_SOURCE:
    return "UnknownSource";
  case TreeLoadErrorKind::FETCH_FAILURE:
    return "FetchFailure";
  case TreeLoadErrorKind::PARSE_FAILURE:
    return "ParseFailure";
  }
  return "Unknown";
}

/***** TreeLoadResult class implementation *****/

TreeLoadResult TreeLoadResult::success(std::shared_ptr<const HaplogroupTree> tree, TreeSourceTier tier,
                                       ReconciliationStats stats) {
  if (tree == nullptr) {
    throw std::invalid_argument(THROW_LINE("A successful load needs a tree."));
  }
  TreeLoadResult result;
  result.loaded_tree = std::move(tree);
  result.source_tier = tier;
  result.stats = stats;
  return result;
}

TreeLoadResult TreeLoadResult::failure(TreeLoadErrorKind kind, string source, string message) {
  TreeLoadResult result;
  result.load_error = TreeLoadError{kind, std::move(source), std::move(message)};
  return result;
}

bool TreeLoadResult::ok() const {
  return !load_error.has_value();
}

const std::shared_ptr<const HaplogroupTree>& TreeLoadResult::tree() const {
  if (!ok()) {
    throw std::logic_error(THROW_LINE("Tree load failed: " + load_error->message));
  }
  return loaded_tree;
}

TreeSourceTier TreeLoadResult::tier() const {
  if (!ok()) {
    throw std::logic_error(THROW_LINE("Tree load failed: " + load_error->message));
  }
  return source_tier;
}

const ReconciliationStats& TreeLoadResult::reconciliation() const {
  return stats;
}

const TreeLoadError& TreeLoadResult::error() const {
  if (ok()) {
    throw std::logic_error(THROW_LINE("Tree load succeeded, there is no error."));
  }
  return *load_error;
}

/***** TreeProvider class implementation *****/

TreeProvider::TreeProvider(ParsedTreeCache& _tree_cache, PayloadCache& _payload_cache, Fetcher& _fetcher,
                           bool _verbose)
    : tree_cache(_tree_cache), payload_cache(_payload_cache), fetcher(_fetcher), verbose(_verbose) {
}

void TreeProvider::register_source(const TreeSourceConfig& config) {
  if (config.source_id.empty()) {
    throw std::invalid_argument(THROW_LINE("Tree source needs a source_id."));
  }
  if (config.native_build.empty()) {
    throw std::invalid_argument(THROW_LINE("Tree source " + config.source_id + " needs a native_build."));
  }
  std::lock_guard<std::mutex> lock(sources_mutex);
  sources[config.source_id] = config;
}

void TreeProvider::register_builtin_sources() {
  for (const TreeSourceConfig& config : tree_sources::builtin_sources()) {
    register_source(config);
  }
}

bool TreeProvider::has_source(const string& source_id) const {
  std::lock_guard<std::mutex> lock(sources_mutex);
  return sources.find(source_id) != sources.end();
}

TreeSourceConfig TreeProvider::source(const string& source_id) const {
  std::lock_guard<std::mutex> lock(sources_mutex);
  auto search = sources.find(source_id);
  if (search == sources.end()) {
    throw std::out_of_range(THROW_LINE("Unknown tree source: " + source_id));
  }
  return search->second;
}

TreeLoadResult TreeProvider::load_tree(const string& source_id, const string& target_build) {
  if (!has_source(source_id)) {
    return TreeLoadResult::failure(TreeLoadErrorKind::UNKNOWN_SOURCE, source_id,
                                   "Unknown tree source: " + source_id);
  }
  const TreeSourceConfig config = source(source_id);
  const string build = canonical_build(target_build);

  std::shared_ptr<const HaplogroupTree> cached = tree_cache.get(source_id, build);
  if (cached != nullptr) {
    return TreeLoadResult::success(cached, TreeSourceTier::MEMORY);
  }

  if (!config.supports_build(build)) {
    std::cerr << "Warning: " << source_id << " does not list " << build
              << " as a supported build; markers without coordinates on it will be dropped" << std::endl;
  }

  std::optional<string> payload = payload_cache.get(source_id);
  if (payload) {
    if (verbose) {
      std::cout << "Found " << config.cache_prefix << " in cache." << std::endl;
    }
    return build_from_payload(config, build, *payload, TreeSourceTier::DISK);
  }

  if (verbose) {
    std::cout << "Downloading " << config.cache_prefix << " from " << config.url << "..." << std::endl;
  }
  FetchResult fetched = fetcher.fetch(config.url);
  if (!fetched.ok) {
    return TreeLoadResult::failure(TreeLoadErrorKind::FETCH_FAILURE, source_id + " (" + config.url + ")",
                                   "Failed to download tree " + source_id + " from " + config.url + ": " +
                                       fetched.error);
  }
  if (verbose) {
    std::cout << "Download complete. Caching tree." << std::endl;
  }
  try {
    payload_cache.put(source_id, fetched.body);
  } catch (const std::runtime_error& e) {
    std::cerr << "Warning: unable to cache payload for " << source_id << ": " << e.what() << std::endl;
  }
  return build_from_payload(config, build, fetched.body, TreeSourceTier::NETWORK);
}

TreeLoadResult TreeProvider::build_from_payload(const TreeSourceConfig& config, const string& build,
                                                const string& payload, TreeSourceTier tier) {
  std::shared_ptr<const HaplogroupTree> tree;
  ReconciliationStats stats;
  try {
    const ParsedTree parsed = tree_parser::parse_tree_payload(payload, config);
    tree = std::make_shared<const HaplogroupTree>(tree_parser::build_tree(parsed, config, build, &stats));
  } catch (const std::runtime_error& e) {
    return TreeLoadResult::failure(TreeLoadErrorKind::PARSE_FAILURE, config.source_id,
                                   "Failed to parse tree " + config.source_id + ": " + e.what());
  }

  if (verbose) {
    std::cout << "Built " << config.source_id << " on " << build << ": " << tree->num_nodes() << " haplogroups, "
              << stats.markers_kept << " markers";
    if (stats.markers_dropped > 0) {
      std::cout << " (" << stats.markers_dropped << " without a " << build << " coordinate dropped)";
    }
    std::cout << std::endl;
  }

  tree_cache.put(config.source_id, build, tree);
  return TreeLoadResult::success(tree, tier, stats);
}

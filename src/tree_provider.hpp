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

#ifndef HAPLO_LIB_TREE_PROVIDER_H
#define HAPLO_LIB_TREE_PROVIDER_H

#include "fetcher.hpp"
#include "haplogroup_tree.hpp"
#include "source_cache.hpp"
#include "tree_parser.hpp"
#include "tree_source.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

enum class TreeLoadErrorKind { UNKNOWN_SOURCE, FETCH_FAILURE, PARSE_FAILURE };

// Where a successfully loaded tree came from
enum class TreeSourceTier { MEMORY, DISK, NETWORK };

struct TreeLoadError {
  TreeLoadErrorKind kind;
  // Source id, plus the URL for fetch failures
  std::string source;
  std::string message;
};

std::string tree_load_error_kind_name(TreeLoadErrorKind kind);

/**
 * @class TreeLoadResult
 * @brief Either a loaded tree or the reason it could not be loaded.
 */
class TreeLoadResult {
public:
  static TreeLoadResult success(std::shared_ptr<const HaplogroupTree> tree, TreeSourceTier tier,
                                ReconciliationStats stats = ReconciliationStats());
  static TreeLoadResult failure(TreeLoadErrorKind kind, std::string source, std::string message);

  bool ok() const;

  // Throws std::logic_error if the load failed
  const std::shared_ptr<const HaplogroupTree>& tree() const;
  TreeSourceTier tier() const;
  const ReconciliationStats& reconciliation() const;

  // Throws std::logic_error if the load succeeded
  const TreeLoadError& error() const;

private:
  TreeLoadResult() = default;

  std::shared_ptr<const HaplogroupTree> loaded_tree;
  TreeSourceTier source_tier = TreeSourceTier::NETWORK;
  ReconciliationStats stats;
  std::optional<TreeLoadError> load_error;
};

/**
 * @class TreeProvider
 * @brief Produces the tree of a registered source for a requested build, consulting the in-memory cache, then
 * the payload cache, then the network.
 *
 * The caches and fetcher are owned by the caller and must outlive the provider. load_tree() may be called from
 * several threads at once; two racing loads of the same key may both do the full work.
 */
class TreeProvider {
public:
  TreeProvider(ParsedTreeCache& _tree_cache, PayloadCache& _payload_cache, Fetcher& _fetcher, bool _verbose = true);

  void register_source(const TreeSourceConfig& config);
  void register_builtin_sources();
  bool has_source(const std::string& source_id) const;

  // Throws std::out_of_range for an unregistered source
  TreeSourceConfig source(const std::string& source_id) const;

  /**
   * @brief Load the tree of a source on a reference build.
   *
   * A network fetch happens only when neither cache holds the source; the downloaded payload is persisted
   * before parsing, and kept even if parsing fails. Markers without a coordinate on the requested build are
   * dropped from the returned tree.
   *
   * @param source_id Registered source id, e.g. "ftdna-ytree".
   * @param target_build Requested build, any alias.
   * @return the tree, or an UNKNOWN_SOURCE, FETCH_FAILURE or PARSE_FAILURE error.
   */
  TreeLoadResult load_tree(const std::string& source_id, const std::string& target_build);

private:
  ParsedTreeCache& tree_cache;
  PayloadCache& payload_cache;
  Fetcher& fetcher;
  bool verbose;

  mutable std::mutex sources_mutex;
  std::unordered_map<std::string, TreeSourceConfig> sources;

  TreeLoadResult build_from_payload(const TreeSourceConfig& config, const std::string& build,
                                    const std::string& payload, TreeSourceTier tier);
};

#endif // HAPLO_LIB_TREE_PROVIDER_H

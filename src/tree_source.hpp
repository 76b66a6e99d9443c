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

#ifndef HAPLO_LIB_TREE_SOURCE_H
#define HAPLO_LIB_TREE_SOURCE_H

#include <string>
#include <vector>

/**
 * @brief Payload layout served by a tree source.
 */
enum class TreeFormat { FTDNA, DECODING_US };

/**
 * @brief Which chromosome the tree classifies.
 */
enum class TreeKind { Y_DNA, MT_DNA };

/**
 * @class TreeSourceConfig
 * @brief Everything that differs between tree sources: where the payload lives, how it is laid out and which
 * reference builds its coordinates cover.
 */
class TreeSourceConfig {
public:
  /**
   * @brief Identifier used as the cache key, e.g. "ftdna-ytree".
   */
  std::string source_id;

  /**
   * @brief URL the raw payload is fetched from.
   */
  std::string url;

  /**
   * @brief Prefix for progress messages and cache file names.
   */
  std::string cache_prefix;

  TreeFormat format = TreeFormat::FTDNA;
  TreeKind kind = TreeKind::Y_DNA;

  /**
   * @brief Canonical name of the build the payload's primary coordinates refer to.
   */
  std::string native_build;

  /**
   * @brief Canonical builds a caller may request.
   */
  std::vector<std::string> supported_builds;

  /**
   * @brief Builds whose coordinates are identical to the native build for this tree.
   */
  std::vector<std::string> identity_builds;

  /**
   * @brief Whether the build (any alias) is listed in supported_builds.
   */
  bool supports_build(const std::string& build) const;

  /**
   * @brief Whether coordinates for the build (any alias) can be taken from the native build unchanged.
   */
  bool is_identity_build(const std::string& build) const;
};

/**
 * @brief Map build aliases and sequence accessions to a canonical build name.
 *
 * For example "hg38", "CM000686.2" and "NC_000024.10" all become "GRCh38". Unrecognised names are returned
 * unchanged.
 */
std::string canonical_build(const std::string& build);

/**
 * @brief Default chromosome label of a tree kind on a build, e.g. "chrY", "Y" or "chrM".
 */
std::string default_chromosome(TreeKind kind, const std::string& build);

std::string tree_kind_name(TreeKind kind);

namespace tree_sources {

TreeSourceConfig ftdna_ytree();
TreeSourceConfig ftdna_mttree();
TreeSourceConfig decodingus_ytree();

// All of the above
std::vector<TreeSourceConfig> builtin_sources();

} // namespace tree_sources

#endif // HAPLO_LIB_TREE_SOURCE_H

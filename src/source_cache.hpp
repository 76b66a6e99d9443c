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

#ifndef HAPLO_LIB_SOURCE_CACHE_H
#define HAPLO_LIB_SOURCE_CACHE_H

#include "haplogroup_tree.hpp"

#include <boost/functional/hash.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

/**
 * @class ParsedTreeCache
 * @brief In-memory cache of built trees keyed by (source id, canonical build).
 *
 * Entries live until clear() is called or the cache is destroyed; there is no eviction. Safe to use from
 * several threads.
 */
class ParsedTreeCache {
public:
  using Key = std::pair<std::string, std::string>;

  /**
   * @brief Look up a tree.
   *
   * @return the cached tree, or nullptr on a miss.
   */
  std::shared_ptr<const HaplogroupTree> get(const std::string& source_id, const std::string& build) const;

  void put(const std::string& source_id, const std::string& build, std::shared_ptr<const HaplogroupTree> tree);

  void clear();

  size_t size() const;

private:
  mutable std::mutex mutex;
  std::unordered_map<Key, std::shared_ptr<const HaplogroupTree>, boost::hash<Key>> trees;
};

/**
 * @class PayloadCache
 * @brief Durable store of raw tree payloads keyed by source id.
 */
class PayloadCache {
public:
  virtual ~PayloadCache() = default;

  /**
   * @brief Look up a payload.
   *
   * @return the bytes stored by the last put() for this key, or std::nullopt on a miss.
   */
  virtual std::optional<std::string> get(const std::string& source_id) const = 0;

  /**
   * @brief Store a payload.
   *
   * @throws std::runtime_error if the payload could not be stored.
   */
  virtual void put(const std::string& source_id, const std::string& payload) = 0;

  virtual bool contains(const std::string& source_id) const = 0;
};

/**
 * @class DiskPayloadCache
 * @brief PayloadCache keeping one HDF5 file per source id in a directory.
 *
 * Each file holds a deflate-compressed `payload` dataset of bytes and the attributes `payload_file_version`,
 * `source_id`, `payload_size` and `datetime_created`. Files are written under a temporary name and renamed
 * into place, so a reader sees either the old file or the complete new one.
 */
class DiskPayloadCache : public PayloadCache {
public:
  /**
   * @brief Construct a cache rooted at a directory, creating it if needed.
   *
   * @param _cache_dir Directory for cache files.
   * @throws std::runtime_error if the directory cannot be created.
   */
  explicit DiskPayloadCache(std::string _cache_dir);

  std::optional<std::string> get(const std::string& source_id) const override;
  void put(const std::string& source_id, const std::string& payload) override;
  bool contains(const std::string& source_id) const override;

  // Path of the file that holds (or would hold) the payload for a source id
  std::string path_for(const std::string& source_id) const;

  const std::string& directory() const;

private:
  std::string cache_dir;
};

namespace payload_cache {

/**
 * @brief Validates the integrity of a payload cache file.
 *
 * Checks that the file exists, is HDF5, carries a supported `payload_file_version` and has the expected
 * attributes and dataset.
 *
 * @param file_name The file path of the payload cache file.
 * @return `true` if the file is valid, otherwise `false`.
 */
bool validate_payload_file(const std::string& file_name);

// Escape characters that are unsafe in file names as `_XX` (hex byte); the mapping is one-to-one
std::string sanitize_key(const std::string& source_id);

} // namespace payload_cache

#endif // HAPLO_LIB_SOURCE_CACHE_H

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

#include "source_cache.hpp"

#include "constants.hpp"
#include "utils.hpp"

#include "H5Cpp.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace
{

// Chunk size for the compressed payload dataset
constexpr hsize_t payload_chunk_bytes = 1u << 20;

// The HDF5 library is not built thread-safe everywhere; serialise all calls into it
std::mutex& hdf5_mutex()
{
  static std::mutex mutex;
  return mutex;
}

bool check_attribute(const H5::H5File& h5_file, const std::string& expected_attr)
{
  if (!h5_file.attrExists(expected_attr)) {
    std::cerr << "Expected file " << h5_file.getFileName() << " to include attribute `" << expected_attr << "`"
              << std::endl;
    return false;
  }
  return true;
}

bool check_dataset(const H5::H5File& h5_file, const std::string& expected_dset)
{
  try {
    auto dset = h5_file.openDataSet(expected_dset);
    return true;
  } catch (const H5::Exception&) {
    std::cerr << "Expected file " << h5_file.getFileName() << " to include dataset `" << expected_dset << "`"
              << std::endl;
    return false;
  }
}

int read_int_attribute(const H5::H5File& file, const std::string& attrName)
{
  int value{};
  try {
    H5::Attribute attribute = file.openAttribute(attrName);
    attribute.read(H5::PredType::NATIVE_INT, &value);
  } catch (const H5::Exception& e) {
    throw std::runtime_error("Error reading attribute `" + attrName + "`: " + e.getDetailMsg());
  }
  return value;
}

long long read_llong_attribute(const H5::H5File& file, const std::string& attrName)
{
  long long value{};
  try {
    H5::Attribute attribute = file.openAttribute(attrName);
    attribute.read(H5::PredType::NATIVE_LLONG, &value);
  } catch (const H5::Exception& e) {
    throw std::runtime_error("Error reading attribute `" + attrName + "`: " + e.getDetailMsg());
  }
  return value;
}

std::string read_string_attribute(const H5::H5File& file, const std::string& attrName)
{
  std::string value;
  try {
    H5::Attribute attribute = file.openAttribute(attrName);
    H5::StrType str_type(H5::PredType::C_S1, H5T_VARIABLE);
    attribute.read(str_type, value);
  } catch (const H5::Exception& e) {
    throw std::runtime_error("Error reading attribute `" + attrName + "`: " + e.getDetailMsg());
  }
  return value;
}

void write_int_attribute(H5::H5File& file, const std::string& attrName, int value)
{
  H5::DataSpace scalar(H5S_SCALAR);
  H5::Attribute attribute = file.createAttribute(attrName, H5::PredType::NATIVE_INT, scalar);
  attribute.write(H5::PredType::NATIVE_INT, &value);
}

void write_llong_attribute(H5::H5File& file, const std::string& attrName, long long value)
{
  H5::DataSpace scalar(H5S_SCALAR);
  H5::Attribute attribute = file.createAttribute(attrName, H5::PredType::NATIVE_LLONG, scalar);
  attribute.write(H5::PredType::NATIVE_LLONG, &value);
}

void write_string_attribute(H5::H5File& file, const std::string& attrName, const std::string& value)
{
  H5::DataSpace scalar(H5S_SCALAR);
  H5::StrType str_type(H5::PredType::C_S1, H5T_VARIABLE);
  H5::Attribute attribute = file.createAttribute(attrName, str_type, scalar);
  attribute.write(str_type, value);
}

bool validate_payload_file_v1(const H5::H5File& h5_file)
{
  std::vector<std::string> expected_attrs = {"payload_file_version", "source_id", "payload_size",
                                             "datetime_created"};
  std::vector<std::string> expected_dsets = {"payload"};

  bool is_valid = true;
  for (const auto& attr : expected_attrs) {
    is_valid = check_attribute(h5_file, attr) && is_valid;
  }
  for (const auto& dset : expected_dsets) {
    is_valid = check_dataset(h5_file, dset) && is_valid;
  }
  return is_valid;
}

std::string read_payload(const H5::H5File& h5_file)
{
  const long long payload_size = read_llong_attribute(h5_file, "payload_size");
  H5::DataSet dataset = h5_file.openDataSet("payload");
  H5::DataSpace dataspace = dataset.getSpace();
  if (dataspace.getSimpleExtentNdims() != 1) {
    throw std::runtime_error("Dataset `payload` must be 1-dimensional");
  }
  hsize_t dims[1];
  dataspace.getSimpleExtentDims(dims);
  if (static_cast<long long>(dims[0]) != payload_size) {
    throw std::runtime_error("Dataset `payload` has " + std::to_string(dims[0]) + " bytes but `payload_size` is " +
                             std::to_string(payload_size));
  }

  std::string payload(static_cast<size_t>(dims[0]), '\0');
  if (!payload.empty()) {
    dataset.read(payload.data(), H5::PredType::NATIVE_UINT8);
  }
  return payload;
}

bool validate_payload_file_unlocked(const std::string& file_name);

// Unique within the process and very unlikely to clash across processes
std::string temporary_suffix()
{
  static std::atomic<unsigned long> counter{0};
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const auto thread_hash = std::hash<std::thread::id>()(std::this_thread::get_id());
  return ".tmp." + std::to_string(thread_hash) + "." + std::to_string(now) + "." + std::to_string(counter++);
}

} // namespace

/***** ParsedTreeCache class implementation *****/

std::shared_ptr<const HaplogroupTree> ParsedTreeCache::get(const std::string& source_id,
                                                           const std::string& build) const
{
  std::lock_guard<std::mutex> lock(mutex);
  auto search = trees.find(Key(source_id, build));
  if (search == trees.end()) {
    return nullptr;
  }
  return search->second;
}

void ParsedTreeCache::put(const std::string& source_id, const std::string& build,
                          std::shared_ptr<const HaplogroupTree> tree)
{
  if (tree == nullptr) {
    throw std::invalid_argument(THROW_LINE("Cannot cache a null tree for " + source_id));
  }
  std::lock_guard<std::mutex> lock(mutex);
  trees[Key(source_id, build)] = std::move(tree);
}

void ParsedTreeCache::clear()
{
  std::lock_guard<std::mutex> lock(mutex);
  trees.clear();
}

size_t ParsedTreeCache::size() const
{
  std::lock_guard<std::mutex> lock(mutex);
  return trees.size();
}

/***** DiskPayloadCache class implementation *****/

DiskPayloadCache::DiskPayloadCache(std::string _cache_dir) : cache_dir(std::move(_cache_dir))
{
  std::error_code ec;
  fs::create_directories(cache_dir, ec);
  if (ec || !fs::is_directory(cache_dir)) {
    throw std::runtime_error(THROW_LINE("Unable to create cache directory " + cache_dir + ": " + ec.message()));
  }
}

std::string DiskPayloadCache::path_for(const std::string& source_id) const
{
  return (fs::path(cache_dir) / (payload_cache::sanitize_key(source_id) + ".h5")).string();
}

const std::string& DiskPayloadCache::directory() const
{
  return cache_dir;
}

bool DiskPayloadCache::contains(const std::string& source_id) const
{
  const std::string file_name = path_for(source_id);
  if (!fs::exists(file_name)) {
    return false;
  }

  std::lock_guard<std::mutex> lock(hdf5_mutex());
  H5::Exception::dontPrint();
  if (H5Fis_hdf5(file_name.c_str()) <= 0) {
    return false;
  }
  try {
    H5::H5File h5_file(file_name, H5F_ACC_RDONLY);
    return h5_file.attrExists("source_id") && read_string_attribute(h5_file, "source_id") == source_id;
  } catch (const H5::Exception& e) {
    std::cerr << "Warning: HDF5 error reading " << file_name << ": " << e.getDetailMsg() << std::endl;
  } catch (const std::runtime_error& e) {
    std::cerr << "Warning: unable to read " << file_name << ": " << e.what() << std::endl;
  }
  return false;
}

std::optional<std::string> DiskPayloadCache::get(const std::string& source_id) const
{
  const std::string file_name = path_for(source_id);
  if (!fs::exists(file_name)) {
    return std::nullopt;
  }

  std::lock_guard<std::mutex> lock(hdf5_mutex());
  if (!validate_payload_file_unlocked(file_name)) {
    std::cerr << "Warning: ignoring invalid payload cache file " << file_name << std::endl;
    return std::nullopt;
  }
  try {
    H5::H5File h5_file(file_name, H5F_ACC_RDONLY);
    const std::string stored_id = read_string_attribute(h5_file, "source_id");
    if (stored_id != source_id) {
      std::cerr << "Warning: payload cache file " << file_name << " belongs to `" << stored_id << "`, not `"
                << source_id << "`" << std::endl;
      return std::nullopt;
    }
    return read_payload(h5_file);
  } catch (const H5::Exception& e) {
    std::cerr << "Warning: HDF5 error reading " << file_name << ": " << e.getDetailMsg() << std::endl;
  } catch (const std::runtime_error& e) {
    std::cerr << "Warning: unable to read " << file_name << ": " << e.what() << std::endl;
  }
  return std::nullopt;
}

void DiskPayloadCache::put(const std::string& source_id, const std::string& payload)
{
  const std::string file_name = path_for(source_id);
  const std::string tmp_name = file_name + temporary_suffix();

  {
    std::lock_guard<std::mutex> lock(hdf5_mutex());
    try {
      H5::Exception::dontPrint();
      H5::H5File h5_file(tmp_name, H5F_ACC_TRUNC);

      hsize_t dims[1] = {static_cast<hsize_t>(payload.size())};
      H5::DataSpace dataspace(1, dims);
      H5::DSetCreatPropList plist;
      if (!payload.empty()) {
        hsize_t chunk[1] = {std::min(dims[0], payload_chunk_bytes)};
        plist.setChunk(1, chunk);
        plist.setDeflate(6);
      }
      H5::DataSet dataset = h5_file.createDataSet("payload", H5::PredType::NATIVE_UINT8, dataspace, plist);
      if (!payload.empty()) {
        dataset.write(payload.data(), H5::PredType::NATIVE_UINT8);
      }

      write_int_attribute(h5_file, "payload_file_version", hgl::payload_file_version);
      write_string_attribute(h5_file, "source_id", source_id);
      write_llong_attribute(h5_file, "payload_size", static_cast<long long>(payload.size()));
      write_string_attribute(h5_file, "datetime_created", utils::current_time_string());
      h5_file.close();
    } catch (const H5::Exception& e) {
      std::error_code ignored;
      fs::remove(tmp_name, ignored);
      throw std::runtime_error(THROW_LINE("HDF5 error writing " + tmp_name + ": " + e.getDetailMsg()));
    }
  }

  std::error_code ec;
  fs::rename(tmp_name, file_name, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp_name, ignored);
    throw std::runtime_error(THROW_LINE("Unable to publish cache file " + file_name + ": " + ec.message()));
  }
}

/***** free functions *****/

namespace
{

bool validate_payload_file_unlocked(const std::string& file_name)
{
  // Check if file exists
  if (!fs::exists(file_name)) {
    std::cout << "File: " << file_name << " is not a valid file" << std::endl;
    return false;
  }

  H5::Exception::dontPrint();
  if (H5Fis_hdf5(file_name.c_str()) <= 0) {
    std::cout << "File: " << file_name << " is not a valid HDF5 file" << std::endl;
    return false;
  }

  try {
    H5::H5File h5_file(file_name, H5F_ACC_RDONLY);

    if (!h5_file.attrExists("payload_file_version")) {
      std::cout << "File: " << file_name
                << " is not a valid payload cache file because it does not contain `payload_file_version` attribute"
                << std::endl;
      return false;
    }

    const int file_version = read_int_attribute(h5_file, "payload_file_version");
    if (file_version == 1) {
      return validate_payload_file_v1(h5_file);
    }

    std::cout << "Payload file version (" << file_version << ") is not supported; valid versions are 1."
              << std::endl;
    return false;
  } catch (const H5::Exception& e) {
    std::cerr << "HDF5 error on file: " << file_name << std::endl;
    std::cerr << e.getDetailMsg() << std::endl;
    return false;
  } catch (const std::runtime_error& e) {
    std::cerr << e.what() << std::endl;
    return false;
  }
}

} // namespace

bool payload_cache::validate_payload_file(const std::string& file_name)
{
  std::lock_guard<std::mutex> lock(hdf5_mutex());
  return validate_payload_file_unlocked(file_name);
}

std::string payload_cache::sanitize_key(const std::string& source_id)
{
  if (source_id.empty()) {
    throw std::invalid_argument(THROW_LINE("Cache key must not be empty."));
  }
  static const char hex_digits[] = "0123456789ABCDEF";
  // "." and ".." are escaped whole; '_' itself is always escaped so distinct keys give distinct names
  const bool escape_all = source_id == "." || source_id == "..";
  std::string sanitized;
  sanitized.reserve(source_id.size());
  for (const char c : source_id) {
    const auto byte = static_cast<unsigned char>(c);
    if (!escape_all && (std::isalnum(byte) || c == '-' || c == '.')) {
      sanitized.push_back(c);
    } else {
      sanitized.push_back('_');
      sanitized.push_back(hex_digits[byte >> 4]);
      sanitized.push_back(hex_digits[byte & 0x0F]);
    }
  }
  return sanitized;
}

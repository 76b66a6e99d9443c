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

#include "tree_source.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>
#include <vector>

using std::string;
using std::vector;

namespace {

const std::unordered_map<string, string>& build_aliases() {
  static const std::unordered_map<string, string> aliases = {
      {"hg38", "GRCh38"},
      {"GRCh38", "GRCh38"},
      {"CM000686.2", "GRCh38"},
      {"NC_000024.10", "GRCh38"},
      {"hg19", "GRCh37"},
      {"b37", "GRCh37"},
      {"GRCh37", "GRCh37"},
      {"CM000686.1", "GRCh37"},
      {"NC_000024.9", "GRCh37"},
      {"chm13", "T2T-CHM13v2.0"},
      {"hs1", "T2T-CHM13v2.0"},
      {"T2T-CHM13v2.0", "T2T-CHM13v2.0"},
      {"NC_060948.1", "T2T-CHM13v2.0"},
      {"CP086569.2", "T2T-CHM13v2.0"},
      {"rCRS", "rCRS"},
      {"chrM", "rCRS"},
      {"NC_012920.1", "rCRS"},
  };
  return aliases;
}

bool contains_build(const vector<string>& builds, const string& build) {
  const string canonical = canonical_build(build);
  return std::any_of(builds.begin(), builds.end(),
                     [&canonical](const string& b) { return canonical_build(b) == canonical; });
}

} // namespace

bool TreeSourceConfig::supports_build(const string& build) const {
  return contains_build(supported_builds, build);
}

bool TreeSourceConfig::is_identity_build(const string& build) const {
  return canonical_build(build) == canonical_build(native_build) || contains_build(identity_builds, build);
}

string canonical_build(const string& build) {
  auto search = build_aliases().find(build);
  if (search == build_aliases().end()) {
    return build;
  }
  return search->second;
}

string default_chromosome(TreeKind kind, const string& build) {
  if (kind == TreeKind::MT_DNA) {
    return "chrM";
  }
  return canonical_build(build) == "GRCh37" ? "Y" : "chrY";
}

string tree_kind_name(TreeKind kind) {
  return kind == TreeKind::Y_DNA ? "Y-DNA" : "MT-DNA";
}

namespace tree_sources {

TreeSourceConfig ftdna_ytree() {
  TreeSourceConfig config;
  config.source_id = "ftdna-ytree";
  config.url = "https://www.familytreedna.com/public/y-dna-haplotree/get";
  config.cache_prefix = "ftdna-ytree";
  config.format = TreeFormat::FTDNA;
  config.kind = TreeKind::Y_DNA;
  config.native_build = "GRCh38";
  config.supported_builds = {"GRCh38"};
  return config;
}

TreeSourceConfig ftdna_mttree() {
  TreeSourceConfig config;
  config.source_id = "ftdna-mttree";
  config.url = "https://www.familytreedna.com/public/mt-dna-haplotree/get";
  config.cache_prefix = "ftdna-mttree";
  config.format = TreeFormat::FTDNA;
  config.kind = TreeKind::MT_DNA;
  // chrM in GRCh38 is the rCRS sequence
  config.native_build = "rCRS";
  config.supported_builds = {"rCRS", "GRCh38"};
  config.identity_builds = {"GRCh38"};
  return config;
}

TreeSourceConfig decodingus_ytree() {
  TreeSourceConfig config;
  config.source_id = "decodingus-ytree";
  config.url = "https://decoding-us.com/api/v1/y-tree";
  config.cache_prefix = "decodingus-ytree";
  config.format = TreeFormat::DECODING_US;
  config.kind = TreeKind::Y_DNA;
  config.native_build = "GRCh38";
  config.supported_builds = {"GRCh38", "GRCh37", "T2T-CHM13v2.0"};
  return config;
}

vector<TreeSourceConfig> builtin_sources() {
  return {ftdna_ytree(), ftdna_mttree(), decodingus_ytree()};
}

} // namespace tree_sources

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

#include "constants.hpp"
#include "fetcher.hpp"
#include "source_cache.hpp"
#include "tree_provider.hpp"

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
  std::string source_id = "ftdna-ytree";
  std::string build = "GRCh38";
  if (argc > 1) {
    source_id = argv[1];
  }
  if (argc > 2) {
    build = argv[2];
  }

  ParsedTreeCache tree_cache;
  DiskPayloadCache payload_cache(hgl::default_cache_dir());
  CurlFetcher fetcher;
  TreeProvider provider(tree_cache, payload_cache, fetcher);
  provider.register_builtin_sources();

  for (int attempt = 0; attempt < 2; ++attempt) {
    TreeLoadResult result = provider.load_tree(source_id, build);
    if (!result.ok()) {
      std::cerr << tree_load_error_kind_name(result.error().kind) << ": " << result.error().message << std::endl;
      return 1;
    }
    std::cout << *result.tree() << std::endl;
  }

  return 0;
}

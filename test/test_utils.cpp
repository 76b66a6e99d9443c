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
#include "utils.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

TEST_CASE("Default configuration", "[config]") {
  CHECK(hgl::get_default_concurrency() >= 1u);
  CHECK(hgl::get_default_concurrency() == hgl::get_default_concurrency());

  SECTION("cache directory override") {
    const char* previous = std::getenv("HAPLO_LIB_CACHE_DIR");
    const std::string saved = previous == nullptr ? "" : previous;

    setenv("HAPLO_LIB_CACHE_DIR", "/tmp/haplo-lib-override", 1);
    CHECK(hgl::default_cache_dir() == "/tmp/haplo-lib-override");

    unsetenv("HAPLO_LIB_CACHE_DIR");
    const char* home = std::getenv("HOME");
    if (home != nullptr && home[0] != '\0') {
      CHECK(hgl::default_cache_dir() == std::string(home) + "/.cache/haplo-lib");
    }

    if (previous != nullptr) {
      setenv("HAPLO_LIB_CACHE_DIR", saved.c_str(), 1);
    }
  }
}

TEST_CASE("String utilities", "[utils]") {
  CHECK(utils::equals_ignore_case("GRCh38", "grch38"));
  CHECK(!utils::equals_ignore_case("A", "AA"));
  CHECK(utils::split_whitespace(" 1000 \t T ") == std::vector<std::string>{"1000", "T"});
  CHECK(utils::split("GT::DP", ':') == std::vector<std::string>{"GT", "", "DP"});
}

TEST_CASE("Positive integer arguments", "[utils]") {
  char four[] = "4";
  char zero[] = "0";
  char negative[] = "-1";
  char word[] = "many";
  char trailing[] = "3x";
  char huge[] = "99999999999999999999";
  CHECK(utils::arg_to_positive_int(four) == 4);
  CHECK_THROWS_AS(utils::arg_to_positive_int(zero), std::invalid_argument);
  CHECK_THROWS_AS(utils::arg_to_positive_int(negative), std::invalid_argument);
  CHECK_THROWS_AS(utils::arg_to_positive_int(word), std::invalid_argument);
  CHECK_THROWS_AS(utils::arg_to_positive_int(trailing), std::invalid_argument);
  CHECK_THROWS_AS(utils::arg_to_positive_int(huge), std::invalid_argument);
}

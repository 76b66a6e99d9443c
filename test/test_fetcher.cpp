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

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <filesystem>
#include <stdexcept>
#include <string>

TEST_CASE("Fetch results", "[fetch]") {
  const FetchResult ok = FetchResult::success("body");
  CHECK(ok.ok);
  CHECK(ok.body == "body");
  CHECK(ok.error.empty());

  const FetchResult failed = FetchResult::failure("timeout");
  CHECK(!failed.ok);
  CHECK(failed.body.empty());
  CHECK(failed.error == "timeout");
}

TEST_CASE("Curl fetcher", "[fetch]") {
  CurlFetcher fetcher(10);

  SECTION("local file") {
    const std::string path = std::filesystem::absolute(HAPLO_LIB_TESTDATA_DIR "/ftdna_ytree.json").string();
    const FetchResult result = fetcher.fetch("file://" + path);
    REQUIRE(result.ok);
    CHECK_THAT(result.body, Catch::Matchers::ContainsSubstring("\"allNodes\""));
  }

  SECTION("missing local file") {
    const FetchResult result = fetcher.fetch("file:///haplo_lib_file_that_does_not_exist.json");
    CHECK(!result.ok);
    CHECK(!result.error.empty());
  }

  SECTION("unsupported scheme") {
    const FetchResult result = fetcher.fetch("haplo://tree");
    CHECK(!result.ok);
    CHECK(!result.error.empty());
  }

  SECTION("failures are returned, not thrown") {
    FetchResult result;
    CHECK_NOTHROW(result = fetcher.fetch(""));
    CHECK(!result.ok);
    CHECK_NOTHROW(result = fetcher.fetch("http://"));
    CHECK(!result.ok);
  }

  SECTION("negative timeout") {
    CHECK_THROWS_AS(CurlFetcher(-1), std::invalid_argument);
  }
}

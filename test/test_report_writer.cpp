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

#include "classifier.hpp"
#include "file_utils.hpp"
#include "haplogroup_tree.hpp"
#include "report_writer.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <chrono>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using Catch::Matchers::ContainsSubstring;

namespace fs = std::filesystem;

namespace {

HaplogroupTree example_tree() {
  HaplogroupTree tree;
  int a = tree.add_root("A");
  int a1 = tree.add_child(a, "A1", {Locus(1000, "M1", "C", "T")});
  tree.add_child(a1, "A1a", {Locus(2000, "M2", "A", "G")});
  return tree;
}

std::string render(const ReportInput& input) {
  std::ostringstream oss;
  write_report(oss, input);
  return oss.str();
}

} // namespace

TEST_CASE("Report titles", "[report]") {
  CHECK(report_title(TreeKind::Y_DNA) == "Y-DNA Haplogroup Analysis Report");
  CHECK(report_title(TreeKind::MT_DNA) == "MT-DNA Haplogroup Analysis Report");
}

TEST_CASE("Summary statistics", "[report]") {
  HaplogroupTree tree = example_tree();
  // the same marker on two branches counts once
  tree.add_child(0, "A2", {Locus(1000, "M1", "C", "T"), Locus(3000, "M3", "G", "A")});
  const CallMap calls = {{1000, "T"}, {3000, "-"}, {9999, "A"}};
  const auto results = classifier::classify(tree, calls);

  const ReportSummary summary = summarize(results, tree, calls);
  CHECK(summary.markers_in_tree == 3);
  CHECK(summary.markers_with_calls == 1);
  CHECK(summary.candidates_evaluated == 4);
  REQUIRE(results[0].name == "A1a");
  CHECK(summary.markers_on_path == 2);

  const ReportSummary empty = summarize({}, tree, calls);
  CHECK(empty.candidates_evaluated == 0);
  CHECK(empty.markers_on_path == 0);
  CHECK(empty.markers_in_tree == 3);
}

TEST_CASE("Write report", "[report]") {
  const HaplogroupTree tree = example_tree();

  SECTION("with a prediction") {
    const CallMap calls = {{1000, "T"}};
    const auto results = classifier::classify(tree, calls);
    const std::string report = render(ReportInput(report_title(TreeKind::Y_DNA), results, tree, calls, "HG00096"));

    CHECK_THAT(report, ContainsSubstring("  Y-DNA Haplogroup Analysis Report\n"));
    CHECK_THAT(report, ContainsSubstring("Generated: "));
    CHECK_THAT(report, ContainsSubstring("Sample: HG00096\n"));
    CHECK_THAT(report, ContainsSubstring("  Predicted Haplogroup: A1a\n"));
    CHECK_THAT(report, ContainsSubstring("  Score: 1\n"));
    CHECK_THAT(report, ContainsSubstring("  Derived SNPs: 1\n"));
    CHECK_THAT(report, ContainsSubstring("  No Calls: 1\n"));
    CHECK_THAT(report, ContainsSubstring("  Tree Depth: 2\n"));
    CHECK_THAT(report, ContainsSubstring("TOP 10 CANDIDATES"));
    CHECK_THAT(report, ContainsSubstring("    1  A1a"));
    CHECK_THAT(report, ContainsSubstring("    3  A "));

    // path with newly derived markers per step
    CHECK_THAT(report, ContainsSubstring("\nA [+0 derived]\n  A1 [+1 derived]\n    A1a [+0 derived]\n"));

    // marker table sorted by position
    const size_t m1 = report.find("M1");
    const size_t m2 = report.find("M2");
    REQUIRE(m1 != std::string::npos);
    REQUIRE(m2 != std::string::npos);
    CHECK(m1 < m2);
    CHECK_THAT(report, ContainsSubstring("Derived"));
    CHECK_THAT(report, ContainsSubstring("No Call"));

    CHECK_THAT(report, ContainsSubstring("  Total SNPs in tree: 2\n"));
    CHECK_THAT(report, ContainsSubstring("  SNPs with calls: 1\n"));
    CHECK_THAT(report, ContainsSubstring("  Haplogroups evaluated: 3\n"));
    CHECK_THAT(report, ContainsSubstring("  SNPs on predicted path: 2\n"));
  }

  SECTION("top N") {
    const CallMap calls = {{1000, "T"}};
    const auto results = classifier::classify(tree, calls);
    const std::string report = render(ReportInput("Title", results, tree, calls, std::nullopt, 2));
    CHECK_THAT(report, ContainsSubstring("TOP 2 CANDIDATES"));
    CHECK_THAT(report, ContainsSubstring("    2  A1 "));
    CHECK_THAT(report, !ContainsSubstring("    3  A "));
    CHECK_THAT(report, !ContainsSubstring("Sample:"));
  }

  SECTION("nothing derived") {
    const CallMap calls = {{1000, "C"}};
    const auto results = classifier::classify(tree, calls);
    const std::string report = render(ReportInput("Title", results, tree, calls));
    CHECK_THAT(report, ContainsSubstring("No haplogroup could be determined."));
    CHECK_THAT(report, !ContainsSubstring("HAPLOGROUP PATH"));
    CHECK_THAT(report, !ContainsSubstring("SNPs on predicted path"));
    CHECK_THAT(report, ContainsSubstring("  Haplogroups evaluated: 3\n"));
  }

  SECTION("no results") {
    const std::vector<HaplogroupResult> results;
    const std::string report = render(ReportInput("Title", results, tree, CallMap()));
    CHECK_THAT(report, ContainsSubstring("No haplogroup could be determined."));
    CHECK_THAT(report, ContainsSubstring("  Haplogroups evaluated: 0\n"));
  }
}

TEST_CASE("Write report files", "[report]") {
  const HaplogroupTree tree = example_tree();
  const CallMap calls = {{1000, "T"}, {2000, "G"}};
  const auto results = classifier::classify(tree, calls);
  const ReportInput input(report_title(TreeKind::Y_DNA), results, tree, calls);

  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = fs::temp_directory_path() / ("haplo_lib_report_" + std::to_string(stamp));
  fs::create_directories(dir);

  for (const std::string name : {"report.txt", "report.txt.gz"}) {
    const std::string path = (dir / name).string();
    write_report_file(path, input);

    file_utils::AutoGzIfstream fin;
    fin.openOrThrow(path);
    std::string line;
    std::string contents;
    while (fin.getline(line)) {
      contents += line + "\n";
    }
    fin.close();
    CHECK_THAT(contents, ContainsSubstring("  Predicted Haplogroup: A1a\n"));
    CHECK_THAT(contents, ContainsSubstring("    A1a [+1 derived]\n"));
  }

  CHECK_THROWS_AS(write_report_file((dir / "missing" / "report.txt").string(), input), std::runtime_error);
  std::error_code ec;
  fs::remove_all(dir, ec);
}

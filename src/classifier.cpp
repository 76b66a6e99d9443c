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

#include "constants.hpp"
#include "locus.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <future>
#include <iostream>
#include <stdexcept>

using std::vector;

namespace {

// Own and path evidence of one node, indexed like the arena
struct NodeEvidence {
  int derived = 0;
  int ancestral = 0;
  int no_calls = 0;
  int unknown = 0;
  int snps = 0;
  hap_real_t score = 0;
};

void check_params(const ScoringParams& params) {
  if (!(params.derived_weight > 0) || !std::isfinite(params.derived_weight)) {
    throw std::invalid_argument(THROW_LINE("derived_weight must be positive and finite, got " +
                                           std::to_string(params.derived_weight)));
  }
  if (!(params.ancestral_weight > 0) || !std::isfinite(params.ancestral_weight)) {
    throw std::invalid_argument(THROW_LINE("ancestral_weight must be positive and finite, got " +
                                           std::to_string(params.ancestral_weight)));
  }
}

void classify_range(const HaplogroupTree& tree, const vector<CallMap>& samples, const ScoringParams& params,
                    size_t begin, size_t end, vector<vector<HaplogroupResult>>& out) {
  for (size_t i = begin; i < end; ++i) {
    out[i] = classifier::classify(tree, samples[i], params);
  }
}

} // namespace

namespace classifier {

unsigned validate_parallel_tasks(const unsigned num_tasks) {
  unsigned recommended_max = hgl::get_default_concurrency();

  if (num_tasks == 0u) {
    std::cerr << "Warning: can't set num_tasks to 0: setting to 1\n";
    return 1u;
  }

  if (num_tasks > recommended_max) {
    std::cerr << "Warning: recommended max num_tasks is " << recommended_max << ": you are requesting "
              << num_tasks << '\n';
  }

  return num_tasks;
}

vector<HaplogroupResult> classify(const HaplogroupTree& tree, const CallMap& calls, const ScoringParams& params) {
  check_params(params);

  const vector<HaplogroupNode>& nodes = tree.all_nodes();
  vector<NodeEvidence> path(nodes.size());
  vector<HaplogroupResult> results;
  results.reserve(nodes.size());

  for (const HaplogroupNode& node : nodes) {
    NodeEvidence own;
    for (const Locus& locus : node.loci) {
      switch (classify_call(locus, calls)) {
      case CallState::DERIVED:
        ++own.derived;
        break;
      case CallState::ANCESTRAL:
        ++own.ancestral;
        break;
      case CallState::NO_CALL:
        ++own.no_calls;
        break;
      case CallState::UNKNOWN:
        ++own.unknown;
        break;
      }
    }
    own.snps = static_cast<int>(node.loci.size());
    own.score = params.derived_weight * own.derived - params.ancestral_weight * own.ancestral;

    NodeEvidence& acc = path[node.ID];
    acc = own;
    if (!node.is_root()) {
      const NodeEvidence& parent = path[node.parent_id];
      acc.derived += parent.derived;
      acc.ancestral += parent.ancestral;
      acc.no_calls += parent.no_calls;
      acc.unknown += parent.unknown;
      acc.snps += parent.snps;
      acc.score += parent.score;
    }

    HaplogroupResult result;
    result.name = node.name;
    result.score = acc.score;
    result.matching_snps = acc.derived;
    result.ancestral_matches = acc.ancestral;
    result.no_calls = acc.no_calls;
    result.unknown_calls = acc.unknown;
    result.total_snps = own.snps;
    result.cumulative_snps = acc.snps;
    result.depth = node.depth;
    results.push_back(std::move(result));
  }

  std::sort(results.begin(), results.end(), result_precedes);
  return results;
}

vector<vector<HaplogroupResult>> classify_samples(const HaplogroupTree& tree, const vector<CallMap>& samples,
                                                  const ScoringParams& params, std::optional<unsigned> num_tasks) {
  check_params(params);
  unsigned valid_num_tasks = validate_parallel_tasks(num_tasks.value_or(hgl::get_default_concurrency()));
  vector<vector<HaplogroupResult>> out(samples.size());
  if (samples.empty()) {
    return out;
  }
  valid_num_tasks = std::min<unsigned>(valid_num_tasks, static_cast<unsigned>(samples.size()));

  if (valid_num_tasks == 1u) {
    classify_range(tree, samples, params, 0, samples.size(), out);
    return out;
  }

  // Each task writes a disjoint slice of out
  std::vector<std::future<void>> tasks;
  const size_t step_size = (samples.size() + valid_num_tasks - 1) / valid_num_tasks;
  for (size_t lo = 0; lo < samples.size(); lo += step_size) {
    const size_t hi = std::min(samples.size(), lo + step_size);
    tasks.push_back(std::async(std::launch::async, classify_range, std::cref(tree), std::cref(samples),
                               std::cref(params), lo, hi, std::ref(out)));
  }
  for (auto& fut : tasks) {
    fut.get();
  }
  return out;
}

hap_real_t compute_confidence(const HaplogroupTree& tree, const vector<HaplogroupResult>& results,
                              hap_real_t max_cap) {
  if (results.empty()) {
    return 0;
  }
  const HaplogroupResult& top = results.front();
  const HaplogroupNode* top_node = tree.find(top.name);
  if (top_node == nullptr) {
    throw std::invalid_argument(THROW_LINE("Result " + top.name + " is not a haplogroup of this tree"));
  }

  const int callable = top.matching_snps + top.ancestral_matches;
  const hap_real_t match_quality = callable > 0 ? static_cast<hap_real_t>(top.matching_snps) / callable : 0.0;

  hap_real_t penalty = 0;
  if (results.size() > 1 && top.score > 0) {
    for (size_t i = 1; i < results.size(); ++i) {
      const HaplogroupNode* candidate = tree.find(results[i].name);
      if (candidate == nullptr || candidate->ID == top_node->ID || tree.is_ancestor(candidate->ID, top_node->ID)) {
        continue;
      }
      // closest competitor found
      if (results[i].score > 0) {
        const hap_real_t diff = (top.score - results[i].score) / top.score;
        if (diff < 0.2) {
          penalty = (0.2 - diff) * 0.5;
        }
      }
      break;
    }
  }

  const hap_real_t confidence = match_quality * (1.0 - penalty);
  return std::min(max_cap, std::max<hap_real_t>(0.0, confidence));
}

} // namespace classifier

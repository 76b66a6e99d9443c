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

#ifndef HAPLO_LIB_CLASSIFIER_H
#define HAPLO_LIB_CLASSIFIER_H

#include "haplogroup_result.hpp"
#include "haplogroup_tree.hpp"
#include "types.hpp"

#include <optional>
#include <vector>

/**
 * @brief Weights of the branch score. A branch scores
 * derived_weight * derived - ancestral_weight * ancestral, no-calls and unknown calls are neutral.
 */
struct ScoringParams {
  hap_real_t derived_weight = 1.0;
  hap_real_t ancestral_weight = 1.0;
};

namespace classifier {

unsigned validate_parallel_tasks(unsigned num_tasks);

/**
 * @brief Score every haplogroup of a tree against one sample.
 *
 * Nodes are visited once in arena order, which puts parents before children, so each node's evidence is
 * its own marker evidence plus its parent's.
 *
 * @param tree The tree to classify against.
 * @param calls Observed alleles keyed by coordinate on the tree's build.
 * @param params Branch score weights, both must be positive and finite.
 * @return One result per node, sorted by result_precedes.
 */
std::vector<HaplogroupResult> classify(const HaplogroupTree& tree, const CallMap& calls,
                                       const ScoringParams& params = ScoringParams());

/**
 * @brief Classify several samples concurrently.
 *
 * @param tree The tree to classify against.
 * @param samples One call map per sample.
 * @param params Branch score weights.
 * @param num_tasks Maximum number of concurrent tasks, defaults to the hardware concurrency.
 * @return The classify() result of each sample, in input order.
 */
std::vector<std::vector<HaplogroupResult>> classify_samples(const HaplogroupTree& tree,
                                                            const std::vector<CallMap>& samples,
                                                            const ScoringParams& params = ScoringParams(),
                                                            std::optional<unsigned> num_tasks = std::nullopt);

/**
 * @brief Confidence in the head of a ranked result list.
 *
 * The match quality derived / (derived + ancestral) of the head is reduced when the best-ranked result
 * that is neither the head nor one of its ancestors scores within 20% of it.
 *
 * @param tree The tree the results were computed on.
 * @param results Output of classify().
 * @param max_cap Upper bound of the returned value.
 * @return confidence in [0, max_cap], 0 for an empty list.
 */
hap_real_t compute_confidence(const HaplogroupTree& tree, const std::vector<HaplogroupResult>& results,
                              hap_real_t max_cap = 1.0);

} // namespace classifier

#endif // HAPLO_LIB_CLASSIFIER_H

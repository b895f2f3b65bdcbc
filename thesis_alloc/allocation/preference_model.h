// Copyright 2010-2025 Google LLC
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


// Translates the preferences of the planning students into assignment costs.
//
// For a (student, topic) pair the first matching rule wins:
//  1. forced topic: if the student has a forced topic that exists and is not
//     banned, it costs kForcedCost and every other topic is inadmissible. A
//     forced topic that is banned or unknown makes the student unassignable.
//  2. banned topic: inadmissible.
//  3. override: the override cost.
//  4. tiers: 0 for tier 1, tier2_cost, tier3_cost.
//  5. ranked choice r (1-based): with top2_bias 0, 1, then 100 + (r - 3);
//     without it r - 1.
//  6. anything else: unranked_cost if allow_unranked, inadmissible otherwise.

#ifndef THESIS_ALLOC_ALLOCATION_PREFERENCE_MODEL_H_
#define THESIS_ALLOC_ALLOCATION_PREFERENCE_MODEL_H_

#include <cstdint>
#include <optional>
#include <vector>

#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "thesis_alloc/allocation/allocation.pb.h"
#include "thesis_alloc/allocation/allocation_instance.h"
#include "thesis_alloc/allocation/allocation_parameters.pb.h"

namespace thesis_alloc {

// Sparse (student index x topic index) matrix of the admissible pairs. Each
// row is sorted by topic index.
class CostMatrix {
 public:
  struct Entry {
    int topic;
    int64_t cost;
  };

  explicit CostMatrix(int num_students) : rows_(num_students) {}

  // Topics must be added in increasing order within a row.
  void Add(int student, int topic, int64_t cost);

  int num_students() const { return rows_.size(); }
  int64_t num_entries() const { return num_entries_; }

  absl::Span<const Entry> row(int student) const { return rows_[student]; }

  // A student is unassignable when no topic is admissible for them.
  bool IsAssignable(int student) const { return !rows_[student].empty(); }

  // Binary search in the row of `student`. nullopt if the pair is
  // inadmissible.
  std::optional<int64_t> Cost(int student, int topic) const;

 private:
  std::vector<std::vector<Entry>> rows_;
  int64_t num_entries_ = 0;
};

class PreferenceModel {
 public:
  static constexpr int64_t kForcedCost = -10000;

  // Preference rank classification, for reporting only.
  static constexpr int kForcedRank = -1;
  static constexpr int kFirstRankedChoice = 10;
  static constexpr int kUnrankedRank = 999;

  PreferenceModel(const AllocationInstance& instance,
                  const PreferenceParameters& params)
      : instance_(instance), params_(params) {}

  // Costs of all the admissible pairs of the planning students.
  CostMatrix ComputeCosts() const;

  // Classification of `topic_id` for the preferences of `student`: -1 forced,
  // 0 to 2 for tiers 1 to 3, 10 to 14 for ranked choices 1 to 5, 999
  // otherwise (including topics only admissible through an override).
  static int PreferenceRank(const Student& student, absl::string_view topic_id);

  // Cost of the r-th ranked choice, r >= 1.
  int64_t RankCost(int rank) const;

  const AllocationInstance& instance() const { return instance_; }
  const PreferenceParameters& params() const { return params_; }

 private:
  void ComputeStudentCosts(int s, CostMatrix* costs) const;

  const AllocationInstance& instance_;
  const PreferenceParameters params_;
};

}  // namespace thesis_alloc

#endif  // THESIS_ALLOC_ALLOCATION_PREFERENCE_MODEL_H_

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


#include "thesis_alloc/allocation/preference_model.h"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/strings/string_view.h"
#include "thesis_alloc/allocation/allocation.pb.h"
#include "thesis_alloc/allocation/allocation_instance.h"

namespace thesis_alloc {

void CostMatrix::Add(int student, int topic, int64_t cost) {
  DCHECK_GE(student, 0);
  DCHECK_LT(student, num_students());
  std::vector<Entry>& row = rows_[student];
  DCHECK(row.empty() || row.back().topic < topic);
  row.push_back({topic, cost});
  ++num_entries_;
}

std::optional<int64_t> CostMatrix::Cost(int student, int topic) const {
  const std::vector<Entry>& row = rows_[student];
  const auto it = std::lower_bound(
      row.begin(), row.end(), topic,
      [](const Entry& entry, int t) { return entry.topic < t; });
  if (it == row.end() || it->topic != topic) return std::nullopt;
  return it->cost;
}

int64_t PreferenceModel::RankCost(int rank) const {
  DCHECK_GE(rank, 1);
  if (!params_.top2_bias()) return rank - 1;
  if (rank == 1) return 0;
  if (rank == 2) return 1;
  return 100 + (rank - 3);
}

CostMatrix PreferenceModel::ComputeCosts() const {
  CostMatrix costs(instance_.num_students());
  for (int s = 0; s < instance_.num_students(); ++s) {
    ComputeStudentCosts(s, &costs);
  }
  VLOG(1) << "Cost matrix: " << costs.num_students() << " students, "
          << costs.num_entries() << " admissible pairs";
  return costs;
}

void PreferenceModel::ComputeStudentCosts(int s, CostMatrix* costs) const {
  const Student& student = instance_.student(s);
  const absl::flat_hash_set<absl::string_view> banned(
      student.banned_topics().begin(), student.banned_topics().end());

  if (student.has_forced_topic() && !student.forced_topic().empty()) {
    const int t = instance_.TopicIndex(student.forced_topic());
    if (t != AllocationInstance::kNoIndex &&
        !banned.contains(student.forced_topic())) {
      costs->Add(s, t, kForcedCost);
    }
    return;
  }

  // Tiers take precedence over ranks, and within each list the first
  // occurrence of a topic counts.
  absl::flat_hash_map<absl::string_view, int64_t> preferred;
  for (const std::string& id : student.tier1_topics()) {
    preferred.insert({id, 0});
  }
  for (const std::string& id : student.tier2_topics()) {
    preferred.insert({id, params_.tier2_cost()});
  }
  for (const std::string& id : student.tier3_topics()) {
    preferred.insert({id, params_.tier3_cost()});
  }
  for (int r = 0; r < student.ranked_topics_size(); ++r) {
    preferred.insert({student.ranked_topics(r), RankCost(r + 1)});
  }

  for (int t = 0; t < instance_.num_topics(); ++t) {
    const std::string& id = instance_.topic(t).id();
    if (banned.contains(id)) continue;
    if (const std::optional<int64_t> cost = instance_.FindOverrideCost(s, t);
        cost.has_value()) {
      costs->Add(s, t, *cost);
      continue;
    }
    if (const auto it = preferred.find(id); it != preferred.end()) {
      costs->Add(s, t, it->second);
      continue;
    }
    if (params_.allow_unranked()) costs->Add(s, t, params_.unranked_cost());
  }
}

int PreferenceModel::PreferenceRank(const Student& student,
                                    absl::string_view topic_id) {
  if (student.has_forced_topic() && !student.forced_topic().empty() &&
      student.forced_topic() == topic_id) {
    return kForcedRank;
  }
  const auto contains = [topic_id](const auto& topics) {
    return std::find(topics.begin(), topics.end(), topic_id) != topics.end();
  };
  if (contains(student.tier1_topics())) return 0;
  if (contains(student.tier2_topics())) return 1;
  if (contains(student.tier3_topics())) return 2;
  const auto& ranked = student.ranked_topics();
  const auto it = std::find(ranked.begin(), ranked.end(), topic_id);
  if (it != ranked.end()) {
    return kFirstRankedChoice + static_cast<int>(it - ranked.begin());
  }
  return kUnrankedRank;
}

}  // namespace thesis_alloc

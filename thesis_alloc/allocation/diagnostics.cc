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


#include "thesis_alloc/allocation/diagnostics.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "thesis_alloc/allocation/allocation.pb.h"
#include "thesis_alloc/allocation/allocation_instance.h"
#include "thesis_alloc/allocation/preference_model.h"

namespace thesis_alloc {

bool StatusHasSolution(absl::string_view status) {
  return status == "OPTIMAL" || status == "FEASIBLE" || status == "SUBOPTIMAL";
}

std::vector<TieReport> FindTies(const AllocationInstance& instance,
                                const CostMatrix& costs,
                                absl::Span<const int> assigned_topics) {
  std::vector<TieReport> ties;
  for (int s = 0; s < static_cast<int>(assigned_topics.size()); ++s) {
    const int assigned = assigned_topics[s];
    if (assigned == AllocationInstance::kNoIndex) continue;
    const std::optional<int64_t> assigned_cost = costs.Cost(s, assigned);
    if (!assigned_cost.has_value()) continue;
    TieReport tie;
    for (const CostMatrix::Entry& entry : costs.row(s)) {
      if (entry.topic != assigned && entry.cost == *assigned_cost) {
        tie.add_alternative_topic_ids(instance.topic(entry.topic).id());
      }
    }
    if (tie.alternative_topic_ids().empty()) continue;
    tie.set_student_id(instance.student(s).id());
    tie.set_assigned_topic_id(instance.topic(assigned).id());
    tie.set_cost(*assigned_cost);
    ties.push_back(std::move(tie));
  }
  return ties;
}

AllocationResult BuildAllocationResult(const AllocationInstance& instance,
                                       const CostMatrix& costs,
                                       const SolverOutcome& outcome,
                                       absl::string_view algorithm,
                                       bool report_ties) {
  const int num_students = instance.num_students();
  CHECK_EQ(static_cast<int>(outcome.assigned_topics.size()), num_students);

  AllocationResult result;
  AllocationDiagnostics& diagnostics = *result.mutable_diagnostics();
  diagnostics.set_status(outcome.status);
  diagnostics.set_objective_value(outcome.objective_value);
  diagnostics.set_algorithm(std::string(algorithm));

  std::vector<int64_t> topic_load(instance.num_topics(), 0);
  for (int s = 0; s < num_students; ++s) {
    const Student& student = instance.student(s);
    const int t = outcome.assigned_topics[s];
    if (!costs.IsAssignable(s)) {
      DCHECK_EQ(t, AllocationInstance::kNoIndex);
      diagnostics.add_unassignable_students(student.id());
    } else if (t == AllocationInstance::kNoIndex) {
      diagnostics.add_unassigned_after_solve(student.id());
    } else {
      ++topic_load[t];
    }
  }

  std::vector<bool> topic_overflowed(instance.num_topics(), false);
  for (int t = 0; t < instance.num_topics(); ++t) {
    const int64_t overflow = topic_load[t] - instance.topic_capacity(t);
    if (overflow > 0) {
      topic_overflowed[t] = true;
      (*diagnostics.mutable_topic_overflow())[instance.topic(t).id()] =
          overflow;
    }
  }
  std::vector<bool> coach_overflowed(instance.num_coaches(), false);
  for (int c = 0; c < instance.num_coaches(); ++c) {
    int64_t load = 0;
    for (const int t : instance.coach_topics(c)) load += topic_load[t];
    const int64_t overflow = load - instance.coach_capacity(c);
    if (overflow > 0) {
      coach_overflowed[c] = true;
      (*diagnostics.mutable_coach_overflow())[instance.coach(c).id()] =
          overflow;
    }
  }
  for (int d = 0; d < instance.num_departments(); ++d) {
    if (instance.department_min(d) <= 0) continue;
    int64_t load = 0;
    for (const int t : instance.department_topics(d)) load += topic_load[t];
    const int64_t shortfall = instance.department_min(d) - load;
    if (shortfall > 0) {
      const std::string& id = instance.department(d).id();
      (*diagnostics.mutable_department_shortfall())[id] = shortfall;
    }
  }

  for (int s = 0; s < num_students; ++s) {
    const int t = outcome.assigned_topics[s];
    if (t == AllocationInstance::kNoIndex) continue;
    const Student& student = instance.student(s);
    const Topic& topic = instance.topic(t);
    AssignmentRow& row = *result.add_assignments();
    row.set_student_id(student.id());
    row.set_topic_id(topic.id());
    row.set_coach_id(topic.coach_id());
    row.set_department_id(topic.department_id());
    row.set_preference_rank(
        PreferenceModel::PreferenceRank(student, topic.id()));
    row.set_effective_cost(costs.Cost(s, t).value_or(0));
    row.set_via_topic_overflow(topic_overflowed[t]);
    row.set_via_coach_overflow(coach_overflowed[instance.topic_coach(t)]);
    row.set_forced(row.preference_rank() == PreferenceModel::kForcedRank);
  }

  if (report_ties) {
    for (TieReport& tie : FindTies(instance, costs, outcome.assigned_topics)) {
      *diagnostics.add_ties() = std::move(tie);
    }
  }
  return result;
}

}  // namespace thesis_alloc

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


// Post-solve analysis shared by all the allocators: assignment rows, capacity
// overflow and department shortfall computed from the loads, partition of the
// planning students, and detection of equal-cost alternatives.

#ifndef THESIS_ALLOC_ALLOCATION_DIAGNOSTICS_H_
#define THESIS_ALLOC_ALLOCATION_DIAGNOSTICS_H_

#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "thesis_alloc/allocation/allocation.pb.h"
#include "thesis_alloc/allocation/allocation_instance.h"
#include "thesis_alloc/allocation/preference_model.h"

namespace thesis_alloc {

// The raw output of a solver.
struct SolverOutcome {
  // OPTIMAL, FEASIBLE, SUBOPTIMAL, INFEASIBLE, NOT_SOLVED, ...
  std::string status;
  double objective_value = 0.0;
  // Indexed by planning student: the assigned topic, or
  // AllocationInstance::kNoIndex.
  std::vector<int> assigned_topics;
};

// True for the statuses that come with an assignment: OPTIMAL, FEASIBLE and
// SUBOPTIMAL.
bool StatusHasSolution(absl::string_view status);

// For each assigned student, the other admissible topics with the same cost as
// the assigned one. Students without alternatives are not reported.
std::vector<TieReport> FindTies(const AllocationInstance& instance,
                                const CostMatrix& costs,
                                absl::Span<const int> assigned_topics);

// Builds the rows and the diagnostics of `outcome`. Ties are only searched
// when `report_ties` is true. The wall time is left unset.
AllocationResult BuildAllocationResult(const AllocationInstance& instance,
                                       const CostMatrix& costs,
                                       const SolverOutcome& outcome,
                                       absl::string_view algorithm,
                                       bool report_ties);

}  // namespace thesis_alloc

#endif  // THESIS_ALLOC_ALLOCATION_DIAGNOSTICS_H_

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


// Exact allocation as an integer program:
//
//   min   sum cost[s,t] x[s,t] + P_topic sum ov_topic[t]
//         + P_coach sum ov_coach[c] + P_dept sum shortfall[d]
//   s.t.  sum_t x[s,t] = 1                 for each assignable student s
//         sum_s x[s,t] - ov_topic[t] <= cap[t]           for each topic t
//         sum_{s, t of c} x[s,t] - ov_coach[c] <= cap[c] for each coach c
//         sum_{s, t of d} x[s,t] + shortfall[d] >= min[d]
//                                 for each department d with min[d] > 0
//
// with x binary, and the overflow and shortfall variables non-negative
// integers. Overflow variables exist only when the corresponding overflow is
// enabled, shortfall variables only in SOFT department minimum mode (in HARD
// mode the minimum is a plain constraint).
//
// With epsilon_suboptimal set, an optimal solve is followed by a second solve
// of the same objective constrained by objective <= opt + epsilon * |opt|. If
// the second solve does not produce a solution, the first one is kept. For a
// non-negative optimum the bound is (1 + epsilon) * opt. For a negative one
// (forced assignments carry negative costs) it is looser than
// (1 + epsilon) * opt, since that value lies below opt.

#ifndef THESIS_ALLOC_ALLOCATION_ILP_ALLOCATOR_H_
#define THESIS_ALLOC_ALLOCATION_ILP_ALLOCATOR_H_

#include <memory>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "thesis_alloc/allocation/allocation.pb.h"
#include "thesis_alloc/allocation/allocation_instance.h"
#include "thesis_alloc/allocation/allocation_parameters.pb.h"
#include "thesis_alloc/allocation/allocator.h"
#include "thesis_alloc/allocation/diagnostics.h"
#include "thesis_alloc/linear_solver/linear_solver.h"

namespace thesis_alloc {

class IlpAllocator : public Allocator {
 public:
  IlpAllocator(const AllocationInstance& instance,
               const AllocationParameters& params);

  // Uses `interface_factory` instead of the bundled branch-and-bound backend.
  IlpAllocator(const AllocationInstance& instance,
               const AllocationParameters& params,
               MPSolver::InterfaceFactory interface_factory);

  ~IlpAllocator() override;

  // Only valid after Build().
  const MPSolver& solver() const { return *solver_; }

  // Solves the model once, without the epsilon re-solve nor diagnostics.
  // Exposed for tests.
  SolverOutcome SolveOnce();

 protected:
  absl::Status BuildModel() override;
  absl::StatusOr<AllocationResult> SolveModel() override;

 private:
  // Reads the assignment from the current solution of solver_.
  std::vector<int> ExtractAssignment() const;

  MPSolver::InterfaceFactory interface_factory_;
  std::unique_ptr<MPSolver> solver_;
  // Parallel to the rows of costs(): x_[s][i] is the variable of the i-th
  // admissible topic of student s.
  std::vector<std::vector<MPVariable*>> x_;
  MPConstraint* epsilon_constraint_ = nullptr;
};

}  // namespace thesis_alloc

#endif  // THESIS_ALLOC_ALLOCATION_ILP_ALLOCATOR_H_

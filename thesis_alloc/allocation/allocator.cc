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


#include "thesis_alloc/allocation/allocator.h"

#include <memory>
#include <utility>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_join.h"
#include "thesis_alloc/allocation/allocation.pb.h"
#include "thesis_alloc/allocation/allocation_instance.h"
#include "thesis_alloc/allocation/allocation_parameters.pb.h"
#include "thesis_alloc/allocation/flow_allocator.h"
#include "thesis_alloc/allocation/hybrid_allocator.h"
#include "thesis_alloc/allocation/ilp_allocator.h"
#include "thesis_alloc/allocation/parameters_validation.h"
#include "thesis_alloc/allocation/preference_model.h"
#include "thesis_alloc/base/status_macros.h"
#include "thesis_alloc/base/timer.h"

namespace thesis_alloc {

Allocator::Allocator(const AllocationInstance& instance,
                     const AllocationParameters& params)
    : instance_(instance),
      params_(params),
      preference_model_(instance, params.preference()) {}

absl::Status Allocator::Build() {
  costs_ = preference_model_.ComputeCosts();
  int num_unassignable = 0;
  for (int s = 0; s < costs_->num_students(); ++s) {
    if (!costs_->IsAssignable(s)) ++num_unassignable;
  }
  if (num_unassignable > 0) {
    LOG(WARNING) << num_unassignable
                 << " planning student(s) have no admissible topic";
  }
  const absl::Status status = BuildModel();
  if (!status.ok()) costs_.reset();
  return status;
}

absl::StatusOr<AllocationResult> Allocator::Solve() {
  if (!is_built()) {
    return absl::FailedPreconditionError(
        "the model is not built, call Build() first");
  }
  WallTimer timer;
  timer.Start();
  ASSIGN_OR_RETURN(AllocationResult result, SolveModel());
  timer.Stop();
  AllocationDiagnostics& diagnostics = *result.mutable_diagnostics();
  diagnostics.set_wall_time_seconds(timer.Get());
  LOG(INFO) << diagnostics.algorithm() << ": " << diagnostics.status()
            << ", objective " << diagnostics.objective_value() << ", "
            << result.assignments_size() << " assignments in "
            << timer.GetDuration();
  if (!diagnostics.unassigned_after_solve().empty()) {
    LOG(WARNING) << diagnostics.unassigned_after_solve_size()
                 << " student(s) left unassigned: "
                 << absl::StrJoin(diagnostics.unassigned_after_solve(), ", ");
  }
  return result;
}

absl::StatusOr<std::unique_ptr<Allocator>> CreateAllocator(
    const AllocationInstance& instance, const AllocationParameters& params) {
  RETURN_IF_ERROR(ValidateAllocationParameters(params));
  switch (params.solver().algorithm()) {
    case SolverParameters::ILP:
      return std::make_unique<IlpAllocator>(instance, params);
    case SolverParameters::FLOW:
      return std::make_unique<FlowAllocator>(instance, params);
    case SolverParameters::HYBRID:
      return std::make_unique<HybridAllocator>(instance, params);
  }
  return absl::InvalidArgumentError("unknown algorithm");
}

}  // namespace thesis_alloc

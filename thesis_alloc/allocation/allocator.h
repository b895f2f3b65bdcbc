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


// Common interface of the allocation algorithms.
//
// Typical use:
//
//   ASSIGN_OR_RETURN(const AllocationInstance instance,
//                    AllocationInstance::Create(input));
//   ASSIGN_OR_RETURN(std::unique_ptr<Allocator> allocator,
//                    CreateAllocator(instance, params));
//   RETURN_IF_ERROR(allocator->Build());
//   ASSIGN_OR_RETURN(const AllocationResult result, allocator->Solve());
//
// An infeasible problem, or a solve interrupted by the time limit, is not an
// error: the result then has a non-optimal status and possibly no rows.

#ifndef THESIS_ALLOC_ALLOCATION_ALLOCATOR_H_
#define THESIS_ALLOC_ALLOCATION_ALLOCATOR_H_

#include <memory>
#include <optional>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "thesis_alloc/allocation/allocation.pb.h"
#include "thesis_alloc/allocation/allocation_instance.h"
#include "thesis_alloc/allocation/allocation_parameters.pb.h"
#include "thesis_alloc/allocation/preference_model.h"

namespace thesis_alloc {

class Allocator {
 public:
  virtual ~Allocator() = default;

  Allocator(const Allocator&) = delete;
  Allocator& operator=(const Allocator&) = delete;

  // Computes the cost matrix and builds the model of the algorithm. Calling it
  // again rebuilds everything.
  absl::Status Build();

  // Returns FailedPreconditionError if Build() has not been called.
  absl::StatusOr<AllocationResult> Solve();

  bool is_built() const { return costs_.has_value(); }

  // Only valid after Build().
  const CostMatrix& costs() const { return *costs_; }

  const AllocationInstance& instance() const { return instance_; }
  const AllocationParameters& params() const { return params_; }

 protected:
  Allocator(const AllocationInstance& instance,
            const AllocationParameters& params);

  // Called by Build() once the costs are known.
  virtual absl::Status BuildModel() = 0;

  // Called by Solve(). The wall time is filled in by the caller.
  virtual absl::StatusOr<AllocationResult> SolveModel() = 0;

  const PreferenceModel& preference_model() const { return preference_model_; }

 private:
  const AllocationInstance& instance_;
  const AllocationParameters params_;
  const PreferenceModel preference_model_;
  std::optional<CostMatrix> costs_;
};

// Returns the allocator selected by params.solver().algorithm(), or
// InvalidArgumentError if the parameters are invalid. `instance`, and the
// AllocationInput it was created from, must outlive the allocator.
absl::StatusOr<std::unique_ptr<Allocator>> CreateAllocator(
    const AllocationInstance& instance, const AllocationParameters& params);

}  // namespace thesis_alloc

#endif  // THESIS_ALLOC_ALLOCATION_ALLOCATOR_H_

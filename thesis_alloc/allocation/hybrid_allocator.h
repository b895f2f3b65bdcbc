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


// Runs the integer program and the min-cost flow on the same instance, one
// after the other, and keeps the result with the lower objective. The integer
// program wins ties, and a run without a solution never wins.
//
// The two objectives are compared as reported: the flow objective never
// contains overflow nor shortfall penalties.

#ifndef THESIS_ALLOC_ALLOCATION_HYBRID_ALLOCATOR_H_
#define THESIS_ALLOC_ALLOCATION_HYBRID_ALLOCATOR_H_

#include <memory>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "thesis_alloc/allocation/allocation.pb.h"
#include "thesis_alloc/allocation/allocation_instance.h"
#include "thesis_alloc/allocation/allocation_parameters.pb.h"
#include "thesis_alloc/allocation/allocator.h"
#include "thesis_alloc/allocation/flow_allocator.h"
#include "thesis_alloc/allocation/ilp_allocator.h"

namespace thesis_alloc {

class HybridAllocator : public Allocator {
 public:
  HybridAllocator(const AllocationInstance& instance,
                  const AllocationParameters& params);
  ~HybridAllocator() override;

  // Returns true if `flow` should be preferred to `ilp`.
  static bool FlowIsBetter(const AllocationDiagnostics& ilp,
                           const AllocationDiagnostics& flow);

 protected:
  absl::Status BuildModel() override;
  absl::StatusOr<AllocationResult> SolveModel() override;

 private:
  std::unique_ptr<IlpAllocator> ilp_;
  std::unique_ptr<FlowAllocator> flow_;
};

}  // namespace thesis_alloc

#endif  // THESIS_ALLOC_ALLOCATION_HYBRID_ALLOCATOR_H_

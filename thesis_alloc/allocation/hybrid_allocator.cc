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


#include "thesis_alloc/allocation/hybrid_allocator.h"

#include <memory>
#include <utility>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "thesis_alloc/allocation/allocation.pb.h"
#include "thesis_alloc/allocation/allocator.h"
#include "thesis_alloc/allocation/diagnostics.h"
#include "thesis_alloc/allocation/flow_allocator.h"
#include "thesis_alloc/allocation/ilp_allocator.h"
#include "thesis_alloc/base/status_macros.h"

namespace thesis_alloc {

HybridAllocator::HybridAllocator(const AllocationInstance& instance,
                                 const AllocationParameters& params)
    : Allocator(instance, params),
      ilp_(std::make_unique<IlpAllocator>(instance, params)),
      flow_(std::make_unique<FlowAllocator>(instance, params)) {}

HybridAllocator::~HybridAllocator() = default;

bool HybridAllocator::FlowIsBetter(const AllocationDiagnostics& ilp,
                                   const AllocationDiagnostics& flow) {
  const bool ilp_solved = StatusHasSolution(ilp.status());
  const bool flow_solved = StatusHasSolution(flow.status());
  if (!flow_solved) return false;
  if (!ilp_solved) return true;
  return flow.objective_value() < ilp.objective_value();
}

absl::Status HybridAllocator::BuildModel() {
  RETURN_IF_ERROR(ilp_->Build());
  RETURN_IF_ERROR(flow_->Build());
  return absl::OkStatus();
}

absl::StatusOr<AllocationResult> HybridAllocator::SolveModel() {
  ASSIGN_OR_RETURN(AllocationResult ilp_result, ilp_->Solve());
  ASSIGN_OR_RETURN(AllocationResult flow_result, flow_->Solve());
  const AllocationDiagnostics& ilp = ilp_result.diagnostics();
  const AllocationDiagnostics& flow = flow_result.diagnostics();
  LOG(INFO) << "Hybrid: ilp " << ilp.status() << " " << ilp.objective_value()
            << ", flow " << flow.status() << " " << flow.objective_value();

  if (FlowIsBetter(ilp, flow)) {
    flow_result.mutable_diagnostics()->set_algorithm("hybrid (flow better)");
    return flow_result;
  }
  ilp_result.mutable_diagnostics()->set_algorithm("hybrid (ilp better)");
  return ilp_result;
}

}  // namespace thesis_alloc

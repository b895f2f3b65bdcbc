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


// Approximate allocation as a maximum flow of minimum cost on the layered
// network
//
//   source -> student -> topic -> coach -> sink
//
// where a student arc has capacity 1, a student -> topic arc has capacity 1
// and the cost of the pair, a topic -> coach arc the capacity of the topic and
// a coach -> sink arc the capacity of the coach. Capacities are hard: there is
// no overflow and department minimums are ignored, so some students may stay
// unassigned (status SUBOPTIMAL). Ties are not reported.

#ifndef THESIS_ALLOC_ALLOCATION_FLOW_ALLOCATOR_H_
#define THESIS_ALLOC_ALLOCATION_FLOW_ALLOCATOR_H_

#include <memory>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "thesis_alloc/allocation/allocation.pb.h"
#include "thesis_alloc/allocation/allocation_instance.h"
#include "thesis_alloc/allocation/allocation_parameters.pb.h"
#include "thesis_alloc/allocation/allocator.h"
#include "thesis_alloc/graph/min_cost_flow.h"

namespace thesis_alloc {

class FlowAllocator : public Allocator {
 public:
  FlowAllocator(const AllocationInstance& instance,
                const AllocationParameters& params);
  ~FlowAllocator() override;

  // Only valid after Build().
  const SimpleMinCostFlow& network() const { return *network_; }

 protected:
  absl::Status BuildModel() override;
  absl::StatusOr<AllocationResult> SolveModel() override;

 private:
  using NodeIndex = SimpleMinCostFlow::NodeIndex;
  using ArcIndex = SimpleMinCostFlow::ArcIndex;

  std::unique_ptr<SimpleMinCostFlow> network_;
  // Parallel to the rows of costs().
  std::vector<std::vector<ArcIndex>> assignment_arcs_;
  int num_assignable_ = 0;
};

}  // namespace thesis_alloc

#endif  // THESIS_ALLOC_ALLOCATION_FLOW_ALLOCATOR_H_

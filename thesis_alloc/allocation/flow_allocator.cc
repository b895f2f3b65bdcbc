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


#include "thesis_alloc/allocation/flow_allocator.h"

#include <memory>
#include <string>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "thesis_alloc/allocation/allocation.pb.h"
#include "thesis_alloc/allocation/allocation_instance.h"
#include "thesis_alloc/allocation/allocation_parameters.pb.h"
#include "thesis_alloc/allocation/allocator.h"
#include "thesis_alloc/allocation/diagnostics.h"
#include "thesis_alloc/allocation/preference_model.h"
#include "thesis_alloc/graph/min_cost_flow.h"

namespace thesis_alloc {

FlowAllocator::FlowAllocator(const AllocationInstance& instance,
                             const AllocationParameters& params)
    : Allocator(instance, params) {}

FlowAllocator::~FlowAllocator() = default;

absl::Status FlowAllocator::BuildModel() {
  const AllocationInstance& instance = this->instance();
  const CostMatrix& costs = this->costs();

  // Node numbering: source, students, topics, coaches, sink.
  const NodeIndex source = 0;
  const NodeIndex first_student = 1;
  const NodeIndex first_topic = first_student + costs.num_students();
  const NodeIndex first_coach = first_topic + instance.num_topics();
  const NodeIndex sink = first_coach + instance.num_coaches();

  network_ = std::make_unique<SimpleMinCostFlow>();
  assignment_arcs_.assign(costs.num_students(), {});
  num_assignable_ = 0;
  for (int s = 0; s < costs.num_students(); ++s) {
    if (!costs.IsAssignable(s)) continue;
    ++num_assignable_;
    network_->AddArcWithCapacityAndUnitCost(source, first_student + s, 1, 0);
    for (const CostMatrix::Entry& entry : costs.row(s)) {
      assignment_arcs_[s].push_back(network_->AddArcWithCapacityAndUnitCost(
          first_student + s, first_topic + entry.topic, 1, entry.cost));
    }
  }
  for (int t = 0; t < instance.num_topics(); ++t) {
    network_->AddArcWithCapacityAndUnitCost(
        first_topic + t, first_coach + instance.topic_coach(t),
        instance.topic_capacity(t), 0);
  }
  for (int c = 0; c < instance.num_coaches(); ++c) {
    network_->AddArcWithCapacityAndUnitCost(first_coach + c, sink,
                                            instance.coach_capacity(c), 0);
  }
  network_->SetNodeSupply(source, num_assignable_);
  network_->SetNodeSupply(sink, -num_assignable_);

  LOG(INFO) << "Flow network: " << network_->NumNodes() << " nodes, "
            << network_->NumArcs() << " arcs, " << num_assignable_
            << " assignable students";
  return absl::OkStatus();
}

absl::StatusOr<AllocationResult> FlowAllocator::SolveModel() {
  const CostMatrix& costs = this->costs();
  const SimpleMinCostFlow::Status status = network_->SolveMaxFlowWithMinCost();

  SolverOutcome outcome;
  outcome.assigned_topics.assign(costs.num_students(),
                                 AllocationInstance::kNoIndex);
  if (status != SimpleMinCostFlow::OPTIMAL) {
    LOG(ERROR) << "Min cost flow failed: "
               << SimpleMinCostFlow::StatusName(status);
    outcome.status = SimpleMinCostFlow::StatusName(status);
    return BuildAllocationResult(instance(), costs, outcome, "flow",
                                 /*report_ties=*/false);
  }

  int num_assigned = 0;
  for (int s = 0; s < costs.num_students(); ++s) {
    const auto row = costs.row(s);
    for (int i = 0; i < static_cast<int>(row.size()); ++i) {
      if (network_->Flow(assignment_arcs_[s][i]) > 0) {
        outcome.assigned_topics[s] = row[i].topic;
        ++num_assigned;
        break;
      }
    }
  }
  outcome.objective_value = network_->OptimalCost();
  outcome.status = num_assigned == num_assignable_ ? "OPTIMAL" : "SUBOPTIMAL";
  return BuildAllocationResult(instance(), costs, outcome, "flow",
                               /*report_ties=*/false);
}

}  // namespace thesis_alloc

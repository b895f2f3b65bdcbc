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


#include "thesis_alloc/allocation/ilp_allocator.h"

#include <cmath>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "thesis_alloc/allocation/allocation.pb.h"
#include "thesis_alloc/allocation/allocation_instance.h"
#include "thesis_alloc/allocation/allocation_parameters.pb.h"
#include "thesis_alloc/allocation/allocator.h"
#include "thesis_alloc/allocation/diagnostics.h"
#include "thesis_alloc/allocation/preference_model.h"
#include "thesis_alloc/linear_solver/linear_solver.h"

namespace thesis_alloc {

namespace {

bool HasSolution(MPSolver::ResultStatus status) {
  return status == MPSolver::OPTIMAL || status == MPSolver::FEASIBLE;
}

}  // namespace

IlpAllocator::IlpAllocator(const AllocationInstance& instance,
                           const AllocationParameters& params)
    : IlpAllocator(instance, params, BuildBranchAndBoundInterface) {}

IlpAllocator::IlpAllocator(const AllocationInstance& instance,
                           const AllocationParameters& params,
                           MPSolver::InterfaceFactory interface_factory)
    : Allocator(instance, params),
      interface_factory_(std::move(interface_factory)) {}

IlpAllocator::~IlpAllocator() = default;

absl::Status IlpAllocator::BuildModel() {
  const AllocationInstance& instance = this->instance();
  const CapacityParameters& capacity = params().capacity();
  const SolverParameters& solver_params = params().solver();
  const CostMatrix& costs = this->costs();
  const double infinity = MPSolver::infinity();

  solver_ = std::make_unique<MPSolver>(
      "thesis_allocation", MPSolver::BRANCH_AND_BOUND_INTEGER_PROGRAMMING,
      interface_factory_);
  epsilon_constraint_ = nullptr;
  if (solver_params.has_time_limit_sec()) {
    solver_->SetTimeLimit(absl::Seconds(solver_params.time_limit_sec()));
  }
  if (solver_params.has_random_seed()) {
    solver_->set_random_seed(solver_params.random_seed());
  }
  if (solver_params.log_search_progress()) solver_->EnableOutput();

  MPObjective* const objective = solver_->MutableObjective();
  objective->SetMinimization();

  // Assignment variables, and one topic per assignable student.
  x_.assign(costs.num_students(), {});
  std::vector<std::vector<MPVariable*>> x_by_topic(instance.num_topics());
  for (int s = 0; s < costs.num_students(); ++s) {
    if (!costs.IsAssignable(s)) continue;
    const std::string& student_id = instance.student(s).id();
    MPConstraint* const one_topic =
        solver_->MakeRowConstraint(1.0, 1.0, "one_topic_" + student_id);
    for (const CostMatrix::Entry& entry : costs.row(s)) {
      MPVariable* const x = solver_->MakeBoolVar(
          "x_" + student_id + "_" + instance.topic(entry.topic).id());
      objective->SetCoefficient(x, entry.cost);
      one_topic->SetCoefficient(x, 1.0);
      x_[s].push_back(x);
      x_by_topic[entry.topic].push_back(x);
    }
  }

  // Topic capacities.
  for (int t = 0; t < instance.num_topics(); ++t) {
    const std::string& topic_id = instance.topic(t).id();
    MPConstraint* const topic_cap = solver_->MakeRowConstraint(
        -infinity, instance.topic_capacity(t), "topic_cap_" + topic_id);
    for (MPVariable* const x : x_by_topic[t]) topic_cap->SetCoefficient(x, 1);
    if (capacity.enable_topic_overflow()) {
      MPVariable* const overflow =
          solver_->MakeIntVar(0.0, infinity, "ov_topic_" + topic_id);
      topic_cap->SetCoefficient(overflow, -1.0);
      objective->SetCoefficient(overflow, capacity.topic_overflow_penalty());
    }
  }

  // Coach capacities.
  for (int c = 0; c < instance.num_coaches(); ++c) {
    const std::string& coach_id = instance.coach(c).id();
    MPConstraint* const coach_cap = solver_->MakeRowConstraint(
        -infinity, instance.coach_capacity(c), "coach_cap_" + coach_id);
    for (const int t : instance.coach_topics(c)) {
      for (MPVariable* const x : x_by_topic[t]) coach_cap->SetCoefficient(x, 1);
    }
    if (capacity.enable_coach_overflow()) {
      MPVariable* const overflow =
          solver_->MakeIntVar(0.0, infinity, "ov_coach_" + coach_id);
      coach_cap->SetCoefficient(overflow, -1.0);
      objective->SetCoefficient(overflow, capacity.coach_overflow_penalty());
    }
  }

  // Department minimums.
  const bool soft = capacity.dept_min_mode() == CapacityParameters::SOFT;
  for (int d = 0; d < instance.num_departments(); ++d) {
    const int64_t desired_min = instance.department_min(d);
    if (desired_min <= 0) continue;
    const std::string& department_id = instance.department(d).id();
    MPConstraint* const dept_min = solver_->MakeRowConstraint(
        desired_min, infinity,
        (soft ? "dept_min_soft_" : "dept_min_hard_") + department_id);
    for (const int t : instance.department_topics(d)) {
      for (MPVariable* const x : x_by_topic[t]) dept_min->SetCoefficient(x, 1);
    }
    if (soft) {
      MPVariable* const shortfall =
          solver_->MakeIntVar(0.0, infinity, "shortfall_" + department_id);
      dept_min->SetCoefficient(shortfall, 1.0);
      objective->SetCoefficient(shortfall, capacity.dept_shortfall_penalty());
    }
  }

  LOG(INFO) << "Integer program: " << solver_->NumVariables()
            << " variables, " << solver_->NumConstraints() << " constraints";
  return absl::OkStatus();
}

std::vector<int> IlpAllocator::ExtractAssignment() const {
  const CostMatrix& costs = this->costs();
  std::vector<int> assigned(costs.num_students(), AllocationInstance::kNoIndex);
  for (int s = 0; s < costs.num_students(); ++s) {
    const auto row = costs.row(s);
    for (int i = 0; i < static_cast<int>(row.size()); ++i) {
      if (x_[s][i]->solution_value() > 0.5) {
        assigned[s] = row[i].topic;
        break;
      }
    }
  }
  return assigned;
}

SolverOutcome IlpAllocator::SolveOnce() {
  CHECK(solver_ != nullptr);
  MPSolverParameters solver_params;
  // The bundled backend stops at a relative gap of 1e-4 by default.
  solver_params.SetDoubleParam(MPSolverParameters::RELATIVE_MIP_GAP, 0.0);
  const MPSolver::ResultStatus status = solver_->Solve(solver_params);

  SolverOutcome outcome;
  outcome.status = std::string(ToString(status));
  if (HasSolution(status)) {
    outcome.objective_value = solver_->Objective().Value();
    outcome.assigned_topics = ExtractAssignment();
  } else {
    outcome.assigned_topics.assign(costs().num_students(),
                                   AllocationInstance::kNoIndex);
  }
  return outcome;
}

absl::StatusOr<AllocationResult> IlpAllocator::SolveModel() {
  // A previous epsilon re-solve must not constrain this one.
  if (epsilon_constraint_ != nullptr) {
    epsilon_constraint_->SetBounds(-MPSolver::infinity(), MPSolver::infinity());
  }
  SolverOutcome outcome = SolveOnce();

  const SolverParameters& solver_params = params().solver();
  if (solver_params.has_epsilon_suboptimal() && outcome.status == "OPTIMAL") {
    const double optimum = outcome.objective_value;
    const double bound =
        optimum + solver_params.epsilon_suboptimal() * std::abs(optimum);
    if (epsilon_constraint_ == nullptr) {
      const MPObjective& objective = solver_->Objective();
      epsilon_constraint_ = solver_->MakeRowConstraint("epsilon_suboptimal");
      for (const auto& [var, coeff] : objective.terms()) {
        epsilon_constraint_->SetCoefficient(var, coeff);
      }
    }
    epsilon_constraint_->SetBounds(-MPSolver::infinity(), bound);
    VLOG(1) << "Re-solving with objective <= " << bound;
    SolverOutcome second = SolveOnce();
    if (StatusHasSolution(second.status)) {
      outcome = std::move(second);
    } else {
      LOG(WARNING) << "Epsilon re-solve ended with " << second.status
                   << ", keeping the first solution";
    }
  }

  return BuildAllocationResult(instance(), costs(), outcome, "ilp",
                               /*report_ties=*/true);
}

}  // namespace thesis_alloc

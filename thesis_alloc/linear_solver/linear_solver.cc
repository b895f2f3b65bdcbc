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

#include "thesis_alloc/linear_solver/linear_solver.h"

#include <cmath>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"

namespace thesis_alloc {

// ----- MPConstraint -----

MPConstraint::MPConstraint(int index, double lb, double ub,
                           const std::string& name,
                           MPSolverInterface* const interface_in)
    : index_(index),
      lb_(lb),
      ub_(ub),
      name_(name.empty() ? absl::StrFormat("auto_c_%09d", index) : name),
      interface_(interface_in) {}

double MPConstraint::GetCoefficient(const MPVariable* const var) const {
  DLOG_IF(FATAL, !interface_->solver_->OwnsVariable(var)) << var;
  if (var == nullptr) return 0.0;
  const auto it = coefficients_.find(var);
  return it == coefficients_.end() ? 0.0 : it->second;
}

void MPConstraint::SetCoefficient(const MPVariable* const var, double coeff) {
  DLOG_IF(FATAL, !interface_->solver_->OwnsVariable(var)) << var;
  if (var == nullptr) return;
  if (coeff == 0.0) {
    // Setting a missing coefficient to 0 is a no-op.
    const auto it = coefficients_.find(var);
    if (it == coefficients_.end()) return;
    coefficients_.erase(it);
  } else {
    coefficients_[var] = coeff;
  }
  interface_->InvalidateSolutionSynchronization();
}

void MPConstraint::Clear() {
  coefficients_.clear();
  interface_->InvalidateSolutionSynchronization();
}

void MPConstraint::SetBounds(double lb, double ub) {
  const bool change = lb != lb_ || ub != ub_;
  lb_ = lb;
  ub_ = ub;
  if (change) interface_->InvalidateSolutionSynchronization();
}

// ----- MPObjective -----

double MPObjective::GetCoefficient(const MPVariable* const var) const {
  DLOG_IF(FATAL, !interface_->solver_->OwnsVariable(var)) << var;
  if (var == nullptr) return 0.0;
  const auto it = coefficients_.find(var);
  return it == coefficients_.end() ? 0.0 : it->second;
}

void MPObjective::SetCoefficient(const MPVariable* const var, double coeff) {
  DLOG_IF(FATAL, !interface_->solver_->OwnsVariable(var)) << var;
  if (var == nullptr) return;
  if (coeff == 0.0) {
    const auto it = coefficients_.find(var);
    if (it == coefficients_.end()) return;
    coefficients_.erase(it);
  } else {
    coefficients_[var] = coeff;
  }
  interface_->InvalidateSolutionSynchronization();
}

void MPObjective::SetOffset(double value) {
  offset_ = value;
  interface_->InvalidateSolutionSynchronization();
}

void MPObjective::Clear() {
  coefficients_.clear();
  offset_ = 0.0;
  SetMinimization();
}

void MPObjective::SetOptimizationDirection(bool maximize) {
  // The direction lives in the interface, which is built before the objective.
  interface_->maximize_ = maximize;
  interface_->InvalidateSolutionSynchronization();
}

bool MPObjective::maximization() const { return interface_->maximize_; }

bool MPObjective::minimization() const { return !interface_->maximize_; }

double MPObjective::Value() const { return interface_->objective_value(); }

double MPObjective::BestBound() const {
  return interface_->best_objective_bound();
}

// ----- MPVariable -----

MPVariable::MPVariable(int index, double lb, double ub, bool integer,
                       const std::string& name,
                       MPSolverInterface* const interface_in)
    : index_(index),
      lb_(lb),
      ub_(ub),
      integer_(integer),
      name_(name.empty() ? absl::StrFormat("auto_v_%09d", index) : name),
      solution_value_(0.0),
      interface_(interface_in) {}

double MPVariable::solution_value() const {
  if (!interface_->CheckSolutionIsSynchronizedAndExists()) return 0.0;
  return integer_ ? std::round(solution_value_) : solution_value_;
}

double MPVariable::unrounded_solution_value() const {
  if (!interface_->CheckSolutionIsSynchronizedAndExists()) return 0.0;
  return solution_value_;
}

void MPVariable::SetBounds(double lb, double ub) {
  const bool change = lb != lb_ || ub != ub_;
  lb_ = lb;
  ub_ = ub;
  if (change) interface_->InvalidateSolutionSynchronization();
}

// ----- Interface shortcuts -----

bool MPSolver::IsMIP() const { return interface_->IsMIP(); }

std::string MPSolver::SolverVersion() const {
  return interface_->SolverVersion();
}

int64_t MPSolver::iterations() const { return interface_->iterations(); }

int64_t MPSolver::nodes() const { return interface_->nodes(); }

// ----- Solver -----

MPSolver::MPSolver(const std::string& name,
                   OptimizationProblemType problem_type)
    : name_(name), problem_type_(problem_type) {
  Init(BuildBranchAndBoundInterface);
}

MPSolver::MPSolver(const std::string& name,
                   OptimizationProblemType problem_type,
                   const InterfaceFactory& interface_factory)
    : name_(name), problem_type_(problem_type) {
  Init(interface_factory);
}

void MPSolver::Init(const InterfaceFactory& interface_factory) {
  interface_ = interface_factory(this);
  CHECK(interface_ != nullptr) << "No solver interface for " << name_;
  objective_.reset(new MPObjective(interface_.get()));
}

MPSolver::~MPSolver() { Clear(); }

// static
bool MPSolver::ParseSolverType(absl::string_view solver_id,
                               MPSolver::OptimizationProblemType* type) {
  const std::string id = absl::AsciiStrToUpper(solver_id);
  if (id == "SIMPLEX" || id == "SIMPLEX_LINEAR_PROGRAMMING") {
    *type = SIMPLEX_LINEAR_PROGRAMMING;
    return true;
  }
  if (id == "BNB" || id == "BRANCH_AND_BOUND" ||
      id == "BRANCH_AND_BOUND_INTEGER_PROGRAMMING") {
    *type = BRANCH_AND_BOUND_INTEGER_PROGRAMMING;
    return true;
  }
  return false;
}

bool MPSolver::OwnsVariable(const MPVariable* var) const {
  if (var == nullptr) return false;
  if (var->index() >= 0 && var->index() < variables_.size()) {
    // Then, verify that the variable with this index has the same address.
    return variables_[var->index()] == var;
  }
  return false;
}

MPVariable* MPSolver::MakeVar(double lb, double ub, bool integer,
                              const std::string& name) {
  const int var_index = NumVariables();
  MPVariable* v =
      new MPVariable(var_index, lb, ub, integer, name, interface_.get());
  variables_.push_back(v);
  interface_->InvalidateSolutionSynchronization();
  return v;
}

MPVariable* MPSolver::MakeNumVar(double lb, double ub,
                                 const std::string& name) {
  return MakeVar(lb, ub, false, name);
}

MPVariable* MPSolver::MakeIntVar(double lb, double ub,
                                 const std::string& name) {
  return MakeVar(lb, ub, true, name);
}

MPVariable* MPSolver::MakeBoolVar(const std::string& name) {
  return MakeVar(0.0, 1.0, true, name);
}

MPConstraint* MPSolver::MakeRowConstraint(double lb, double ub) {
  return MakeRowConstraint(lb, ub, "");
}

MPConstraint* MPSolver::MakeRowConstraint() {
  return MakeRowConstraint(-infinity(), infinity(), "");
}

MPConstraint* MPSolver::MakeRowConstraint(double lb, double ub,
                                          const std::string& name) {
  const int constraint_index = NumConstraints();
  MPConstraint* const constraint =
      new MPConstraint(constraint_index, lb, ub, name, interface_.get());
  constraints_.push_back(constraint);
  interface_->InvalidateSolutionSynchronization();
  return constraint;
}

MPConstraint* MPSolver::MakeRowConstraint(const std::string& name) {
  return MakeRowConstraint(-infinity(), infinity(), name);
}

void MPSolver::Clear() {
  if (objective_ != nullptr) objective_->Clear();
  for (MPVariable* const variable : variables_) delete variable;
  variables_.clear();
  for (MPConstraint* const constraint : constraints_) delete constraint;
  constraints_.clear();
  interface_->InvalidateSolutionSynchronization();
}

void MPSolver::SetTimeLimit(absl::Duration time_limit) {
  DCHECK_GE(time_limit, absl::ZeroDuration());
  time_limit_ = time_limit;
}

MPSolver::ResultStatus MPSolver::Solve() {
  MPSolverParameters default_param;
  return Solve(default_param);
}

MPSolver::ResultStatus MPSolver::Solve(const MPSolverParameters& param) {
  // Special case for infeasible constraints so that all backends have the
  // same behavior.
  if (HasInfeasibleConstraints()) {
    interface_->result_status_ = MPSolver::INFEASIBLE;
    interface_->sync_status_ = MPSolverInterface::SOLUTION_SYNCHRONIZED;
    return interface_->result_status_;
  }
  const MPSolver::ResultStatus status = interface_->Solve(param);
  DCHECK_EQ(interface_->result_status_, status);
  return status;
}

std::vector<double> MPSolver::ComputeConstraintActivities() const {
  std::vector<double> activities(constraints_.size(), 0.0);
  if (!interface_->CheckSolutionIsSynchronizedAndExists()) return activities;
  for (int i = 0; i < constraints_.size(); ++i) {
    double activity = 0.0;
    for (const auto& entry : constraints_[i]->terms()) {
      activity += entry.second * entry.first->unrounded_solution_value();
    }
    activities[i] = activity;
  }
  return activities;
}

bool MPSolver::VerifySolution(double tolerance, bool log_errors) const {
  if (!interface_->CheckSolutionIsSynchronizedAndExists()) return false;
  int num_errors = 0;
  for (const MPVariable* const var : variables_) {
    const double value = var->unrounded_solution_value();
    if (value < var->lb() - tolerance || value > var->ub() + tolerance) {
      ++num_errors;
      LOG_IF(ERROR, log_errors)
          << "Variable '" << var->name() << "' value " << value
          << " is outside [" << var->lb() << ", " << var->ub() << "]";
    }
    if (var->integer() && std::abs(value - std::round(value)) > tolerance) {
      ++num_errors;
      LOG_IF(ERROR, log_errors)
          << "Integer variable '" << var->name() << "' has value " << value;
    }
  }
  const std::vector<double> activities = ComputeConstraintActivities();
  for (int i = 0; i < constraints_.size(); ++i) {
    const MPConstraint& constraint = *constraints_[i];
    if (activities[i] < constraint.lb() - tolerance ||
        activities[i] > constraint.ub() + tolerance) {
      ++num_errors;
      LOG_IF(ERROR, log_errors)
          << "Constraint '" << constraint.name() << "' activity "
          << activities[i] << " is outside [" << constraint.lb() << ", "
          << constraint.ub() << "]";
    }
  }
  return num_errors == 0;
}

void MPSolver::EnableOutput() { interface_->set_quiet(false); }

bool MPSolver::HasInfeasibleConstraints() const {
  bool hasInfeasibleConstraints = false;
  for (int i = 0; i < constraints_.size(); ++i) {
    if (constraints_[i]->lb() > constraints_[i]->ub()) {
      LOG(WARNING) << "Constraint " << constraints_[i]->name() << " (" << i
                   << ") has contradictory bounds:"
                   << " lower bound = " << constraints_[i]->lb()
                   << " upper bound = " << constraints_[i]->ub();
      hasInfeasibleConstraints = true;
    }
  }
  return hasInfeasibleConstraints;
}

absl::string_view ToString(MPSolver::ResultStatus status) {
  switch (status) {
    case MPSolver::OPTIMAL:
      return "OPTIMAL";
    case MPSolver::FEASIBLE:
      return "FEASIBLE";
    case MPSolver::INFEASIBLE:
      return "INFEASIBLE";
    case MPSolver::UNBOUNDED:
      return "UNBOUNDED";
    case MPSolver::ABNORMAL:
      return "ABNORMAL";
    case MPSolver::MODEL_INVALID:
      return "MODEL_INVALID";
    case MPSolver::NOT_SOLVED:
      return "NOT_SOLVED";
  }
  return "UNKNOWN";
}

// ----- MPSolverInterface -----

MPSolverInterface::MPSolverInterface(MPSolver* const solver)
    : solver_(solver),
      sync_status_(MUST_RELOAD),
      result_status_(MPSolver::NOT_SOLVED),
      maximize_(false),
      objective_value_(0.0),
      best_objective_bound_(0.0),
      quiet_(true) {}

MPSolverInterface::~MPSolverInterface() = default;

void MPSolverInterface::InvalidateSolutionSynchronization() {
  if (sync_status_ == SOLUTION_SYNCHRONIZED) {
    sync_status_ = MUST_RELOAD;
  }
}

bool MPSolverInterface::CheckSolutionIsSynchronized() const {
  if (sync_status_ != SOLUTION_SYNCHRONIZED) {
    LOG(ERROR)
        << "The model has been changed since the solution was last computed."
        << " MPSolverInterface::sync_status_ = " << sync_status_;
    return false;
  }
  return true;
}

bool MPSolverInterface::CheckSolutionExists() const {
  if (result_status_ != MPSolver::OPTIMAL &&
      result_status_ != MPSolver::FEASIBLE) {
    LOG(ERROR) << "No solution exists. MPSolverInterface::result_status_ = "
               << result_status_;
    return false;
  }
  return true;
}

double MPSolverInterface::objective_value() const {
  if (!CheckSolutionIsSynchronizedAndExists()) return 0;
  return objective_value_;
}

double MPSolverInterface::best_objective_bound() const {
  const double trivial_worst_bound =
      maximize_ ? -std::numeric_limits<double>::infinity()
                : std::numeric_limits<double>::infinity();
  if (!IsMIP()) {
    LOG(ERROR) << "Best objective bound only available for discrete problems.";
    return trivial_worst_bound;
  }
  if (!CheckSolutionIsSynchronized()) return trivial_worst_bound;
  // Special case for empty model.
  if (solver_->variables_.empty() && solver_->constraints_.empty()) {
    return solver_->Objective().offset();
  }
  return best_objective_bound_;
}

// ----- MPSolverParameters -----

const double MPSolverParameters::kDefaultRelativeMipGap = 1e-4;
const double MPSolverParameters::kDefaultPrimalTolerance =
    thesis_alloc::kDefaultPrimalTolerance;
const int MPSolverParameters::kDefaultLpIterationLimit = 1000000;

MPSolverParameters::MPSolverParameters()
    : relative_mip_gap_value_(kDefaultRelativeMipGap),
      primal_tolerance_value_(kDefaultPrimalTolerance),
      lp_iteration_limit_value_(kDefaultLpIterationLimit) {}

void MPSolverParameters::SetDoubleParam(MPSolverParameters::DoubleParam param,
                                        double value) {
  switch (param) {
    case RELATIVE_MIP_GAP: {
      relative_mip_gap_value_ = value;
      break;
    }
    case PRIMAL_TOLERANCE: {
      primal_tolerance_value_ = value;
      break;
    }
    default: {
      LOG(ERROR) << "Trying to set an unknown parameter: " << param << ".";
    }
  }
}

void MPSolverParameters::SetIntegerParam(
    MPSolverParameters::IntegerParam param, int value) {
  switch (param) {
    case LP_ITERATION_LIMIT: {
      if (value <= 0) {
        LOG(ERROR) << "Trying to set a non-positive iteration limit: " << value;
      } else {
        lp_iteration_limit_value_ = value;
      }
      break;
    }
    default: {
      LOG(ERROR) << "Trying to set an unknown parameter: " << param << ".";
    }
  }
}

double MPSolverParameters::GetDoubleParam(
    MPSolverParameters::DoubleParam param) const {
  switch (param) {
    case RELATIVE_MIP_GAP: {
      return relative_mip_gap_value_;
    }
    case PRIMAL_TOLERANCE: {
      return primal_tolerance_value_;
    }
    default: {
      LOG(ERROR) << "Trying to get an unknown parameter: " << param << ".";
      return 0.0;
    }
  }
}

int MPSolverParameters::GetIntegerParam(
    MPSolverParameters::IntegerParam param) const {
  switch (param) {
    case LP_ITERATION_LIMIT: {
      return lp_iteration_limit_value_;
    }
    default: {
      LOG(ERROR) << "Trying to get an unknown parameter: " << param << ".";
      return 0;
    }
  }
}

}  // namespace thesis_alloc

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

// Depth-first branch-and-bound on top of DenseSimplex.
//
// Each node is described by the column bounds of its LP relaxation. The
// branching variable is the most fractional one; among equally fractional
// candidates, the one with the highest random priority (drawn once per solve
// from MPSolver::random_seed()) is chosen. The "up" child is explored first,
// which tends to find feasible assignments quickly on set-partitioning-like
// rows. A node is pruned when its LP bound cannot improve the incumbent;
// when the objective only takes integral values, the bound is rounded up
// first. Consecutive nodes only differ by column bounds, so each LP is
// reoptimized from the basis of the previously solved node.

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/random/distributions.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "thesis_alloc/linear_solver/dense_simplex.h"
#include "thesis_alloc/linear_solver/linear_solver.h"

namespace thesis_alloc {

namespace {

constexpr double kInfinity = std::numeric_limits<double>::infinity();

struct Node {
  std::vector<double> lower_bounds;
  std::vector<double> upper_bounds;
  // LP bound of the parent, in the minimization sense.
  double parent_bound;
  int depth;
};

bool IsIntegral(double value) { return value == std::round(value); }

}  // namespace

class BranchAndBoundInterface : public MPSolverInterface {
 public:
  explicit BranchAndBoundInterface(MPSolver* const solver);
  ~BranchAndBoundInterface() override;

  MPSolver::ResultStatus Solve(const MPSolverParameters& param) override;

  int64_t iterations() const override { return iterations_; }
  int64_t nodes() const override { return nodes_; }

  bool IsMIP() const override {
    return solver_->ProblemType() ==
           MPSolver::BRANCH_AND_BOUND_INTEGER_PROGRAMMING;
  }

  std::string SolverVersion() const override {
    return "Branch-and-bound over dense bounded simplex";
  }

 private:
  // Returns false if the model contains NaN values or empty variable domains.
  bool ModelIsValid() const;

  // Loads the constraint matrix and the objective (in minimization form) in
  // lp_.
  void ExtractModel();

  // Returns true if the objective value is integral on every solution
  // satisfying the integrality requirements.
  bool ObjectiveIsIntegral() const;

  // Returns the index of the column to branch on, or -1 if the current LP
  // solution satisfies all integrality requirements.
  int SelectBranchingVariable(double integrality_tolerance) const;

  DenseSimplex lp_;
  std::vector<bool> is_integer_;
  std::vector<uint32_t> branching_priority_;
  int64_t iterations_;
  int64_t nodes_;
};

BranchAndBoundInterface::BranchAndBoundInterface(MPSolver* const solver)
    : MPSolverInterface(solver), iterations_(0), nodes_(0) {}

BranchAndBoundInterface::~BranchAndBoundInterface() = default;

bool BranchAndBoundInterface::ModelIsValid() const {
  for (const MPVariable* const var : solver_->variables()) {
    if (std::isnan(var->lb()) || std::isnan(var->ub()) || var->lb() > var->ub()) {
      LOG(ERROR) << "Variable '" << var->name() << "' has invalid bounds ["
                 << var->lb() << ", " << var->ub() << "]";
      return false;
    }
    if (std::isnan(solver_->Objective().GetCoefficient(var))) {
      LOG(ERROR) << "NaN objective coefficient for '" << var->name() << "'";
      return false;
    }
  }
  for (const MPConstraint* const constraint : solver_->constraints()) {
    if (std::isnan(constraint->lb()) || std::isnan(constraint->ub())) {
      LOG(ERROR) << "Constraint '" << constraint->name() << "' has NaN bounds";
      return false;
    }
    for (const auto& entry : constraint->terms()) {
      if (!std::isfinite(entry.second)) {
        LOG(ERROR) << "Invalid coefficient " << entry.second << " for '"
                   << entry.first->name() << "' in constraint '"
                   << constraint->name() << "'";
        return false;
      }
    }
  }
  return true;
}

void BranchAndBoundInterface::ExtractModel() {
  const int num_cols = solver_->NumVariables();
  const int num_rows = solver_->NumConstraints();
  lp_.Reset(num_rows, num_cols);
  is_integer_.assign(num_cols, false);
  for (const MPVariable* const var : solver_->variables()) {
    double lb = var->lb();
    double ub = var->ub();
    is_integer_[var->index()] = IsMIP() && var->integer();
    if (is_integer_[var->index()]) {
      lb = std::ceil(lb - kDefaultPrimalTolerance);
      ub = std::floor(ub + kDefaultPrimalTolerance);
    }
    lp_.SetColumnBounds(var->index(), lb, ub);
  }
  const double sign = maximize_ ? -1.0 : 1.0;
  for (const auto& entry : solver_->Objective().terms()) {
    lp_.SetObjectiveCoefficient(entry.first->index(), sign * entry.second);
  }
  for (const MPConstraint* const constraint : solver_->constraints()) {
    lp_.SetRowBounds(constraint->index(), constraint->lb(), constraint->ub());
    for (const auto& entry : constraint->terms()) {
      lp_.SetCoefficient(constraint->index(), entry.first->index(),
                         entry.second);
    }
  }
}

bool BranchAndBoundInterface::ObjectiveIsIntegral() const {
  if (!IsMIP()) return false;
  for (const auto& entry : solver_->Objective().terms()) {
    if (!is_integer_[entry.first->index()] || !IsIntegral(entry.second)) {
      return false;
    }
  }
  return true;
}

int BranchAndBoundInterface::SelectBranchingVariable(
    double integrality_tolerance) const {
  int best_col = -1;
  double best_score = 0.0;
  for (int col = 0; col < lp_.num_cols(); ++col) {
    if (!is_integer_[col]) continue;
    const double value = lp_.variable_value(col);
    const double fraction = value - std::floor(value);
    const double score = std::min(fraction, 1.0 - fraction);
    if (score <= integrality_tolerance) continue;
    if (best_col == -1 || score > best_score + 1e-9 ||
        (score >= best_score - 1e-9 &&
         branching_priority_[col] > branching_priority_[best_col])) {
      best_col = col;
      best_score = score;
    }
  }
  return best_col;
}

MPSolver::ResultStatus BranchAndBoundInterface::Solve(
    const MPSolverParameters& param) {
  const absl::Time start_time = absl::Now();
  iterations_ = 0;
  nodes_ = 0;
  objective_value_ = 0.0;
  best_objective_bound_ = 0.0;
  sync_status_ = SOLUTION_SYNCHRONIZED;

  if (!ModelIsValid()) {
    result_status_ = MPSolver::MODEL_INVALID;
    return result_status_;
  }
  ExtractModel();

  const double integrality_tolerance =
      param.GetDoubleParam(MPSolverParameters::PRIMAL_TOLERANCE);
  const double relative_gap =
      IsMIP() ? param.GetDoubleParam(MPSolverParameters::RELATIVE_MIP_GAP)
              : 0.0;
  lp_.set_iteration_limit(
      param.GetIntegerParam(MPSolverParameters::LP_ITERATION_LIMIT));
  const absl::Time deadline =
      solver_->TimeLimit() == absl::InfiniteDuration()
          ? absl::InfiniteFuture()
          : start_time + solver_->TimeLimit();
  lp_.set_deadline(deadline);

  std::mt19937 random(solver_->random_seed());
  branching_priority_.resize(lp_.num_cols());
  for (uint32_t& priority : branching_priority_) {
    priority = absl::Uniform<uint32_t>(random);
  }
  const bool integral_objective = ObjectiveIsIntegral();

  // All quantities below are in the minimization sense.
  double incumbent_value = kInfinity;
  std::vector<double> incumbent;
  // Returns true if a node with LP bound `bound` cannot improve the incumbent.
  const auto can_prune = [&](double bound) {
    if (incumbent.empty()) return false;
    if (integral_objective) bound = std::ceil(bound - 1e-6);
    const double gap =
        std::max(1e-9, relative_gap * std::abs(incumbent_value));
    return bound >= incumbent_value - gap;
  };

  std::vector<Node> stack;
  {
    Node root;
    root.lower_bounds.resize(lp_.num_cols());
    root.upper_bounds.resize(lp_.num_cols());
    for (int col = 0; col < lp_.num_cols(); ++col) {
      root.lower_bounds[col] = lp_.column_lower_bound(col);
      root.upper_bounds[col] = lp_.column_upper_bound(col);
    }
    root.parent_bound = -kInfinity;
    root.depth = 0;
    stack.push_back(std::move(root));
  }

  bool limit_reached = false;
  bool unbounded = false;
  double open_bound = kInfinity;  // Bound of the nodes left unexplored.
  while (!stack.empty()) {
    if (absl::Now() >= deadline) {
      limit_reached = true;
      break;
    }
    Node node = std::move(stack.back());
    stack.pop_back();
    if (can_prune(node.parent_bound)) continue;

    for (int col = 0; col < lp_.num_cols(); ++col) {
      lp_.SetColumnBounds(col, node.lower_bounds[col], node.upper_bounds[col]);
    }
    const DenseSimplex::Status lp_status = lp_.Solve();
    iterations_ += lp_.iterations();
    ++nodes_;

    if (lp_status == DenseSimplex::INFEASIBLE) continue;
    if (lp_status == DenseSimplex::UNBOUNDED) {
      unbounded = true;
      break;
    }
    if (lp_status == DenseSimplex::LIMIT_REACHED) {
      limit_reached = true;
      open_bound = std::min(open_bound, node.parent_bound);
      break;
    }
    DCHECK_EQ(lp_status, DenseSimplex::OPTIMAL);

    const double bound = lp_.objective_value();
    if (can_prune(bound)) continue;

    const int branching_col = SelectBranchingVariable(integrality_tolerance);
    if (branching_col == -1) {
      incumbent_value = integral_objective ? std::round(bound) : bound;
      incumbent.resize(lp_.num_cols());
      for (int col = 0; col < lp_.num_cols(); ++col) {
        incumbent[col] = lp_.variable_value(col);
      }
      if (!quiet_) {
        LOG(INFO) << "New incumbent " << (maximize_ ? -bound : bound)
                  << " at node " << nodes_ << " (depth " << node.depth << ")";
      }
      continue;
    }
    VLOG(2) << "Node " << nodes_ << " depth " << node.depth << " bound "
            << bound << " branching on column " << branching_col << " = "
            << lp_.variable_value(branching_col);

    const double value = lp_.variable_value(branching_col);
    Node down;
    down.lower_bounds = node.lower_bounds;
    down.upper_bounds = node.upper_bounds;
    down.upper_bounds[branching_col] = std::floor(value);
    down.parent_bound = bound;
    down.depth = node.depth + 1;
    Node up = std::move(node);
    up.lower_bounds[branching_col] = std::ceil(value);
    up.parent_bound = bound;
    up.depth = down.depth;
    // Last in, first out: the up branch is explored first.
    stack.push_back(std::move(down));
    stack.push_back(std::move(up));
  }
  for (const Node& node : stack) {
    open_bound = std::min(open_bound, node.parent_bound);
  }

  if (unbounded && incumbent.empty()) {
    result_status_ = MPSolver::UNBOUNDED;
  } else if (unbounded) {
    // An unbounded relaxation with an integer solution at hand: the MIP is
    // unbounded or infeasible, we cannot tell which.
    result_status_ = MPSolver::ABNORMAL;
  } else if (limit_reached) {
    result_status_ =
        incumbent.empty() ? MPSolver::NOT_SOLVED : MPSolver::FEASIBLE;
  } else {
    result_status_ =
        incumbent.empty() ? MPSolver::INFEASIBLE : MPSolver::OPTIMAL;
  }

  const double sign = maximize_ ? -1.0 : 1.0;
  const double offset = solver_->Objective().offset();
  if (!incumbent.empty()) {
    for (MPVariable* const var : solver_->variables()) {
      double value = incumbent[var->index()];
      if (is_integer_[var->index()]) value = std::round(value);
      SetVariableSolutionValue(var, value);
    }
    objective_value_ = sign * incumbent_value + offset;
    const double best_bound =
        result_status_ == MPSolver::OPTIMAL
            ? incumbent_value
            : std::min(incumbent_value, open_bound);
    best_objective_bound_ = sign * best_bound + offset;
  } else {
    best_objective_bound_ = sign * open_bound + offset;
  }
  if (!quiet_) {
    LOG(INFO) << "Branch-and-bound: " << ToString(result_status_)
              << ", objective " << objective_value_ << ", " << nodes_
              << " nodes, " << iterations_ << " simplex iterations, "
              << absl::FormatDuration(absl::Now() - start_time);
  }
  return result_status_;
}

std::unique_ptr<MPSolverInterface> BuildBranchAndBoundInterface(
    MPSolver* const solver) {
  return std::make_unique<BranchAndBoundInterface>(solver);
}

}  // namespace thesis_alloc

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

// A bounded-variable primal simplex working on a dense tableau. It is meant
// for the small and medium linear programs solved at each node of the
// branch-and-bound in branch_and_bound_interface.cc, not as a general purpose
// LP solver.
//
// The problem solved is
//   minimize    c.x
//   subject to  row_lb <= A.x <= row_ub
//               col_lb <= x <= col_ub
// where any bound can be infinite.
//
// Each row i gets a slack s_i = A_i.x bounded by [row_lb_i, row_ub_i], so the
// equality system is A.x - s = 0. The initial basis is made of the slacks of
// the rows that are satisfied by the starting point (every structural
// variable at a finite bound, or 0 when free) and of artificial variables for
// the others. Phase I minimizes the sum of the artificials, phase II the true
// objective with the artificials fixed to zero.
//
// Pricing uses the largest reduced cost (Dantzig's rule) and switches to
// Bland's rule after a run of degenerate pivots, which prevents cycling. The
// ratio test handles bound flips of the entering variable. The reduced costs
// are kept as an extra tableau row updated by each pivot, and recomputed from
// scratch only when a phase starts and to confirm optimality.
//
// When only bounds changed since the last optimal solve, which is what
// happens between two nodes of a branch-and-bound, Solve() reoptimizes from
// the last basis: that basis stays dual feasible, so a bounded dual simplex
// restores primal feasibility. It falls back to a solve from scratch when
// the basis cannot be reused.

#ifndef THESIS_ALLOC_LINEAR_SOLVER_DENSE_SIMPLEX_H_
#define THESIS_ALLOC_LINEAR_SOLVER_DENSE_SIMPLEX_H_

#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

#include "absl/time/time.h"

namespace thesis_alloc {

class DenseSimplex {
 public:
  enum Status {
    NOT_SOLVED,
    OPTIMAL,
    INFEASIBLE,
    UNBOUNDED,
    // The iteration limit or the deadline was hit.
    LIMIT_REACHED,
  };

  DenseSimplex();

  DenseSimplex(const DenseSimplex&) = delete;
  DenseSimplex& operator=(const DenseSimplex&) = delete;

  // Clears the problem and resizes it. All coefficients are zero and all
  // bounds are [0, +inf) for the columns and (-inf, +inf) for the rows.
  void Reset(int num_rows, int num_cols);

  int num_rows() const { return num_rows_; }
  int num_cols() const { return num_cols_; }

  void SetCoefficient(int row, int col, double value);
  void SetObjectiveCoefficient(int col, double value);
  void SetRowBounds(int row, double lb, double ub);
  void SetColumnBounds(int col, double lb, double ub);

  double column_lower_bound(int col) const { return col_lb_[col]; }
  double column_upper_bound(int col) const { return col_ub_[col]; }

  // Limits for the next calls to Solve(). The iteration limit applies to
  // each call, the deadline is absolute.
  void set_iteration_limit(int64_t limit) { iteration_limit_ = limit; }
  void set_deadline(absl::Time deadline) { deadline_ = deadline; }

  // Solves the problem. Bounds can be changed freely between two calls; the
  // basis of the previous call is reused when the matrix and the objective
  // are unchanged.
  Status Solve();

  // True if the next call to Solve() can start from the current basis.
  bool has_basis() const { return has_basis_; }

  // Solution of the last call to Solve(), meaningful only if it returned
  // OPTIMAL.
  double objective_value() const { return objective_value_; }
  double variable_value(int col) const { return value_[col]; }

  // Number of pivots and bound flips performed by the last call to Solve().
  int64_t iterations() const { return iterations_; }

  static constexpr double kInfinity = std::numeric_limits<double>::infinity();

 private:
  // Builds the slack/artificial basis and runs the two phases.
  Status SolveFromScratch();

  // Reoptimizes from the current basis after bound changes. Sets
  // `*basis_reused` to false, without touching the tableau, if some nonbasic
  // variable cannot be placed at a bound compatible with its reduced cost.
  Status Reoptimize(bool* basis_reused);

  // Runs the primal simplex on the current tableau with the current costs
  // until optimality, unboundedness or a limit.
  Status RunPrimalSimplex();

  // Runs the dual simplex from a dual feasible basis until the basic values
  // are within their bounds, or proves the problem infeasible.
  Status RunDualSimplex();

  bool LimitReached() const;
  void RefreshReducedCosts();
  void Pivot(int row, int entering);
  void ComputeObjectiveValue();

  // Returns true if the structural values satisfy the rows and the column
  // bounds of the original problem, up to a relative tolerance.
  bool SolutionIsConsistent() const;

  // Recomputes the values of the basic variables from the nonbasic ones, to
  // remove the drift accumulated by the incremental updates.
  void RecomputeBasicValues();

  double& Tableau(int row, int var) {
    return tableau_[static_cast<size_t>(row) * num_vars_ + var];
  }
  double Tableau(int row, int var) const {
    return tableau_[static_cast<size_t>(row) * num_vars_ + var];
  }

  // Problem data.
  int num_rows_;
  int num_cols_;
  std::vector<double> matrix_;  // Row major.
  std::vector<double> objective_;
  std::vector<double> row_lb_;
  std::vector<double> row_ub_;
  std::vector<double> col_lb_;
  std::vector<double> col_ub_;

  // Working data of Solve(). Variables are ordered as: structural columns,
  // row slacks, row artificials.
  int num_vars_;
  std::vector<double> tableau_;
  std::vector<double> lb_;
  std::vector<double> ub_;
  std::vector<double> cost_;
  std::vector<double> value_;
  std::vector<double> reduced_costs_;
  std::vector<int> basis_;
  std::vector<bool> is_basic_;
  // Nonzero positions of the last pivot row.
  std::vector<int> pivot_row_nonzeros_;
  int64_t pivots_since_refresh_;
  bool has_basis_;

  double objective_value_;
  int64_t iterations_;
  int64_t iteration_limit_;
  absl::Time deadline_;
};

}  // namespace thesis_alloc

#endif  // THESIS_ALLOC_LINEAR_SOLVER_DENSE_SIMPLEX_H_

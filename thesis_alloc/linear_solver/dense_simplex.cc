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


#include "thesis_alloc/linear_solver/dense_simplex.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"

namespace thesis_alloc {

namespace {

// Smallest magnitude of a pivot element.
constexpr double kPivotTolerance = 1e-9;
// A reduced cost smaller than this in magnitude is considered zero.
constexpr double kOptimalityTolerance = 1e-9;
// Bound violations below this are accepted.
constexpr double kFeasibilityTolerance = 1e-7;
// Tableau entries smaller than this after an update are set to zero.
constexpr double kDropTolerance = 1e-12;
// Relative tolerance of the check of a reoptimized solution against the
// original rows.
constexpr double kConsistencyTolerance = 1e-6;
// Number of consecutive degenerate iterations before switching to Bland's
// rule.
constexpr int kMaxDegenerateIterations = 50;
constexpr int64_t kDefaultIterationLimit = 1000000;

double InitialValue(double lb, double ub) {
  if (std::isfinite(lb)) return lb;
  if (std::isfinite(ub)) return ub;
  return 0.0;
}

// The finite bound of [lb, ub] closest to `value`, or 0 for a free variable.
double ClosestBound(double value, double lb, double ub) {
  const bool has_lb = std::isfinite(lb);
  const bool has_ub = std::isfinite(ub);
  if (has_lb && has_ub) {
    return std::abs(value - lb) <= std::abs(value - ub) ? lb : ub;
  }
  if (has_lb) return lb;
  if (has_ub) return ub;
  return 0.0;
}

}  // namespace

DenseSimplex::DenseSimplex()
    : num_rows_(0),
      num_cols_(0),
      num_vars_(0),
      pivots_since_refresh_(0),
      has_basis_(false),
      objective_value_(0.0),
      iterations_(0),
      iteration_limit_(kDefaultIterationLimit),
      deadline_(absl::InfiniteFuture()) {}

void DenseSimplex::Reset(int num_rows, int num_cols) {
  CHECK_GE(num_rows, 0);
  CHECK_GE(num_cols, 0);
  num_rows_ = num_rows;
  num_cols_ = num_cols;
  matrix_.assign(static_cast<size_t>(num_rows) * num_cols, 0.0);
  objective_.assign(num_cols, 0.0);
  row_lb_.assign(num_rows, -kInfinity);
  row_ub_.assign(num_rows, kInfinity);
  col_lb_.assign(num_cols, 0.0);
  col_ub_.assign(num_cols, kInfinity);
  value_.assign(num_cols, 0.0);
  objective_value_ = 0.0;
  iterations_ = 0;
  has_basis_ = false;
}

void DenseSimplex::SetCoefficient(int row, int col, double value) {
  DCHECK_LT(row, num_rows_);
  DCHECK_LT(col, num_cols_);
  matrix_[static_cast<size_t>(row) * num_cols_ + col] = value;
  has_basis_ = false;
}

void DenseSimplex::SetObjectiveCoefficient(int col, double value) {
  objective_[col] = value;
  has_basis_ = false;
}

void DenseSimplex::SetRowBounds(int row, double lb, double ub) {
  row_lb_[row] = lb;
  row_ub_[row] = ub;
}

void DenseSimplex::SetColumnBounds(int col, double lb, double ub) {
  col_lb_[col] = lb;
  col_ub_[col] = ub;
}

DenseSimplex::Status DenseSimplex::Solve() {
  iterations_ = 0;
  objective_value_ = 0.0;
  for (int col = 0; col < num_cols_; ++col) {
    if (col_lb_[col] > col_ub_[col]) return INFEASIBLE;
  }
  for (int row = 0; row < num_rows_; ++row) {
    if (row_lb_[row] > row_ub_[row]) return INFEASIBLE;
  }
  if (has_basis_) {
    bool basis_reused = false;
    const Status status = Reoptimize(&basis_reused);
    if (basis_reused) {
      if (status != OPTIMAL || SolutionIsConsistent()) return status;
      VLOG(1) << "Reoptimized solution lost accuracy, solving from scratch";
    }
  }
  return SolveFromScratch();
}

DenseSimplex::Status DenseSimplex::SolveFromScratch() {
  has_basis_ = false;
  const int m = num_rows_;
  const int n = num_cols_;
  num_vars_ = n + 2 * m;
  tableau_.assign(static_cast<size_t>(m) * num_vars_, 0.0);
  lb_.assign(num_vars_, 0.0);
  ub_.assign(num_vars_, 0.0);
  cost_.assign(num_vars_, 0.0);
  value_.assign(num_vars_, 0.0);
  basis_.assign(m, -1);
  is_basic_.assign(num_vars_, false);

  for (int col = 0; col < n; ++col) {
    lb_[col] = col_lb_[col];
    ub_[col] = col_ub_[col];
    value_[col] = InitialValue(col_lb_[col], col_ub_[col]);
  }

  bool needs_phase_one = false;
  for (int row = 0; row < m; ++row) {
    const int slack = n + row;
    const int artificial = n + m + row;
    lb_[slack] = row_lb_[row];
    ub_[slack] = row_ub_[row];
    double activity = 0.0;
    for (int col = 0; col < n; ++col) {
      const double coefficient = matrix_[static_cast<size_t>(row) * n + col];
      Tableau(row, col) = coefficient;
      activity += coefficient * value_[col];
    }
    Tableau(row, slack) = -1.0;
    if (activity >= row_lb_[row] - kFeasibilityTolerance &&
        activity <= row_ub_[row] + kFeasibilityTolerance) {
      // The slack is basic: scale the row by -1 to get a unit column.
      for (int col = 0; col < n; ++col) Tableau(row, col) = -Tableau(row, col);
      Tableau(row, slack) = 1.0;
      basis_[row] = slack;
      value_[slack] = activity;
    } else {
      value_[slack] = activity < row_lb_[row] ? row_lb_[row] : row_ub_[row];
      const double gap = value_[slack] - activity;
      const double sign = gap > 0.0 ? 1.0 : -1.0;
      // Row: A.x - s + sign * r = 0, scaled by sign.
      for (int col = 0; col < n; ++col) Tableau(row, col) *= sign;
      Tableau(row, slack) = -sign;
      Tableau(row, artificial) = 1.0;
      basis_[row] = artificial;
      value_[artificial] = std::abs(gap);
      ub_[artificial] = kInfinity;
      cost_[artificial] = 1.0;
      needs_phase_one = true;
    }
    is_basic_[basis_[row]] = true;
  }

  if (needs_phase_one) {
    RefreshReducedCosts();
    const Status status = RunPrimalSimplex();
    if (status != OPTIMAL) {
      // Phase I is bounded below by zero.
      DCHECK_NE(status, UNBOUNDED);
      return status;
    }
    RecomputeBasicValues();
    double infeasibility = 0.0;
    for (int row = 0; row < m; ++row) {
      infeasibility += std::abs(value_[n + m + row]);
    }
    VLOG(2) << "Phase I done after " << iterations_
            << " iterations, infeasibility " << infeasibility;
    if (infeasibility > kFeasibilityTolerance) return INFEASIBLE;
  }

  for (int row = 0; row < m; ++row) {
    const int artificial = n + m + row;
    ub_[artificial] = 0.0;
    cost_[artificial] = 0.0;
    if (!is_basic_[artificial]) value_[artificial] = 0.0;
  }
  for (int col = 0; col < n; ++col) cost_[col] = objective_[col];

  RefreshReducedCosts();
  const Status status = RunPrimalSimplex();
  if (status != OPTIMAL) return status;
  RecomputeBasicValues();
  ComputeObjectiveValue();
  has_basis_ = true;
  VLOG(2) << "Simplex done after " << iterations_ << " iterations, objective "
          << objective_value_;
  return OPTIMAL;
}

DenseSimplex::Status DenseSimplex::Reoptimize(bool* basis_reused) {
  *basis_reused = false;
  const int n = num_cols_;
  for (int col = 0; col < n; ++col) {
    lb_[col] = col_lb_[col];
    ub_[col] = col_ub_[col];
  }
  for (int row = 0; row < num_rows_; ++row) {
    lb_[n + row] = row_lb_[row];
    ub_[n + row] = row_ub_[row];
  }
  // Nonbasic variables go to the bound matching the sign of their reduced
  // cost, which keeps the basis dual feasible.
  for (int var = 0; var < num_vars_; ++var) {
    if (is_basic_[var]) continue;
    const double reduced_cost = reduced_costs_[var];
    if (lb_[var] == ub_[var]) {
      value_[var] = lb_[var];
    } else if (reduced_cost > kOptimalityTolerance) {
      if (!std::isfinite(lb_[var])) return NOT_SOLVED;
      value_[var] = lb_[var];
    } else if (reduced_cost < -kOptimalityTolerance) {
      if (!std::isfinite(ub_[var])) return NOT_SOLVED;
      value_[var] = ub_[var];
    } else {
      value_[var] = ClosestBound(value_[var], lb_[var], ub_[var]);
    }
  }
  *basis_reused = true;
  RecomputeBasicValues();

  // A dual simplex that stops early still leaves a dual feasible basis.
  const Status dual_status = RunDualSimplex();
  if (dual_status != OPTIMAL) return dual_status;
  const Status status = RunPrimalSimplex();
  if (status != OPTIMAL) {
    has_basis_ = false;
    return status;
  }
  RecomputeBasicValues();
  ComputeObjectiveValue();
  VLOG(2) << "Reoptimized after " << iterations_ << " iterations, objective "
          << objective_value_;
  return OPTIMAL;
}

bool DenseSimplex::LimitReached() const {
  return iterations_ >= iteration_limit_ || absl::Now() >= deadline_;
}

void DenseSimplex::RefreshReducedCosts() {
  reduced_costs_.assign(cost_.begin(), cost_.end());
  for (int row = 0; row < num_rows_; ++row) {
    const double basic_cost = cost_[basis_[row]];
    if (basic_cost == 0.0) continue;
    const double* const tableau_row =
        &tableau_[static_cast<size_t>(row) * num_vars_];
    for (int var = 0; var < num_vars_; ++var) {
      reduced_costs_[var] -= basic_cost * tableau_row[var];
    }
  }
  pivots_since_refresh_ = 0;
}

DenseSimplex::Status DenseSimplex::RunPrimalSimplex() {
  int num_degenerate_iterations = 0;
  bool use_bland_rule = false;
  while (true) {
    if (LimitReached()) return LIMIT_REACHED;

    // Pricing.
    int entering = -1;
    double direction = 0.0;
    double best_reduced_cost = kOptimalityTolerance;
    for (int var = 0; var < num_vars_; ++var) {
      if (is_basic_[var] || lb_[var] == ub_[var]) continue;
      const double reduced_cost = reduced_costs_[var];
      double var_direction = 0.0;
      if (reduced_cost < -kOptimalityTolerance && value_[var] < ub_[var]) {
        var_direction = 1.0;
      } else if (reduced_cost > kOptimalityTolerance &&
                 value_[var] > lb_[var]) {
        var_direction = -1.0;
      } else {
        continue;
      }
      if (use_bland_rule) {
        entering = var;
        direction = var_direction;
        break;
      }
      if (std::abs(reduced_cost) > best_reduced_cost) {
        best_reduced_cost = std::abs(reduced_cost);
        entering = var;
        direction = var_direction;
      }
    }
    if (entering == -1) {
      // The updated reduced costs are confirmed on fresh ones.
      if (pivots_since_refresh_ == 0) return OPTIMAL;
      RefreshReducedCosts();
      continue;
    }

    // Ratio test. The entering variable moves by direction * step, the basic
    // variable of row i by alpha_i * step.
    double step = ub_[entering] - lb_[entering];
    if (std::isnan(step)) step = kInfinity;
    int leaving_row = -1;
    double leaving_alpha = 0.0;
    for (int row = 0; row < num_rows_; ++row) {
      const double alpha = -Tableau(row, entering) * direction;
      if (std::abs(alpha) <= kPivotTolerance) continue;
      const int basic = basis_[row];
      double limit;
      if (alpha > 0.0) {
        if (!std::isfinite(ub_[basic])) continue;
        limit = (ub_[basic] - value_[basic]) / alpha;
      } else {
        if (!std::isfinite(lb_[basic])) continue;
        limit = (lb_[basic] - value_[basic]) / alpha;
      }
      limit = std::max(0.0, limit);
      bool better;
      if (leaving_row == -1) {
        better = limit < step;
      } else if (limit < step - kPivotTolerance) {
        better = true;
      } else if (limit <= step + kPivotTolerance) {
        better = use_bland_rule ? basic < basis_[leaving_row]
                                : std::abs(alpha) > std::abs(leaving_alpha);
      } else {
        better = false;
      }
      if (better) {
        step = limit;
        leaving_row = row;
        leaving_alpha = alpha;
      }
    }
    if (!std::isfinite(step)) return UNBOUNDED;

    for (int row = 0; row < num_rows_; ++row) {
      const double coefficient = Tableau(row, entering);
      if (coefficient != 0.0) {
        value_[basis_[row]] -= coefficient * direction * step;
      }
    }
    value_[entering] += direction * step;
    if (leaving_row == -1) {
      value_[entering] = direction > 0.0 ? ub_[entering] : lb_[entering];
    } else {
      const int leaving = basis_[leaving_row];
      value_[leaving] = leaving_alpha > 0.0 ? ub_[leaving] : lb_[leaving];
      Pivot(leaving_row, entering);
      is_basic_[leaving] = false;
      is_basic_[entering] = true;
      basis_[leaving_row] = entering;
    }
    ++iterations_;

    if (step <= kPivotTolerance) {
      if (++num_degenerate_iterations >= kMaxDegenerateIterations &&
          !use_bland_rule) {
        VLOG(2) << "Switching to Bland's rule at iteration " << iterations_;
        use_bland_rule = true;
      }
    } else {
      num_degenerate_iterations = 0;
    }
  }
}

DenseSimplex::Status DenseSimplex::RunDualSimplex() {
  int num_degenerate_iterations = 0;
  bool use_bland_rule = false;
  while (true) {
    if (LimitReached()) return LIMIT_REACHED;

    // Leaving row: the basic variable with the largest bound violation, or
    // the smallest infeasible variable under Bland's rule.
    int leaving_row = -1;
    double target = 0.0;
    double max_violation = kFeasibilityTolerance;
    for (int row = 0; row < num_rows_; ++row) {
      const int basic = basis_[row];
      const double value = value_[basic];
      double violation;
      double bound;
      if (value < lb_[basic] - kFeasibilityTolerance) {
        violation = lb_[basic] - value;
        bound = lb_[basic];
      } else if (value > ub_[basic] + kFeasibilityTolerance) {
        violation = value - ub_[basic];
        bound = ub_[basic];
      } else {
        continue;
      }
      if (use_bland_rule) {
        if (leaving_row == -1 || basic < basis_[leaving_row]) {
          leaving_row = row;
          target = bound;
        }
      } else if (violation > max_violation) {
        max_violation = violation;
        leaving_row = row;
        target = bound;
      }
    }
    if (leaving_row == -1) return OPTIMAL;
    const int leaving = basis_[leaving_row];
    const bool increase = target > value_[leaving];

    // Ratio test on the reduced costs. The basic variable of the row moves by
    // -alpha per unit increase of a nonbasic variable.
    const double* const tableau_row =
        &tableau_[static_cast<size_t>(leaving_row) * num_vars_];
    int entering = -1;
    double best_ratio = kInfinity;
    double best_alpha = 0.0;
    for (int var = 0; var < num_vars_; ++var) {
      if (is_basic_[var] || lb_[var] == ub_[var]) continue;
      const double alpha = tableau_row[var];
      if (std::abs(alpha) <= kPivotTolerance) continue;
      const bool var_increases = (alpha < 0.0) == increase;
      if (var_increases ? !(value_[var] < ub_[var])
                        : !(value_[var] > lb_[var])) {
        continue;
      }
      const double ratio = std::abs(reduced_costs_[var]) / std::abs(alpha);
      bool better;
      if (entering == -1 || ratio < best_ratio - kOptimalityTolerance) {
        better = true;
      } else if (ratio <= best_ratio + kOptimalityTolerance) {
        better = use_bland_rule ? var < entering
                                : std::abs(alpha) > std::abs(best_alpha);
      } else {
        better = false;
      }
      if (better) {
        entering = var;
        best_ratio = ratio;
        best_alpha = alpha;
      }
    }
    // Nothing can move the row towards its bound.
    if (entering == -1) return INFEASIBLE;

    const double step = (value_[leaving] - target) / best_alpha;
    for (int row = 0; row < num_rows_; ++row) {
      const double coefficient = Tableau(row, entering);
      if (coefficient != 0.0) value_[basis_[row]] -= coefficient * step;
    }
    value_[entering] += step;
    value_[leaving] = target;
    Pivot(leaving_row, entering);
    is_basic_[leaving] = false;
    is_basic_[entering] = true;
    basis_[leaving_row] = entering;
    ++iterations_;

    if (best_ratio <= kOptimalityTolerance) {
      if (++num_degenerate_iterations >= kMaxDegenerateIterations &&
          !use_bland_rule) {
        VLOG(2) << "Dual simplex switching to Bland's rule at iteration "
                << iterations_;
        use_bland_rule = true;
      }
    } else {
      num_degenerate_iterations = 0;
    }
  }
}

void DenseSimplex::Pivot(int row, int entering) {
  double* const pivot_row = &tableau_[static_cast<size_t>(row) * num_vars_];
  const double pivot = pivot_row[entering];
  DCHECK_GT(std::abs(pivot), kPivotTolerance);
  pivot_row_nonzeros_.clear();
  for (int var = 0; var < num_vars_; ++var) {
    if (pivot_row[var] == 0.0) continue;
    pivot_row[var] /= pivot;
    if (std::abs(pivot_row[var]) < kDropTolerance) {
      pivot_row[var] = 0.0;
      continue;
    }
    pivot_row_nonzeros_.push_back(var);
  }
  pivot_row[entering] = 1.0;
  for (int other = 0; other < num_rows_; ++other) {
    if (other == row) continue;
    double* const other_row =
        &tableau_[static_cast<size_t>(other) * num_vars_];
    const double factor = other_row[entering];
    if (factor == 0.0) continue;
    for (const int var : pivot_row_nonzeros_) {
      double& entry = other_row[var];
      entry -= factor * pivot_row[var];
      if (std::abs(entry) < kDropTolerance) entry = 0.0;
    }
    other_row[entering] = 0.0;
  }
  // The reduced costs are one more row of the tableau.
  const double entering_cost = reduced_costs_[entering];
  if (entering_cost != 0.0) {
    for (const int var : pivot_row_nonzeros_) {
      reduced_costs_[var] -= entering_cost * pivot_row[var];
    }
  }
  reduced_costs_[entering] = 0.0;
  ++pivots_since_refresh_;
}

void DenseSimplex::RecomputeBasicValues() {
  std::vector<int> nonzero_nonbasic;
  for (int var = 0; var < num_vars_; ++var) {
    if (!is_basic_[var] && value_[var] != 0.0) nonzero_nonbasic.push_back(var);
  }
  for (int row = 0; row < num_rows_; ++row) {
    const double* const tableau_row =
        &tableau_[static_cast<size_t>(row) * num_vars_];
    double sum = 0.0;
    for (const int var : nonzero_nonbasic) {
      sum += tableau_row[var] * value_[var];
    }
    value_[basis_[row]] = -sum;
  }
}

void DenseSimplex::ComputeObjectiveValue() {
  objective_value_ = 0.0;
  for (int col = 0; col < num_cols_; ++col) {
    objective_value_ += objective_[col] * value_[col];
  }
}

bool DenseSimplex::SolutionIsConsistent() const {
  std::vector<int> nonzero_cols;
  for (int col = 0; col < num_cols_; ++col) {
    const double tolerance =
        kConsistencyTolerance * std::max(1.0, std::abs(value_[col]));
    if (value_[col] < col_lb_[col] - tolerance ||
        value_[col] > col_ub_[col] + tolerance) {
      return false;
    }
    if (value_[col] != 0.0) nonzero_cols.push_back(col);
  }
  for (int row = 0; row < num_rows_; ++row) {
    const double* const matrix_row =
        &matrix_[static_cast<size_t>(row) * num_cols_];
    double activity = 0.0;
    for (const int col : nonzero_cols) {
      activity += matrix_row[col] * value_[col];
    }
    const double tolerance =
        kConsistencyTolerance * std::max(1.0, std::abs(activity));
    if (activity < row_lb_[row] - tolerance ||
        activity > row_ub_[row] + tolerance) {
      return false;
    }
  }
  return true;
}

}  // namespace thesis_alloc

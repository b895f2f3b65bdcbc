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

/**
 * \file
 * A linear and mixed-integer programming modeling layer.
 *
 * The model is built with MPSolver: variables (continuous or integer, with
 * bounds), row constraints lb <= sum(coeff * var) <= ub, and a linear
 * objective to minimize or maximize. The actual solving is delegated to an
 * MPSolverInterface. The bundled backend is a depth-first branch-and-bound
 * over a dense bounded primal simplex (see branch_and_bound_interface.cc);
 * another backend can be plugged in by passing an InterfaceFactory to the
 * MPSolver constructor.
 *
 * Example:
 * \code
 *   MPSolver solver("example", MPSolver::BRANCH_AND_BOUND_INTEGER_PROGRAMMING);
 *   MPVariable* const x = solver.MakeIntVar(0, 10, "x");
 *   MPVariable* const y = solver.MakeIntVar(0, 10, "y");
 *   MPConstraint* const c = solver.MakeRowConstraint(-MPSolver::infinity(), 7);
 *   c->SetCoefficient(x, 2);
 *   c->SetCoefficient(y, 3);
 *   MPObjective* const objective = solver.MutableObjective();
 *   objective->SetCoefficient(x, 1);
 *   objective->SetCoefficient(y, 2);
 *   objective->SetMaximization();
 *   if (solver.Solve() == MPSolver::OPTIMAL) {
 *     LOG(INFO) << objective->Value();
 *   }
 * \endcode
 */

#ifndef THESIS_ALLOC_LINEAR_SOLVER_LINEAR_SOLVER_H_
#define THESIS_ALLOC_LINEAR_SOLVER_LINEAR_SOLVER_H_

#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"

namespace thesis_alloc {

constexpr double kDefaultPrimalTolerance = 1e-07;

class MPConstraint;
class MPObjective;
class MPSolverInterface;
class MPSolverParameters;
class MPVariable;

/**
 * This mathematical programming (MP) solver class is the main class
 * though which users build and solve problems.
 */
class MPSolver {
 public:
  /**
   * The type of problems (LP or MIP) that will be solved.
   */
  enum OptimizationProblemType {
    // The linear relaxation only: integrality requirements are ignored.
    SIMPLEX_LINEAR_PROGRAMMING = 0,
    // Depth-first branch-and-bound on top of the simplex.
    BRANCH_AND_BOUND_INTEGER_PROGRAMMING = 1,
  };

  /// Creates the backend of a solver. The MPSolver is passed as argument.
  using InterfaceFactory =
      std::function<std::unique_ptr<MPSolverInterface>(MPSolver*)>;

  /// Create a solver with the given name and the bundled backend.
  MPSolver(const std::string& name, OptimizationProblemType problem_type);

  /// Create a solver whose backend is built by `interface_factory`.
  MPSolver(const std::string& name, OptimizationProblemType problem_type,
           const InterfaceFactory& interface_factory);

  virtual ~MPSolver();

  MPSolver(const MPSolver&) = delete;
  MPSolver& operator=(const MPSolver&) = delete;

  /**
   * Parses the name of the solver. Returns true if the solver type is
   * successfully parsed as one of the OptimizationProblemType. Accepts the
   * enum names and the short versions "SIMPLEX" and "BRANCH_AND_BOUND" (or
   * "BNB"), case insensitive.
   */
  static bool ParseSolverType(absl::string_view solver_id,
                              OptimizationProblemType* type);

  bool IsMIP() const;

  /// Returns the optimization problem type set at construction.
  OptimizationProblemType ProblemType() const { return problem_type_; }

  /**
   * Clears the objective (including the optimization direction), all variables
   * and constraints. All the other properties of the MPSolver (like the time
   * limit) are kept untouched.
   */
  void Clear();

  /// Returns the number of variables.
  int NumVariables() const { return variables_.size(); }

  /**
   * Returns the array of variables handled by the MPSolver. (They are listed in
   * the order in which they were created.)
   */
  const std::vector<MPVariable*>& variables() const { return variables_; }

  /**
   * Creates a variable with the given bounds, integrality requirement and
   * name. Bounds can be finite or +/- MPSolver::infinity(). The MPSolver owns
   * the variable (i.e. the returned pointer is borrowed). Variable names are
   * optional. If you give an empty name, one is generated.
   */
  MPVariable* MakeVar(double lb, double ub, bool integer,
                      const std::string& name);

  MPVariable* MakeNumVar(double lb, double ub, const std::string& name);

  MPVariable* MakeIntVar(double lb, double ub, const std::string& name);

  MPVariable* MakeBoolVar(const std::string& name);

  int NumConstraints() const { return constraints_.size(); }

  /**
   * Returns the array of constraints handled by the MPSolver.
   *
   * They are listed in the order in which they were created.
   */
  const std::vector<MPConstraint*>& constraints() const { return constraints_; }

  /**
   * Creates a linear constraint with given bounds.
   *
   * Bounds can be finite or +/- MPSolver::infinity(). The MPSolver class
   * assumes ownership of the constraint.
   */
  MPConstraint* MakeRowConstraint(double lb, double ub);

  MPConstraint* MakeRowConstraint();

  MPConstraint* MakeRowConstraint(double lb, double ub,
                                  const std::string& name);

  MPConstraint* MakeRowConstraint(const std::string& name);

  /**
   * Returns the objective object.
   *
   * Note that the objective is owned by the solver, and is initialized to its
   * default value (see the MPObjective class below) at construction.
   */
  const MPObjective& Objective() const { return *objective_; }

  MPObjective* MutableObjective() { return objective_.get(); }

  /**
   * The status of solving the problem.
   */
  enum ResultStatus {
    /// optimal.
    OPTIMAL,
    /// feasible, or stopped by limit.
    FEASIBLE,
    /// proven infeasible.
    INFEASIBLE,
    /// proven unbounded.
    UNBOUNDED,
    /// abnormal, i.e., error of some kind.
    ABNORMAL,
    /// the model is trivially invalid (NaN coefficients, etc).
    MODEL_INVALID,
    /// not been solved yet.
    NOT_SOLVED = 6
  };

  /// Solves the problem using the default parameter values.
  ResultStatus Solve();

  /// Solves the problem using the specified parameter values.
  ResultStatus Solve(const MPSolverParameters& param);

  /**
   * Advanced usage: compute the "activities" of all constraints, which are the
   * sums of their linear terms. The activities are returned in the same order
   * as constraints().
   */
  std::vector<double> ComputeConstraintActivities() const;

  /**
   * Checks the current solution against all bounds, constraints and
   * integrality requirements, up to `tolerance`. Returns false and logs the
   * violations (when `log_errors` is true) if any.
   */
  bool VerifySolution(double tolerance, bool log_errors) const;

  /**
   * Infinity.
   *
   * You can use -MPSolver::infinity() for negative infinity.
   */
  static double infinity() { return std::numeric_limits<double>::infinity(); }

  /**
   * Enables the LOG(INFO) output of the underlying solver: new incumbents and
   * a summary of the solve. Output is suppressed by default.
   */
  void EnableOutput();

  absl::Duration TimeLimit() const { return time_limit_; }
  void SetTimeLimit(absl::Duration time_limit);

  // Same as TimeLimit() in milliseconds, where 0 means "no limit".
  int64_t time_limit() const {
    return time_limit_ == absl::InfiniteDuration()
               ? 0
               : absl::ToInt64Milliseconds(time_limit_);
  }
  void set_time_limit(int64_t time_limit_milliseconds) {
    SetTimeLimit(time_limit_milliseconds == 0
                     ? absl::InfiniteDuration()
                     : absl::Milliseconds(time_limit_milliseconds));
  }

  // Seed of the pseudo-random choices of the backend (branching order among
  // equally good candidates). Default 0.
  int32_t random_seed() const { return random_seed_; }
  void set_random_seed(int32_t seed) { random_seed_ = seed; }

  /// Returns the number of simplex iterations.
  int64_t iterations() const;

  /**
   * Returns the number of branch-and-bound nodes evaluated during the solve.
   *
   * Only available for discrete problems.
   */
  int64_t nodes() const;

  /// Returns a string describing the underlying solver and its version.
  std::string SolverVersion() const;

  // Debugging: verify that the given MPVariable* belongs to this solver.
  bool OwnsVariable(const MPVariable* var) const;

  friend class MPSolverInterface;

 private:
  void Init(const InterfaceFactory& interface_factory);

  // Returns true if the model has constraints with lower bound > upper bound.
  bool HasInfeasibleConstraints() const;

  // The name of the linear programming problem.
  const std::string name_;

  // The type of the linear programming problem.
  const OptimizationProblemType problem_type_;

  // The solver interface.
  std::unique_ptr<MPSolverInterface> interface_;

  // The vector of variables in the problem.
  std::vector<MPVariable*> variables_;

  // The vector of constraints in the problem.
  std::vector<MPConstraint*> constraints_;

  // The linear objective function.
  std::unique_ptr<MPObjective> objective_;

  absl::Duration time_limit_ = absl::InfiniteDuration();  // Default = No limit.

  int32_t random_seed_ = 0;

};

absl::string_view ToString(MPSolver::ResultStatus status);

inline std::ostream& operator<<(std::ostream& os,
                                MPSolver::ResultStatus status) {
  return os << ToString(status);
}

/// A class to express a linear objective.
class MPObjective {
 public:
  MPObjective(const MPObjective&) = delete;
  MPObjective& operator=(const MPObjective&) = delete;

  /**
   *  Clears the offset, all variables and coefficients, and the optimization
   * direction.
   */
  void Clear();

  /**
   * Sets the coefficient of the variable in the objective.
   *
   * If the variable does not belong to the solver, the function just returns,
   * or crashes in non-opt mode.
   */
  void SetCoefficient(const MPVariable* const var, double coeff);

  /**
   *  Gets the coefficient of a given variable in the objective
   *
   * It returns 0 if the variable does not appear in the objective).
   */
  double GetCoefficient(const MPVariable* const var) const;

  /**
   * Returns a map from variables to their coefficients in the objective.
   *
   * If a variable is not present in the map, then its coefficient is zero.
   */
  const absl::flat_hash_map<const MPVariable*, double>& terms() const {
    return coefficients_;
  }

  /// Sets the constant term in the objective.
  void SetOffset(double value);

  /// Gets the constant term in the objective.
  double offset() const { return offset_; }

  /// Sets the optimization direction (maximize: true or minimize: false).
  void SetOptimizationDirection(bool maximize);

  /// Sets the optimization direction to minimize.
  void SetMinimization() { SetOptimizationDirection(false); }

  /// Sets the optimization direction to maximize.
  void SetMaximization() { SetOptimizationDirection(true); }

  /// Is the optimization direction set to maximize?
  bool maximization() const;

  /// Is the optimization direction set to minimize?
  bool minimization() const;

  /**
   * Returns the objective value of the best solution found so far.
   *
   * It is the optimal objective value if the problem has been solved to
   * optimality.
   */
  double Value() const;

  /**
   * Returns the best objective bound.
   *
   * In case of minimization, it is a lower bound on the objective value of the
   * optimal integer solution. Only available for discrete problems.
   */
  double BestBound() const;

 private:
  friend class MPSolver;
  friend class MPSolverInterface;

  // An objective points to a single MPSolverInterface. At construction, an
  // MPObjective has no terms and an offset of 0.
  explicit MPObjective(MPSolverInterface* const interface_in)
      : interface_(interface_in), offset_(0.0) {}

  MPSolverInterface* const interface_;

  // Mapping var -> coefficient.
  absl::flat_hash_map<const MPVariable*, double> coefficients_;
  // Constant term.
  double offset_;
};

/// The class for variables of a Mathematical Programming (MP) model.
class MPVariable {
 public:
  MPVariable(const MPVariable&) = delete;
  MPVariable& operator=(const MPVariable&) = delete;

  /// Returns the name of the variable.
  const std::string& name() const { return name_; }

  /// Returns the integrality requirement of the variable.
  bool integer() const { return integer_; }

  /**
   * Returns the value of the variable in the current solution.
   *
   * If the variable is integer, then the value will always be an integer (the
   * underlying solver handles floating-point values only, but this function
   * automatically rounds it to the nearest integer; see: man 3 round).
   */
  double solution_value() const;

  /// Returns the index of the variable in the MPSolver::variables_.
  int index() const { return index_; }

  /// Returns the lower bound.
  double lb() const { return lb_; }

  /// Returns the upper bound.
  double ub() const { return ub_; }

  /// Sets the lower bound.
  void SetLB(double lb) { SetBounds(lb, ub_); }

  /// Sets the upper bound.
  void SetUB(double ub) { SetBounds(lb_, ub); }

  /// Sets both the lower and upper bounds.
  void SetBounds(double lb, double ub);

  /**
   * Advanced usage: unrounded solution value.
   *
   * The returned value won't be rounded to the nearest integer even if the
   * variable is integer.
   */
  double unrounded_solution_value() const;

 protected:
  friend class MPSolver;
  friend class MPSolverInterface;

  // A variable points to a single MPSolverInterface that is specified in the
  // constructor. A variable cannot belong to several models.
  MPVariable(int index, double lb, double ub, bool integer,
             const std::string& name, MPSolverInterface* const interface_in);

  void set_solution_value(double value) { solution_value_ = value; }

 private:
  const int index_;
  double lb_;
  double ub_;
  bool integer_;
  const std::string name_;
  double solution_value_;
  MPSolverInterface* const interface_;
};

/**
 * The class for constraints of a Mathematical Programming (MP) model.
 *
 * A constraint is represented as a linear equation or inequality.
 */
class MPConstraint {
 public:
  MPConstraint(const MPConstraint&) = delete;
  MPConstraint& operator=(const MPConstraint&) = delete;

  /// Returns the name of the constraint.
  const std::string& name() const { return name_; }

  /// Clears all variables and coefficients. Does not clear the bounds.
  void Clear();

  /**
   * Sets the coefficient of the variable on the constraint.
   *
   * If the variable does not belong to the solver, the function just returns,
   * or crashes in non-opt mode.
   */
  void SetCoefficient(const MPVariable* const var, double coeff);

  /**
   * Gets the coefficient of a given variable on the constraint (which is 0 if
   * the variable does not appear in the constraint).
   */
  double GetCoefficient(const MPVariable* const var) const;

  /**
   * Returns a map from variables to their coefficients in the constraint.
   *
   * If a variable is not present in the map, then its coefficient is zero.
   */
  const absl::flat_hash_map<const MPVariable*, double>& terms() const {
    return coefficients_;
  }

  /// Returns the lower bound.
  double lb() const { return lb_; }

  /// Returns the upper bound.
  double ub() const { return ub_; }

  /// Sets the lower bound.
  void SetLB(double lb) { SetBounds(lb, ub_); }

  /// Sets the upper bound.
  void SetUB(double ub) { SetBounds(lb_, ub); }

  /// Sets both the lower and upper bounds.
  void SetBounds(double lb, double ub);

  /// Returns the index of the constraint in the MPSolver::constraints_.
  int index() const { return index_; }

 protected:
  friend class MPSolver;
  friend class MPSolverInterface;

  // A constraint points to a single MPSolverInterface that is specified in the
  // constructor. A constraint cannot belong to several models.
  MPConstraint(int index, double lb, double ub, const std::string& name,
               MPSolverInterface* const interface_in);

 private:
  // Mapping var -> coefficient.
  absl::flat_hash_map<const MPVariable*, double> coefficients_;

  const int index_;  // See index().

  // The lower bound for the linear constraint.
  double lb_;

  // The upper bound for the linear constraint.
  double ub_;

  // Name.
  const std::string name_;

  MPSolverInterface* const interface_;
};

/**
 * This class stores parameter settings for the solvers.
 */
class MPSolverParameters {
 public:
  /// Enumeration of parameters that take continuous values.
  enum DoubleParam {
    /// Limit for relative MIP gap.
    RELATIVE_MIP_GAP = 0,

    /**
     * Advanced usage: tolerance for primal feasibility of basic solutions and
     * for the integrality of integer variables.
     */
    PRIMAL_TOLERANCE = 1,
  };

  /// Enumeration of parameters that take integer or categorical values.
  enum IntegerParam {
    /// Maximum number of simplex iterations per linear program.
    LP_ITERATION_LIMIT = 0,
  };

  static const double kDefaultRelativeMipGap;
  static const double kDefaultPrimalTolerance;
  static const int kDefaultLpIterationLimit;

  /// The constructor sets all parameters to their default value.
  MPSolverParameters();

  void SetDoubleParam(MPSolverParameters::DoubleParam param, double value);
  void SetIntegerParam(MPSolverParameters::IntegerParam param, int value);

  double GetDoubleParam(MPSolverParameters::DoubleParam param) const;
  int GetIntegerParam(MPSolverParameters::IntegerParam param) const;

 private:
  double relative_mip_gap_value_;
  double primal_tolerance_value_;
  int lp_iteration_limit_value_;
};

// This class wraps the actual mathematical programming solver. Each solver
// has its own interface class that derives from this abstract class. This
// class is never directly accessed by the user.
// @see branch_and_bound_interface.cc
class MPSolverInterface {
 public:
  enum SynchronizationStatus {
    // The model has changed since the last solve, or was never solved.
    MUST_RELOAD,
    // The solution was computed on the current model.
    SOLUTION_SYNCHRONIZED
  };

  // When the underlying solver does not provide the number of simplex
  // iterations.
  static constexpr int64_t kUnknownNumberOfIterations = -1;
  // When the underlying solver does not provide the number of
  // branch-and-bound nodes.
  static constexpr int64_t kUnknownNumberOfNodes = -1;

  // The user will access the MPSolverInterface through the MPSolver passed as
  // argument.
  explicit MPSolverInterface(MPSolver* const solver);
  virtual ~MPSolverInterface();

  // Solves the model currently held by the MPSolver with the given
  // parameters. On return, result_status_ is set and, when a solution exists,
  // the variable values, objective_value_ and best_objective_bound_ too.
  virtual MPSolver::ResultStatus Solve(const MPSolverParameters& param) = 0;

  // Returns the number of simplex iterations. The problem must be discrete,
  // otherwise it crashes, or returns kUnknownNumberOfIterations in NDEBUG
  // mode.
  virtual int64_t iterations() const = 0;
  // Returns the number of branch-and-bound nodes.
  virtual int64_t nodes() const = 0;

  // Returns true if the problem is discrete and linear.
  virtual bool IsMIP() const = 0;

  // Returns a string describing the underlying solver and its version.
  virtual std::string SolverVersion() const = 0;

  // Checks whether the solution is synchronized with the model, i.e. whether
  // the model has changed since the solution was computed last.
  // If it isn't, it crashes in NDEBUG, and returns false otherwise.
  bool CheckSolutionIsSynchronized() const;
  // Checks whether a feasible solution exists. The behavior is similar to
  // CheckSolutionIsSynchronized() above.
  bool CheckSolutionExists() const;
  // Handy shortcut to do both checks above (it is often used).
  bool CheckSolutionIsSynchronizedAndExists() const {
    return CheckSolutionIsSynchronized() && CheckSolutionExists();
  }

  // Returns the objective value of the best solution found so far.
  double objective_value() const;

  // Returns the best objective bound. The problem must be discrete, otherwise
  // it crashes, or returns trivial bound (+/- inf) in NDEBUG mode.
  double best_objective_bound() const;

  // Returns the result status of the last solve.
  MPSolver::ResultStatus result_status() const { return result_status_; }

  void set_quiet(bool quiet_value) { quiet_ = quiet_value; }

  bool maximize() const { return maximize_; }

  // Called by the model objects when the model changes.
  void InvalidateSolutionSynchronization();

  friend class MPSolver;

  // To access the maximize_ bool and the MPSolver.
  friend class MPConstraint;
  friend class MPObjective;

 protected:
  // Writes a solution value, for the backends.
  static void SetVariableSolutionValue(MPVariable* var, double value) {
    var->set_solution_value(value);
  }

  MPSolver* const solver_;
  // Indicates whether the model and the solution are synchronized.
  SynchronizationStatus sync_status_;
  // Indicates whether the solve has reached optimality,
  // infeasibility, a limit, etc.
  MPSolver::ResultStatus result_status_;
  // Optimization direction.
  bool maximize_;

  // The value of the objective function.
  double objective_value_;

  // The value of the best objective bound. Used only for MIP solvers.
  double best_objective_bound_;

  // Boolean indicator for the verbosity of the solver output.
  bool quiet_;
};

// Builds the bundled branch-and-bound backend. For SIMPLEX_LINEAR_PROGRAMMING
// it solves the linear relaxation only.
std::unique_ptr<MPSolverInterface> BuildBranchAndBoundInterface(
    MPSolver* const solver);

}  // namespace thesis_alloc

#endif  // THESIS_ALLOC_LINEAR_SOLVER_LINEAR_SOLVER_H_

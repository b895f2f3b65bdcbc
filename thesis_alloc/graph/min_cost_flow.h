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

// An implementation of the successive shortest path algorithm for the
// min-cost flow problem.
//
// We consider a graph G = (V,E) where each arc (v,w) has a nonnegative
// capacity u(v,w) and a unit cost c(v,w), and each node v has a supply(v)
// (a demand is modeled as a negative supply).
//
// The problem to solve: find a flow of minimum cost such that all the fluid
// flows from the supply nodes to the demand nodes, or, with
// SolveMaxFlowWithMinCost(), the largest possible amount of fluid at the
// lowest possible cost.
//
// The algorithm adds a super source linked to every supply node and a super
// sink linked from every demand node, then repeatedly augments the flow along
// a shortest path (w.r.t. the unit costs) in the residual graph. Each node
// carries a potential p(v) and Dijkstra's algorithm runs on the reduced costs
//    c_p(v,w) = c(v,w) + p(v) - p(w)
// which stay nonnegative on residual arcs from one iteration to the next.
// The initial potentials are computed with Bellman-Ford so that negative unit
// costs are supported. Negative cost cycles are not: they are detected and
// reported as BAD_COST_RANGE.
//
// Since the shortest path lengths are nondecreasing along the iterations, the
// flow obtained after k augmentations is a min-cost flow among the flows of
// the same value. The complexity is O(F * m * log(n)) after an O(n * m)
// initialization, where F is the total flow value.
//
// Reference:
// R. K. Ahuja, T. L. Magnanti, J. B. Orlin, "Network Flows: Theory, Algorithms,
// and Applications," Prentice Hall, 1993, ISBN: 978-0136175490, chapter 9.
//
// Example usage:
//
//   SimpleMinCostFlow min_cost_flow;
//   min_cost_flow.AddArcWithCapacityAndUnitCost(0, 1, 2, 3);
//   min_cost_flow.SetNodeSupply(0, 2);
//   min_cost_flow.SetNodeSupply(1, -2);
//   if (min_cost_flow.Solve() == SimpleMinCostFlow::OPTIMAL) {
//     LOG(INFO) << "Cost: " << min_cost_flow.OptimalCost();
//   }

#ifndef THESIS_ALLOC_GRAPH_MIN_COST_FLOW_H_
#define THESIS_ALLOC_GRAPH_MIN_COST_FLOW_H_

#include <cstdint>
#include <string>
#include <vector>

namespace thesis_alloc {

// Different statuses for a solved problem.
class MinCostFlowBase {
 public:
  enum Status {
    NOT_SOLVED,
    OPTIMAL,
    FEASIBLE,
    INFEASIBLE,
    UNBALANCED,
    BAD_RESULT,
    BAD_COST_RANGE,
    BAD_CAPACITY_RANGE,
  };

  static std::string StatusName(Status status);
};

// A simple min-cost flow interface over integer-indexed arc arrays.
//
// TODO(user): If the need arises, support warm start between solves.
class SimpleMinCostFlow : public MinCostFlowBase {
 public:
  typedef int32_t NodeIndex;
  typedef int32_t ArcIndex;
  typedef int64_t FlowQuantity;
  typedef int64_t CostValue;

  // The constructor takes no size. New node indices will be created lazily by
  // AddArcWithCapacityAndUnitCost() or SetNodeSupply() such that the set of
  // valid nodes will always be [0, NumNodes()).
  SimpleMinCostFlow();

  SimpleMinCostFlow(const SimpleMinCostFlow&) = delete;
  SimpleMinCostFlow& operator=(const SimpleMinCostFlow&) = delete;

  // Adds a directed arc from tail to head to the underlying graph with
  // a given capacity and cost per unit of flow.
  // * Node indices and the capacity must be non-negative (>= 0).
  // * The unit cost can take any integer value (even negative).
  // * Self-looping and duplicate arcs are supported.
  // * After the method finishes, NumArcs() == the returned ArcIndex + 1.
  ArcIndex AddArcWithCapacityAndUnitCost(NodeIndex tail, NodeIndex head,
                                         FlowQuantity capacity,
                                         CostValue unit_cost);

  // Sets the supply of the given node. The node index must be non-negative (>=
  // 0). Nodes implicitly created will have a default supply set to 0. A demand
  // is modeled as a negative supply.
  void SetNodeSupply(NodeIndex node, FlowQuantity supply);

  // Solves the problem, and returns the problem status. This function
  // requires that the sum of all node supply minus node demand is zero and
  // that the graph has enough capacity to send all supplies and serve all
  // demands. Otherwise, it will return UNBALANCED or INFEASIBLE.
  Status Solve() { return SolveWithPossibleAdjustment(DONT_ADJUST); }

  // Same as Solve(), but does not have the restriction that the supply
  // must match the demand or that the graph has enough capacity to serve
  // all the demand or use all the supply. This will compute a maximum-flow
  // with minimum cost. The value of the maximum-flow will be given by
  // MaximumFlow().
  Status SolveMaxFlowWithMinCost() {
    return SolveWithPossibleAdjustment(ADJUST);
  }

  // Returns the cost of the minimum-cost flow found by the algorithm when
  // the returned Status is OPTIMAL.
  CostValue OptimalCost() const { return optimal_cost_; }

  // Returns the total flow of the minimum-cost flow found by the algorithm
  // when the returned Status is OPTIMAL.
  FlowQuantity MaximumFlow() const { return maximum_flow_; }

  // Returns the flow on arc, this only make sense for a successful Solve().
  //
  // Note: It is possible that there is more than one optimal solution. The
  // algorithm is deterministic so it will always return the same solution for
  // a given problem with arcs added in the same order.
  FlowQuantity Flow(ArcIndex arc) const;

  // Accessors for the user given data. The implementation will crash if "arc"
  // is not in [0, NumArcs()) or "node" is not in [0, NumNodes()).
  NodeIndex NumNodes() const { return node_supply_.size(); }
  ArcIndex NumArcs() const { return arc_tail_.size(); }
  NodeIndex Tail(ArcIndex arc) const;
  NodeIndex Head(ArcIndex arc) const;
  FlowQuantity Capacity(ArcIndex arc) const;
  FlowQuantity Supply(NodeIndex node) const;
  CostValue UnitCost(ArcIndex arc) const;

 private:
  enum SupplyAdjustment { ADJUST, DONT_ADJUST };

  // Solves the problem, potentially accepting unbalanced supplies and demands,
  // and returns the problem status.
  Status SolveWithPossibleAdjustment(SupplyAdjustment adjustment);
  void ResizeNodeVectors(NodeIndex node);

  // User data.
  std::vector<NodeIndex> arc_tail_;
  std::vector<NodeIndex> arc_head_;
  std::vector<FlowQuantity> arc_capacity_;
  std::vector<CostValue> arc_cost_;
  std::vector<FlowQuantity> node_supply_;

  // Solution.
  std::vector<FlowQuantity> arc_flow_;
  CostValue optimal_cost_;
  FlowQuantity maximum_flow_;
};

}  // namespace thesis_alloc

#endif  // THESIS_ALLOC_GRAPH_MIN_COST_FLOW_H_

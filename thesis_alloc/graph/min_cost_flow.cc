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

#include "thesis_alloc/graph/min_cost_flow.h"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <functional>
#include <limits>
#include <queue>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"

namespace thesis_alloc {

std::string MinCostFlowBase::StatusName(Status status) {
  switch (status) {
    case NOT_SOLVED:
      return "NOT_SOLVED";
    case OPTIMAL:
      return "OPTIMAL";
    case FEASIBLE:
      return "FEASIBLE";
    case INFEASIBLE:
      return "INFEASIBLE";
    case UNBALANCED:
      return "UNBALANCED";
    case BAD_RESULT:
      return "BAD_RESULT";
    case BAD_COST_RANGE:
      return "BAD_COST_RANGE";
    case BAD_CAPACITY_RANGE:
      return "BAD_CAPACITY_RANGE";
  }
  return "UNKNOWN";
}

namespace {

typedef SimpleMinCostFlow::NodeIndex NodeIndex;
typedef SimpleMinCostFlow::ArcIndex ArcIndex;
typedef SimpleMinCostFlow::FlowQuantity FlowQuantity;
typedef SimpleMinCostFlow::CostValue CostValue;

constexpr CostValue kInfiniteDistance = std::numeric_limits<CostValue>::max();

// The residual graph on which the augmentations take place. Residual arc 2*i
// is the direct arc i and 2*i+1 its reverse, so that Opposite(a) == a ^ 1.
// The outgoing residual arcs of each node are stored contiguously (forward
// star representation), in insertion order.
class ResidualNetwork {
 public:
  explicit ResidualNetwork(NodeIndex num_nodes) : num_nodes_(num_nodes) {}

  // Adds a direct arc and its reverse, returns the index of the direct one.
  ArcIndex AddArc(NodeIndex tail, NodeIndex head, FlowQuantity capacity,
                  CostValue unit_cost) {
    const ArcIndex arc = head_.size();
    tail_.push_back(tail);
    head_.push_back(head);
    residual_capacity_.push_back(capacity);
    cost_.push_back(unit_cost);
    tail_.push_back(head);
    head_.push_back(tail);
    residual_capacity_.push_back(0);
    cost_.push_back(-unit_cost);
    return arc;
  }

  void Build() {
    first_outgoing_.assign(num_nodes_ + 1, 0);
    for (const NodeIndex tail : tail_) ++first_outgoing_[tail + 1];
    for (NodeIndex node = 0; node < num_nodes_; ++node) {
      first_outgoing_[node + 1] += first_outgoing_[node];
    }
    outgoing_.resize(tail_.size());
    std::vector<ArcIndex> next = first_outgoing_;
    for (ArcIndex arc = 0; arc < tail_.size(); ++arc) {
      outgoing_[next[tail_[arc]]++] = arc;
    }
  }

  NodeIndex num_nodes() const { return num_nodes_; }
  NodeIndex Head(ArcIndex arc) const { return head_[arc]; }
  NodeIndex Tail(ArcIndex arc) const { return tail_[arc]; }
  CostValue Cost(ArcIndex arc) const { return cost_[arc]; }
  FlowQuantity ResidualCapacity(ArcIndex arc) const {
    return residual_capacity_[arc];
  }
  // Flow on a direct arc, which is the residual capacity of its reverse.
  FlowQuantity Flow(ArcIndex arc) const { return residual_capacity_[arc ^ 1]; }

  void PushFlow(FlowQuantity flow, ArcIndex arc) {
    residual_capacity_[arc] -= flow;
    residual_capacity_[arc ^ 1] += flow;
  }

  // Iteration over the residual arcs leaving `node`.
  const ArcIndex* OutgoingBegin(NodeIndex node) const {
    return outgoing_.data() + first_outgoing_[node];
  }
  const ArcIndex* OutgoingEnd(NodeIndex node) const {
    return outgoing_.data() + first_outgoing_[node + 1];
  }

 private:
  const NodeIndex num_nodes_;
  std::vector<NodeIndex> tail_;
  std::vector<NodeIndex> head_;
  std::vector<FlowQuantity> residual_capacity_;
  std::vector<CostValue> cost_;
  std::vector<ArcIndex> first_outgoing_;
  std::vector<ArcIndex> outgoing_;
};

// Computes shortest path distances from `source` with the queue-based
// Bellman-Ford algorithm. Returns false if a negative cycle is reachable.
bool ComputeInitialPotentials(const ResidualNetwork& network, NodeIndex source,
                              std::vector<CostValue>* potential) {
  const NodeIndex num_nodes = network.num_nodes();
  std::vector<CostValue> distance(num_nodes, kInfiniteDistance);
  std::vector<int> num_relaxations(num_nodes, 0);
  std::vector<bool> in_queue(num_nodes, false);
  std::deque<NodeIndex> queue;
  distance[source] = 0;
  queue.push_back(source);
  in_queue[source] = true;
  while (!queue.empty()) {
    const NodeIndex node = queue.front();
    queue.pop_front();
    in_queue[node] = false;
    for (const ArcIndex* it = network.OutgoingBegin(node);
         it != network.OutgoingEnd(node); ++it) {
      const ArcIndex arc = *it;
      if (network.ResidualCapacity(arc) <= 0) continue;
      const NodeIndex head = network.Head(arc);
      const CostValue candidate = distance[node] + network.Cost(arc);
      if (candidate < distance[head]) {
        distance[head] = candidate;
        if (++num_relaxations[head] > num_nodes) return false;
        if (!in_queue[head]) {
          queue.push_back(head);
          in_queue[head] = true;
        }
      }
    }
  }
  potential->assign(num_nodes, 0);
  for (NodeIndex node = 0; node < num_nodes; ++node) {
    if (distance[node] != kInfiniteDistance) (*potential)[node] = distance[node];
  }
  return true;
}

}  // namespace

SimpleMinCostFlow::SimpleMinCostFlow() : optimal_cost_(0), maximum_flow_(0) {}

void SimpleMinCostFlow::ResizeNodeVectors(NodeIndex node) {
  if (node < node_supply_.size()) return;
  node_supply_.resize(node + 1, 0);
}

SimpleMinCostFlow::ArcIndex SimpleMinCostFlow::AddArcWithCapacityAndUnitCost(
    NodeIndex tail, NodeIndex head, FlowQuantity capacity,
    CostValue unit_cost) {
  CHECK_GE(tail, 0);
  CHECK_GE(head, 0);
  CHECK_GE(capacity, 0);
  ResizeNodeVectors(std::max(tail, head));
  const ArcIndex arc = arc_tail_.size();
  arc_tail_.push_back(tail);
  arc_head_.push_back(head);
  arc_capacity_.push_back(capacity);
  arc_cost_.push_back(unit_cost);
  return arc;
}

void SimpleMinCostFlow::SetNodeSupply(NodeIndex node, FlowQuantity supply) {
  CHECK_GE(node, 0);
  ResizeNodeVectors(node);
  node_supply_[node] = supply;
}

SimpleMinCostFlow::FlowQuantity SimpleMinCostFlow::Flow(ArcIndex arc) const {
  if (arc_flow_.empty()) return 0;
  return arc_flow_[arc];
}

SimpleMinCostFlow::NodeIndex SimpleMinCostFlow::Tail(ArcIndex arc) const {
  return arc_tail_[arc];
}

SimpleMinCostFlow::NodeIndex SimpleMinCostFlow::Head(ArcIndex arc) const {
  return arc_head_[arc];
}

SimpleMinCostFlow::FlowQuantity SimpleMinCostFlow::Capacity(
    ArcIndex arc) const {
  return arc_capacity_[arc];
}

SimpleMinCostFlow::FlowQuantity SimpleMinCostFlow::Supply(
    NodeIndex node) const {
  return node_supply_[node];
}

SimpleMinCostFlow::CostValue SimpleMinCostFlow::UnitCost(ArcIndex arc) const {
  return arc_cost_[arc];
}

SimpleMinCostFlow::Status SimpleMinCostFlow::SolveWithPossibleAdjustment(
    SupplyAdjustment adjustment) {
  optimal_cost_ = 0;
  maximum_flow_ = 0;
  arc_flow_.clear();

  const NodeIndex num_nodes = NumNodes();
  const ArcIndex num_arcs = NumArcs();

  FlowQuantity total_supply = 0;
  FlowQuantity total_demand = 0;
  for (const FlowQuantity supply : node_supply_) {
    if (supply > 0) total_supply += supply;
    if (supply < 0) total_demand -= supply;
  }
  if (adjustment == DONT_ADJUST && total_supply != total_demand) {
    VLOG(1) << "Unbalanced problem: supply " << total_supply << " vs demand "
            << total_demand;
    return UNBALANCED;
  }

  // Every path uses at most num_nodes + 1 arcs, so its cost must fit.
  CostValue max_abs_cost = 0;
  for (const CostValue cost : arc_cost_) {
    max_abs_cost = std::max(max_abs_cost, std::abs(cost));
  }
  if (max_abs_cost > 0 &&
      max_abs_cost >
          std::numeric_limits<CostValue>::max() / 4 / (num_nodes + 2)) {
    return BAD_COST_RANGE;
  }

  // Super source and super sink.
  const NodeIndex source = num_nodes;
  const NodeIndex sink = num_nodes + 1;
  ResidualNetwork network(num_nodes + 2);
  for (ArcIndex arc = 0; arc < num_arcs; ++arc) {
    network.AddArc(arc_tail_[arc], arc_head_[arc], arc_capacity_[arc],
                   arc_cost_[arc]);
  }
  for (NodeIndex node = 0; node < num_nodes; ++node) {
    if (node_supply_[node] > 0) {
      network.AddArc(source, node, node_supply_[node], 0);
    } else if (node_supply_[node] < 0) {
      network.AddArc(node, sink, -node_supply_[node], 0);
    }
  }
  network.Build();

  std::vector<CostValue> potential;
  if (!ComputeInitialPotentials(network, source, &potential)) {
    LOG(ERROR) << "Negative cost cycle in min-cost flow problem.";
    return BAD_COST_RANGE;
  }

  const NodeIndex num_network_nodes = network.num_nodes();
  std::vector<CostValue> distance(num_network_nodes);
  std::vector<ArcIndex> parent_arc(num_network_nodes);
  typedef std::pair<CostValue, NodeIndex> Entry;
  FlowQuantity total_flow = 0;
  int num_augmentations = 0;
  while (true) {
    // Dijkstra on reduced costs.
    std::fill(distance.begin(), distance.end(), kInfiniteDistance);
    std::fill(parent_arc.begin(), parent_arc.end(), -1);
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> queue;
    distance[source] = 0;
    queue.push({0, source});
    while (!queue.empty()) {
      const auto [node_distance, node] = queue.top();
      queue.pop();
      if (node_distance > distance[node]) continue;
      for (const ArcIndex* it = network.OutgoingBegin(node);
           it != network.OutgoingEnd(node); ++it) {
        const ArcIndex arc = *it;
        if (network.ResidualCapacity(arc) <= 0) continue;
        const NodeIndex head = network.Head(arc);
        const CostValue reduced_cost =
            network.Cost(arc) + potential[node] - potential[head];
        DCHECK_GE(reduced_cost, 0) << "arc " << arc;
        const CostValue candidate = node_distance + reduced_cost;
        if (candidate < distance[head]) {
          distance[head] = candidate;
          parent_arc[head] = arc;
          queue.push({candidate, head});
        }
      }
    }
    if (distance[sink] == kInfiniteDistance) break;

    for (NodeIndex node = 0; node < num_network_nodes; ++node) {
      if (distance[node] != kInfiniteDistance) potential[node] += distance[node];
    }

    FlowQuantity bottleneck = std::numeric_limits<FlowQuantity>::max();
    for (NodeIndex node = sink; node != source;
         node = network.Tail(parent_arc[node])) {
      bottleneck =
          std::min(bottleneck, network.ResidualCapacity(parent_arc[node]));
    }
    for (NodeIndex node = sink; node != source;
         node = network.Tail(parent_arc[node])) {
      network.PushFlow(bottleneck, parent_arc[node]);
    }
    total_flow += bottleneck;
    ++num_augmentations;
  }
  VLOG(1) << "Min-cost flow: " << num_augmentations << " augmentations, flow "
          << total_flow;

  arc_flow_.resize(num_arcs);
  for (ArcIndex arc = 0; arc < num_arcs; ++arc) {
    arc_flow_[arc] = network.Flow(2 * arc);
    optimal_cost_ += arc_flow_[arc] * arc_cost_[arc];
  }
  maximum_flow_ = total_flow;

  if (adjustment == DONT_ADJUST && total_flow < total_supply) {
    VLOG(1) << "Infeasible problem: only " << total_flow << " out of "
            << total_supply << " units can be routed.";
    return INFEASIBLE;
  }
  return OPTIMAL;
}

}  // namespace thesis_alloc

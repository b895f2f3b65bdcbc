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

#include <string>
#include <utility>

#include "absl/log/check.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "thesis_alloc/allocation/allocation.pb.h"
#include "thesis_alloc/allocation/allocation_instance.h"
#include "thesis_alloc/allocation/allocation_parameters.pb.h"
#include "thesis_alloc/base/parse_text_proto.h"
#include "thesis_alloc/base/status_matchers.h"

namespace thesis_alloc {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::SizeIs;
using ::testing::status::StatusIs;

AllocationInstance CreateInstance(const AllocationInput& input) {
  absl::StatusOr<AllocationInstance> instance =
      AllocationInstance::Create(input);
  CHECK(instance.ok()) << instance.status();
  return *std::move(instance);
}

AllocationResult BuildAndSolve(const AllocationInstance& instance,
                               const AllocationParameters& params) {
  FlowAllocator allocator(instance, params);
  CHECK(allocator.Build().ok());
  absl::StatusOr<AllocationResult> result = allocator.Solve();
  CHECK(result.ok()) << result.status();
  return *std::move(result);
}

AllocationParameters NoUnrankedParameters() {
  AllocationParameters params;
  params.mutable_preference()->set_allow_unranked(false);
  return params;
}

TEST(FlowAllocatorTest, SolveBeforeBuild) {
  const AllocationInput input;
  const AllocationInstance instance = CreateInstance(input);
  FlowAllocator allocator(instance, AllocationParameters());
  EXPECT_THAT(allocator.Solve(),
              StatusIs(absl::StatusCode::kFailedPrecondition));
}

TEST(FlowAllocatorTest, EmptyInstance) {
  const AllocationInput input;
  const AllocationInstance instance = CreateInstance(input);
  const AllocationResult result =
      BuildAndSolve(instance, AllocationParameters());
  EXPECT_EQ(result.diagnostics().status(), "OPTIMAL");
  EXPECT_EQ(result.diagnostics().objective_value(), 0.0);
  EXPECT_THAT(result.assignments(), IsEmpty());
}

TEST(FlowAllocatorTest, ConcreteScenario) {
  const AllocationInput input = ParseTextProtoOrDie(R"pb(
    students { id: "S1" plan: true ranked_topics: [ "A", "B" ] }
    students { id: "S2" plan: true ranked_topics: [ "A", "B" ] }
    students { id: "S3" plan: true ranked_topics: [ "A", "B" ] }
    topics { id: "A" coach_id: "C" capacity: 2 }
    topics { id: "B" coach_id: "C" capacity: 2 }
    coaches { id: "C" capacity: 4 }
  )pb");
  const AllocationInstance instance = CreateInstance(input);
  FlowAllocator allocator(instance, NoUnrankedParameters());
  ASSERT_OK(allocator.Build());
  // Source, 3 students, 2 topics, 1 coach, sink.
  EXPECT_EQ(allocator.network().NumNodes(), 8);
  EXPECT_EQ(allocator.network().NumArcs(), 3 + 6 + 2 + 1);

  ASSERT_OK_AND_ASSIGN(const AllocationResult result, allocator.Solve());
  EXPECT_EQ(result.diagnostics().status(), "OPTIMAL");
  EXPECT_EQ(result.diagnostics().algorithm(), "flow");
  EXPECT_EQ(result.diagnostics().objective_value(), 1.0);
  int on_a = 0;
  for (const AssignmentRow& row : result.assignments()) {
    if (row.topic_id() == "A") ++on_a;
    EXPECT_FALSE(row.via_topic_overflow());
    EXPECT_FALSE(row.via_coach_overflow());
  }
  EXPECT_EQ(result.assignments_size(), 3);
  EXPECT_EQ(on_a, 2);
  EXPECT_THAT(result.diagnostics().unassigned_after_solve(), IsEmpty());
  EXPECT_THAT(result.diagnostics().ties(), IsEmpty());
}

TEST(FlowAllocatorTest, MinimizesTheTotalCost) {
  // Giving A to S1 would force S2 to an unranked topic.
  const AllocationInput input = ParseTextProtoOrDie(R"pb(
    students { id: "S1" plan: true ranked_topics: [ "A", "B" ] }
    students { id: "S2" plan: true ranked_topics: "A" }
    topics { id: "A" coach_id: "C" capacity: 1 }
    topics { id: "B" coach_id: "C" capacity: 1 }
    coaches { id: "C" capacity: 2 }
  )pb");
  const AllocationInstance instance = CreateInstance(input);
  const AllocationResult result =
      BuildAndSolve(instance, AllocationParameters());
  EXPECT_EQ(result.diagnostics().status(), "OPTIMAL");
  EXPECT_EQ(result.diagnostics().objective_value(), 1.0);
  ASSERT_EQ(result.assignments_size(), 2);
  EXPECT_EQ(result.assignments(0).topic_id(), "B");
  EXPECT_EQ(result.assignments(1).topic_id(), "A");
}

TEST(FlowAllocatorTest, TopicCapacitiesAreHard) {
  const AllocationInput input = ParseTextProtoOrDie(R"pb(
    students { id: "S1" plan: true tier1_topics: "A" }
    students { id: "S2" plan: true tier1_topics: "A" }
    students { id: "S3" plan: true tier1_topics: "A" }
    topics { id: "A" coach_id: "C" capacity: 1 }
    coaches { id: "C" capacity: 10 }
  )pb");
  const AllocationInstance instance = CreateInstance(input);
  // Overflow is enabled by default, the flow ignores it.
  const AllocationResult result =
      BuildAndSolve(instance, NoUnrankedParameters());
  EXPECT_EQ(result.diagnostics().status(), "SUBOPTIMAL");
  EXPECT_EQ(result.diagnostics().objective_value(), 0.0);
  EXPECT_EQ(result.assignments_size(), 1);
  EXPECT_THAT(result.diagnostics().unassigned_after_solve(), SizeIs(2));
  EXPECT_THAT(result.diagnostics().topic_overflow(), IsEmpty());
}

TEST(FlowAllocatorTest, CoachCapacitiesAreHard) {
  const AllocationInput input = ParseTextProtoOrDie(R"pb(
    students { id: "S1" plan: true tier1_topics: [ "A", "B" ] }
    students { id: "S2" plan: true tier1_topics: [ "A", "B" ] }
    students { id: "S3" plan: true tier1_topics: [ "A", "B" ] }
    topics { id: "A" coach_id: "C" capacity: 2 }
    topics { id: "B" coach_id: "C" capacity: 2 }
    coaches { id: "C" capacity: 2 }
  )pb");
  const AllocationInstance instance = CreateInstance(input);
  const AllocationResult result =
      BuildAndSolve(instance, NoUnrankedParameters());
  EXPECT_EQ(result.diagnostics().status(), "SUBOPTIMAL");
  EXPECT_EQ(result.assignments_size(), 2);
  EXPECT_THAT(result.diagnostics().coach_overflow(), IsEmpty());
}

TEST(FlowAllocatorTest, DepartmentMinimumsAreIgnored) {
  const AllocationInput input = ParseTextProtoOrDie(R"pb(
    students { id: "S1" plan: true tier1_topics: "A" }
    topics { id: "A" coach_id: "C1" department_id: "D1" capacity: 1 }
    topics { id: "X" coach_id: "C2" department_id: "D2" capacity: 1 }
    coaches { id: "C1" department_id: "D1" capacity: 1 }
    coaches { id: "C2" department_id: "D2" capacity: 1 }
    departments { id: "D1" }
    departments { id: "D2" desired_min: 1 }
  )pb");
  const AllocationInstance instance = CreateInstance(input);
  const AllocationResult result =
      BuildAndSolve(instance, AllocationParameters());
  EXPECT_EQ(result.diagnostics().status(), "OPTIMAL");
  ASSERT_EQ(result.assignments_size(), 1);
  EXPECT_EQ(result.assignments(0).topic_id(), "A");
  EXPECT_EQ(result.diagnostics().department_shortfall().at("D2"), 1);
}

TEST(FlowAllocatorTest, ForcedAndUnassignableStudents) {
  const AllocationInput input = ParseTextProtoOrDie(R"pb(
    students { id: "S1" plan: true tier1_topics: "A" forced_topic: "B" }
    students { id: "S2" plan: true tier1_topics: "B" }
    students { id: "S3" plan: true banned_topics: [ "A", "B" ] }
    topics { id: "A" coach_id: "C" capacity: 1 }
    topics { id: "B" coach_id: "C" capacity: 1 }
    coaches { id: "C" capacity: 2 }
  )pb");
  const AllocationInstance instance = CreateInstance(input);
  const AllocationResult result =
      BuildAndSolve(instance, AllocationParameters());
  EXPECT_EQ(result.diagnostics().status(), "OPTIMAL");
  EXPECT_EQ(result.diagnostics().objective_value(), -10000.0 + 200.0);
  ASSERT_EQ(result.assignments_size(), 2);
  EXPECT_EQ(result.assignments(0).topic_id(), "B");
  EXPECT_TRUE(result.assignments(0).forced());
  EXPECT_EQ(result.assignments(1).topic_id(), "A");
  EXPECT_EQ(result.assignments(1).preference_rank(), 999);
  EXPECT_THAT(result.diagnostics().unassignable_students(), ElementsAre("S3"));
  EXPECT_THAT(result.diagnostics().unassigned_after_solve(), IsEmpty());
}

TEST(FlowAllocatorTest, RebuildIsIdempotent) {
  const AllocationInput input = ParseTextProtoOrDie(R"pb(
    students { id: "S1" plan: true ranked_topics: "A" }
    topics { id: "A" coach_id: "C" capacity: 1 }
    coaches { id: "C" capacity: 1 }
  )pb");
  const AllocationInstance instance = CreateInstance(input);
  FlowAllocator allocator(instance, AllocationParameters());
  ASSERT_OK(allocator.Build());
  ASSERT_OK(allocator.Build());
  EXPECT_EQ(allocator.network().NumArcs(), 4);
  ASSERT_OK_AND_ASSIGN(const AllocationResult result, allocator.Solve());
  EXPECT_EQ(result.assignments_size(), 1);
}

}  // namespace
}  // namespace thesis_alloc

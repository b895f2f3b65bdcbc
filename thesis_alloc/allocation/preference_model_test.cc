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


#include "thesis_alloc/allocation/preference_model.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "absl/log/check.h"
#include "absl/status/statusor.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "thesis_alloc/allocation/allocation.pb.h"
#include "thesis_alloc/allocation/allocation_instance.h"
#include "thesis_alloc/allocation/allocation_parameters.pb.h"
#include "thesis_alloc/base/parse_text_proto.h"

namespace thesis_alloc {
namespace {

using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::IsEmpty;
using ::testing::Optional;

// Seven topics T1..T7 of a single coach, and the students of `students`.
AllocationInput SevenTopicsInput(const std::string& students) {
  AllocationInput input = ParseTextProtoOrDie(R"pb(
    topics { id: "T1" coach_id: "C" capacity: 1 }
    topics { id: "T2" coach_id: "C" capacity: 1 }
    topics { id: "T3" coach_id: "C" capacity: 1 }
    topics { id: "T4" coach_id: "C" capacity: 1 }
    topics { id: "T5" coach_id: "C" capacity: 1 }
    topics { id: "T6" coach_id: "C" capacity: 1 }
    topics { id: "T7" coach_id: "C" capacity: 1 }
    coaches { id: "C" capacity: 7 }
  )pb");
  const AllocationInput with_students = ParseTextProtoOrDie(students);
  input.MergeFrom(with_students);
  return input;
}

AllocationInstance CreateInstance(const AllocationInput& input) {
  absl::StatusOr<AllocationInstance> instance =
      AllocationInstance::Create(input);
  CHECK(instance.ok()) << instance.status();
  return *std::move(instance);
}

auto IsEntry(int topic, int64_t cost) {
  return ::testing::AllOf(Field(&CostMatrix::Entry::topic, topic),
                          Field(&CostMatrix::Entry::cost, cost));
}

TEST(PreferenceModelTest, DefaultCostsFollowPreferenceOrder) {
  const AllocationInput input = SevenTopicsInput(R"pb(
    students {
      id: "S"
      plan: true
      tier1_topics: "T1"
      tier2_topics: "T2"
      tier3_topics: "T3"
      ranked_topics: [ "T4", "T5", "T6" ]
    }
    students { id: "F" plan: true forced_topic: "T7" }
  )pb");
  const AllocationInstance instance = CreateInstance(input);
  const PreferenceModel model(instance, PreferenceParameters());
  const CostMatrix costs = model.ComputeCosts();

  EXPECT_THAT(costs.row(0),
              ElementsAre(IsEntry(0, 0), IsEntry(1, 1), IsEntry(2, 5),
                          IsEntry(3, 0), IsEntry(4, 1), IsEntry(5, 100),
                          IsEntry(6, 200)));
  EXPECT_THAT(costs.row(1),
              ElementsAre(IsEntry(6, PreferenceModel::kForcedCost)));

  const int64_t forced = *costs.Cost(1, 6);
  const int64_t tier1 = *costs.Cost(0, 0);
  const int64_t tier2 = *costs.Cost(0, 1);
  const int64_t tier3 = *costs.Cost(0, 2);
  const int64_t third_choice = *costs.Cost(0, 5);
  const int64_t unranked = *costs.Cost(0, 6);
  EXPECT_LT(forced, tier1);
  EXPECT_LT(tier1, tier2);
  EXPECT_LT(tier2, tier3);
  EXPECT_LE(tier3, third_choice);
  EXPECT_LT(third_choice, unranked);
}

TEST(PreferenceModelTest, RankCosts) {
  const AllocationInput input = SevenTopicsInput(R"pb(
    students {
      id: "S"
      plan: true
      ranked_topics: [ "T1", "T2", "T3", "T4", "T5" ]
    }
  )pb");
  const AllocationInstance instance = CreateInstance(input);

  PreferenceParameters params;
  params.set_allow_unranked(false);
  const CostMatrix biased = PreferenceModel(instance, params).ComputeCosts();
  EXPECT_THAT(biased.row(0),
              ElementsAre(IsEntry(0, 0), IsEntry(1, 1), IsEntry(2, 100),
                          IsEntry(3, 101), IsEntry(4, 102)));

  params.set_top2_bias(false);
  const PreferenceModel model(instance, params);
  EXPECT_EQ(model.RankCost(1), 0);
  EXPECT_EQ(model.RankCost(5), 4);
  const CostMatrix linear = model.ComputeCosts();
  EXPECT_THAT(linear.row(0),
              ElementsAre(IsEntry(0, 0), IsEntry(1, 1), IsEntry(2, 2),
                          IsEntry(3, 3), IsEntry(4, 4)));
}

TEST(PreferenceModelTest, ConfiguredTierAndUnrankedCosts) {
  const AllocationInput input = SevenTopicsInput(R"pb(
    students {
      id: "S"
      plan: true
      tier2_topics: "T1"
      tier3_topics: "T2"
    }
  )pb");
  const AllocationInstance instance = CreateInstance(input);
  PreferenceParameters params;
  params.set_tier2_cost(3);
  params.set_tier3_cost(8);
  params.set_unranked_cost(50);
  const CostMatrix costs = PreferenceModel(instance, params).ComputeCosts();
  EXPECT_THAT(costs.Cost(0, 0), Optional(3));
  EXPECT_THAT(costs.Cost(0, 1), Optional(8));
  EXPECT_THAT(costs.Cost(0, 6), Optional(50));
}

TEST(PreferenceModelTest, ForcedTopicIsTheOnlyEdge) {
  const AllocationInput input = SevenTopicsInput(R"pb(
    students {
      id: "S"
      plan: true
      tier1_topics: "T1"
      ranked_topics: "T3"
      forced_topic: "T2"
    }
    overrides { student_id: "S" topic_id: "T4" cost: -50000 }
  )pb");
  const AllocationInstance instance = CreateInstance(input);
  const CostMatrix costs =
      PreferenceModel(instance, PreferenceParameters()).ComputeCosts();
  EXPECT_THAT(costs.row(0), ElementsAre(IsEntry(1, -10000)));
  EXPECT_TRUE(costs.IsAssignable(0));
}

TEST(PreferenceModelTest, BannedOrUnknownForcedTopicMakesUnassignable) {
  const AllocationInput input = SevenTopicsInput(R"pb(
    students {
      id: "Banned"
      plan: true
      forced_topic: "T2"
      banned_topics: "T2"
    }
    students { id: "Unknown" plan: true forced_topic: "T9" }
  )pb");
  const AllocationInstance instance = CreateInstance(input);
  const CostMatrix costs =
      PreferenceModel(instance, PreferenceParameters()).ComputeCosts();
  EXPECT_THAT(costs.row(0), IsEmpty());
  EXPECT_FALSE(costs.IsAssignable(0));
  EXPECT_FALSE(costs.IsAssignable(1));
  EXPECT_EQ(costs.num_entries(), 0);
}

TEST(PreferenceModelTest, BanBeatsOverrideWhichBeatsTiers) {
  const AllocationInput input = SevenTopicsInput(R"pb(
    students {
      id: "S"
      plan: true
      tier1_topics: [ "T1", "T2" ]
      banned_topics: "T3"
    }
    overrides { student_id: "S" topic_id: "T2" cost: 42 }
    overrides { student_id: "S" topic_id: "T3" cost: 0 }
  )pb");
  const AllocationInstance instance = CreateInstance(input);
  const CostMatrix costs =
      PreferenceModel(instance, PreferenceParameters()).ComputeCosts();
  EXPECT_THAT(costs.Cost(0, 0), Optional(0));
  EXPECT_THAT(costs.Cost(0, 1), Optional(42));
  EXPECT_EQ(costs.Cost(0, 2), std::nullopt);
  EXPECT_EQ(costs.row(0).size(), 6);
}

TEST(PreferenceModelTest, TierBeatsRank) {
  const AllocationInput input = SevenTopicsInput(R"pb(
    students {
      id: "S"
      plan: true
      tier3_topics: "T1"
      ranked_topics: "T1"
    }
  )pb");
  const AllocationInstance instance = CreateInstance(input);
  const CostMatrix costs =
      PreferenceModel(instance, PreferenceParameters()).ComputeCosts();
  EXPECT_THAT(costs.Cost(0, 0), Optional(5));
}

TEST(PreferenceModelTest, WithoutUnrankedOnlyPreferredAndOverriddenTopics) {
  const AllocationInput input = SevenTopicsInput(R"pb(
    students {
      id: "S"
      plan: true
      tier2_topics: "T2"
      ranked_topics: "T5"
    }
    students { id: "Nothing" plan: true }
    overrides { student_id: "S" topic_id: "T7" cost: 9 }
  )pb");
  const AllocationInstance instance = CreateInstance(input);
  PreferenceParameters params;
  params.set_allow_unranked(false);
  const CostMatrix costs = PreferenceModel(instance, params).ComputeCosts();
  EXPECT_THAT(costs.row(0),
              ElementsAre(IsEntry(1, 1), IsEntry(4, 0), IsEntry(6, 9)));
  EXPECT_FALSE(costs.IsAssignable(1));
}

TEST(PreferenceModelTest, NonPlanningStudentsHaveNoRow) {
  const AllocationInput input = SevenTopicsInput(R"pb(
    students { id: "Out" plan: false tier1_topics: "T1" }
    students { id: "In" plan: true }
  )pb");
  const AllocationInstance instance = CreateInstance(input);
  const CostMatrix costs =
      PreferenceModel(instance, PreferenceParameters()).ComputeCosts();
  EXPECT_EQ(costs.num_students(), 1);
  EXPECT_EQ(costs.num_entries(), 7);
}

TEST(PreferenceModelTest, PreferenceRank) {
  const Student student = ParseTextProtoOrDie(R"pb(
    id: "S"
    tier1_topics: "A"
    tier2_topics: "B"
    tier3_topics: "C"
    ranked_topics: [ "D", "E", "F", "G", "H" ]
    forced_topic: "A"
  )pb");
  EXPECT_EQ(PreferenceModel::PreferenceRank(student, "A"), -1);
  EXPECT_EQ(PreferenceModel::PreferenceRank(student, "B"), 1);
  EXPECT_EQ(PreferenceModel::PreferenceRank(student, "C"), 2);
  EXPECT_EQ(PreferenceModel::PreferenceRank(student, "D"), 10);
  EXPECT_EQ(PreferenceModel::PreferenceRank(student, "H"), 14);
  EXPECT_EQ(PreferenceModel::PreferenceRank(student, "Z"), 999);

  Student unforced = student;
  unforced.clear_forced_topic();
  EXPECT_EQ(PreferenceModel::PreferenceRank(unforced, "A"), 0);
}

TEST(CostMatrixTest, Lookup) {
  CostMatrix costs(2);
  costs.Add(0, 1, 10);
  costs.Add(0, 4, -3);
  costs.Add(0, 7, 0);
  EXPECT_EQ(costs.num_entries(), 3);
  EXPECT_THAT(costs.Cost(0, 4), Optional(-3));
  EXPECT_THAT(costs.Cost(0, 7), Optional(0));
  EXPECT_EQ(costs.Cost(0, 0), std::nullopt);
  EXPECT_EQ(costs.Cost(0, 5), std::nullopt);
  EXPECT_EQ(costs.Cost(0, 8), std::nullopt);
  EXPECT_EQ(costs.Cost(1, 1), std::nullopt);
  EXPECT_TRUE(costs.IsAssignable(0));
  EXPECT_FALSE(costs.IsAssignable(1));
}

}  // namespace
}  // namespace thesis_alloc

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


#include "thesis_alloc/allocation/parameters_validation.h"

#include <cmath>
#include <limits>
#include <string>

#include "absl/status/status.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "thesis_alloc/allocation/allocation_parameters.pb.h"
#include "thesis_alloc/base/file.h"
#include "thesis_alloc/base/status_matchers.h"

namespace thesis_alloc {
namespace {

using ::testing::HasSubstr;
using ::testing::status::StatusIs;

TEST(ValidateAllocationParameters, DefaultIsValid) {
  const AllocationParameters params;
  EXPECT_OK(ValidateAllocationParameters(params));
}

TEST(ValidateAllocationParameters, DefaultValues) {
  const AllocationParameters params;
  EXPECT_TRUE(params.preference().allow_unranked());
  EXPECT_EQ(params.preference().tier2_cost(), 1);
  EXPECT_EQ(params.preference().tier3_cost(), 5);
  EXPECT_EQ(params.preference().unranked_cost(), 200);
  EXPECT_TRUE(params.preference().top2_bias());
  EXPECT_TRUE(params.capacity().enable_topic_overflow());
  EXPECT_TRUE(params.capacity().enable_coach_overflow());
  EXPECT_EQ(params.capacity().dept_min_mode(), CapacityParameters::SOFT);
  EXPECT_EQ(params.capacity().dept_shortfall_penalty(), 1000);
  EXPECT_EQ(params.capacity().topic_overflow_penalty(), 800);
  EXPECT_EQ(params.capacity().coach_overflow_penalty(), 600);
  EXPECT_EQ(params.solver().algorithm(), SolverParameters::ILP);
  EXPECT_FALSE(params.solver().has_time_limit_sec());
  EXPECT_FALSE(params.solver().has_epsilon_suboptimal());
}

TEST(ValidateAllocationParameters, BadTier2Cost) {
  AllocationParameters params;
  params.mutable_preference()->set_tier2_cost(-1);
  const absl::Status status = ValidateAllocationParameters(params);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr("tier2_cost"));
}

TEST(ValidateAllocationParameters, ZeroPenaltiesAreRejected) {
  AllocationParameters params;
  params.mutable_capacity()->set_dept_shortfall_penalty(0);
  EXPECT_THAT(ValidateAllocationParameters(params),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("dept_shortfall_penalty")));

  params.mutable_capacity()->clear_dept_shortfall_penalty();
  params.mutable_capacity()->set_topic_overflow_penalty(-800);
  EXPECT_THAT(ValidateAllocationParameters(params),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("topic_overflow_penalty")));

  params.mutable_capacity()->clear_topic_overflow_penalty();
  params.mutable_capacity()->set_coach_overflow_penalty(0);
  EXPECT_THAT(ValidateAllocationParameters(params),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("coach_overflow_penalty")));
}

TEST(ValidateAllocationParameters, BadEpsilon) {
  AllocationParameters params;
  params.mutable_solver()->set_epsilon_suboptimal(1.0);
  EXPECT_THAT(ValidateAllocationParameters(params),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("epsilon_suboptimal")));
  params.mutable_solver()->set_epsilon_suboptimal(-0.1);
  EXPECT_THAT(ValidateAllocationParameters(params),
              StatusIs(absl::StatusCode::kInvalidArgument));
  params.mutable_solver()->set_epsilon_suboptimal(
      std::numeric_limits<double>::quiet_NaN());
  EXPECT_THAT(ValidateAllocationParameters(params),
              StatusIs(absl::StatusCode::kInvalidArgument, HasSubstr("NAN")));
  params.mutable_solver()->set_epsilon_suboptimal(0.0);
  EXPECT_OK(ValidateAllocationParameters(params));
  params.mutable_solver()->set_epsilon_suboptimal(0.05);
  EXPECT_OK(ValidateAllocationParameters(params));
}

TEST(ValidateAllocationParameters, BadTimeLimit) {
  AllocationParameters params;
  params.mutable_solver()->set_time_limit_sec(0.0);
  EXPECT_THAT(ValidateAllocationParameters(params),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("time_limit_sec")));
  params.mutable_solver()->set_time_limit_sec(2.5);
  EXPECT_OK(ValidateAllocationParameters(params));
}

TEST(ParseDepartmentMinimumMode, KnownNames) {
  ASSERT_OK_AND_ASSIGN(const CapacityParameters::DepartmentMinimumMode soft,
                       ParseDepartmentMinimumMode("soft"));
  EXPECT_EQ(soft, CapacityParameters::SOFT);
  ASSERT_OK_AND_ASSIGN(const CapacityParameters::DepartmentMinimumMode hard,
                       ParseDepartmentMinimumMode("HARD"));
  EXPECT_EQ(hard, CapacityParameters::HARD);
}

TEST(ParseDepartmentMinimumMode, UnknownName) {
  EXPECT_THAT(ParseDepartmentMinimumMode("medium"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("medium")));
}

TEST(ParseAlgorithm, KnownNames) {
  for (const SolverParameters::Algorithm algorithm :
       {SolverParameters::ILP, SolverParameters::FLOW,
        SolverParameters::HYBRID}) {
    const absl::StatusOr<SolverParameters::Algorithm> parsed =
        ParseAlgorithm(AlgorithmName(algorithm));
    ASSERT_OK(parsed);
    EXPECT_EQ(*parsed, algorithm);
  }
  ASSERT_OK_AND_ASSIGN(const SolverParameters::Algorithm flow,
                       ParseAlgorithm("Flow"));
  EXPECT_EQ(flow, SolverParameters::FLOW);
}

TEST(ParseAlgorithm, UnknownName) {
  EXPECT_THAT(ParseAlgorithm("greedy"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("greedy")));
  EXPECT_THAT(ParseAlgorithm(""), StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(ReadAllocationParameters, TextFormat) {
  const std::string path = ::testing::TempDir() + "/params.textproto";
  ASSERT_OK(file::SetContents(path, R"pb(
    preference { allow_unranked: false unranked_cost: 50 }
    capacity { dept_min_mode: HARD }
    solver { algorithm: HYBRID time_limit_sec: 10 }
  )pb"));
  ASSERT_OK_AND_ASSIGN(const AllocationParameters params,
                       ReadAllocationParameters(path));
  EXPECT_FALSE(params.preference().allow_unranked());
  EXPECT_EQ(params.preference().unranked_cost(), 50);
  EXPECT_EQ(params.preference().tier3_cost(), 5);
  EXPECT_EQ(params.capacity().dept_min_mode(), CapacityParameters::HARD);
  EXPECT_EQ(params.solver().algorithm(), SolverParameters::HYBRID);
  EXPECT_EQ(params.solver().time_limit_sec(), 10.0);
}

TEST(ReadAllocationParameters, Json) {
  const std::string path = ::testing::TempDir() + "/params.json";
  ASSERT_OK(file::SetContents(
      path, R"json({"solver": {"algorithm": "FLOW"},
                   "capacity": {"enableTopicOverflow": false}})json"));
  ASSERT_OK_AND_ASSIGN(const AllocationParameters params,
                       ReadAllocationParameters(path));
  EXPECT_EQ(params.solver().algorithm(), SolverParameters::FLOW);
  EXPECT_FALSE(params.capacity().enable_topic_overflow());
  EXPECT_TRUE(params.capacity().enable_coach_overflow());
}

TEST(ReadAllocationParameters, InvalidValuesAreRejected) {
  const std::string path = ::testing::TempDir() + "/bad_params.textproto";
  ASSERT_OK(file::SetContents(path, "solver { epsilon_suboptimal: 2 }"));
  EXPECT_THAT(ReadAllocationParameters(path),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(ReadAllocationParameters, MissingFile) {
  EXPECT_FALSE(
      ReadAllocationParameters(::testing::TempDir() + "/does_not_exist.json")
          .ok());
}

TEST(FillDefaultValues, SetsFieldsWithDefaults) {
  AllocationParameters params;
  params.mutable_preference()->set_unranked_cost(50);
  FillDefaultValues(&params);
  EXPECT_EQ(params.preference().unranked_cost(), 50);
  EXPECT_TRUE(params.preference().has_tier2_cost());
  EXPECT_TRUE(params.preference().has_allow_unranked());
  EXPECT_TRUE(params.capacity().has_dept_min_mode());
  EXPECT_EQ(params.capacity().topic_overflow_penalty(), 800);
  EXPECT_TRUE(params.solver().has_algorithm());
  EXPECT_TRUE(params.solver().has_log_search_progress());
  // Fields without a default value keep meaning "unset".
  EXPECT_FALSE(params.solver().has_time_limit_sec());
  EXPECT_FALSE(params.solver().has_random_seed());
  EXPECT_FALSE(params.solver().has_epsilon_suboptimal());
  EXPECT_OK(ValidateAllocationParameters(params));
}

}  // namespace
}  // namespace thesis_alloc

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


#include "thesis_alloc/io/report_writer.h"

#include <string>

#include "absl/strings/str_cat.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "thesis_alloc/allocation/allocation.pb.h"
#include "thesis_alloc/base/file.h"
#include "thesis_alloc/base/parse_text_proto.h"
#include "thesis_alloc/base/status_matchers.h"

namespace thesis_alloc {
namespace {

using ::testing::HasSubstr;
using ::testing::Not;

AllocationInput MakeInput() {
  return ParseTextProtoOrDie(R"pb(
    topics { id: "A" coach_id: "C1" department_id: "D1" capacity: 1 }
    topics { id: "B" coach_id: "C1" department_id: "D1" capacity: 2 }
    coaches { id: "C1" department_id: "D1" capacity: 3 }
    departments { id: "D1" desired_min: 4 }
    departments { id: "D2" }
  )pb");
}

AllocationResult MakeResult() {
  return ParseTextProtoOrDie(R"pb(
    assignments {
      student_id: "S1"
      topic_id: "A"
      coach_id: "C1"
      department_id: "D1"
      preference_rank: 10
      effective_cost: 0
      via_topic_overflow: true
    }
    assignments {
      student_id: "Doe, \"J\""
      topic_id: "A"
      coach_id: "C1"
      department_id: "D1"
      preference_rank: 999
      effective_cost: 200
      via_topic_overflow: true
    }
    assignments {
      student_id: "S3"
      topic_id: "B"
      coach_id: "C1"
      department_id: "D1"
      preference_rank: -1
      effective_cost: -10000
      forced: true
    }
    diagnostics {
      status: "OPTIMAL"
      objective_value: -9000
      algorithm: "ilp"
      unassignable_students: "S4"
      topic_overflow { key: "A" value: 1 }
      department_shortfall { key: "D1" value: 1 }
      ties {
        student_id: "S1"
        assigned_topic_id: "A"
        cost: 0
        alternative_topic_ids: [ "B", "C" ]
      }
    }
  )pb");
}

TEST(AllocationToCsvTest, QuotesAndBooleans) {
  EXPECT_EQ(AllocationToCsv(MakeResult()),
            "student,assigned_topic,assigned_coach,department_id,"
            "preference_rank,effective_cost,via_topic_overflow,"
            "via_coach_overflow\n"
            "S1,A,C1,D1,10,0,True,False\n"
            "\"Doe, \"\"J\"\"\",A,C1,D1,999,200,True,False\n"
            "S3,B,C1,D1,-1,-10000,False,False\n");
}

TEST(AllocationToCsvTest, NoAssignments) {
  EXPECT_EQ(AllocationToCsv(AllocationResult()),
            "student,assigned_topic,assigned_coach,department_id,"
            "preference_rank,effective_cost,via_topic_overflow,"
            "via_coach_overflow\n");
}

TEST(AllocationSummaryTest, Sections) {
  const std::string summary = AllocationSummary(MakeInput(), MakeResult());
  EXPECT_THAT(summary, HasSubstr("Solver status: OPTIMAL\n"));
  EXPECT_THAT(summary, HasSubstr("Objective: -9000\n"));
  EXPECT_THAT(summary, HasSubstr("Assigned students: 3\n"));
  EXPECT_THAT(summary,
              HasSubstr("Unassignable students (no admissible topics): 1\n"
                        "  - S4\n"
                        "Unassigned after solve: 0\n"));
  EXPECT_THAT(summary, HasSubstr("  S1: assigned A (cost=0), could also "
                                 "take: B, C\n"));
  EXPECT_THAT(summary, HasSubstr("  Forced: 1\n"));
  EXPECT_THAT(summary, HasSubstr("  1st choice: 1\n  2nd choice: 0\n"));
  EXPECT_THAT(summary, HasSubstr("  Unranked: 1\n"));
  EXPECT_THAT(summary, HasSubstr("Topic utilization:\n"
                                 "  A: 2 / 1  (overflow=1)\n"
                                 "  B: 1 / 2\n"));
  EXPECT_THAT(summary, HasSubstr("Coach utilization:\n  C1: 3 / 3\n"));
  EXPECT_THAT(summary, HasSubstr("Department totals:\n"
                                 "  D1: 3 (desired_min=4, shortfall=1)\n"
                                 "  D2: 0\n"));
}

TEST(AllocationSummaryTest, ListsAtMostTenTies) {
  AllocationResult result;
  for (int i = 0; i < kMaxReportedTies + 3; ++i) {
    TieReport* const tie = result.mutable_diagnostics()->add_ties();
    tie->set_student_id(absl::StrCat("S", i));
    tie->set_assigned_topic_id("A");
    tie->add_alternative_topic_ids("B");
  }
  const std::string summary = AllocationSummary(AllocationInput(), result);
  EXPECT_THAT(summary, HasSubstr("13 student(s) have equally-good"));
  EXPECT_THAT(summary, HasSubstr("  S9: assigned A"));
  EXPECT_THAT(summary, Not(HasSubstr("  S10: assigned A")));
  EXPECT_THAT(summary, HasSubstr("... and 3 more students with tied costs."));
}

TEST(AllocationSummaryTest, UniqueSolution) {
  EXPECT_THAT(AllocationSummary(AllocationInput(), AllocationResult()),
              HasSubstr("Solution appears unique"));
}

TEST(WriteReportsTest, WritesFiles) {
  const std::string csv_path = ::testing::TempDir() + "/allocation.csv";
  const std::string summary_path = ::testing::TempDir() + "/summary.txt";
  ASSERT_OK(WriteAllocationCsv(csv_path, MakeResult()));
  ASSERT_OK(WriteAllocationSummary(summary_path, MakeInput(), MakeResult()));
  ASSERT_OK_AND_ASSIGN(const std::string csv, file::GetContents(csv_path));
  EXPECT_EQ(csv, AllocationToCsv(MakeResult()));
  ASSERT_OK_AND_ASSIGN(const std::string summary,
                       file::GetContents(summary_path));
  EXPECT_EQ(summary, AllocationSummary(MakeInput(), MakeResult()));
}

}  // namespace
}  // namespace thesis_alloc

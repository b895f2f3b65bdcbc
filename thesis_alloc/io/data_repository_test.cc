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


#include "thesis_alloc/io/data_repository.h"

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "gmock/gmock.h"
#include "google/protobuf/util/message_differencer.h"
#include "gtest/gtest.h"
#include "thesis_alloc/allocation/allocation.pb.h"
#include "thesis_alloc/base/file.h"
#include "thesis_alloc/base/parse_text_proto.h"
#include "thesis_alloc/base/status_matchers.h"

namespace thesis_alloc {
namespace {

using ::google::protobuf::util::MessageDifferencer;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::SizeIs;
using ::testing::status::StatusIs;

constexpr char kStudentsCsv[] =
    "Student ID,Plan thesis,Pref1,Pref2,Pref3,Pref4,Pref5,Tier1,Tier2,Tier3,"
    "Banned,Forced topic\n"
    "S1,Yes,A,B,,,,,,,,\n"
    "S2,no,B,,,,,,,,,\n"
    "S3,yes,,,,,,A|B,,C,D,\n"
    "S4,YES,,,,,,,,,,C\n"
    ",yes,A,,,,,,,,,\n";

constexpr char kCapacitiesCsv[] =
    "Topic ID,Coach ID,Department ID,Maximum students per topic,"
    "Maximum students per coach,Desired minimum by department\n"
    "A,C1,D1,2,3,2\n"
    "B,C1,D1,1,3,\n"
    "C,C2,D2,1,1,0\n";

constexpr char kOverridesCsv[] =
    "student_id,topic_id,cost\n"
    "S1,C,7\n"
    "S2,A,abc\n"
    ",A,3\n"
    "S3,C,-2\n";

constexpr char kCapacitiesHeader[] =
    "topic_id,coach_id,department_id,maximum_students_per_topic,"
    "maximum_students_per_coach,desired_minimum_by_department\n";

TEST(ParseCsvTest, QuotedFieldsAndByteOrderMark) {
  ASSERT_OK_AND_ASSIGN(
      const CsvTable table,
      ParseCsv("\xEF\xBB\xBFName,Comment\r\n"
               "a,\"x, y\"\r\n"
               "b,\"say \"\"hi\"\"\nbye\"\r\n"
               "\r\n"
               " , \n"
               "c\n"));
  EXPECT_THAT(table.header, ElementsAre("name", "comment"));
  ASSERT_THAT(table.rows, SizeIs(3));
  EXPECT_THAT(table.rows[0], ElementsAre("a", "x, y"));
  EXPECT_THAT(table.rows[1], ElementsAre("b", "say \"hi\"\nbye"));
  EXPECT_THAT(table.rows[2], ElementsAre("c"));
  EXPECT_EQ(table.ColumnIndex("Comment"), 1);
  EXPECT_EQ(table.ColumnIndex("missing"), -1);
}

TEST(ParseCsvTest, Empty) {
  ASSERT_OK_AND_ASSIGN(const CsvTable table, ParseCsv(""));
  EXPECT_THAT(table.header, IsEmpty());
  EXPECT_THAT(table.rows, IsEmpty());
}

TEST(ParseCsvTest, UnterminatedQuote) {
  EXPECT_THAT(ParseCsv("a,b\n1,\"open\n2,3\n"),
              StatusIs(absl::StatusCode::kInvalidArgument, HasSubstr("line 2")));
}

TEST(NormalizeCsvHeaderTest, Basic) {
  EXPECT_EQ(NormalizeCsvHeader(" Maximum students per topic "),
            "maximum_students_per_topic");
  EXPECT_EQ(NormalizeCsvHeader("Desired minimum (by department)"),
            "desired_minimum_by_department");
  EXPECT_EQ(NormalizeCsvHeader("__Pref1__"), "pref1");
  EXPECT_EQ(NormalizeCsvHeader("student_id"), "student_id");
  EXPECT_EQ(NormalizeCsvHeader("--"), "");
}

TEST(SplitTopicListTest, Basic) {
  EXPECT_THAT(SplitTopicList(" A | |B|"), ElementsAre("A", "B"));
  EXPECT_THAT(SplitTopicList(""), IsEmpty());
}

TEST(ParseAllocationInputCsvTest, AllFiles) {
  ASSERT_OK_AND_ASSIGN(
      const AllocationInput input,
      ParseAllocationInputCsv(kStudentsCsv, kCapacitiesCsv, kOverridesCsv));
  const AllocationInput expected = ParseTextProtoOrDie(R"pb(
    students { id: "S1" plan: true ranked_topics: [ "A", "B" ] }
    students { id: "S2" ranked_topics: "B" }
    students {
      id: "S3"
      plan: true
      tier1_topics: [ "A", "B" ]
      tier3_topics: "C"
      banned_topics: "D"
    }
    students { id: "S4" plan: true forced_topic: "C" }
    topics { id: "A" coach_id: "C1" department_id: "D1" capacity: 2 }
    topics { id: "B" coach_id: "C1" department_id: "D1" capacity: 1 }
    topics { id: "C" coach_id: "C2" department_id: "D2" capacity: 1 }
    coaches { id: "C1" department_id: "D1" capacity: 3 }
    coaches { id: "C2" department_id: "D2" capacity: 1 }
    departments { id: "D1" desired_min: 2 }
    departments { id: "D2" }
    overrides { student_id: "S1" topic_id: "C" cost: 7 }
    overrides { student_id: "S3" topic_id: "C" cost: -2 }
  )pb");
  EXPECT_TRUE(MessageDifferencer::Equals(input, expected))
      << input.DebugString();
}

TEST(ParseAllocationInputCsvTest, WithoutOverrides) {
  ASSERT_OK_AND_ASSIGN(const AllocationInput input,
                       ParseAllocationInputCsv(kStudentsCsv, kCapacitiesCsv,
                                               /*overrides_csv=*/""));
  EXPECT_EQ(input.students_size(), 4);
  EXPECT_THAT(input.overrides(), IsEmpty());
}

TEST(ParseAllocationInputCsvTest, StudentListedTwiceKeepsLastRow) {
  ASSERT_OK_AND_ASSIGN(const AllocationInput input,
                       ParseAllocationInputCsv("student_id,plan_thesis,pref1\n"
                                               "S1,yes,A\n"
                                               "S2,yes,A\n"
                                               "S1,no,B\n",
                                               kCapacitiesCsv, ""));
  ASSERT_EQ(input.students_size(), 2);
  EXPECT_EQ(input.students(0).id(), "S1");
  EXPECT_FALSE(input.students(0).plan());
  EXPECT_THAT(input.students(0).ranked_topics(), ElementsAre("B"));
  EXPECT_EQ(input.students(1).id(), "S2");
}

TEST(ParseAllocationInputCsvTest, SameDepartmentMinimumOnSeveralRows) {
  const std::string capacities = std::string(kCapacitiesHeader) +
                                 "A,C1,D1,1,3,2\n"
                                 "B,C1,D1,1,3,\n"
                                 "C,C1,D1,1,3,2\n"
                                 "A,C1,D1,1,3,2\n";
  ASSERT_OK_AND_ASSIGN(const AllocationInput input,
                       ParseAllocationInputCsv("", capacities, ""));
  EXPECT_EQ(input.topics_size(), 3);
  EXPECT_EQ(input.coaches_size(), 1);
  ASSERT_EQ(input.departments_size(), 1);
  EXPECT_EQ(input.departments(0).desired_min(), 2);
}

TEST(ParseAllocationInputCsvTest, InconsistentCapacities) {
  const std::string header = kCapacitiesHeader;
  EXPECT_THAT(ParseAllocationInputCsv("", "", ""),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(
      ParseAllocationInputCsv("", header + "A,,D1,1,1,0\n", ""),
      StatusIs(absl::StatusCode::kInvalidArgument, HasSubstr("row 1")));
  EXPECT_THAT(ParseAllocationInputCsv(
                  "", header + "A,C1,D1,1,3,0\nA,C1,D1,2,3,0\n", ""),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("topic 'A'")));
  EXPECT_THAT(ParseAllocationInputCsv(
                  "", header + "A,C1,D1,1,3,0\nB,C1,D1,1,4,0\n", ""),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("maximum_students_per_coach")));
  EXPECT_THAT(ParseAllocationInputCsv(
                  "", header + "A,C1,D1,1,3,0\nB,C1,D2,1,3,0\n", ""),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("coach 'C1' appears in departments")));
  EXPECT_THAT(ParseAllocationInputCsv(
                  "", header + "A,C1,D1,1,3,2\nB,C2,D1,1,3,4\n", ""),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("department 'D1'")));
}

TEST(LoadAllocationInputFromCsvTest, ReadsFiles) {
  const std::string dir = ::testing::TempDir();
  CsvInputFiles files;
  files.students = dir + "/students.csv";
  files.capacities = dir + "/capacities.csv";
  ASSERT_OK(file::SetContents(files.students, kStudentsCsv));
  ASSERT_OK(file::SetContents(files.capacities, kCapacitiesCsv));
  ASSERT_OK_AND_ASSIGN(const AllocationInput input,
                       LoadAllocationInputFromCsv(files));
  EXPECT_EQ(input.students_size(), 4);
  EXPECT_EQ(input.topics_size(), 3);
  EXPECT_THAT(input.overrides(), IsEmpty());

  files.overrides = dir + "/overrides.csv";
  ASSERT_OK(file::SetContents(files.overrides, kOverridesCsv));
  ASSERT_OK_AND_ASSIGN(const AllocationInput with_overrides,
                       LoadAllocationInputFromCsv(files));
  EXPECT_EQ(with_overrides.overrides_size(), 2);
}

TEST(LoadAllocationInputFromCsvTest, MissingFile) {
  CsvInputFiles files;
  files.students = ::testing::TempDir() + "/no_students.csv";
  files.capacities = ::testing::TempDir() + "/no_capacities.csv";
  EXPECT_THAT(LoadAllocationInputFromCsv(files),
              StatusIs(absl::StatusCode::kNotFound));
}

TEST(ReadAllocationInputTest, TextFormat) {
  const std::string path = ::testing::TempDir() + "/input.textproto";
  ASSERT_OK(file::SetContents(path, R"pb(
    students { id: "S1" plan: true ranked_topics: "A" }
    topics { id: "A" coach_id: "C" capacity: 1 }
    coaches { id: "C" capacity: 1 }
  )pb"));
  ASSERT_OK_AND_ASSIGN(const AllocationInput input, ReadAllocationInput(path));
  EXPECT_EQ(input.students_size(), 1);
  EXPECT_EQ(input.topics(0).coach_id(), "C");
}

}  // namespace
}  // namespace thesis_alloc

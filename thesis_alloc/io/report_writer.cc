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

#include <cstdint>
#include <string>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/map.h"
#include "google/protobuf/repeated_ptr_field.h"
#include "thesis_alloc/allocation/allocation.pb.h"
#include "thesis_alloc/base/file.h"

namespace thesis_alloc {

namespace {

// Quotes `field` if it contains a separator, a quote or a line break.
std::string CsvField(absl::string_view field) {
  if (field.find_first_of(",\"\r\n") == absl::string_view::npos) {
    return std::string(field);
  }
  std::string quoted = "\"";
  for (const char c : field) {
    if (c == '"') quoted.push_back('"');
    quoted.push_back(c);
  }
  quoted.push_back('"');
  return quoted;
}

absl::string_view CsvBool(bool value) { return value ? "True" : "False"; }

void AppendStudentList(
    absl::string_view title,
    const google::protobuf::RepeatedPtrField<std::string>& students,
    std::string* out) {
  absl::StrAppend(out, title, ": ", students.size(), "\n");
  for (const std::string& student : students) {
    absl::StrAppend(out, "  - ", student, "\n");
  }
}

void AppendTies(const AllocationDiagnostics& diagnostics, std::string* out) {
  absl::StrAppend(out, "\n--- SOLUTION UNIQUENESS ---\n");
  if (diagnostics.ties().empty()) {
    absl::StrAppend(out, "Solution appears unique (no ties in costs).\n");
    return;
  }
  absl::StrAppend(out, "Solution may not be unique: ", diagnostics.ties_size(),
                  " student(s) have equally-good alternatives:\n");
  for (int i = 0; i < diagnostics.ties_size() && i < kMaxReportedTies; ++i) {
    const TieReport& tie = diagnostics.ties(i);
    absl::StrAppend(out, "  ", tie.student_id(), ": assigned ",
                    tie.assigned_topic_id(), " (cost=", tie.cost(),
                    "), could also take: ",
                    absl::StrJoin(tie.alternative_topic_ids(), ", "), "\n");
  }
  if (diagnostics.ties_size() > kMaxReportedTies) {
    absl::StrAppend(out, "  ... and ",
                    diagnostics.ties_size() - kMaxReportedTies,
                    " more students with tied costs.\n");
  }
}

void AppendUtilization(
    absl::string_view id, int64_t used, int capacity,
    const google::protobuf::Map<std::string, int64_t>& overflow,
    std::string* out) {
  absl::StrAppend(out, "  ", id, ": ", used, " / ", capacity);
  const auto it = overflow.find(std::string(id));
  if (it != overflow.end() && it->second > 0) {
    absl::StrAppend(out, "  (overflow=", it->second, ")");
  }
  absl::StrAppend(out, "\n");
}

}  // namespace

std::string AllocationToCsv(const AllocationResult& result) {
  std::string csv =
      "student,assigned_topic,assigned_coach,department_id,preference_rank,"
      "effective_cost,via_topic_overflow,via_coach_overflow\n";
  for (const AssignmentRow& row : result.assignments()) {
    absl::StrAppend(&csv, CsvField(row.student_id()), ",",
                    CsvField(row.topic_id()), ",", CsvField(row.coach_id()),
                    ",", CsvField(row.department_id()), ",",
                    row.preference_rank(), ",", row.effective_cost(), ",",
                    CsvBool(row.via_topic_overflow()), ",",
                    CsvBool(row.via_coach_overflow()), "\n");
  }
  return csv;
}

absl::Status WriteAllocationCsv(absl::string_view path,
                                const AllocationResult& result) {
  return file::SetContents(path, AllocationToCsv(result));
}

std::string AllocationSummary(const AllocationInput& input,
                              const AllocationResult& result) {
  const AllocationDiagnostics& diagnostics = result.diagnostics();
  absl::flat_hash_map<int, int> rank_count;
  absl::flat_hash_map<std::string, int64_t> topic_load;
  absl::flat_hash_map<std::string, int64_t> coach_load;
  absl::flat_hash_map<std::string, int64_t> department_load;
  for (const AssignmentRow& row : result.assignments()) {
    ++rank_count[row.preference_rank()];
    ++topic_load[row.topic_id()];
    ++coach_load[row.coach_id()];
    ++department_load[row.department_id()];
  }
  const auto count = [&rank_count](int rank) {
    const auto it = rank_count.find(rank);
    return it == rank_count.end() ? 0 : it->second;
  };

  std::string out;
  absl::StrAppend(&out, "Solver status: ", diagnostics.status(), "\n");
  absl::StrAppend(&out, "Algorithm: ", diagnostics.algorithm(), "\n");
  absl::StrAppend(&out, "Objective: ", diagnostics.objective_value(), "\n");
  absl::StrAppend(&out, "Wall time: ", diagnostics.wall_time_seconds(),
                  " s\n\n");
  absl::StrAppend(&out, "Assigned students: ", result.assignments_size(),
                  "\n");
  AppendStudentList("Unassignable students (no admissible topics)",
                    diagnostics.unassignable_students(), &out);
  AppendStudentList("Unassigned after solve",
                    diagnostics.unassigned_after_solve(), &out);
  AppendTies(diagnostics, &out);

  absl::StrAppend(&out, "\nPreference satisfaction:\n");
  absl::StrAppend(&out, "  Forced: ", count(-1), "\n");
  absl::StrAppend(&out, "  Tier1: ", count(0), "\n");
  absl::StrAppend(&out, "  Tier2: ", count(1), "\n");
  absl::StrAppend(&out, "  Tier3: ", count(2), "\n");

  static constexpr absl::string_view kChoiceNames[] = {"1st", "2nd", "3rd",
                                                       "4th", "5th"};
  absl::StrAppend(&out, "\nRanked choice satisfaction:\n");
  for (int i = 0; i < 5; ++i) {
    absl::StrAppend(&out, "  ", kChoiceNames[i], " choice: ", count(10 + i),
                    "\n");
  }
  absl::StrAppend(&out, "  Unranked: ", count(999), "\n");

  absl::StrAppend(&out, "\nTopic utilization:\n");
  for (const Topic& topic : input.topics()) {
    AppendUtilization(topic.id(), topic_load[topic.id()], topic.capacity(),
                      diagnostics.topic_overflow(), &out);
  }
  absl::StrAppend(&out, "\nCoach utilization:\n");
  for (const Coach& coach : input.coaches()) {
    AppendUtilization(coach.id(), coach_load[coach.id()], coach.capacity(),
                      diagnostics.coach_overflow(), &out);
  }

  absl::StrAppend(&out, "\nDepartment totals:\n");
  for (const Department& department : input.departments()) {
    absl::StrAppend(&out, "  ", department.id(), ": ",
                    department_load[department.id()]);
    if (department.desired_min() > 0) {
      const auto it =
          diagnostics.department_shortfall().find(department.id());
      absl::StrAppend(
          &out, " (desired_min=", department.desired_min(), ", shortfall=",
          it == diagnostics.department_shortfall().end() ? 0 : it->second,
          ")");
    }
    absl::StrAppend(&out, "\n");
  }
  return out;
}

absl::Status WriteAllocationSummary(absl::string_view path,
                                    const AllocationInput& input,
                                    const AllocationResult& result) {
  return file::SetContents(path, AllocationSummary(input, result));
}

}  // namespace thesis_alloc

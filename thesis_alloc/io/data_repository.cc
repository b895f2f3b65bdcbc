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

#include <cstdint>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"
#include "thesis_alloc/allocation/allocation.pb.h"
#include "thesis_alloc/base/file.h"
#include "thesis_alloc/base/status_macros.h"

namespace thesis_alloc {

namespace {

constexpr absl::string_view kUtf8ByteOrderMark = "\xEF\xBB\xBF";
constexpr int kNumRankedColumns = 5;

// Returns the stripped cell of `row` in `column`, or "" if there is none.
absl::string_view Cell(const std::vector<std::string>& row, int column) {
  if (column < 0 || column >= static_cast<int>(row.size())) return "";
  return absl::StripAsciiWhitespace(row[column]);
}

int ParseIntOrZero(absl::string_view cell) {
  int value;
  return absl::SimpleAtoi(cell, &value) ? value : 0;
}

absl::Status RowError(absl::string_view file, int row,
                      absl::string_view message) {
  return absl::InvalidArgumentError(
      absl::StrCat(file, " row ", row, ": ", message));
}

absl::Status ParseCapacities(const CsvTable& table, AllocationInput* input) {
  if (table.rows.empty()) {
    return absl::InvalidArgumentError("capacities: no rows");
  }
  const int topic_column = table.ColumnIndex("topic_id");
  const int coach_column = table.ColumnIndex("coach_id");
  const int department_column = table.ColumnIndex("department_id");
  const int topic_capacity_column =
      table.ColumnIndex("maximum_students_per_topic");
  const int coach_capacity_column =
      table.ColumnIndex("maximum_students_per_coach");
  const int minimum_column = table.ColumnIndex("desired_minimum_by_department");

  absl::flat_hash_map<std::string, int> topic_index;
  absl::flat_hash_map<std::string, int> coach_index;
  absl::flat_hash_map<std::string, int> department_index;
  for (int r = 0; r < static_cast<int>(table.rows.size()); ++r) {
    const std::vector<std::string>& row = table.rows[r];
    const std::string topic_id(Cell(row, topic_column));
    const std::string coach_id(Cell(row, coach_column));
    const std::string department_id(Cell(row, department_column));
    if (topic_id.empty() || coach_id.empty() || department_id.empty()) {
      return RowError("capacities", r + 1,
                      "missing topic_id, coach_id or department_id");
    }
    const int topic_capacity =
        ParseIntOrZero(Cell(row, topic_capacity_column));
    const int coach_capacity =
        ParseIntOrZero(Cell(row, coach_capacity_column));
    const int desired_min = ParseIntOrZero(Cell(row, minimum_column));

    const auto [topic_it, new_topic] =
        topic_index.try_emplace(topic_id, input->topics_size());
    if (new_topic) {
      Topic* const topic = input->add_topics();
      topic->set_id(topic_id);
      topic->set_coach_id(coach_id);
      topic->set_department_id(department_id);
      topic->set_capacity(topic_capacity);
    } else {
      const Topic& topic = input->topics(topic_it->second);
      if (topic.coach_id() != coach_id ||
          topic.department_id() != department_id ||
          topic.capacity() != topic_capacity) {
        return RowError("capacities", r + 1,
                        absl::StrCat("inconsistent rows for topic '", topic_id,
                                     "'"));
      }
    }

    const auto [coach_it, new_coach] =
        coach_index.try_emplace(coach_id, input->coaches_size());
    if (new_coach) {
      Coach* const coach = input->add_coaches();
      coach->set_id(coach_id);
      coach->set_department_id(department_id);
      coach->set_capacity(coach_capacity);
    } else {
      const Coach& coach = input->coaches(coach_it->second);
      if (coach.capacity() != coach_capacity) {
        return RowError("capacities", r + 1,
                        absl::StrCat("inconsistent maximum_students_per_coach "
                                     "for coach '",
                                     coach_id, "'"));
      }
      if (coach.department_id() != department_id) {
        return RowError(
            "capacities", r + 1,
            absl::StrCat("coach '", coach_id, "' appears in departments '",
                         coach.department_id(), "' and '", department_id,
                         "'"));
      }
    }

    const auto [department_it, new_department] =
        department_index.try_emplace(department_id, input->departments_size());
    if (new_department) {
      Department* const department = input->add_departments();
      department->set_id(department_id);
      department->set_desired_min(desired_min);
    } else if (desired_min != 0 &&
               input->departments(department_it->second).desired_min() !=
                   desired_min) {
      return RowError("capacities", r + 1,
                      absl::StrCat("inconsistent desired_minimum_by_department "
                                   "for department '",
                                   department_id, "'"));
    }
  }
  return absl::OkStatus();
}

void ParseStudents(const CsvTable& table, AllocationInput* input) {
  const int id_column = table.ColumnIndex("student_id");
  const int plan_column = table.ColumnIndex("plan_thesis");
  int ranked_columns[kNumRankedColumns];
  for (int i = 0; i < kNumRankedColumns; ++i) {
    ranked_columns[i] = table.ColumnIndex(absl::StrCat("pref", i + 1));
  }
  const int tier1_column = table.ColumnIndex("tier1");
  const int tier2_column = table.ColumnIndex("tier2");
  const int tier3_column = table.ColumnIndex("tier3");
  const int banned_column = table.ColumnIndex("banned");
  const int forced_column = table.ColumnIndex("forced_topic");

  absl::flat_hash_map<std::string, int> student_index;
  for (const std::vector<std::string>& row : table.rows) {
    const absl::string_view id = Cell(row, id_column);
    if (id.empty()) continue;

    Student student;
    student.set_id(std::string(id));
    student.set_plan(absl::AsciiStrToLower(Cell(row, plan_column)) == "yes");
    for (const int column : ranked_columns) {
      const absl::string_view topic = Cell(row, column);
      if (!topic.empty()) student.add_ranked_topics(std::string(topic));
    }
    for (std::string& topic : SplitTopicList(Cell(row, tier1_column))) {
      student.add_tier1_topics(std::move(topic));
    }
    for (std::string& topic : SplitTopicList(Cell(row, tier2_column))) {
      student.add_tier2_topics(std::move(topic));
    }
    for (std::string& topic : SplitTopicList(Cell(row, tier3_column))) {
      student.add_tier3_topics(std::move(topic));
    }
    for (std::string& topic : SplitTopicList(Cell(row, banned_column))) {
      student.add_banned_topics(std::move(topic));
    }
    const absl::string_view forced = Cell(row, forced_column);
    if (!forced.empty()) student.set_forced_topic(std::string(forced));

    const auto [it, inserted] =
        student_index.try_emplace(student.id(), input->students_size());
    if (inserted) {
      *input->add_students() = std::move(student);
    } else {
      VLOG(1) << "Student '" << student.id() << "' is listed twice.";
      *input->mutable_students(it->second) = std::move(student);
    }
  }
}

void ParseOverrides(const CsvTable& table, AllocationInput* input) {
  const int student_column = table.ColumnIndex("student_id");
  const int topic_column = table.ColumnIndex("topic_id");
  const int cost_column = table.ColumnIndex("cost");
  int num_skipped = 0;
  for (const std::vector<std::string>& row : table.rows) {
    const absl::string_view student_id = Cell(row, student_column);
    const absl::string_view topic_id = Cell(row, topic_column);
    int64_t cost;
    if (!absl::SimpleAtoi(Cell(row, cost_column), &cost) ||
        student_id.empty() || topic_id.empty()) {
      ++num_skipped;
      continue;
    }
    OverrideCost* const override_cost = input->add_overrides();
    override_cost->set_student_id(std::string(student_id));
    override_cost->set_topic_id(std::string(topic_id));
    override_cost->set_cost(cost);
  }
  if (num_skipped > 0) {
    LOG(WARNING) << "Skipped " << num_skipped
                 << " override rows without ids or integer cost.";
  }
}

}  // namespace

int CsvTable::ColumnIndex(absl::string_view name) const {
  const std::string normalized = NormalizeCsvHeader(name);
  for (int i = 0; i < static_cast<int>(header.size()); ++i) {
    if (header[i] == normalized) return i;
  }
  return -1;
}

std::string NormalizeCsvHeader(absl::string_view header) {
  std::string normalized;
  bool pending_separator = false;
  for (const char c : header) {
    if (absl::ascii_isalnum(static_cast<unsigned char>(c))) {
      if (pending_separator && !normalized.empty()) normalized.push_back('_');
      pending_separator = false;
      normalized.push_back(absl::ascii_tolower(static_cast<unsigned char>(c)));
    } else {
      pending_separator = true;
    }
  }
  return normalized;
}

std::vector<std::string> SplitTopicList(absl::string_view cell) {
  std::vector<std::string> topics;
  for (const absl::string_view item : absl::StrSplit(cell, '|')) {
    const absl::string_view topic = absl::StripAsciiWhitespace(item);
    if (!topic.empty()) topics.emplace_back(topic);
  }
  return topics;
}

absl::StatusOr<CsvTable> ParseCsv(absl::string_view contents) {
  absl::ConsumePrefix(&contents, kUtf8ByteOrderMark);

  std::vector<std::vector<std::string>> records;
  std::vector<std::string> record;
  std::string field;
  bool in_quotes = false;
  int line = 1;
  int quote_line = 0;
  const auto end_record = [&]() {
    record.push_back(std::move(field));
    field.clear();
    bool blank = true;
    for (const std::string& value : record) {
      if (!absl::StripAsciiWhitespace(value).empty()) blank = false;
    }
    if (!blank) records.push_back(std::move(record));
    record.clear();
  };

  for (size_t i = 0; i < contents.size(); ++i) {
    const char c = contents[i];
    if (in_quotes) {
      if (c != '"') {
        if (c == '\n') ++line;
        field.push_back(c);
      } else if (i + 1 < contents.size() && contents[i + 1] == '"') {
        field.push_back('"');
        ++i;
      } else {
        in_quotes = false;
      }
      continue;
    }
    switch (c) {
      case '"':
        in_quotes = true;
        quote_line = line;
        break;
      case ',':
        record.push_back(std::move(field));
        field.clear();
        break;
      case '\r':
        break;
      case '\n':
        end_record();
        ++line;
        break;
      default:
        field.push_back(c);
    }
  }
  if (in_quotes) {
    return absl::InvalidArgumentError(
        absl::StrCat("unterminated quoted field starting on line ", quote_line));
  }
  end_record();

  CsvTable table;
  if (records.empty()) return table;
  for (const std::string& name : records[0]) {
    table.header.push_back(NormalizeCsvHeader(name));
  }
  table.rows.assign(std::make_move_iterator(records.begin() + 1),
                    std::make_move_iterator(records.end()));
  return table;
}

absl::StatusOr<AllocationInput> ParseAllocationInputCsv(
    absl::string_view students_csv, absl::string_view capacities_csv,
    absl::string_view overrides_csv) {
  AllocationInput input;
  ASSIGN_OR_RETURN(const CsvTable capacities, ParseCsv(capacities_csv));
  RETURN_IF_ERROR(ParseCapacities(capacities, &input));
  ASSIGN_OR_RETURN(const CsvTable students, ParseCsv(students_csv));
  ParseStudents(students, &input);
  ASSIGN_OR_RETURN(const CsvTable overrides, ParseCsv(overrides_csv));
  ParseOverrides(overrides, &input);
  return input;
}

absl::StatusOr<AllocationInput> LoadAllocationInputFromCsv(
    const CsvInputFiles& files) {
  ASSIGN_OR_RETURN(const std::string students,
                   file::GetContents(files.students));
  ASSIGN_OR_RETURN(const std::string capacities,
                   file::GetContents(files.capacities));
  std::string overrides;
  if (!files.overrides.empty()) {
    ASSIGN_OR_RETURN(overrides, file::GetContents(files.overrides));
  }
  absl::StatusOr<AllocationInput> input =
      ParseAllocationInputCsv(students, capacities, overrides);
  if (!input.ok()) return input.status();

  int num_planning = 0;
  for (const Student& student : input->students()) {
    if (student.plan()) ++num_planning;
  }
  LOG(INFO) << "Loaded " << input->students_size() << " students ("
            << num_planning << " planning), " << input->topics_size()
            << " topics, " << input->coaches_size() << " coaches, "
            << input->departments_size() << " departments, "
            << input->overrides_size() << " overrides.";
  return input;
}

absl::StatusOr<AllocationInput> ReadAllocationInput(absl::string_view path) {
  return file::GetTextProto<AllocationInput>(path);
}

}  // namespace thesis_alloc

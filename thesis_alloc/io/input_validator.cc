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


#include "thesis_alloc/io/input_validator.h"

#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/repeated_ptr_field.h"
#include "thesis_alloc/allocation/allocation.pb.h"

namespace thesis_alloc {

namespace {

class InputChecker {
 public:
  explicit InputChecker(const AllocationInput& input) : input_(input) {}

  void Run() {
    for (const Department& department : input_.departments()) {
      CheckUnique("department", department.id(), &department_ids_);
      if (department.desired_min() < 0) {
        Error(absl::StrCat("department '", department.id(),
                           "' has a negative desired minimum (",
                           department.desired_min(), ")"));
      }
    }
    for (const Coach& coach : input_.coaches()) {
      CheckUnique("coach", coach.id(), &coach_ids_);
      coach_department_[coach.id()] = coach.department_id();
      if (coach.capacity() <= 0) {
        Error(absl::StrCat("coach '", coach.id(),
                           "' has a non-positive capacity (", coach.capacity(),
                           ")"));
      }
      if (!coach.department_id().empty() &&
          !department_ids_.contains(coach.department_id())) {
        Error(absl::StrCat("coach '", coach.id(),
                           "' refers to unknown department '",
                           coach.department_id(), "'"));
      }
    }
    for (const Topic& topic : input_.topics()) {
      CheckTopic(topic);
    }
    absl::flat_hash_set<std::string> student_ids;
    for (const Student& student : input_.students()) {
      CheckUnique("student", student.id(), &student_ids);
      CheckStudent(student);
    }
  }

  const std::vector<ValidationIssue>& errors() const { return errors_; }
  const std::vector<ValidationIssue>& warnings() const { return warnings_; }

 private:
  void Error(std::string message) {
    errors_.push_back({ValidationIssue::kError, std::move(message)});
  }
  void Warning(std::string message) {
    warnings_.push_back({ValidationIssue::kWarning, std::move(message)});
  }

  void CheckUnique(absl::string_view kind, const std::string& id,
                   absl::flat_hash_set<std::string>* ids) {
    if (!ids->insert(id).second) {
      Error(absl::StrCat("duplicate ", kind, " id '", id, "'"));
    }
  }

  void CheckTopic(const Topic& topic) {
    CheckUnique("topic", topic.id(), &topic_ids_);
    if (topic.capacity() <= 0) {
      Error(absl::StrCat("topic '", topic.id(),
                         "' has a non-positive capacity (", topic.capacity(),
                         ")"));
    }
    if (!topic.department_id().empty() &&
        !department_ids_.contains(topic.department_id())) {
      Error(absl::StrCat("topic '", topic.id(),
                         "' refers to unknown department '",
                         topic.department_id(), "'"));
    }
    const auto coach = coach_department_.find(topic.coach_id());
    if (coach == coach_department_.end()) {
      Error(absl::StrCat("topic '", topic.id(), "' refers to unknown coach '",
                         topic.coach_id(), "'"));
    } else if (!topic.department_id().empty() && !coach->second.empty() &&
               topic.department_id() != coach->second) {
      Error(absl::StrCat("topic '", topic.id(), "' is in department '",
                         topic.department_id(), "' but its coach '",
                         topic.coach_id(), "' is in department '",
                         coach->second, "'"));
    }
  }

  void CheckStudent(const Student& student) {
    if (student.has_forced_topic()) {
      for (const std::string& banned : student.banned_topics()) {
        if (banned == student.forced_topic()) {
          Error(absl::StrCat("student '", student.id(), "' is forced to topic '",
                             student.forced_topic(),
                             "' which is in their banned list"));
          break;
        }
      }
      if (!topic_ids_.contains(student.forced_topic())) {
        Error(absl::StrCat("student '", student.id(),
                           "' is forced to unknown topic '",
                           student.forced_topic(), "'"));
      }
    }
    if (!student.plan()) return;
    CheckTopicList(student, "ranked", student.ranked_topics());
    CheckTopicList(student, "tier 1", student.tier1_topics());
    CheckTopicList(student, "tier 2", student.tier2_topics());
    CheckTopicList(student, "tier 3", student.tier3_topics());
    CheckTopicList(student, "banned", student.banned_topics());
  }

  void CheckTopicList(
      const Student& student, absl::string_view list,
      const google::protobuf::RepeatedPtrField<std::string>& topics) {
    for (const std::string& topic : topics) {
      if (!topic_ids_.contains(topic)) {
        Warning(absl::StrCat("student '", student.id(), "' has unknown ", list,
                             " topic '", topic, "'"));
      }
    }
  }

  const AllocationInput& input_;
  absl::flat_hash_set<std::string> department_ids_;
  absl::flat_hash_set<std::string> coach_ids_;
  absl::flat_hash_set<std::string> topic_ids_;
  absl::flat_hash_map<std::string, std::string> coach_department_;
  std::vector<ValidationIssue> errors_;
  std::vector<ValidationIssue> warnings_;
};

}  // namespace

std::string ValidationIssue::ToString() const {
  return absl::StrCat(severity == kError ? "[ERROR] " : "[WARNING] ",
                      message);
}

absl::Status ValidateAllocationInput(const AllocationInput& input,
                                     std::vector<ValidationIssue>* issues) {
  InputChecker checker(input);
  checker.Run();
  if (issues != nullptr) {
    issues->insert(issues->end(), checker.errors().begin(),
                   checker.errors().end());
    issues->insert(issues->end(), checker.warnings().begin(),
                   checker.warnings().end());
  }
  if (checker.errors().empty()) return absl::OkStatus();
  return absl::InvalidArgumentError(
      absl::StrCat(checker.errors().size(), " error(s) in the input, first: ",
                   checker.errors().front().message));
}

}  // namespace thesis_alloc

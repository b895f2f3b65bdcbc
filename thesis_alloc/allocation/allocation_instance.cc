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


#include "thesis_alloc/allocation/allocation_instance.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "thesis_alloc/allocation/allocation.pb.h"
#include "thesis_alloc/base/status_macros.h"

namespace thesis_alloc {

namespace {

// Adds `id` -> `index` to `map`, failing if `id` is already present.
absl::Status InsertUnique(absl::string_view kind, const std::string& id,
                          int index,
                          absl::flat_hash_map<std::string, int>* map) {
  if (!map->insert({id, index}).second) {
    return absl::InvalidArgumentError(
        absl::StrCat("duplicate ", kind, " id '", id, "'"));
  }
  return absl::OkStatus();
}

}  // namespace

int AllocationInstance::Lookup(
    const absl::flat_hash_map<std::string, int>& index, absl::string_view id) {
  const auto it = index.find(id);
  return it == index.end() ? kNoIndex : it->second;
}

absl::StatusOr<AllocationInstance> AllocationInstance::Create(
    const AllocationInput& input) {
  AllocationInstance instance(&input);

  for (int d = 0; d < input.departments_size(); ++d) {
    RETURN_IF_ERROR(InsertUnique("department", input.departments(d).id(), d,
                                 &instance.department_index_));
  }
  instance.department_topics_.resize(input.departments_size());

  for (int c = 0; c < input.coaches_size(); ++c) {
    const Coach& coach = input.coaches(c);
    RETURN_IF_ERROR(
        InsertUnique("coach", coach.id(), c, &instance.coach_index_));
    if (!coach.department_id().empty() &&
        instance.DepartmentIndex(coach.department_id()) == kNoIndex) {
      return absl::InvalidArgumentError(
          absl::StrCat("coach '", coach.id(), "' refers to unknown department '",
                       coach.department_id(), "'"));
    }
  }
  instance.coach_topics_.resize(input.coaches_size());

  instance.topic_coach_.reserve(input.topics_size());
  instance.topic_department_.reserve(input.topics_size());
  for (int t = 0; t < input.topics_size(); ++t) {
    const Topic& topic = input.topics(t);
    RETURN_IF_ERROR(
        InsertUnique("topic", topic.id(), t, &instance.topic_index_));
    const int coach = instance.CoachIndex(topic.coach_id());
    if (coach == kNoIndex) {
      return absl::InvalidArgumentError(
          absl::StrCat("topic '", topic.id(), "' refers to unknown coach '",
                       topic.coach_id(), "'"));
    }
    int department = kNoIndex;
    if (!topic.department_id().empty()) {
      department = instance.DepartmentIndex(topic.department_id());
      if (department == kNoIndex) {
        return absl::InvalidArgumentError(
            absl::StrCat("topic '", topic.id(),
                         "' refers to unknown department '",
                         topic.department_id(), "'"));
      }
      instance.department_topics_[department].push_back(t);
    }
    instance.topic_coach_.push_back(coach);
    instance.topic_department_.push_back(department);
    instance.coach_topics_[coach].push_back(t);
  }

  for (const Student& student : input.students()) {
    if (!student.plan()) continue;
    RETURN_IF_ERROR(InsertUnique("student", student.id(),
                                 instance.student_protos_.size(),
                                 &instance.student_index_));
    instance.student_protos_.push_back(&student);
  }

  int num_ignored_overrides = 0;
  for (const OverrideCost& override_cost : input.overrides()) {
    const int s = instance.StudentIndex(override_cost.student_id());
    const int t = instance.TopicIndex(override_cost.topic_id());
    if (s == kNoIndex || t == kNoIndex) {
      ++num_ignored_overrides;
      continue;
    }
    // The last override of a pair wins.
    instance.overrides_[{s, t}] = override_cost.cost();
  }
  if (num_ignored_overrides > 0) {
    VLOG(1) << num_ignored_overrides
            << " override(s) refer to an unknown topic or to a student not "
               "planning a thesis";
  }
  return instance;
}

int AllocationInstance::StudentIndex(absl::string_view id) const {
  return Lookup(student_index_, id);
}

int AllocationInstance::TopicIndex(absl::string_view id) const {
  return Lookup(topic_index_, id);
}

int AllocationInstance::CoachIndex(absl::string_view id) const {
  return Lookup(coach_index_, id);
}

int AllocationInstance::DepartmentIndex(absl::string_view id) const {
  return Lookup(department_index_, id);
}

std::optional<int64_t> AllocationInstance::FindOverrideCost(int s, int t) const {
  const auto it = overrides_.find({s, t});
  if (it == overrides_.end()) return std::nullopt;
  return it->second;
}

}  // namespace thesis_alloc

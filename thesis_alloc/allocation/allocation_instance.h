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


// Dense integer indexing of an AllocationInput: planning students, topics,
// coaches and departments are numbered in input order, and the relations
// between them (topic -> coach, topic -> department, coach -> topics, ...)
// are stored as plain vectors.
//
// An AllocationInstance keeps a pointer to the input it was created from; the
// input must outlive it.

#ifndef THESIS_ALLOC_ALLOCATION_ALLOCATION_INSTANCE_H_
#define THESIS_ALLOC_ALLOCATION_ALLOCATION_INSTANCE_H_

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "thesis_alloc/allocation/allocation.pb.h"

namespace thesis_alloc {

class AllocationInstance {
 public:
  // Returned by the *Index() lookups for unknown ids.
  static constexpr int kNoIndex = -1;

  // Returns InvalidArgumentError on duplicate ids, or when a topic or a coach
  // refers to an unknown coach or department. An empty department id means
  // "no department". Overrides naming unknown students or topics are ignored.
  // The instance keeps a pointer to `input`, which must outlive it and every
  // allocator built on it.
  static absl::StatusOr<AllocationInstance> Create(
      const AllocationInput& input);

  const AllocationInput& input() const { return *input_; }

  // Students with plan = true, in input order.
  int num_students() const { return student_protos_.size(); }
  const Student& student(int s) const { return *student_protos_[s]; }
  int StudentIndex(absl::string_view id) const;

  int num_topics() const { return input_->topics_size(); }
  const Topic& topic(int t) const { return input_->topics(t); }
  int TopicIndex(absl::string_view id) const;
  int topic_coach(int t) const { return topic_coach_[t]; }
  // kNoIndex if the topic has no department.
  int topic_department(int t) const { return topic_department_[t]; }
  int64_t topic_capacity(int t) const { return input_->topics(t).capacity(); }

  int num_coaches() const { return input_->coaches_size(); }
  const Coach& coach(int c) const { return input_->coaches(c); }
  int CoachIndex(absl::string_view id) const;
  int64_t coach_capacity(int c) const { return input_->coaches(c).capacity(); }
  absl::Span<const int> coach_topics(int c) const { return coach_topics_[c]; }

  int num_departments() const { return input_->departments_size(); }
  const Department& department(int d) const { return input_->departments(d); }
  int DepartmentIndex(absl::string_view id) const;
  int64_t department_min(int d) const {
    return input_->departments(d).desired_min();
  }
  absl::Span<const int> department_topics(int d) const {
    return department_topics_[d];
  }

  // The override cost of a (student, topic) pair, if any.
  std::optional<int64_t> FindOverrideCost(int s, int t) const;
  int num_overrides() const { return overrides_.size(); }

 private:
  explicit AllocationInstance(const AllocationInput* input) : input_(input) {}

  static int Lookup(const absl::flat_hash_map<std::string, int>& index,
                    absl::string_view id);

  const AllocationInput* input_;

  std::vector<const Student*> student_protos_;
  absl::flat_hash_map<std::string, int> student_index_;
  absl::flat_hash_map<std::string, int> topic_index_;
  absl::flat_hash_map<std::string, int> coach_index_;
  absl::flat_hash_map<std::string, int> department_index_;

  std::vector<int> topic_coach_;
  std::vector<int> topic_department_;
  std::vector<std::vector<int>> coach_topics_;
  std::vector<std::vector<int>> department_topics_;

  absl::flat_hash_map<std::pair<int, int>, int64_t> overrides_;
};

}  // namespace thesis_alloc

#endif  // THESIS_ALLOC_ALLOCATION_ALLOCATION_INSTANCE_H_

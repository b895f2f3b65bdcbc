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

#ifndef THESIS_ALLOC_BASE_TIMER_H_
#define THESIS_ALLOC_BASE_TIMER_H_

#include <cstdint>

#include "absl/time/clock.h"
#include "absl/time/time.h"

namespace thesis_alloc {

class WallTimer {
 public:
  WallTimer() { Reset(); }
  void Reset() {
    running_ = false;
    sum_ = 0;
  }
  // When Start() is called multiple times, only the most recent is used.
  void Start() {
    running_ = true;
    start_ = absl::GetCurrentTimeNanos();
  }
  void Stop() {
    if (running_) {
      sum_ += absl::GetCurrentTimeNanos() - start_;
      running_ = false;
    }
  }
  double Get() const { return GetNanos() * 1e-9; }
  int64_t GetInMs() const { return GetNanos() / 1000000; }
  absl::Duration GetDuration() const { return absl::Nanoseconds(GetNanos()); }
  bool IsRunning() const { return running_; }

 private:
  int64_t GetNanos() const {
    return running_ ? absl::GetCurrentTimeNanos() - start_ + sum_ : sum_;
  }

  bool running_;
  int64_t start_;
  int64_t sum_;
};

}  // namespace thesis_alloc

#endif  // THESIS_ALLOC_BASE_TIMER_H_

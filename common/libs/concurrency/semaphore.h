/*
 * Copyright (C) 2021 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <condition_variable>
#include <mutex>

namespace looplab {

// Counting semaphore bounding how many holders run at once.
class Semaphore {
 public:
  explicit Semaphore(const unsigned int init_val) : count_{init_val} {}

  void SemWait() {
    std::unique_lock<std::mutex> lock(mtx_);
    resource_cv_.wait(lock, [this]() -> bool { return count_ > 0; });
    --count_;
  }

  void SemPost() {
    std::unique_lock<std::mutex> lock(mtx_);
    ++count_;
    resource_cv_.notify_one();
  }

 private:
  std::mutex mtx_;
  std::condition_variable resource_cv_;
  unsigned int count_;
};

// Holds one unit of a Semaphore for its lifetime.
class ScopedSemaphoreSlot {
 public:
  explicit ScopedSemaphoreSlot(Semaphore& semaphore) : semaphore_(semaphore) {
    semaphore_.SemWait();
  }
  ~ScopedSemaphoreSlot() { semaphore_.SemPost(); }

  ScopedSemaphoreSlot(const ScopedSemaphoreSlot&) = delete;
  ScopedSemaphoreSlot& operator=(const ScopedSemaphoreSlot&) = delete;

 private:
  Semaphore& semaphore_;
};

}  // namespace looplab

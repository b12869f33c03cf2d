/*
 * Copyright (C) 2022 The Android Open Source Project
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

#include <chrono>
#include <string>
#include <vector>

#include <json/json.h>

#include "common/libs/utils/result.h"
#include "host/libs/config/build_target.h"
#include "host/libs/image/image_pipeline.h"
#include "host/libs/image/loop_device.h"

namespace looplab {

struct BuildOutcome {
  Arch arch;
  std::string image_path;
  bool ok = false;
  // Meaningful only when !ok.
  ErrorKind kind = ErrorKind::kInternal;
  std::string message;
  std::chrono::milliseconds elapsed{0};
};

struct BuildReport {
  // One per target, in target order.
  std::vector<BuildOutcome> outcomes;
  bool parallel = false;

  bool AllSucceeded() const;
  Json::Value ToJson() const;
  // "all architectures built" or the list of failed architectures.
  std::string Summary() const;
};

Result<void> WriteBuildReport(const BuildReport& report,
                              const std::string& path);

/*
 * Builds one image per target.
 *
 * Loop devices left behind by an interrupted earlier run are detached first,
 * looking only at each target's own image. The builds then run one after the
 * other or concurrently, at most `max_parallel` at a time. Running under
 * continuous integration always builds serially.
 *
 * Every target gets an outcome; a failing build never stops the others.
 */
class BuildOrchestrator {
 public:
  BuildOrchestrator(ImageBuilder& builder, LoopDeviceManager& loops,
                    ExecutionContext context);

  // Fails only when the target set itself is unusable.
  Result<BuildReport> BuildAll(const std::vector<BuildTarget>& targets);

 private:
  bool RunInParallel(size_t target_count) const;
  Result<void> ReclaimStaleLoops(const BuildTarget& target);
  BuildOutcome BuildOne(const BuildTarget& target);

  ImageBuilder& builder_;
  LoopDeviceManager& loops_;
  ExecutionContext context_;
};

}  // namespace looplab

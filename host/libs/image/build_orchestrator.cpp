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

#include "host/libs/image/build_orchestrator.h"

#include <chrono>
#include <future>
#include <optional>
#include <string>
#include <vector>

#include <android-base/logging.h>
#include <android-base/strings.h>
#include <json/json.h>

#include "common/libs/concurrency/semaphore.h"
#include "common/libs/utils/json.h"
#include "common/libs/utils/result.h"

namespace looplab {
namespace {

using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

BuildOutcome FailedOutcome(const BuildTarget& target,
                           const StackTraceError& error,
                           milliseconds elapsed) {
  BuildOutcome outcome;
  outcome.arch = target.arch;
  outcome.image_path = target.image_path;
  outcome.ok = false;
  outcome.kind = error.Kind();
  outcome.message = error.Message();
  outcome.elapsed = elapsed;
  return outcome;
}

}  // namespace

bool BuildReport::AllSucceeded() const {
  for (const auto& outcome : outcomes) {
    if (!outcome.ok) {
      return false;
    }
  }
  return !outcomes.empty();
}

Json::Value BuildReport::ToJson() const {
  Json::Value root;
  root["parallel"] = parallel;
  root["success"] = AllSucceeded();
  Json::Value builds(Json::arrayValue);
  for (const auto& outcome : outcomes) {
    Json::Value build;
    build["arch"] = ArchTag(outcome.arch);
    build["image"] = outcome.image_path;
    build["ok"] = outcome.ok;
    build["elapsed_ms"] = static_cast<Json::Int64>(outcome.elapsed.count());
    if (!outcome.ok) {
      build["error_kind"] = ErrorKindName(outcome.kind);
      build["error"] = outcome.message;
    }
    builds.append(build);
  }
  root["builds"] = builds;
  return root;
}

std::string BuildReport::Summary() const {
  std::vector<std::string> failed;
  for (const auto& outcome : outcomes) {
    if (!outcome.ok) {
      failed.emplace_back(ArchTag(outcome.arch));
    }
  }
  if (failed.empty()) {
    return "all architectures built";
  }
  return "some builds failed: " + android::base::Join(failed, ", ");
}

Result<void> WriteBuildReport(const BuildReport& report,
                              const std::string& path) {
  LL_EXPECT(WriteToFile(report.ToJson(), path),
            "Could not write the build report");
  return {};
}

BuildOrchestrator::BuildOrchestrator(ImageBuilder& builder,
                                     LoopDeviceManager& loops,
                                     ExecutionContext context)
    : builder_(builder), loops_(loops), context_(context) {}

bool BuildOrchestrator::RunInParallel(size_t target_count) const {
  if (!context_.parallel || target_count < 2) {
    return false;
  }
  if (context_.continuous_integration) {
    LOG(INFO) << "Continuous integration environment, building serially";
    return false;
  }
  return true;
}

Result<void> BuildOrchestrator::ReclaimStaleLoops(const BuildTarget& target) {
  const auto tag = StageTag(target, "reclaim");
  auto start = steady_clock::now();
  auto detached = LL_EXPECT(loops_.DetachStaleLoops(target.image_path));
  auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start);
  if (detached.empty()) {
    LOG(DEBUG) << tag << " No stale loop devices (" << elapsed.count()
               << " ms)";
  } else {
    LOG(INFO) << tag << " Detached " << android::base::Join(detached, ", ")
              << " in " << elapsed.count() << " ms";
  }
  return {};
}

BuildOutcome BuildOrchestrator::BuildOne(const BuildTarget& target) {
  const auto tag = StageTag(target, "build");
  auto start = steady_clock::now();
  auto result = builder_.Build(target);
  auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start);
  if (!result.ok()) {
    LOG(ERROR) << tag << " Failed after " << elapsed.count() << " ms ("
               << result.error().Kind() << "): " << result.error().Trace();
    return FailedOutcome(target, result.error(), elapsed);
  }
  LOG(INFO) << tag << " Succeeded in " << elapsed.count() << " ms";
  BuildOutcome outcome;
  outcome.arch = target.arch;
  outcome.image_path = target.image_path;
  outcome.ok = true;
  outcome.elapsed = elapsed;
  return outcome;
}

Result<BuildReport> BuildOrchestrator::BuildAll(
    const std::vector<BuildTarget>& targets) {
  if (targets.empty()) {
    return LL_ERR_KIND(ErrorKind::kPreconditionViolation,
                       "No architectures to build");
  }
  LL_EXPECT(ValidateDistinctResources(targets));

  BuildReport report;
  report.parallel = RunInParallel(targets.size());
  report.outcomes.resize(targets.size());

  std::vector<bool> runnable(targets.size(), true);
  for (size_t i = 0; i < targets.size(); i++) {
    auto reclaimed = ReclaimStaleLoops(targets[i]);
    if (!reclaimed.ok()) {
      LOG(ERROR) << StageTag(targets[i], "reclaim")
                 << " Could not reclaim stale loop devices: "
                 << reclaimed.error().Message();
      report.outcomes[i] = FailedOutcome(targets[i], reclaimed.error(),
                                         milliseconds(0));
      runnable[i] = false;
    }
  }

  if (!report.parallel) {
    for (size_t i = 0; i < targets.size(); i++) {
      if (runnable[i]) {
        report.outcomes[i] = BuildOne(targets[i]);
      }
    }
  } else {
    unsigned int slots = context_.max_parallel;
    if (slots == 0 || slots > targets.size()) {
      slots = targets.size();
    }
    LOG(INFO) << "Building " << targets.size() << " images, " << slots
              << " at a time";
    Semaphore gate(slots);
    std::vector<std::optional<std::future<BuildOutcome>>> builds(
        targets.size());
    for (size_t i = 0; i < targets.size(); i++) {
      if (!runnable[i]) {
        continue;
      }
      const auto& target = targets[i];
      builds[i] = std::async(std::launch::async, [this, &gate, &target]() {
        ScopedSemaphoreSlot slot(gate);
        return BuildOne(target);
      });
    }
    // Every future is waited on before `gate` goes out of scope.
    for (size_t i = 0; i < builds.size(); i++) {
      if (builds[i]) {
        report.outcomes[i] = builds[i]->get();
      }
    }
  }

  LOG(INFO) << report.Summary();
  return report;
}

}  // namespace looplab

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

#include "host/libs/image/loop_device.h"

#include <chrono>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <android-base/logging.h>
#include <android-base/strings.h>
#include <fmt/core.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/process_runner.h"
#include "common/libs/utils/result.h"
#include "common/libs/utils/subprocess.h"

namespace looplab {
namespace {

constexpr char kLosetup[] = "losetup";

bool IsExhaustionMessage(const std::string& message) {
  // util-linux wording differs between versions.
  return message.find("cannot find an unused loop device") !=
             std::string::npos ||
         message.find("could not find any free loop device") !=
             std::string::npos ||
         message.find("No free loop device") != std::string::npos;
}

}  // namespace

LoopBinding::LoopBinding(LoopDeviceManager* manager, std::string device,
                         std::string image_path)
    : manager_(manager),
      device_(std::move(device)),
      image_path_(std::move(image_path)) {}

LoopBinding::LoopBinding(LoopBinding&& other)
    : manager_(other.manager_),
      device_(std::move(other.device_)),
      image_path_(std::move(other.image_path_)) {
  other.manager_ = nullptr;
}

LoopBinding& LoopBinding::operator=(LoopBinding&& other) {
  if (this != &other) {
    Release();
    manager_ = other.manager_;
    device_ = std::move(other.device_);
    image_path_ = std::move(other.image_path_);
    other.manager_ = nullptr;
  }
  return *this;
}

LoopBinding::~LoopBinding() { Release(); }

std::string LoopBinding::PartitionDevice(int index) const {
  return fmt::format("{}p{}", device_, index);
}

void LoopBinding::Release() {
  if (manager_ != nullptr) {
    manager_->ReleaseLoop(*this);
  }
}

LoopDeviceManager::LoopDeviceManager(ProcessRunner& runner,
                                     PartitionWaitPolicy wait_policy)
    : LoopDeviceManager(runner, wait_policy, [](const std::string& path) {
        return FileExists(path);
      }) {}

LoopDeviceManager::LoopDeviceManager(ProcessRunner& runner,
                                     PartitionWaitPolicy wait_policy,
                                     NodeProbe node_exists)
    : runner_(runner),
      wait_policy_(wait_policy),
      node_exists_(std::move(node_exists)) {}

Result<LoopBinding> LoopDeviceManager::AcquireLoop(
    const std::string& image_path) {
  LL_EXPECTF(FileExists(image_path), "Image \"{}\" does not exist",
             image_path);
  Command losetup(kLosetup);
  losetup.AddParameter("--find");
  losetup.AddParameter("--show");
  losetup.AddParameter("--partscan");
  losetup.AddParameter(image_path);
  std::string stdout_str;
  std::string stderr_str;
  int exit_code =
      runner_.Run(std::move(losetup), nullptr, &stdout_str, &stderr_str);
  if (exit_code != 0) {
    if (IsExhaustionMessage(stderr_str)) {
      return LL_ERR_KIND(ErrorKind::kResourceExhaustion,
                         "No free loop device for \""
                             << image_path
                             << "\": " << android::base::Trim(stderr_str));
    }
    return LL_ERR_KIND(ErrorKind::kSubprocessFailure,
                       "losetup failed for \"" << image_path << "\" with "
                                               << exit_code << ": "
                                               << android::base::Trim(stderr_str));
  }
  auto device = android::base::Trim(stdout_str);
  if (device.empty() || !android::base::StartsWith(device, "/dev/")) {
    return LL_ERR_KIND(ErrorKind::kSubprocessFailure,
                       "losetup printed no device for \""
                           << image_path << "\": \"" << stdout_str << "\"");
  }
  LOG(INFO) << "Attached " << image_path << " to " << device;
  return LoopBinding(this, device, image_path);
}

Result<void> LoopDeviceManager::WaitForPartitions(const LoopBinding& binding,
                                                  int count) {
  LL_EXPECT(!binding.Released(), "Waiting on a released loop binding");
  auto deadline = std::chrono::steady_clock::now() + wait_policy_.timeout;
  while (true) {
    std::vector<std::string> missing;
    for (int i = 1; i <= count; i++) {
      auto node = binding.PartitionDevice(i);
      if (!node_exists_(node)) {
        missing.emplace_back(node);
      }
    }
    if (missing.empty()) {
      return {};
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return LL_ERR_KIND(
          ErrorKind::kTimingAnomaly,
          "Partition nodes " << android::base::Join(missing, ", ")
                             << " did not appear within "
                             << wait_policy_.timeout.count() << " ms");
    }
    std::this_thread::sleep_for(wait_policy_.step);
  }
}

void LoopDeviceManager::ReleaseLoop(LoopBinding& binding) {
  if (binding.manager_ == nullptr) {
    LOG(VERBOSE) << "Loop device " << binding.device_ << " already released";
    return;
  }
  binding.manager_ = nullptr;
  if (Detach(binding.device_)) {
    LOG(INFO) << "Detached " << binding.device_ << " from "
              << binding.image_path_;
  }
}

bool LoopDeviceManager::Detach(const std::string& device) {
  Command losetup(kLosetup);
  losetup.AddParameter("-d");
  losetup.AddParameter(device);
  auto result = RunCommand(runner_, std::move(losetup));
  if (!result.ok()) {
    LOG(WARNING) << ErrorKind::kResourceTeardownRace << ": could not detach "
                 << device << ", treating it as already gone: "
                 << result.error().Message();
    return false;
  }
  return true;
}

Result<std::vector<std::string>> LoopDeviceManager::DetachStaleLoops(
    const std::string& image_path) {
  if (!FileExists(image_path)) {
    return std::vector<std::string>{};
  }
  Command losetup(kLosetup);
  losetup.AddParameter("--noheadings");
  losetup.AddParameter("--output");
  losetup.AddParameter("NAME");
  losetup.AddParameter("--associated");
  losetup.AddParameter(image_path);
  auto listing = LL_EXPECTF(RunCommand(runner_, std::move(losetup)),
                            "Could not list loop devices backed by \"{}\"",
                            image_path);
  std::vector<std::string> detached;
  for (const auto& line : android::base::Split(listing, "\n")) {
    auto device = android::base::Trim(line);
    if (device.empty()) {
      continue;
    }
    LOG(INFO) << "Detaching stale " << device << " backed by " << image_path;
    if (Detach(device)) {
      detached.emplace_back(device);
    }
  }
  return detached;
}

}  // namespace looplab

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

#include <functional>
#include <string>
#include <vector>

#include "common/libs/utils/process_runner.h"
#include "common/libs/utils/result.h"
#include "host/libs/config/build_target.h"

namespace looplab {

class LoopDeviceManager;

/*
 * An image file attached to a loop device with partition scanning enabled.
 *
 * The device is detached when the binding is destroyed or released, whichever
 * comes first. Releasing more than once is a no-op.
 */
class LoopBinding {
 public:
  LoopBinding(LoopBinding&& other);
  LoopBinding& operator=(LoopBinding&& other);
  ~LoopBinding();

  const std::string& Device() const { return device_; }
  const std::string& ImagePath() const { return image_path_; }
  // "/dev/loop7" and 2 give "/dev/loop7p2".
  std::string PartitionDevice(int index) const;
  bool Released() const { return manager_ == nullptr; }

  void Release();

 private:
  friend class LoopDeviceManager;
  LoopBinding(LoopDeviceManager* manager, std::string device,
              std::string image_path);

  LoopBinding(const LoopBinding&) = delete;
  LoopBinding& operator=(const LoopBinding&) = delete;

  LoopDeviceManager* manager_;
  std::string device_;
  std::string image_path_;
};

class LoopDeviceManager {
 public:
  using NodeProbe = std::function<bool(const std::string&)>;

  LoopDeviceManager(ProcessRunner& runner, PartitionWaitPolicy wait_policy);
  // `node_exists` decides whether a partition device node is present.
  LoopDeviceManager(ProcessRunner& runner, PartitionWaitPolicy wait_policy,
                    NodeProbe node_exists);

  // Fails with ErrorKind::kResourceExhaustion when no loop device is free.
  Result<LoopBinding> AcquireLoop(const std::string& image_path);

  // Polls until partitions 1..`count` of `binding` have device nodes. Fails
  // with ErrorKind::kTimingAnomaly once the wait policy runs out.
  Result<void> WaitForPartitions(const LoopBinding& binding, int count);

  // Detaches the device. Never fails, a device that is already gone is only
  // logged.
  void ReleaseLoop(LoopBinding& binding);

  // Detaches every loop device still backed by `image_path` and returns their
  // names. Devices backed by other files are never touched.
  Result<std::vector<std::string>> DetachStaleLoops(
      const std::string& image_path);

 private:
  bool Detach(const std::string& device);

  ProcessRunner& runner_;
  PartitionWaitPolicy wait_policy_;
  NodeProbe node_exists_;
};

}  // namespace looplab

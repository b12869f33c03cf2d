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

#include <string>
#include <vector>

#include "common/libs/utils/process_runner.h"
#include "common/libs/utils/result.h"

namespace looplab {

class Mounter;

// One active mount. Unmounted when destroyed unless already unmounted.
class MountPoint {
 public:
  MountPoint(MountPoint&& other);
  MountPoint& operator=(MountPoint&& other);
  ~MountPoint();

  const std::string& Source() const { return source_; }
  const std::string& Target() const { return target_; }
  // Empty for bind mounts.
  const std::string& FsType() const { return fstype_; }
  bool Mounted() const { return mounter_ != nullptr; }

  void Unmount();

 private:
  friend class Mounter;
  MountPoint(Mounter* mounter, std::string source, std::string target,
             std::string fstype);

  MountPoint(const MountPoint&) = delete;
  MountPoint& operator=(const MountPoint&) = delete;

  Mounter* mounter_;
  std::string source_;
  std::string target_;
  std::string fstype_;
};

class Mounter {
 public:
  explicit Mounter(ProcessRunner& runner);

  // Mounts `device` of type `fstype` on `target`, creating `target` first.
  // Fails with ErrorKind::kMountFailed.
  Result<MountPoint> Mount(const std::string& device, const std::string& target,
                           const std::string& fstype);
  // Bind mounts the host directory `source` on `target`.
  Result<MountPoint> Bind(const std::string& source, const std::string& target);

  // Never fails. A busy target is detached lazily, a target that is no longer
  // mounted is only logged.
  void Unmount(MountPoint& mount_point);

 private:
  Result<MountPoint> DoMount(Command command, const std::string& source,
                             const std::string& target,
                             const std::string& fstype);

  ProcessRunner& runner_;
};

/*
 * Nested mounts torn down in exact reverse order of setup.
 *
 *     MountStack mounts;
 *     mounts.Push(LL_EXPECT(mounter.Mount(root_dev, dir, "ext4")));
 *     mounts.Push(LL_EXPECT(mounter.Mount(esp_dev, dir + "/boot/efi", "vfat")));
 *     // leaving the scope unmounts dir/boot/efi, then dir
 */
class MountStack {
 public:
  MountStack() = default;
  MountStack(MountStack&&) = default;
  ~MountStack();

  void Push(MountPoint mount_point);
  size_t Size() const { return mounts_.size(); }
  bool Empty() const { return mounts_.empty(); }
  const MountPoint& Top() const { return mounts_.back(); }

  // Unmounts and removes the most recent mount.
  void Pop();
  void UnmountAll();

 private:
  MountStack(const MountStack&) = delete;
  MountStack& operator=(const MountStack&) = delete;

  std::vector<MountPoint> mounts_;
};

}  // namespace looplab

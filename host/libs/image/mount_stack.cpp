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

#include "host/libs/image/mount_stack.h"

#include <string>
#include <utility>

#include <android-base/logging.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/process_runner.h"
#include "common/libs/utils/result.h"
#include "common/libs/utils/subprocess.h"

namespace looplab {
namespace {

constexpr char kMount[] = "mount";
constexpr char kUmount[] = "umount";

}  // namespace

MountPoint::MountPoint(Mounter* mounter, std::string source, std::string target,
                       std::string fstype)
    : mounter_(mounter),
      source_(std::move(source)),
      target_(std::move(target)),
      fstype_(std::move(fstype)) {}

MountPoint::MountPoint(MountPoint&& other)
    : mounter_(other.mounter_),
      source_(std::move(other.source_)),
      target_(std::move(other.target_)),
      fstype_(std::move(other.fstype_)) {
  other.mounter_ = nullptr;
}

MountPoint& MountPoint::operator=(MountPoint&& other) {
  if (this != &other) {
    Unmount();
    mounter_ = other.mounter_;
    source_ = std::move(other.source_);
    target_ = std::move(other.target_);
    fstype_ = std::move(other.fstype_);
    other.mounter_ = nullptr;
  }
  return *this;
}

MountPoint::~MountPoint() { Unmount(); }

void MountPoint::Unmount() {
  if (mounter_ != nullptr) {
    mounter_->Unmount(*this);
  }
}

Mounter::Mounter(ProcessRunner& runner) : runner_(runner) {}

Result<MountPoint> Mounter::Mount(const std::string& device,
                                  const std::string& target,
                                  const std::string& fstype) {
  Command mount(kMount);
  mount.AddParameter("-t");
  mount.AddParameter(fstype);
  mount.AddParameter(device);
  mount.AddParameter(target);
  return DoMount(std::move(mount), device, target, fstype);
}

Result<MountPoint> Mounter::Bind(const std::string& source,
                                 const std::string& target) {
  Command mount(kMount);
  mount.AddParameter("--bind");
  mount.AddParameter(source);
  mount.AddParameter(target);
  return DoMount(std::move(mount), source, target, "");
}

Result<MountPoint> Mounter::DoMount(Command command, const std::string& source,
                                    const std::string& target,
                                    const std::string& fstype) {
  auto created = EnsureDirectoryExists(target);
  if (!created.ok()) {
    return LL_ERR_KIND(ErrorKind::kMountFailed,
                       "Could not create mount point \""
                           << target << "\": " << created.error().Message());
  }
  auto mounted = RunCommand(runner_, std::move(command));
  if (!mounted.ok()) {
    return LL_ERR_KIND(ErrorKind::kMountFailed,
                       "Mounting \"" << source << "\" on \"" << target
                                     << "\" failed: "
                                     << mounted.error().Message());
  }
  LOG(DEBUG) << "Mounted " << source << " on " << target
             << (fstype.empty() ? " (bind)" : " as " + fstype);
  return MountPoint(this, source, target, fstype);
}

void Mounter::Unmount(MountPoint& mount_point) {
  if (mount_point.mounter_ == nullptr) {
    LOG(VERBOSE) << mount_point.target_ << " already unmounted";
    return;
  }
  mount_point.mounter_ = nullptr;
  Command umount(kUmount);
  umount.AddParameter(mount_point.target_);
  auto result = RunCommand(runner_, std::move(umount));
  if (result.ok()) {
    LOG(DEBUG) << "Unmounted " << mount_point.target_;
    return;
  }
  LOG(WARNING) << "umount " << mount_point.target_
               << " failed, retrying lazily: " << result.error().Message();
  Command lazy_umount(kUmount);
  lazy_umount.AddParameter("--lazy");
  lazy_umount.AddParameter(mount_point.target_);
  auto lazy_result = RunCommand(runner_, std::move(lazy_umount));
  if (!lazy_result.ok()) {
    LOG(WARNING) << ErrorKind::kResourceTeardownRace << ": "
                 << mount_point.target_
                 << " is not mounted anymore: " << lazy_result.error().Message();
  }
}

MountStack::~MountStack() { UnmountAll(); }

void MountStack::Push(MountPoint mount_point) {
  mounts_.emplace_back(std::move(mount_point));
}

void MountStack::Pop() {
  if (mounts_.empty()) {
    return;
  }
  mounts_.back().Unmount();
  mounts_.pop_back();
}

void MountStack::UnmountAll() {
  while (!mounts_.empty()) {
    Pop();
  }
}

}  // namespace looplab

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

#include "host/libs/image/rootfs_import.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <android-base/logging.h>

#include "common/libs/utils/archive.h"
#include "common/libs/utils/files.h"
#include "common/libs/utils/process_runner.h"
#include "common/libs/utils/result.h"
#include "common/libs/utils/subprocess.h"
#include "host/libs/image/guest_configuration.h"

namespace looplab {
namespace {

// Bound into the tree for the duration of the chroot, in mount order.
const std::vector<std::string>& PseudoFilesystems() {
  static const std::vector<std::string> kPseudoFilesystems = {
      "/proc",
      "/sys",
      "/dev",
      "/dev/pts",
  };
  return kPseudoFilesystems;
}

}  // namespace

std::string EspMountPoint(const std::string& mount_point) {
  return mount_point + "/boot/efi";
}

std::string EspBootDir(const std::string& mount_point) {
  return EspMountPoint(mount_point) + "/" + kEspBootDir;
}

Result<MountStack> MountImageTree(Mounter& mounter, const LoopBinding& loop,
                                  const std::string& mount_point) {
  MountStack mounts;
  mounts.Push(LL_EXPECT(mounter.Mount(loop.PartitionDevice(kRootPartition),
                                      mount_point, "ext4")));
  mounts.Push(LL_EXPECT(mounter.Mount(loop.PartitionDevice(kEspPartition),
                                      EspMountPoint(mount_point), "vfat")));
  LL_EXPECT(EnsureDirectoryExists(EspBootDir(mount_point)));
  return std::move(mounts);
}

RootfsImportStage::RootfsImportStage(ProcessRunner& runner, Mounter& mounter,
                                     FilesystemProbe& probe,
                                     RootfsCache* cache)
    : runner_(runner), mounter_(mounter), probe_(probe), cache_(cache) {}

Result<PartitionedImage> RootfsImportStage::Run(const BuildTarget& target,
                                                const LoopBinding& loop,
                                                const ImportOptions& options) {
  const auto tag = StageTag(target, "import");
  LL_EXPECT(ValidateImportOptions(options));
  if (!FileExists(target.rootfs_tarball)) {
    return LL_ERR_KIND(ErrorKind::kPreconditionViolation,
                       "Rootfs tarball \"" << target.rootfs_tarball
                                           << "\" does not exist");
  }

  std::optional<std::string> cache_key;
  std::optional<std::string> cached_tree;
  if (cache_ != nullptr) {
    cache_key = LL_EXPECT(cache_->KeyFor(target, options));
    cached_tree = LL_EXPECT(cache_->Lookup(*cache_key));
  }

  if (cached_tree) {
    LOG(INFO) << tag << " Configured tree cache hit " << *cache_key;
    LL_EXPECT(cache_->Restore(*cached_tree, target.mount_point));
  } else {
    LL_EXPECT(Populate(target, options));
    if (cache_key) {
      auto stored = cache_->Store(*cache_key, target.mount_point, target,
                                  options);
      if (!stored.ok()) {
        LOG(WARNING) << tag << " Could not cache the configured tree: "
                     << stored.error().Message();
      }
    }
  }

  LOG(INFO) << tag << " Reading filesystem UUIDs";
  auto partitions = LL_EXPECT(ProbePartitions(probe_, loop));
  LL_EXPECT(WriteFstab(target.mount_point, partitions));
  return partitions;
}

Result<void> RootfsImportStage::Populate(const BuildTarget& target,
                                         const ImportOptions& options) {
  const auto tag = StageTag(target, "import");
  LOG(INFO) << tag << " Unpacking " << target.rootfs_tarball << " into "
            << target.mount_point;
  Archive rootfs(target.rootfs_tarball, runner_);
  LL_EXPECT(rootfs.ExtractAll(target.mount_point));

  LOG(INFO) << tag << " Copying host name resolution files";
  LL_EXPECT(CopyHostNameResolution(target.mount_point, options));

  LL_EXPECT(ConfigureInChroot(target, options));
  return {};
}

Result<void> RootfsImportStage::CopyHostNameResolution(
    const std::string& tree, const ImportOptions& options) {
  const auto etc = tree + "/etc";
  LL_EXPECT(EnsureDirectoryExists(etc));
  const std::vector<std::pair<std::string, std::string>> files = {
      {options.host_resolv_conf, etc + "/resolv.conf"},
      {options.host_hosts, etc + "/hosts"},
  };
  for (const auto& [host_file, tree_file] : files) {
    // The tree's copy is often a symlink that resolves outside of it.
    if (FileExists(tree_file, /* follow_symlinks */ false)) {
      LL_EXPECTF(RemoveFile(tree_file), "Could not remove \"{}\"", tree_file);
    }
    LL_EXPECTF(Copy(host_file, tree_file), "Could not copy \"{}\" to \"{}\"",
               host_file, tree_file);
  }
  return {};
}

Result<void> RootfsImportStage::ConfigureInChroot(
    const BuildTarget& target, const ImportOptions& options) {
  const auto tag = StageTag(target, "import");
  MountStack pseudo_mounts;
  for (const auto& fs : PseudoFilesystems()) {
    LOG(INFO) << tag << " Binding " << fs;
    pseudo_mounts.Push(LL_EXPECT(mounter_.Bind(fs, target.mount_point + fs)));
  }

  LOG(INFO) << tag << " Configuring the system in a chroot";
  auto script = GuestConfigurationScript(target.Info(), options);
  Command chroot("chroot");
  chroot.AddParameter(target.mount_point);
  chroot.AddParameter("/bin/bash");
  chroot.AddParameter("-euo");
  chroot.AddParameter("pipefail");
  chroot.AddEnvironmentVariable("DEBIAN_FRONTEND", "noninteractive");
  LL_EXPECT(RunCommand(runner_, std::move(chroot), &script),
            "Configuration inside the chroot failed");
  LOG(INFO) << tag << " Chroot configuration complete";
  return {};
}

Result<void> RootfsImportStage::WriteFstab(const std::string& tree,
                                           const PartitionedImage& partitions) {
  LL_EXPECT(!partitions.root.uuid.empty(), "Root partition has no UUID");
  LL_EXPECT(!partitions.esp.uuid.empty(), "ESP has no UUID");
  LL_EXPECT(EnsureDirectoryExists(tree + "/etc"));
  LL_EXPECT(WriteNewFile(tree + "/etc/fstab",
                         FstabContents(partitions.root.uuid,
                                       partitions.esp.uuid)));
  return {};
}

}  // namespace looplab

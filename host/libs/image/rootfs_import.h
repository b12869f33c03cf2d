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

#include "common/libs/utils/process_runner.h"
#include "common/libs/utils/result.h"
#include "host/libs/config/build_target.h"
#include "host/libs/image/filesystem_probe.h"
#include "host/libs/image/loop_device.h"
#include "host/libs/image/mount_stack.h"
#include "host/libs/image/partition_stage.h"
#include "host/libs/image/rootfs_cache.h"

namespace looplab {

// Directory of the removable media boot files, relative to the ESP root.
constexpr char kEspBootDir[] = "EFI/BOOT";

// "<mount_point>/boot/efi"
std::string EspMountPoint(const std::string& mount_point);
// "<mount_point>/boot/efi/EFI/BOOT"
std::string EspBootDir(const std::string& mount_point);

/*
 * Mounts the root partition of `loop` at `mount_point` and the ESP on top of
 * it at boot/efi, then creates EFI/BOOT on the ESP. The returned stack
 * unmounts both, ESP first.
 */
Result<MountStack> MountImageTree(Mounter& mounter, const LoopBinding& loop,
                                  const std::string& mount_point);

/*
 * Populates and configures the root filesystem of an image whose partitions
 * are mounted by MountImageTree.
 *
 * The rootfs tarball is unpacked, the host's name resolution files are copied
 * in, and the configuration script runs in a chroot with /proc, /sys, /dev and
 * /dev/pts bound from the host. These pseudo filesystem mounts are removed
 * before Run returns, on success and on failure. Finally /etc/fstab is written
 * from the filesystem UUIDs.
 *
 * With a cache the unpack and chroot steps are replaced by a cached tree when
 * one with a matching key exists, and a fresh tree is cached otherwise.
 */
class RootfsImportStage {
 public:
  // `cache` may be null.
  RootfsImportStage(ProcessRunner& runner, Mounter& mounter,
                    FilesystemProbe& probe, RootfsCache* cache);

  Result<PartitionedImage> Run(const BuildTarget& target,
                               const LoopBinding& loop,
                               const ImportOptions& options);

 private:
  Result<void> Populate(const BuildTarget& target,
                        const ImportOptions& options);
  Result<void> CopyHostNameResolution(const std::string& tree,
                                      const ImportOptions& options);
  Result<void> ConfigureInChroot(const BuildTarget& target,
                                 const ImportOptions& options);
  Result<void> WriteFstab(const std::string& tree,
                          const PartitionedImage& partitions);

  ProcessRunner& runner_;
  Mounter& mounter_;
  FilesystemProbe& probe_;
  RootfsCache* cache_;
};

}  // namespace looplab

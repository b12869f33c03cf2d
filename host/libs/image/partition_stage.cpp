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

#include "host/libs/image/partition_stage.h"

#include <string>
#include <utility>

#include <android-base/logging.h>
#include <fmt/core.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/process_runner.h"
#include "common/libs/utils/result.h"
#include "common/libs/utils/subprocess.h"

namespace looplab {
namespace {

constexpr char kSgdisk[] = "sgdisk";

}  // namespace

PartitionStage::PartitionStage(ProcessRunner& runner, LoopDeviceManager& loops,
                               FilesystemProbe& probe)
    : runner_(runner), loops_(loops), probe_(probe) {}

Result<PartitionedImage> PartitionStage::Run(const BuildTarget& target) {
  const auto tag = StageTag(target, "partition");
  if (target.image_size_bytes < kEspSizeBytes + kMinRootSizeBytes) {
    return LL_ERR_KIND(ErrorKind::kPreconditionViolation,
                       "Image size " << target.image_size_bytes
                                     << " is too small for a "
                                     << kEspSizeBytes << " byte ESP");
  }

  LOG(INFO) << tag << " Allocating " << target.image_size_bytes
            << " bytes at " << target.image_path;
  LL_EXPECT(EnsureDirectoryExists(cpp_dirname(target.image_path)));
  LL_EXPECT(CreateSparseFile(target.image_path,
                             static_cast<off_t>(target.image_size_bytes)));

  LOG(INFO) << tag << " Attaching " << target.image_path;
  auto loop = LL_EXPECT(loops_.AcquireLoop(target.image_path));

  LL_EXPECT(WritePartitionTable(target, loop));
  LL_EXPECT(loops_.WaitForPartitions(loop, kPartitionCount));
  LL_EXPECT(Format(target, loop));

  LOG(INFO) << tag << " Verifying partition layout";
  auto partitions = LL_EXPECT(ProbePartitions(probe_, loop));
  LOG(INFO) << tag << " ESP UUID " << partitions.esp.uuid << ", root UUID "
            << partitions.root.uuid;
  return partitions;
}

Result<void> PartitionStage::WritePartitionTable(const BuildTarget& target,
                                                 const LoopBinding& loop) {
  const auto tag = StageTag(target, "partition");

  LOG(INFO) << tag << " Clearing partition tables on " << loop.Device();
  Command zap(kSgdisk);
  zap.AddParameter("--zap-all");
  zap.AddParameter(loop.Device());
  LL_EXPECT(RunCommand(runner_, std::move(zap)));

  LOG(INFO) << tag << " Creating EFI system partition";
  Command esp(kSgdisk);
  esp.AddParameter("-n", kEspPartition, ":0:+", kEspSizeBytes >> 20, "M");
  esp.AddParameter("-t", kEspPartition, ":EF00");
  esp.AddParameter("-c", kEspPartition, ":", kEspLabel);
  esp.AddParameter(loop.Device());
  LL_EXPECT(RunCommand(runner_, std::move(esp)));

  LOG(INFO) << tag << " Creating root partition";
  Command root(kSgdisk);
  root.AddParameter("-n", kRootPartition, ":0:0");
  root.AddParameter("-t", kRootPartition, ":8300");
  root.AddParameter("-c", kRootPartition, ":", kRootLabel);
  root.AddParameter(loop.Device());
  LL_EXPECT(RunCommand(runner_, std::move(root)));
  return {};
}

Result<void> PartitionStage::Format(const BuildTarget& target,
                                    const LoopBinding& loop) {
  const auto tag = StageTag(target, "partition");
  const auto esp_device = loop.PartitionDevice(kEspPartition);
  const auto root_device = loop.PartitionDevice(kRootPartition);

  LOG(INFO) << tag << " Formatting " << esp_device << " as FAT32";
  Command mkfs_vfat("mkfs.vfat");
  mkfs_vfat.AddParameter("-F");
  mkfs_vfat.AddParameter("32");
  mkfs_vfat.AddParameter("-n");
  mkfs_vfat.AddParameter(kEspLabel);
  mkfs_vfat.AddParameter(esp_device);
  LL_EXPECT(RunCommand(runner_, std::move(mkfs_vfat)));

  LOG(INFO) << tag << " Formatting " << root_device << " as ext4";
  Command mkfs_ext4("mkfs.ext4");
  mkfs_ext4.AddParameter("-F");
  mkfs_ext4.AddParameter("-L");
  mkfs_ext4.AddParameter(kRootLabel);
  mkfs_ext4.AddParameter(root_device);
  LL_EXPECT(RunCommand(runner_, std::move(mkfs_ext4)));
  return {};
}

Result<PartitionedImage> ProbePartitions(FilesystemProbe& probe,
                                         const LoopBinding& loop) {
  PartitionedImage partitions;
  partitions.esp = LL_EXPECT(
      ExpectFilesystem(probe, loop.PartitionDevice(kEspPartition), "vfat"));
  partitions.root = LL_EXPECT(
      ExpectFilesystem(probe, loop.PartitionDevice(kRootPartition), "ext4"));
  return partitions;
}

}  // namespace looplab

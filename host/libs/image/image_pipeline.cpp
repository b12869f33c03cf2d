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

#include "host/libs/image/image_pipeline.h"

#include <errno.h>
#include <string.h>
#include <unistd.h>

#include <string>
#include <utility>

#include <android-base/logging.h>

#include "common/libs/utils/result.h"
#include "host/libs/image/boot_staging.h"
#include "host/libs/image/partition_stage.h"
#include "host/libs/image/rootfs_import.h"

namespace looplab {

ImagePipeline::ImagePipeline(ProcessRunner& runner, LoopDeviceManager& loops,
                             FilesystemProbe& probe, RootfsCache* cache,
                             ImportOptions options)
    : runner_(runner),
      loops_(loops),
      probe_(probe),
      cache_(cache),
      mounter_(runner),
      options_(std::move(options)) {}

Result<void> ImagePipeline::Build(const BuildTarget& target) {
  LL_EXPECT(Assemble(target));
  return {};
}

Result<BootAssets> ImagePipeline::Assemble(const BuildTarget& target) {
  const auto tag = StageTag(target, "build");
  LOG(INFO) << tag << " Assembling " << target.image_path;

  PartitionStage partition(runner_, loops_, probe_);
  LL_EXPECT(partition.Run(target));

  auto assets = PopulateImage(target);
  // The mount point only goes away once nothing is mounted on it.
  if (rmdir(target.mount_point.c_str()) != 0) {
    LOG(DEBUG) << tag << " Keeping " << target.mount_point << ": "
               << strerror(errno);
  }
  if (assets.ok()) {
    LOG(INFO) << tag << " Image " << target.image_path << " is ready";
  }
  return assets;
}

Result<BootAssets> ImagePipeline::PopulateImage(const BuildTarget& target) {
  const auto tag = StageTag(target, "build");
  LOG(INFO) << tag << " Attaching " << target.image_path << " for import";
  auto loop = LL_EXPECT(loops_.AcquireLoop(target.image_path));
  LL_EXPECT(loops_.WaitForPartitions(loop, kPartitionCount));
  // Destroyed before `loop`, so every mount is gone before the detach.
  auto mounts =
      LL_EXPECT(MountImageTree(mounter_, loop, target.mount_point));

  RootfsImportStage import(runner_, mounter_, probe_, cache_);
  auto partitions = LL_EXPECT(import.Run(target, loop, options_));

  BootStagingStage boot;
  return LL_EXPECT(boot.Run(target, partitions));
}

}  // namespace looplab

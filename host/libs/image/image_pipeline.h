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
#include "host/libs/image/rootfs_cache.h"
#include "host/libs/image/startup_script.h"

namespace looplab {

// Produces the disk image of one build target.
class ImageBuilder {
 public:
  virtual ~ImageBuilder() = default;

  virtual Result<void> Build(const BuildTarget& target) = 0;
};

/*
 * Runs every stage of an image build for one architecture:
 *
 *   1. partition and format the image (PartitionStage)
 *   2. attach it again, mount root and ESP (MountImageTree)
 *   3. import and configure the root filesystem (RootfsImportStage)
 *   4. stage the boot files on the ESP (BootStagingStage)
 *
 * Mounts are removed in reverse order and the loop device is detached last,
 * whichever stage fails.
 */
class ImagePipeline : public ImageBuilder {
 public:
  // `cache` may be null.
  ImagePipeline(ProcessRunner& runner, LoopDeviceManager& loops,
                FilesystemProbe& probe, RootfsCache* cache,
                ImportOptions options);

  Result<void> Build(const BuildTarget& target) override;

  Result<BootAssets> Assemble(const BuildTarget& target);

 private:
  Result<BootAssets> PopulateImage(const BuildTarget& target);

  ProcessRunner& runner_;
  LoopDeviceManager& loops_;
  FilesystemProbe& probe_;
  RootfsCache* cache_;
  Mounter mounter_;
  ImportOptions options_;
};

}  // namespace looplab

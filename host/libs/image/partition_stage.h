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

#include <cstdint>
#include <string>

#include "common/libs/utils/process_runner.h"
#include "common/libs/utils/result.h"
#include "host/libs/config/build_target.h"
#include "host/libs/image/filesystem_probe.h"
#include "host/libs/image/loop_device.h"

namespace looplab {

// GPT entry numbers of the fixed two partition layout.
constexpr int kEspPartition = 1;
constexpr int kRootPartition = 2;
constexpr int kPartitionCount = 2;

constexpr uint64_t kEspSizeBytes = 512ull << 20;
// Smallest root partition mkfs.ext4 is asked to format.
constexpr uint64_t kMinRootSizeBytes = 64ull << 20;

constexpr char kEspLabel[] = "EFI";
constexpr char kRootLabel[] = "root";

// Identifiers read back from the freshly formatted partitions.
struct PartitionedImage {
  FilesystemInfo esp;
  FilesystemInfo root;
};

/*
 * Turns the target's image path into a sparse file holding a GPT with a 512MiB
 * FAT32 EFI system partition followed by an ext4 root partition spanning the
 * rest of the disk.
 *
 * The loop device used for partitioning is detached again before returning.
 */
class PartitionStage {
 public:
  PartitionStage(ProcessRunner& runner, LoopDeviceManager& loops,
                 FilesystemProbe& probe);

  Result<PartitionedImage> Run(const BuildTarget& target);

 private:
  Result<void> WritePartitionTable(const BuildTarget& target,
                                   const LoopBinding& loop);
  Result<void> Format(const BuildTarget& target, const LoopBinding& loop);

  ProcessRunner& runner_;
  LoopDeviceManager& loops_;
  FilesystemProbe& probe_;
};

// Reads the filesystem identity of both partitions of an attached image and
// checks their types.
Result<PartitionedImage> ProbePartitions(FilesystemProbe& probe,
                                         const LoopBinding& loop);

}  // namespace looplab

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

#include "common/libs/utils/result.h"
#include "host/libs/config/build_target.h"
#include "host/libs/image/partition_stage.h"
#include "host/libs/image/startup_script.h"

namespace looplab {

// Kernel and initrd found in the /boot directory of a configured tree.
struct KernelFiles {
  std::string kernel;
  std::string initrd;
};

// Finds the single regular file named vmlinuz-* and the single regular file
// named initrd.img-* in `boot_dir`. None or several of either kind is
// ErrorKind::kPreconditionViolation.
Result<KernelFiles> LocateKernelFiles(const std::string& boot_dir);

/*
 * Makes the image bootable by UEFI firmware without a bootloader. The EFI
 * shell becomes the removable media loader EFI/BOOT/BOOT<ID>.EFI and runs
 * startup.nsh, which starts the kernel copied next to it.
 *
 * Expects the configured tree at `target.mount_point` with the ESP mounted at
 * boot/efi. All inputs are checked before the first file is written.
 */
class BootStagingStage {
 public:
  Result<BootAssets> Run(const BuildTarget& target,
                         const PartitionedImage& partitions);

 private:
  Result<void> FixupKernelStub(const BuildTarget& target,
                               const std::string& kernel_path);
};

}  // namespace looplab

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

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "common/libs/utils/result.h"

namespace looplab {

// Target architectures an image can be assembled for.
enum class Arch {
  X64,
  Aarch64,
};

// Static per-architecture metadata.
struct ArchInfo {
  Arch arch;
  // "x64", "aarch64"
  const char* tag;
  // Suffix of the removable media boot path, EFI/BOOT/BOOT<uefi_id>.EFI
  const char* uefi_id;
  const char* debian_arch;
  // Serial console of the virtual machines the image targets.
  const char* console_device;
  int console_baud;
  const char* grub_target;
  const char* bootloader_package;
  const char* kernel_package;
  // The distribution kernel is a gzip compressed EFI stub that firmware can
  // not execute directly.
  bool gzip_kernel_stub;
};

const std::vector<Arch>& SupportedArchs();
const ArchInfo& GetArchInfo(Arch arch);
Result<Arch> ParseArch(const std::string& tag);
std::string ArchTag(Arch arch);
std::ostream& operator<<(std::ostream& out, Arch arch);

// Architecture of the running host, if it is one images can be built for.
std::optional<Arch> HostArch();

}  // namespace looplab

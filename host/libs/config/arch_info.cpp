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

#include "host/libs/config/arch_info.h"

#include <sys/utsname.h>

#include <cerrno>
#include <cstring>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <android-base/logging.h>
#include <android-base/no_destructor.h>
#include <android-base/strings.h>

#include "common/libs/utils/result.h"

namespace looplab {
namespace {

constexpr ArchInfo kX64Info = {
    .arch = Arch::X64,
    .tag = "x64",
    .uefi_id = "X64",
    .debian_arch = "amd64",
    .console_device = "ttyS0",  // 16550 UART
    .console_baud = 115200,
    .grub_target = "x86_64-efi",
    .bootloader_package = "shim-signed",
    .kernel_package = "linux-image-generic",
    .gzip_kernel_stub = false,
};

constexpr ArchInfo kAarch64Info = {
    .arch = Arch::Aarch64,
    .tag = "aarch64",
    .uefi_id = "AA64",
    .debian_arch = "arm64",
    .console_device = "ttyAMA0",  // PL011 UART
    .console_baud = 115200,
    .grub_target = "arm64-efi",
    .bootloader_package = "shim-signed",
    .kernel_package = "linux-image-generic",
    .gzip_kernel_stub = true,
};

}  // namespace

const std::vector<Arch>& SupportedArchs() {
  static const android::base::NoDestructor<std::vector<Arch>> archs(
      std::vector<Arch>{Arch::X64, Arch::Aarch64});
  return *archs;
}

const ArchInfo& GetArchInfo(Arch arch) {
  switch (arch) {
    case Arch::X64:
      return kX64Info;
    case Arch::Aarch64:
      return kAarch64Info;
  }
  LOG(FATAL) << "Arch value out of range: " << static_cast<int>(arch);
  return kX64Info;
}

Result<Arch> ParseArch(const std::string& tag) {
  for (Arch arch : SupportedArchs()) {
    if (tag == GetArchInfo(arch).tag) {
      return arch;
    }
  }
  return LL_ERR_KIND(ErrorKind::kPreconditionViolation,
                     "Unsupported architecture \""
                         << tag << "\", expected one of: x64, aarch64");
}

std::string ArchTag(Arch arch) { return GetArchInfo(arch).tag; }

std::ostream& operator<<(std::ostream& out, Arch arch) {
  return out << GetArchInfo(arch).tag;
}

std::optional<Arch> HostArch() {
  utsname buf;
  CHECK_EQ(uname(&buf), 0) << strerror(errno);
  std::string arch_str(buf.machine);
  if (arch_str == "x86_64") {
    return Arch::X64;
  } else if (arch_str == "aarch64" || arch_str == "arm64") {
    return Arch::Aarch64;
  }
  return std::nullopt;
}

}  // namespace looplab

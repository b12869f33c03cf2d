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

#include "host/libs/config/kernel_args.h"

#include <string>
#include <vector>

#include <android-base/strings.h>
#include <fmt/core.h>

#include "common/libs/utils/result.h"

namespace looplab {
namespace {

template<typename T>
void AppendVector(std::vector<T>* destination, const std::vector<T>& source) {
  destination->insert(destination->end(), source.begin(), source.end());
}

std::vector<std::string> SerialConsoleArgs(const ArchInfo& info) {
  auto console = fmt::format("{},{}", info.console_device, info.console_baud);
  return {"console=" + console, "earlycon=" + console};
}

}  // namespace

Result<std::vector<std::string>> ConsoleArgs(Arch arch) {
  switch (arch) {
    case Arch::X64:
      // First 16550 UART exposed by QEMU and OVMF.
      return SerialConsoleArgs(GetArchInfo(Arch::X64));
    case Arch::Aarch64:
      // First PL011 of the virt machine.
      return SerialConsoleArgs(GetArchInfo(Arch::Aarch64));
  }
  return LL_ERR_KIND(ErrorKind::kPreconditionViolation,
                     "No console for architecture value "
                         << static_cast<int>(arch));
}

Result<std::vector<std::string>> KernelCmdline(
    Arch arch, const std::string& root_partuuid) {
  if (root_partuuid.empty()) {
    return LL_ERR_KIND(ErrorKind::kPreconditionViolation,
                       "The root partition has no PARTUUID");
  }
  std::vector<std::string> cmdline = {
      "root=PARTUUID=" + root_partuuid,
      "rootfstype=ext4",
      "rw",
      "rootwait",
  };
  AppendVector(&cmdline, LL_EXPECT(ConsoleArgs(arch)));
  AppendVector(&cmdline, {
                             "console=tty0",
                             "earlyprintk=efi,keep",
                             "ignore_loglevel",
                             "loglevel=8",
                             "debug",
                             "initcall_debug",
                             "efi=debug",
                             "systemd.log_level=debug",
                             "systemd.log_target=console",
                         });
  return cmdline;
}

Result<std::string> KernelCmdlineString(Arch arch,
                                        const std::string& root_partuuid) {
  return android::base::Join(LL_EXPECT(KernelCmdline(arch, root_partuuid)),
                             " ");
}

}  // namespace looplab

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

#include "host/libs/image/startup_script.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>

#include <fmt/core.h>

namespace looplab {
namespace {

constexpr char kBanner[] = "Loop-lab EFI Boot Script - iSCSI Ready";
constexpr char kIscsiBanner[] = "Loop-lab EFI Boot Script - iSCSI Boot";

constexpr char kIscsiKernelArgs[] =
    "iscsi_initiator=%ISCSI_INITIATOR% "
    "iscsi_target_name=%ISCSI_TARGET_NAME% "
    "iscsi_target_ip=%ISCSI_TARGET_IP% "
    "iscsi_target_port=%ISCSI_TARGET_PORT% "
    "iscsi_lun=%ISCSI_LUN% ip=dhcp";

void EnterEsp(std::ostream& script) {
  script << "echo \"Checking mapped devices...\"\n";
  script << "map -r\n";
  script << "echo \"Entering ESP filesystem...\"\n";
  script << "FS0:\n";
  script << "cd EFI\\BOOT\n";
}

}  // namespace

std::string EfiBootCommand(const BootAssets& assets,
                           const std::string& cmdline) {
  return fmt::format("{} initrd=\\EFI\\BOOT\\{} {}", assets.kernel,
                     assets.initrd, cmdline);
}

std::string StartupScript(const BootAssets& assets) {
  const auto command = EfiBootCommand(assets, assets.cmdline);
  std::stringstream script;
  script << "@echo -off\n";
  script << "echo \"" << kBanner << "\"\n";
  EnterEsp(script);
  script << "echo \"Current directory contents:\"\n";
  script << "ls\n";
  script << "echo \"Command line:\"\n";
  script << "echo \"" << command << "\"\n";
  script << "echo \"Loading kernel...\"\n";
  script << command << "\n";
  return script.str();
}

std::string IscsiBootScript(const BootAssets& assets) {
  const auto local_command = EfiBootCommand(assets, assets.cmdline);
  const auto iscsi_command = EfiBootCommand(
      assets, fmt::format("{} {}", kIscsiKernelArgs, assets.cmdline));
  std::stringstream script;
  script << "@echo -off\n";
  script << "echo \"" << kIscsiBanner << "\"\n";
  script << "#\n";
  script << "# Fill in the iSCSI settings below to boot the root filesystem "
            "from a LUN.\n";
  script << "# With ISCSI_TARGET_IP left unset the local disk is booted.\n";
  script << "#\n";
  std::string initiator_suffix = assets.uefi_id;
  std::transform(initiator_suffix.begin(), initiator_suffix.end(),
                 initiator_suffix.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  script << "set ISCSI_INITIATOR \"iqn.2025-01.org.looplab:"
         << initiator_suffix << "\"\n";
  script << "set ISCSI_TARGET_NAME \"iqn.2025-01.org.looplab:target\"\n";
  // UEFI shells differ on whether `set VAR ""` is accepted.
  script << "# set ISCSI_TARGET_IP 192.0.2.10\n";
  script << "set ISCSI_TARGET_PORT \"3260\"\n";
  script << "set ISCSI_LUN \"0\"\n";
  EnterEsp(script);
  script << "if \"%ISCSI_TARGET_IP%\" == \"\" then\n";
  script << "  echo \"No iSCSI target configured, booting the local disk\"\n";
  script << "  " << local_command << "\n";
  script << "else\n";
  script << "  echo \"Booting %ISCSI_TARGET_NAME% LUN %ISCSI_LUN% from "
            "%ISCSI_TARGET_IP%:%ISCSI_TARGET_PORT%\"\n";
  script << "  " << iscsi_command << "\n";
  script << "endif\n";
  return script.str();
}

}  // namespace looplab

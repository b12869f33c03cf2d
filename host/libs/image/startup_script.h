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

namespace looplab {

constexpr char kStartupScriptName[] = "startup.nsh";
constexpr char kIscsiScriptName[] = "iscsi-boot.nsh";

// Everything the EFI shell scripts need to start the staged kernel.
struct BootAssets {
  // File names inside EFI/BOOT on the ESP.
  std::string kernel;
  std::string initrd;
  std::string cmdline;
  std::string uefi_id;
};

// "<kernel> initrd=\EFI\BOOT\<initrd> <cmdline>"
std::string EfiBootCommand(const BootAssets& assets,
                           const std::string& cmdline);

// Script the EFI shell runs automatically: lists devices and the ESP contents
// for diagnostics, then boots the local root partition.
std::string StartupScript(const BootAssets& assets);

/*
 * Editable network boot script. The iSCSI initiator, target name, portal
 * address, port and LUN are shell variables at the top of the script; as long
 * as no portal address is filled in, the local boot command of StartupScript
 * is used instead.
 */
std::string IscsiBootScript(const BootAssets& assets);

}  // namespace looplab

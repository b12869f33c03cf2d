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
#include "host/libs/config/arch_info.h"
#include "host/libs/config/build_target.h"

namespace looplab {

// Kernel modules and NIC drivers the initramfs needs to reach an iSCSI root.
const std::vector<std::string>& IscsiInitramfsModules();

// Sorted, duplicate free list of the packages installed into the guest.
std::vector<std::string> GuestPackages(const ArchInfo& info,
                                       const ImportOptions& options);

// Rejects account names and passwords that can not be embedded in the
// configuration script.
Result<void> ValidateImportOptions(const ImportOptions& options);

/*
 * The bash script run inside the chroot of a freshly unpacked root
 * filesystem. It installs the kernel, bootloader shim, SSH server and sudo,
 * creates the maintenance account, configures console auto-login on tty1 and
 * on the serial console of `info`, and when `options.install_iscsi` is set
 * prepares the initramfs for booting from an iSCSI LUN.
 *
 * The script expects to be run by `bash -euo pipefail`.
 */
std::string GuestConfigurationScript(const ArchInfo& info,
                                     const ImportOptions& options);

std::string FstabContents(const std::string& root_uuid,
                          const std::string& esp_uuid);

}  // namespace looplab

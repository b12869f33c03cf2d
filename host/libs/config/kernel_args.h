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

namespace looplab {

// "console=<dev>,<baud> earlycon=<dev>,<baud>" for the serial console the
// architecture's virtual machines expose.
Result<std::vector<std::string>> ConsoleArgs(Arch arch);

// Kernel command line booting the ext4 root partition `root_partuuid` with
// verbose early logging on the serial console and tty0.
Result<std::vector<std::string>> KernelCmdline(
    Arch arch, const std::string& root_partuuid);

Result<std::string> KernelCmdlineString(Arch arch,
                                        const std::string& root_partuuid);

}  // namespace looplab

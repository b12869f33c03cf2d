//
// Copyright (C) 2022 The Android Open Source Project
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "host/libs/config/kernel_args.h"

#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/result_matchers.h"

namespace looplab {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

TEST(KernelArgsTest, ConsoleFollowsArchitecture) {
  auto x64 = ConsoleArgs(Arch::X64);
  ASSERT_THAT(x64, IsOk());
  EXPECT_THAT(*x64, ElementsAre("console=ttyS0,115200",
                                "earlycon=ttyS0,115200"));

  auto arm = ConsoleArgs(Arch::Aarch64);
  ASSERT_THAT(arm, IsOk());
  EXPECT_THAT(*arm, ElementsAre("console=ttyAMA0,115200",
                                "earlycon=ttyAMA0,115200"));
}

TEST(KernelArgsTest, FullCommandLine) {
  auto cmdline = KernelCmdlineString(Arch::X64, "0f1e2d3c-01");

  ASSERT_THAT(cmdline, IsOk());
  EXPECT_EQ(*cmdline,
            "root=PARTUUID=0f1e2d3c-01 rootfstype=ext4 rw rootwait "
            "console=ttyS0,115200 earlycon=ttyS0,115200 console=tty0 "
            "earlyprintk=efi,keep ignore_loglevel loglevel=8 debug "
            "initcall_debug efi=debug systemd.log_level=debug "
            "systemd.log_target=console");
}

TEST(KernelArgsTest, EveryArchitectureHasACommandLine) {
  for (Arch arch : SupportedArchs()) {
    auto cmdline = KernelCmdlineString(arch, "uuid");
    ASSERT_THAT(cmdline, IsOk()) << arch;
    EXPECT_THAT(*cmdline, HasSubstr(GetArchInfo(arch).console_device));
  }
}

TEST(KernelArgsTest, OutOfRangeArchitectureIsRejected) {
  auto unknown = static_cast<Arch>(42);

  EXPECT_THAT(ConsoleArgs(unknown),
              IsErrorOfKind(ErrorKind::kPreconditionViolation));
  EXPECT_THAT(KernelCmdline(unknown, "uuid"),
              IsErrorOfKind(ErrorKind::kPreconditionViolation));
}

TEST(KernelArgsTest, RequiresRootPartuuid) {
  EXPECT_THAT(KernelCmdline(Arch::X64, ""),
              IsErrorOfKind(ErrorKind::kPreconditionViolation));
}

}  // namespace looplab

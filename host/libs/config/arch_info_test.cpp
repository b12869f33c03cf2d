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

#include "host/libs/config/arch_info.h"

#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/result_matchers.h"

namespace looplab {

TEST(ArchInfoTest, ParsesEverySupportedTag) {
  for (Arch arch : SupportedArchs()) {
    auto parsed = ParseArch(GetArchInfo(arch).tag);
    ASSERT_THAT(parsed, IsOk());
    EXPECT_EQ(*parsed, arch);
  }
}

TEST(ArchInfoTest, UnknownTagIsPreconditionViolation) {
  for (const std::string tag : {"", "x86_64", "arm64", "X64", "riscv64"}) {
    EXPECT_THAT(ParseArch(tag),
                IsErrorOfKind(ErrorKind::kPreconditionViolation))
        << tag;
  }
}

TEST(ArchInfoTest, X64Metadata) {
  const auto& info = GetArchInfo(Arch::X64);
  EXPECT_STREQ(info.uefi_id, "X64");
  EXPECT_STREQ(info.console_device, "ttyS0");
  EXPECT_EQ(info.console_baud, 115200);
  EXPECT_STREQ(info.debian_arch, "amd64");
  EXPECT_FALSE(info.gzip_kernel_stub);
}

TEST(ArchInfoTest, Aarch64Metadata) {
  const auto& info = GetArchInfo(Arch::Aarch64);
  EXPECT_STREQ(info.uefi_id, "AA64");
  EXPECT_STREQ(info.console_device, "ttyAMA0");
  EXPECT_EQ(info.console_baud, 115200);
  EXPECT_STREQ(info.debian_arch, "arm64");
  EXPECT_TRUE(info.gzip_kernel_stub);
}

TEST(ArchInfoTest, TableEntriesMatchTheirKey) {
  for (Arch arch : SupportedArchs()) {
    EXPECT_EQ(GetArchInfo(arch).arch, arch);
    EXPECT_EQ(ArchTag(arch), GetArchInfo(arch).tag);
  }
}

}  // namespace looplab

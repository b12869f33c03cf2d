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

#include "host/libs/image/startup_script.h"

#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace looplab {

using ::testing::EndsWith;
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::StartsWith;

namespace {

BootAssets TestAssets() {
  BootAssets assets;
  assets.kernel = "vmlinuz-6.8.0-31-generic";
  assets.initrd = "initrd.img-6.8.0-31-generic";
  assets.cmdline = "root=PARTUUID=abcd rw console=ttyS0,115200";
  assets.uefi_id = "X64";
  return assets;
}

}  // namespace

TEST(StartupScriptTest, BootCommand) {
  EXPECT_EQ(EfiBootCommand(TestAssets(), "quiet"),
            "vmlinuz-6.8.0-31-generic "
            "initrd=\\EFI\\BOOT\\initrd.img-6.8.0-31-generic quiet");
}

TEST(StartupScriptTest, LocalBootScript) {
  auto script = StartupScript(TestAssets());

  EXPECT_THAT(script, StartsWith("@echo -off\n"));
  EXPECT_THAT(script, HasSubstr("Loop-lab EFI Boot Script - iSCSI Ready"));
  EXPECT_THAT(script, HasSubstr("map -r\n"));
  EXPECT_THAT(script, HasSubstr("FS0:\ncd EFI\\BOOT\n"));
  EXPECT_THAT(script, HasSubstr("\nls\n"));
  EXPECT_THAT(script,
              HasSubstr("echo \"vmlinuz-6.8.0-31-generic "
                        "initrd=\\EFI\\BOOT\\initrd.img-6.8.0-31-generic "
                        "root=PARTUUID=abcd rw console=ttyS0,115200\"\n"));
  EXPECT_THAT(script,
              EndsWith("\nvmlinuz-6.8.0-31-generic "
                       "initrd=\\EFI\\BOOT\\initrd.img-6.8.0-31-generic "
                       "root=PARTUUID=abcd rw console=ttyS0,115200\n"));
  EXPECT_LT(script.find("map -r"), script.find("FS0:"));
  EXPECT_LT(script.find("FS0:"), script.find("\nls\n"));
}

TEST(StartupScriptTest, IscsiScriptIsEditableTemplate) {
  auto script = IscsiBootScript(TestAssets());

  EXPECT_THAT(script, HasSubstr("set ISCSI_INITIATOR \"iqn.2025-01.org."
                                "looplab:x64\"\n"));
  EXPECT_THAT(script, HasSubstr("set ISCSI_TARGET_NAME "));
  EXPECT_THAT(script, HasSubstr("\n# set ISCSI_TARGET_IP 192.0.2.10\n"));
  EXPECT_THAT(script, Not(HasSubstr("\nset ISCSI_TARGET_IP")));
  EXPECT_THAT(script, HasSubstr("set ISCSI_TARGET_PORT \"3260\"\n"));
  EXPECT_THAT(script, HasSubstr("set ISCSI_LUN \"0\"\n"));
  EXPECT_THAT(script, HasSubstr("iscsi_target_ip=%ISCSI_TARGET_IP%"));
  EXPECT_THAT(script, HasSubstr("iscsi_lun=%ISCSI_LUN%"));
}

TEST(StartupScriptTest, IscsiScriptFallsBackToLocalBoot) {
  auto assets = TestAssets();
  auto script = IscsiBootScript(assets);
  auto local = EfiBootCommand(assets, assets.cmdline);

  auto condition = script.find("if \"%ISCSI_TARGET_IP%\" == \"\" then\n");
  auto fallback = script.find("  " + local + "\n");
  auto otherwise = script.find("else\n");
  ASSERT_NE(condition, std::string::npos);
  ASSERT_NE(fallback, std::string::npos);
  EXPECT_LT(condition, fallback);
  EXPECT_LT(fallback, otherwise);
  EXPECT_THAT(script, EndsWith("endif\n"));
}

}  // namespace looplab

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

#include "host/libs/config/build_target.h"

#include <string>
#include <vector>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/result_matchers.h"

namespace looplab {
namespace {

TargetTemplate TestTemplate() {
  TargetTemplate defaults;
  defaults.output_dir = "/work";
  defaults.image_size = "10G";
  defaults.rootfs_tarball = "/cache/ubuntu-{debian_arch}.tar.xz";
  defaults.uefi_shell = "/cache/shell-{arch}.efi";
  defaults.mount_root = "/mnt/looplab";
  return defaults;
}

}  // namespace

TEST(ParseImageSizeTest, Suffixes) {
  auto bytes = ParseImageSize("4096");
  ASSERT_THAT(bytes, IsOk());
  EXPECT_EQ(*bytes, 4096u);

  auto mebibytes = ParseImageSize("512M");
  ASSERT_THAT(mebibytes, IsOk());
  EXPECT_EQ(*mebibytes, 512ull << 20);

  auto gibibytes = ParseImageSize("10g");
  ASSERT_THAT(gibibytes, IsOk());
  EXPECT_EQ(*gibibytes, 10ull << 30);
}

TEST(ParseImageSizeTest, RejectsMalformedSizes) {
  EXPECT_THAT(ParseImageSize(""), IsError());
  EXPECT_THAT(ParseImageSize("G"), IsError());
  EXPECT_THAT(ParseImageSize("ten"), IsError());
  EXPECT_THAT(ParseImageSize("0"), IsError());
  EXPECT_THAT(ParseImageSize("-5M"), IsError());
  EXPECT_THAT(ParseImageSize("99999999999999999999T"), IsError());
}

TEST(BuildTargetTest, ExpandsPlaceholders) {
  EXPECT_EQ(ExpandArchTemplate("/c/{arch}/{debian_arch}/BOOT{uefi_id}.EFI",
                               Arch::Aarch64),
            "/c/aarch64/arm64/BOOTAA64.EFI");
  EXPECT_EQ(ExpandArchTemplate("/plain/path", Arch::X64), "/plain/path");
}

TEST(BuildTargetTest, DerivesPerArchitecturePaths) {
  auto targets = MakeBuildTargets({"x64", "aarch64"}, TestTemplate());
  ASSERT_THAT(targets, IsOk());
  ASSERT_EQ(targets->size(), 2u);

  const auto& x64 = (*targets)[0];
  EXPECT_EQ(x64.arch, Arch::X64);
  EXPECT_EQ(x64.image_path, "/work/template-x64.img");
  EXPECT_EQ(x64.image_size_bytes, 10ull << 30);
  EXPECT_EQ(x64.rootfs_tarball, "/cache/ubuntu-amd64.tar.xz");
  EXPECT_EQ(x64.uefi_shell, "/cache/shell-x64.efi");
  EXPECT_EQ(x64.mount_point, "/mnt/looplab_x64");

  const auto& aarch64 = (*targets)[1];
  EXPECT_EQ(aarch64.image_path, "/work/template-aarch64.img");
  EXPECT_EQ(aarch64.mount_point, "/mnt/looplab_aarch64");
}

TEST(BuildTargetTest, UnknownArchitectureFailsConstruction) {
  EXPECT_THAT(MakeBuildTargets({"x64", "mips"}, TestTemplate()),
              IsErrorOfKind(ErrorKind::kPreconditionViolation));
}

TEST(BuildTargetTest, RejectsDuplicateTargets) {
  EXPECT_THAT(MakeBuildTargets({"x64", "x64"}, TestTemplate()), IsError());
}

TEST(BuildTargetTest, MissingRootfsIsAnError) {
  auto defaults = TestTemplate();
  defaults.rootfs_tarball = "";
  EXPECT_THAT(MakeBuildTarget(Arch::X64, defaults), IsError());
}

TEST(BuildTargetTest, LoadsTargetsFromJson) {
  android::base::TemporaryFile config;
  ASSERT_TRUE(android::base::WriteStringToFile(R"({
    "targets": [
      { "arch": "aarch64", "image_size": "8G",
        "rootfs_tarball": "/other/rootfs.tar.xz" },
      { "arch": "x64", "image_size": 1073741824 }
    ]
  })", config.path));

  auto targets = LoadBuildTargets(config.path, TestTemplate());
  ASSERT_THAT(targets, IsOk()) << targets.error().Trace();
  ASSERT_EQ(targets->size(), 2u);
  EXPECT_EQ((*targets)[0].arch, Arch::Aarch64);
  EXPECT_EQ((*targets)[0].image_size_bytes, 8ull << 30);
  EXPECT_EQ((*targets)[0].rootfs_tarball, "/other/rootfs.tar.xz");
  EXPECT_EQ((*targets)[0].uefi_shell, "/cache/shell-aarch64.efi");
  EXPECT_EQ((*targets)[1].arch, Arch::X64);
  EXPECT_EQ((*targets)[1].image_size_bytes, 1ull << 30);
}

TEST(BuildTargetTest, RejectsConfigWithoutTargets) {
  android::base::TemporaryFile config;
  ASSERT_TRUE(android::base::WriteStringToFile(R"({"arch": "x64"})",
                                               config.path));
  EXPECT_THAT(LoadBuildTargets(config.path, TestTemplate()), IsError());
}

TEST(BuildTargetTest, StageTagNamesArchitectureAndStage) {
  auto target = MakeBuildTarget(Arch::Aarch64, TestTemplate());
  ASSERT_THAT(target, IsOk());
  EXPECT_EQ(StageTag(*target, "partition"), "[aarch64/partition]");
}

}  // namespace looplab

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

#include "host/libs/image/image_pipeline.h"

#include <chrono>
#include <string>
#include <vector>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/archive.h"
#include "common/libs/utils/fake_process_runner.h"
#include "common/libs/utils/files.h"
#include "common/libs/utils/result_matchers.h"
#include "host/libs/image/mock_filesystem_probe.h"

namespace looplab {

using test::FakeProcessRunner;
using test::Formatted;
using test::MockFilesystemProbe;
using test::RecordedCommand;
using ::testing::_;
using ::testing::Return;

namespace {

constexpr char kKernel[] = "vmlinuz-6.8.0-31-generic";
constexpr char kInitrd[] = "initrd.img-6.8.0-31-generic";

// Stands in for unpacking an Ubuntu rootfs: bsdtar -x ... -C <dir> -f <file>
void UnpackFakeRootfs(const RecordedCommand& command) {
  const auto boot = command.args[6] + "/boot";
  if (!EnsureDirectoryExists(boot).ok() ||
      !android::base::WriteStringToFile("bzImage", boot + "/" + kKernel) ||
      !android::base::WriteStringToFile("initrd", boot + "/" + kInitrd)) {
    ADD_FAILURE() << "Could not populate " << boot;
  }
}

ImportOptions TestImportOptions(const std::string& work) {
  ImportOptions options;
  options.host_resolv_conf = work + "/resolv.conf";
  options.host_hosts = work + "/hosts";
  android::base::WriteStringToFile("nameserver 10.0.0.1\n",
                                   options.host_resolv_conf);
  android::base::WriteStringToFile("127.0.0.1 localhost\n",
                                   options.host_hosts);
  return options;
}

}  // namespace

class ImagePipelineTest : public ::testing::Test {
 protected:
  ImagePipelineTest()
      : work_(dir_.path),
        loops_(runner_, PartitionWaitPolicy{},
               [](const std::string&) { return true; }),
        pipeline_(runner_, loops_, probe_, nullptr, TestImportOptions(work_)) {
    target_.arch = Arch::X64;
    target_.image_path = work_ + "/template-x64.img";
    target_.image_size_bytes = 2ull << 30;
    target_.rootfs_tarball = work_ + "/rootfs.tar.xz";
    target_.uefi_shell = work_ + "/shellx64.efi";
    target_.mount_point = work_ + "/mnt_x64";
    android::base::WriteStringToFile("rootfs", target_.rootfs_tarball);
    android::base::WriteStringToFile("shell", target_.uefi_shell);

    runner_.On({"losetup", "--find"}, {.out = "/dev/loop0\n"});
    runner_.On({kBsdtarPath, "-x"}, {.effect = UnpackFakeRootfs});
    ON_CALL(probe_, Probe("/dev/loop0p1"))
        .WillByDefault(Return(Formatted("vfat", "ESP-UUID", "esp-pu")));
    ON_CALL(probe_, Probe("/dev/loop0p2"))
        .WillByDefault(Return(Formatted("ext4", "ROOT-UUID", "root-pu")));
    EXPECT_CALL(probe_, Probe(_)).Times(::testing::AnyNumber());
  }

  android::base::TemporaryDir dir_;
  std::string work_;
  FakeProcessRunner runner_;
  MockFilesystemProbe probe_;
  LoopDeviceManager loops_;
  ImagePipeline pipeline_;
  BuildTarget target_;
};

TEST_F(ImagePipelineTest, AssemblesBootableImage) {
  auto assets = pipeline_.Assemble(target_);

  ASSERT_THAT(assets, IsOk());
  EXPECT_EQ(assets->kernel, kKernel);
  EXPECT_EQ(assets->uefi_id, "X64");
  const auto efi_boot = target_.mount_point + "/boot/efi/EFI/BOOT";
  EXPECT_TRUE(FileExists(efi_boot + "/BOOTX64.EFI"));
  EXPECT_TRUE(FileExists(efi_boot + "/" + kKernel));
  EXPECT_TRUE(FileExists(efi_boot + "/" + kInitrd));
  EXPECT_TRUE(FileExists(efi_boot + "/startup.nsh"));
  EXPECT_TRUE(FileExists(efi_boot + "/iscsi-boot.nsh"));
  EXPECT_THAT(assets->cmdline, ::testing::HasSubstr("root=PARTUUID=root-pu"));
}

TEST_F(ImagePipelineTest, TeardownMirrorsSetup) {
  ASSERT_THAT(pipeline_.Build(target_), IsOk());

  const auto& mnt = target_.mount_point;
  auto lines = runner_.CommandLines();
  std::vector<std::string> lifecycle;
  for (const auto& line : lines) {
    if (line.rfind("losetup", 0) == 0 || line.rfind("mount", 0) == 0 ||
        line.rfind("umount", 0) == 0 || line.rfind("chroot", 0) == 0) {
      lifecycle.push_back(line);
    }
  }
  EXPECT_THAT(
      lifecycle,
      ::testing::ElementsAre(
          "losetup --find --show --partscan " + target_.image_path,
          "losetup -d /dev/loop0",
          "losetup --find --show --partscan " + target_.image_path,
          "mount -t ext4 /dev/loop0p2 " + mnt,
          "mount -t vfat /dev/loop0p1 " + mnt + "/boot/efi",
          "mount --bind /proc " + mnt + "/proc",
          "mount --bind /sys " + mnt + "/sys",
          "mount --bind /dev " + mnt + "/dev",
          "mount --bind /dev/pts " + mnt + "/dev/pts",
          "chroot " + mnt + " /bin/bash -euo pipefail",
          "umount " + mnt + "/dev/pts", "umount " + mnt + "/dev",
          "umount " + mnt + "/sys", "umount " + mnt + "/proc",
          "umount " + mnt + "/boot/efi", "umount " + mnt,
          "losetup -d /dev/loop0"));
}

TEST_F(ImagePipelineTest, FailedChrootUnwindsEverything) {
  runner_.On({"chroot"}, {.exit_code = 100, .err = "dpkg error"});

  auto built = pipeline_.Build(target_);

  EXPECT_THAT(built, IsErrorOfKind(ErrorKind::kSubprocessFailure));
  const auto& mnt = target_.mount_point;
  int chroot = runner_.IndexOf({"chroot"});
  int last_umount = runner_.IndexOf({"umount", mnt});
  int detach = static_cast<int>(runner_.Commands().size()) - 1;
  EXPECT_LT(chroot, last_umount);
  EXPECT_EQ(runner_.CommandLines()[detach], "losetup -d /dev/loop0");
  EXPECT_EQ(runner_.Count({"mount"}), runner_.Count({"umount"}));
  EXPECT_FALSE(FileExists(mnt + "/boot/efi/EFI/BOOT/startup.nsh"));
}

TEST_F(ImagePipelineTest, PartitionTimeoutKeepsNothingAttached) {
  PartitionWaitPolicy policy;
  policy.timeout = std::chrono::milliseconds(20);
  policy.step = std::chrono::milliseconds(5);
  LoopDeviceManager slow_loops(runner_, policy,
                               [](const std::string&) { return false; });
  ImagePipeline pipeline(runner_, slow_loops, probe_, nullptr,
                         TestImportOptions(work_));

  EXPECT_THAT(pipeline.Build(target_),
              IsErrorOfKind(ErrorKind::kTimingAnomaly));
  EXPECT_EQ(runner_.Count({"losetup", "--find"}),
            runner_.Count({"losetup", "-d"}));
  EXPECT_FALSE(runner_.Ran({"mkfs.vfat"}));
}

}  // namespace looplab

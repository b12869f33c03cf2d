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

#include "host/libs/image/boot_staging.h"

#include <unistd.h>
#include <zlib.h>

#include <string>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/result_matchers.h"
#include "host/libs/image/mock_filesystem_probe.h"

namespace looplab {

using test::Formatted;
using ::testing::HasSubstr;

namespace {

constexpr char kKernel[] = "vmlinuz-6.8.0-31-generic";
constexpr char kInitrd[] = "initrd.img-6.8.0-31-generic";
constexpr char kStub[] = "MZ\x90\x00 arm64 EFI stub";

bool WriteGzip(const std::string& path, const std::string& contents) {
  gzFile out = gzopen(path.c_str(), "wb");
  if (out == nullptr) {
    return false;
  }
  bool ok = gzwrite(out, contents.data(), contents.size()) ==
            static_cast<int>(contents.size());
  return gzclose(out) == Z_OK && ok;
}

std::string ReadOrEmpty(const std::string& path) {
  std::string contents;
  android::base::ReadFileToString(path, &contents);
  return contents;
}

}  // namespace

class BootStagingTest : public ::testing::Test {
 protected:
  BootStagingTest() : work_(dir_.path) {
    partitions_.esp = Formatted("vfat", "ESP-UUID", "esp-partuuid");
    partitions_.root = Formatted("ext4", "ROOT-UUID", "9a8b7c6d-02");
  }

  void SetUpTree(Arch arch) {
    const auto& info = GetArchInfo(arch);
    target_.arch = arch;
    target_.image_path = work_ + "/template.img";
    target_.image_size_bytes = 1ull << 30;
    target_.rootfs_tarball = work_ + "/rootfs.tar.xz";
    target_.uefi_shell = work_ + "/shell.efi";
    target_.mount_point = work_ + "/mnt_" + info.tag;
    boot_ = target_.mount_point + "/boot";
    efi_boot_ = target_.mount_point + "/boot/efi/EFI/BOOT";
    ASSERT_THAT(EnsureDirectoryExists(boot_), IsOk());
    ASSERT_TRUE(android::base::WriteStringToFile("shell", target_.uefi_shell));
    ASSERT_TRUE(
        android::base::WriteStringToFile("initrd", boot_ + "/" + kInitrd));
    // Distributions keep unversioned symlinks next to the real files.
    ASSERT_EQ(symlink(kKernel, (boot_ + "/vmlinuz").c_str()), 0);
    ASSERT_EQ(symlink(kInitrd, (boot_ + "/initrd.img").c_str()), 0);
  }

  android::base::TemporaryDir dir_;
  std::string work_;
  std::string boot_;
  std::string efi_boot_;
  BuildTarget target_;
  PartitionedImage partitions_;
  BootStagingStage stage_;
};

TEST_F(BootStagingTest, StagesX64Image) {
  SetUpTree(Arch::X64);
  ASSERT_TRUE(android::base::WriteStringToFile("bzImage", boot_ + "/" + kKernel));

  auto assets = stage_.Run(target_, partitions_);

  ASSERT_THAT(assets, IsOk());
  EXPECT_EQ(assets->kernel, kKernel);
  EXPECT_EQ(assets->initrd, kInitrd);
  EXPECT_EQ(ReadOrEmpty(efi_boot_ + "/BOOTX64.EFI"), "shell");
  EXPECT_EQ(ReadOrEmpty(efi_boot_ + "/" + kKernel), "bzImage");
  EXPECT_EQ(ReadOrEmpty(efi_boot_ + "/" + kInitrd), "initrd");
  auto startup = ReadOrEmpty(efi_boot_ + "/startup.nsh");
  EXPECT_THAT(startup, HasSubstr("console=ttyS0,115200"));
  EXPECT_THAT(startup, HasSubstr("root=PARTUUID=9a8b7c6d-02"));
  EXPECT_THAT(startup, HasSubstr(std::string(kKernel) +
                                 " initrd=\\EFI\\BOOT\\" + kInitrd));
  EXPECT_THAT(ReadOrEmpty(efi_boot_ + "/iscsi-boot.nsh"),
              HasSubstr("ISCSI_TARGET_IP"));
}

TEST_F(BootStagingTest, InflatesAarch64Stub) {
  SetUpTree(Arch::Aarch64);
  const std::string stub(kStub, sizeof(kStub) - 1);
  ASSERT_TRUE(WriteGzip(boot_ + "/" + kKernel, stub));

  auto assets = stage_.Run(target_, partitions_);

  ASSERT_THAT(assets, IsOk());
  EXPECT_TRUE(FileExists(efi_boot_ + "/BOOTAA64.EFI"));
  EXPECT_EQ(ReadOrEmpty(efi_boot_ + "/" + kKernel), stub);
  EXPECT_FALSE(FileExists(efi_boot_ + "/" + kKernel + ".gz"));
  auto startup = ReadOrEmpty(efi_boot_ + "/startup.nsh");
  EXPECT_THAT(startup, HasSubstr("console=ttyAMA0,115200"));
  EXPECT_THAT(startup, HasSubstr("earlycon=ttyAMA0,115200"));
}

TEST_F(BootStagingTest, UncompressedAarch64StubIsStagedUnchanged) {
  SetUpTree(Arch::Aarch64);
  ASSERT_TRUE(android::base::WriteStringToFile("MZ plain stub",
                                               boot_ + "/" + kKernel));

  ASSERT_THAT(stage_.Run(target_, partitions_), IsOk());

  EXPECT_EQ(ReadOrEmpty(efi_boot_ + "/" + kKernel), "MZ plain stub");
}

TEST_F(BootStagingTest, SeveralKernelsAreRejectedBeforeWriting) {
  SetUpTree(Arch::X64);
  ASSERT_TRUE(android::base::WriteStringToFile("a", boot_ + "/" + kKernel));
  ASSERT_TRUE(android::base::WriteStringToFile(
      "b", boot_ + "/vmlinuz-6.5.0-14-generic"));

  auto assets = stage_.Run(target_, partitions_);

  EXPECT_THAT(assets, IsErrorOfKind(ErrorKind::kPreconditionViolation));
  EXPECT_FALSE(FileExists(efi_boot_ + "/BOOTX64.EFI"));
  EXPECT_FALSE(FileExists(efi_boot_ + "/startup.nsh"));
}

TEST_F(BootStagingTest, MissingInitrdIsRejected) {
  SetUpTree(Arch::X64);
  ASSERT_TRUE(android::base::WriteStringToFile("a", boot_ + "/" + kKernel));
  ASSERT_TRUE(RemoveFile(boot_ + "/" + kInitrd));

  EXPECT_THAT(stage_.Run(target_, partitions_),
              IsErrorOfKind(ErrorKind::kPreconditionViolation));
  EXPECT_FALSE(FileExists(efi_boot_ + "/" + kKernel));
}

TEST_F(BootStagingTest, MissingShellIsRejected) {
  SetUpTree(Arch::X64);
  ASSERT_TRUE(android::base::WriteStringToFile("a", boot_ + "/" + kKernel));
  target_.uefi_shell = work_ + "/missing.efi";

  EXPECT_THAT(stage_.Run(target_, partitions_),
              IsErrorOfKind(ErrorKind::kPreconditionViolation));
  EXPECT_FALSE(FileExists(efi_boot_ + "/" + kKernel));
}

TEST_F(BootStagingTest, LocateIgnoresSymlinks) {
  SetUpTree(Arch::X64);
  ASSERT_TRUE(android::base::WriteStringToFile("a", boot_ + "/" + kKernel));
  ASSERT_EQ(symlink(kKernel, (boot_ + "/vmlinuz-latest").c_str()), 0);

  auto files = LocateKernelFiles(boot_);

  ASSERT_THAT(files, IsOk());
  EXPECT_EQ(files->kernel, kKernel);
  EXPECT_EQ(files->initrd, kInitrd);
}

}  // namespace looplab

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

#include "host/libs/image/boot_staging.h"

#include <sys/stat.h>

#include <string>
#include <vector>

#include <android-base/logging.h>
#include <android-base/strings.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/gzip_file.h"
#include "common/libs/utils/result.h"
#include "host/libs/config/kernel_args.h"
#include "host/libs/image/rootfs_import.h"

namespace looplab {
namespace {

constexpr char kKernelPrefix[] = "vmlinuz-";
constexpr char kInitrdPrefix[] = "initrd.img-";

bool IsRegularFile(const std::string& path) {
  struct stat st {};
  return lstat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

Result<std::string> LocateSingle(const std::string& boot_dir,
                                 const std::string& prefix) {
  std::vector<std::string> found;
  for (const auto& path : LL_EXPECT(FilesWithPrefix(boot_dir, prefix))) {
    if (IsRegularFile(path)) {
      found.emplace_back(path);
    }
  }
  if (found.size() != 1) {
    return LL_ERR_KIND(ErrorKind::kPreconditionViolation,
                       "Expected exactly one " << prefix << "* file in \""
                                               << boot_dir << "\", found "
                                               << found.size() << ": "
                                               << android::base::Join(found,
                                                                      ", "));
  }
  return cpp_basename(found[0]);
}

Result<void> CopyInto(const std::string& from, const std::string& to) {
  LL_EXPECTF(Copy(from, to), "Could not copy \"{}\" to \"{}\"", from, to);
  return {};
}

}  // namespace

Result<KernelFiles> LocateKernelFiles(const std::string& boot_dir) {
  KernelFiles files;
  files.kernel = LL_EXPECT(LocateSingle(boot_dir, kKernelPrefix));
  files.initrd = LL_EXPECT(LocateSingle(boot_dir, kInitrdPrefix));
  return files;
}

Result<BootAssets> BootStagingStage::Run(const BuildTarget& target,
                                         const PartitionedImage& partitions) {
  const auto tag = StageTag(target, "boot");
  const auto& info = target.Info();
  if (!FileExists(target.uefi_shell)) {
    return LL_ERR_KIND(ErrorKind::kPreconditionViolation,
                       "UEFI shell \"" << target.uefi_shell
                                       << "\" does not exist");
  }
  const auto boot_dir = target.mount_point + "/boot";
  auto kernel_files = LL_EXPECT(LocateKernelFiles(boot_dir));

  BootAssets assets;
  assets.kernel = kernel_files.kernel;
  assets.initrd = kernel_files.initrd;
  assets.uefi_id = info.uefi_id;
  assets.cmdline =
      LL_EXPECT(KernelCmdlineString(target.arch, partitions.root.partuuid));

  const auto efi_boot = EspBootDir(target.mount_point);
  LL_EXPECT(EnsureDirectoryExists(efi_boot));

  const auto shell_path = efi_boot + "/BOOT" + assets.uefi_id + ".EFI";
  LOG(INFO) << tag << " Staging UEFI shell as " << shell_path;
  LL_EXPECT(CopyInto(target.uefi_shell, shell_path));

  LOG(INFO) << tag << " Staging " << assets.kernel << " and " << assets.initrd;
  const auto kernel_path = efi_boot + "/" + assets.kernel;
  LL_EXPECT(CopyInto(boot_dir + "/" + assets.kernel, kernel_path));
  LL_EXPECT(CopyInto(boot_dir + "/" + assets.initrd,
                     efi_boot + "/" + assets.initrd));
  LL_EXPECT(FixupKernelStub(target, kernel_path));

  LOG(INFO) << tag << " Kernel command line: " << assets.cmdline;
  LL_EXPECT(WriteNewFile(efi_boot + "/" + kStartupScriptName,
                         StartupScript(assets)));
  LL_EXPECT(WriteNewFile(efi_boot + "/" + kIscsiScriptName,
                         IscsiBootScript(assets)));
  LOG(INFO) << tag << " Wrote " << kStartupScriptName << " and "
            << kIscsiScriptName;
  return assets;
}

Result<void> BootStagingStage::FixupKernelStub(const BuildTarget& target,
                                               const std::string& kernel_path) {
  const auto tag = StageTag(target, "boot");
  switch (target.arch) {
    case Arch::X64:
      // bzImage is an EFI application as shipped.
      return {};
    case Arch::Aarch64: {
      if (!LL_EXPECT(HasGzipMagic(kernel_path))) {
        LOG(WARNING) << tag << " " << kernel_path
                     << " is not gzip compressed, staging it unchanged";
        return {};
      }
      const auto compressed_path = kernel_path + ".gz";
      LOG(INFO) << tag << " Decompressing the EFI stub " << kernel_path;
      LL_EXPECT(RenameFile(kernel_path, compressed_path));
      LL_EXPECT(GunzipFile(compressed_path, kernel_path));
      LL_EXPECTF(RemoveFile(compressed_path), "Could not remove \"{}\"",
                 compressed_path);
      return {};
    }
  }
  return LL_ERR_KIND(ErrorKind::kPreconditionViolation,
                     "No kernel stub handling for architecture value "
                         << static_cast<int>(target.arch));
}

}  // namespace looplab

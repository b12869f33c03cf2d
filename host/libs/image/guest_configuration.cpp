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

#include "host/libs/image/guest_configuration.h"

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

#include <android-base/strings.h>
#include <fmt/core.h>

#include "common/libs/utils/result.h"

namespace looplab {
namespace {

constexpr char kSshdConfig[] = "/etc/ssh/sshd_config";
constexpr char kSystemdUnitDir[] = "/etc/systemd/system";

void WriteAutologinOverride(std::ostream& script, const std::string& unit,
                            const std::string& file,
                            const std::string& agetty_args) {
  auto dir = fmt::format("{}/{}.service.d", kSystemdUnitDir, unit);
  script << "mkdir -p " << dir << "\n";
  script << "cat > " << dir << "/" << file << " <<'UNIT'\n";
  script << "[Service]\n";
  script << "ExecStart=\n";
  script << "ExecStart=-/sbin/agetty " << agetty_args << " %I $TERM\n";
  script << "UNIT\n";
}

void WriteIscsiSetup(std::ostream& script) {
  script << "\n# iSCSI initiator\n";
  script << "systemctl enable iscsid open-iscsi\n";
  script << "echo \"InitiatorName=$(/sbin/iscsi-iname)\" > "
            "/etc/iscsi/initiatorname.iscsi\n";
  script << "sed -i 's/^node.startup = manual/node.startup = automatic/' "
            "/etc/iscsi/iscsid.conf\n";
  script << "cat >> /etc/initramfs-tools/modules <<'MODULES'\n";
  for (const auto& module : IscsiInitramfsModules()) {
    script << module << "\n";
  }
  script << "MODULES\n";
  script << "echo 'ISCSI_AUTO=true' > /etc/iscsi/iscsi.initramfs\n";
  script << "update-initramfs -u -k all\n";
}

bool IsValidUserName(const std::string& name) {
  if (name.empty() || name.size() > 32) {
    return false;
  }
  if (!((name[0] >= 'a' && name[0] <= 'z') || name[0] == '_')) {
    return false;
  }
  return std::all_of(name.begin(), name.end(), [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' ||
           c == '-';
  });
}

}  // namespace

const std::vector<std::string>& IscsiInitramfsModules() {
  static const std::vector<std::string> kModules = {
      "iscsi_tcp",  "libiscsi", "libiscsi_tcp", "scsi_transport_iscsi",
      "virtio_net", "e1000",    "e1000e",
  };
  return kModules;
}

std::vector<std::string> GuestPackages(const ArchInfo& info,
                                       const ImportOptions& options) {
  std::vector<std::string> packages = {
      info.bootloader_package,
      info.kernel_package,
      "openssh-server",
      "sudo",
  };
  if (options.install_iscsi) {
    packages.emplace_back("open-iscsi");
  }
  std::sort(packages.begin(), packages.end());
  packages.erase(std::unique(packages.begin(), packages.end()),
                 packages.end());
  return packages;
}

Result<void> ValidateImportOptions(const ImportOptions& options) {
  if (!IsValidUserName(options.maintenance_user)) {
    return LL_ERR_KIND(ErrorKind::kPreconditionViolation,
                       "Invalid maintenance user name \""
                           << options.maintenance_user << "\"");
  }
  const auto& password = options.maintenance_password;
  if (password.empty() ||
      password.find_first_of("'\n:") != std::string::npos) {
    return LL_ERR_KIND(
        ErrorKind::kPreconditionViolation,
        "The maintenance password must be non empty and may not contain "
        "quotes, colons or newlines");
  }
  return {};
}

std::string GuestConfigurationScript(const ArchInfo& info,
                                     const ImportOptions& options) {
  const auto& user = options.maintenance_user;
  std::stringstream script;

  script << "export DEBIAN_FRONTEND=noninteractive\n";
  script << "apt-get update\n";
  // The install order is the one the packages are listed in, not sorted.
  std::vector<std::string> install = {info.bootloader_package,
                                      info.kernel_package, "openssh-server",
                                      "sudo"};
  if (options.install_iscsi) {
    install.emplace_back("open-iscsi");
  }
  script << "apt-get install -y " << android::base::Join(install, " ")
         << "\n";

  script << "\n# Maintenance account\n";
  script << "id -u " << user << " >/dev/null 2>&1 || useradd -m -s /bin/bash "
         << user << "\n";
  script << "echo '" << user << ":" << options.maintenance_password
         << "' | chpasswd\n";
  script << "usermod -aG sudo " << user << "\n";

  script << "\n# SSH\n";
  script << "sed -i 's/#PasswordAuthentication yes/PasswordAuthentication "
            "yes/' "
         << kSshdConfig << "\n";
  script << "sed -i 's/#PermitRootLogin prohibit-password/PermitRootLogin "
            "yes/' "
         << kSshdConfig << "\n";

  script << "\n# Console auto-login\n";
  WriteAutologinOverride(script, "getty@tty1", "override.conf",
                         fmt::format("--autologin {} --noclear", user));
  WriteAutologinOverride(
      script, fmt::format("serial-getty@{}", info.console_device),
      "autologin.conf",
      fmt::format("--autologin {} --keep-baud {},38400,9600", user,
                  info.console_baud));

  script << "\nsystemctl enable ssh\n";

  if (options.install_iscsi) {
    WriteIscsiSetup(script);
  }
  return script.str();
}

std::string FstabContents(const std::string& root_uuid,
                          const std::string& esp_uuid) {
  return fmt::format(
      "UUID={}  /          ext4    defaults        0 1\n"
      "UUID={}   /boot/efi  vfat    umask=0077      0 1\n",
      root_uuid, esp_uuid);
}

}  // namespace looplab

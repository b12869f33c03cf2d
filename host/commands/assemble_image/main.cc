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

#include <unistd.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <android-base/logging.h>
#include <android-base/strings.h>
#include <gflags/gflags.h>

#include "common/libs/utils/environment.h"
#include "common/libs/utils/process_runner.h"
#include "common/libs/utils/result.h"
#include "common/libs/utils/tee_logging.h"
#include "host/libs/config/arch_info.h"
#include "host/libs/config/build_target.h"
#include "host/libs/image/build_orchestrator.h"
#include "host/libs/image/filesystem_probe.h"
#include "host/libs/image/image_pipeline.h"
#include "host/libs/image/loop_device.h"
#include "host/libs/image/rootfs_cache.h"

DEFINE_string(arch, "x64,aarch64",
              "Comma separated list of architectures to build images for.");
DEFINE_string(output_dir, ".", "Directory receiving template-<arch>.img.");
DEFINE_string(image_size, "10G",
              "Size of each disk image, in bytes or with a K, M, G or T "
              "suffix.");
DEFINE_string(rootfs_tarball, "/rootfs-cache/{debian_arch}/rootfs.tar.xz",
              "Root filesystem tarball. {arch}, {debian_arch} and {uefi_id} "
              "are replaced per architecture.");
DEFINE_string(uefi_shell, "/usr/local/share/uefi-shell/{arch}/Shell.efi",
              "UEFI shell binary staged as the fallback bootloader. Accepts "
              "the same placeholders as --rootfs_tarball.");
DEFINE_string(mount_root, "/mnt/looplab",
              "Root partition mount point prefix; _<arch> is appended unless "
              "it contains {arch}.");
DEFINE_bool(install_iscsi, true,
            "Install and configure the iSCSI initiator in the guest.");
DEFINE_string(maintenance_user, "maintuser",
              "Account created in the guest with sudo rights.");
DEFINE_string(maintenance_password, "maintpass",
              "Password of the maintenance account.");
DEFINE_string(tree_cache_dir, "",
              "Directory of configured root trees. Empty disables the cache.");
DEFINE_bool(parallel, true, "Build the architectures concurrently.");
DEFINE_uint32(max_parallel, 0,
              "Maximum number of concurrent builds, 0 for one per "
              "architecture.");
DEFINE_uint32(partition_wait_ms, 3000,
              "How long to wait for partition device nodes to appear.");
DEFINE_uint32(partition_wait_step_ms, 100,
              "Interval between checks for partition device nodes.");
DEFINE_string(config, "",
              "JSON file listing explicit build targets. Overrides --arch.");
DEFINE_string(report_file, "", "Where to write the JSON build report.");
DEFINE_string(log_file, "", "Log file receiving every message.");

namespace looplab {
namespace {

TargetTemplate TemplateFromFlags() {
  TargetTemplate defaults;
  defaults.output_dir = FLAGS_output_dir;
  defaults.image_size = FLAGS_image_size;
  defaults.rootfs_tarball = FLAGS_rootfs_tarball;
  defaults.uefi_shell = FLAGS_uefi_shell;
  defaults.mount_root = FLAGS_mount_root;
  return defaults;
}

ImportOptions ImportOptionsFromFlags() {
  ImportOptions options;
  options.install_iscsi = FLAGS_install_iscsi;
  options.maintenance_user = FLAGS_maintenance_user;
  options.maintenance_password = FLAGS_maintenance_password;
  options.tree_cache_dir = FLAGS_tree_cache_dir;
  return options;
}

Result<int> AssembleImageMain(int argc, char** argv) {
  ::android::base::InitLogging(argv, android::base::StderrLogger);
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  std::vector<std::string> log_files;
  if (!FLAGS_log_file.empty()) {
    log_files.push_back(FLAGS_log_file);
  }
  android::base::SetLogger(LogToStderrAndFiles(log_files));

  if (geteuid() != 0) {
    LOG(WARNING) << "Not running as root, attaching loop devices and "
                    "mounting will most likely fail";
  }

  const auto defaults = TemplateFromFlags();
  std::vector<BuildTarget> targets;
  if (!FLAGS_config.empty()) {
    targets = LL_EXPECT(LoadBuildTargets(FLAGS_config, defaults),
                        "Invalid build config \"" << FLAGS_config << "\"");
  } else {
    targets = LL_EXPECT(
        MakeBuildTargets(android::base::Split(FLAGS_arch, ","), defaults),
        "Invalid --arch \"" << FLAGS_arch << "\"");
  }

  const auto host_arch = HostArch();
  for (const auto& target : targets) {
    if (host_arch != target.arch) {
      LOG(INFO) << "[" << target.arch << "] Foreign architecture, the "
                << "chrooted configuration relies on binfmt_misc emulation";
    }
  }

  ExecutionContext context;
  context.continuous_integration = RunningUnderContinuousIntegration();
  context.parallel = FLAGS_parallel;
  context.max_parallel = FLAGS_max_parallel;

  PartitionWaitPolicy wait_policy;
  wait_policy.timeout = std::chrono::milliseconds(FLAGS_partition_wait_ms);
  wait_policy.step = std::chrono::milliseconds(FLAGS_partition_wait_step_ms);
  LL_EXPECT(wait_policy.step.count() > 0,
            "--partition_wait_step_ms must be positive");

  const auto options = ImportOptionsFromFlags();
  LocalProcessRunner runner;
  LoopDeviceManager loops(runner, wait_policy);
  BlkidFilesystemProbe probe;
  std::unique_ptr<RootfsCache> cache;
  if (!options.tree_cache_dir.empty()) {
    cache = std::make_unique<RootfsCache>(options.tree_cache_dir, runner);
  }
  ImagePipeline pipeline(runner, loops, probe, cache.get(), options);
  BuildOrchestrator orchestrator(pipeline, loops, context);

  auto report = LL_EXPECT(orchestrator.BuildAll(targets));
  if (!FLAGS_report_file.empty()) {
    LL_EXPECT(WriteBuildReport(report, FLAGS_report_file));
  }
  for (const auto& outcome : report.outcomes) {
    if (outcome.ok) {
      LOG(INFO) << ArchTag(outcome.arch) << ": " << outcome.image_path;
    } else {
      LOG(ERROR) << ArchTag(outcome.arch) << ": " << outcome.kind << ": "
                 << outcome.message;
    }
  }
  return report.AllSucceeded() ? 0 : 1;
}

}  // namespace
}  // namespace looplab

int main(int argc, char** argv) {
  auto res = looplab::AssembleImageMain(argc, argv);
  if (res.ok()) {
    return *res;
  }
  LOG(ERROR) << "assemble_image failed: \n" << res.error().Trace();
  return 1;
}

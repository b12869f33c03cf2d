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

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "common/libs/utils/result.h"
#include "host/libs/config/arch_info.h"

namespace looplab {

// How long to poll for partition device nodes after a loop device attaches.
struct PartitionWaitPolicy {
  std::chrono::milliseconds timeout{3000};
  std::chrono::milliseconds step{100};
};

// Options of the chrooted configuration transaction.
struct ImportOptions {
  bool install_iscsi = true;
  std::string maintenance_user = "maintuser";
  std::string maintenance_password = "maintpass";
  // Host files copied into the tree so the package manager can resolve names.
  std::string host_resolv_conf = "/etc/resolv.conf";
  std::string host_hosts = "/etc/hosts";
  // Directory of configured-tree cache entries. Empty disables the cache.
  std::string tree_cache_dir;
};

// Supplied by the caller, never probed by the pipeline itself.
struct ExecutionContext {
  bool continuous_integration = false;
  bool parallel = true;
  // 0 means one slot per target.
  unsigned int max_parallel = 0;
};

// One image build. Immutable for the duration of the build.
struct BuildTarget {
  Arch arch;
  std::string image_path;
  uint64_t image_size_bytes;
  std::string rootfs_tarball;
  std::string uefi_shell;
  // Where the root partition gets mounted while the tree is configured.
  std::string mount_point;

  const ArchInfo& Info() const { return GetArchInfo(arch); }
};

// Settings from which one BuildTarget per architecture is derived. Paths may
// contain the {arch}, {debian_arch} and {uefi_id} placeholders.
struct TargetTemplate {
  std::string output_dir = ".";
  std::string image_name = "template-{arch}.img";
  std::string image_size = "10G";
  std::string rootfs_tarball;
  std::string uefi_shell;
  std::string mount_root = "/mnt/looplab";
};

// Accepts a byte count with an optional K, M, G or T (binary) suffix.
Result<uint64_t> ParseImageSize(const std::string& size);

std::string ExpandArchTemplate(const std::string& path_template, Arch arch);

Result<BuildTarget> MakeBuildTarget(Arch arch, const TargetTemplate& defaults);

Result<std::vector<BuildTarget>> MakeBuildTargets(
    const std::vector<std::string>& arch_tags, const TargetTemplate& defaults);

/*
 * Reads build targets from a JSON file of the form
 *
 *     {
 *       "targets": [
 *         { "arch": "x64", "image_size": "8G",
 *           "rootfs_tarball": "/cache/ubuntu-amd64.tar.xz" },
 *         { "arch": "aarch64" }
 *       ]
 *     }
 *
 * Members missing from a target entry fall back to `defaults`.
 */
Result<std::vector<BuildTarget>> LoadBuildTargets(
    const std::string& config_path, const TargetTemplate& defaults);

// Checks that no two targets share an image path or a mount point.
Result<void> ValidateDistinctResources(const std::vector<BuildTarget>& targets);

// "[x64/partition]" style prefix for log lines.
std::string StageTag(const BuildTarget& target, const char* stage);

}  // namespace looplab

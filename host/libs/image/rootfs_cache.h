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

#include <optional>
#include <string>
#include <vector>

#include "common/libs/utils/process_runner.h"
#include "common/libs/utils/result.h"
#include "host/libs/config/build_target.h"

namespace looplab {

// Lowercase hex SHA-256 of the contents of `path`.
Result<std::string> Sha256File(const std::string& path);

// Content address of a configured tree. Any change in the tarball contents,
// the architecture, the iSCSI setting, the package set or the configuration
// script run in the chroot gives a new key.
Result<std::string> ConfiguredTreeKey(
    const std::string& tarball_sha256, Arch arch, bool install_iscsi,
    const std::vector<std::string>& packages,
    const std::string& configuration_script);

/*
 * Directory of fully configured root filesystem trees.
 *
 * Each entry is a pair of files named after its key:
 *
 *     <key>.tar.gz   the tree, without the contents of /boot/efi
 *     <key>.json     manifest recording the key and its inputs
 *
 * An entry is only used when its manifest records exactly the requested key.
 */
class RootfsCache {
 public:
  RootfsCache(std::string cache_dir, ProcessRunner& runner);

  const std::string& Directory() const { return cache_dir_; }

  Result<std::string> KeyFor(const BuildTarget& target,
                             const ImportOptions& options) const;

  // Archive of the entry for `key`, or nullopt when there is no usable entry.
  Result<std::optional<std::string>> Lookup(const std::string& key) const;

  // Extracts a looked up entry into `tree_dir`.
  Result<void> Restore(const std::string& archive,
                       const std::string& tree_dir);

  // Saves the configured tree at `tree_dir` under `key`.
  Result<void> Store(const std::string& key, const std::string& tree_dir,
                     const BuildTarget& target, const ImportOptions& options);

 private:
  std::string ArchivePath(const std::string& key) const;
  std::string ManifestPath(const std::string& key) const;

  std::string cache_dir_;
  ProcessRunner& runner_;
};

}  // namespace looplab

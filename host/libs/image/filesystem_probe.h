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

#include <string>

#include "common/libs/utils/result.h"

namespace looplab {

// Identity of a formatted block device as reported by the superblock and the
// partition table.
struct FilesystemInfo {
  // "vfat", "ext4", ... Empty when no filesystem was recognized.
  std::string type;
  std::string uuid;
  std::string partuuid;
};

// Reads filesystem metadata from block devices.
class FilesystemProbe {
 public:
  FilesystemProbe() = default;
  virtual ~FilesystemProbe() = default;

  virtual Result<FilesystemInfo> Probe(const std::string& device) = 0;

 private:
  FilesystemProbe(const FilesystemProbe&) = delete;
  FilesystemProbe& operator=(const FilesystemProbe&) = delete;
};

// libblkid backed probe. Results are never served from the on-disk blkid
// cache, a freshly formatted device always reports its new identifiers.
class BlkidFilesystemProbe : public FilesystemProbe {
 public:
  Result<FilesystemInfo> Probe(const std::string& device) override;
};

// Fails with ErrorKind::kPreconditionViolation unless `device` holds a
// filesystem of type `fstype`.
Result<FilesystemInfo> ExpectFilesystem(FilesystemProbe& probe,
                                        const std::string& device,
                                        const std::string& fstype);

}  // namespace looplab

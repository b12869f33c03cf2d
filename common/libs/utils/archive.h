/*
 * Copyright (C) 2019 The Android Open Source Project
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
#include <vector>

#include "common/libs/utils/process_runner.h"
#include "common/libs/utils/result.h"

namespace looplab {

inline constexpr char kBsdtarPath[] = "/usr/bin/bsdtar";

// Operations on a tar archive through bsdtar. Compression is detected by
// bsdtar on extraction.
class Archive {
 public:
  Archive(const std::string& file, ProcessRunner& runner);
  ~Archive();

  // Extracts the whole archive into `target_directory`, keeping permissions
  // and numeric uid/gid ownership.
  Result<void> ExtractAll(const std::string& target_directory);

 private:
  std::string file_;
  ProcessRunner& runner_;
};

// Packs the contents of `source_directory` into a gzip compressed archive at
// `archive_path`. Entries matching one of `excludes` are skipped.
Result<void> CreateArchive(ProcessRunner& runner,
                           const std::string& source_directory,
                           const std::string& archive_path,
                           const std::vector<std::string>& excludes);

}  // namespace looplab

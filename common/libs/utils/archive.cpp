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

#include "common/libs/utils/archive.h"

#include <string>
#include <utility>
#include <vector>

#include <android-base/logging.h>

#include "common/libs/utils/process_runner.h"
#include "common/libs/utils/result.h"
#include "common/libs/utils/subprocess.h"

namespace looplab {

Archive::Archive(const std::string& file, ProcessRunner& runner)
    : file_(file), runner_(runner) {}

Archive::~Archive() {}

Result<void> Archive::ExtractAll(const std::string& target_directory) {
  Command bsdtar_cmd(kBsdtarPath);
  bsdtar_cmd.AddParameter("-x");
  bsdtar_cmd.AddParameter("-p");
  bsdtar_cmd.AddParameter("--numeric-owner");
  bsdtar_cmd.AddParameter("-S");
  bsdtar_cmd.AddParameter("-C");
  bsdtar_cmd.AddParameter(target_directory);
  bsdtar_cmd.AddParameter("-f");
  bsdtar_cmd.AddParameter(file_);
  LL_EXPECT(RunCommand(runner_, std::move(bsdtar_cmd)),
            "bsdtar extraction of \"" << file_ << "\" into \""
                                      << target_directory << "\" failed");
  return {};
}

Result<void> CreateArchive(ProcessRunner& runner,
                           const std::string& source_directory,
                           const std::string& archive_path,
                           const std::vector<std::string>& excludes) {
  Command bsdtar_cmd(kBsdtarPath);
  bsdtar_cmd.AddParameter("-c");
  bsdtar_cmd.AddParameter("-z");
  bsdtar_cmd.AddParameter("-p");
  bsdtar_cmd.AddParameter("--numeric-owner");
  bsdtar_cmd.AddParameter("-f");
  bsdtar_cmd.AddParameter(archive_path);
  for (const auto& exclude : excludes) {
    bsdtar_cmd.AddParameter("--exclude");
    bsdtar_cmd.AddParameter(exclude);
  }
  bsdtar_cmd.AddParameter("-C");
  bsdtar_cmd.AddParameter(source_directory);
  bsdtar_cmd.AddParameter(".");
  LL_EXPECT(RunCommand(runner, std::move(bsdtar_cmd)),
            "Could not pack \"" << source_directory << "\" into \""
                                << archive_path << "\"");
  return {};
}

}  // namespace looplab

/*
 * Copyright (C) 2017 The Android Open Source Project
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

#include <sys/stat.h>
#include <sys/types.h>

#include <string>
#include <vector>

#include "common/libs/utils/result.h"

namespace looplab {

bool FileExists(const std::string& path, bool follow_symlinks = true);
bool FileHasContent(const std::string& path);
Result<std::vector<std::string>> DirectoryContents(const std::string& path);
bool DirectoryExists(const std::string& path, bool follow_symlinks = true);
Result<void> EnsureDirectoryExists(const std::string& directory_path,
                                   mode_t mode = S_IRWXU | S_IRWXG | S_IROTH |
                                                 S_IXOTH);
// Copies a regular file, preserving holes.
bool Copy(const std::string& from, const std::string& to);
off_t FileSize(const std::string& path);
Result<std::string> RenameFile(const std::string& current_filepath,
                               const std::string& target_filepath);
bool RemoveFile(const std::string& file);
std::string ReadFile(const std::string& file);
Result<void> WriteNewFile(const std::string& path, const std::string& contents,
                          mode_t mode = 0644);

// Creates (or truncates) `path` as a sparse file of exactly `size_bytes`.
Result<void> CreateSparseFile(const std::string& path, off_t size_bytes);

// Returns the entries of `dir` whose names start with `prefix`, sorted, as
// full paths.
Result<std::vector<std::string>> FilesWithPrefix(const std::string& dir,
                                                 const std::string& prefix);

std::string cpp_basename(const std::string& str);
std::string cpp_dirname(const std::string& str);

}  // namespace looplab

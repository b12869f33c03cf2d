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

#include <gmock/gmock.h>

#include "host/libs/image/filesystem_probe.h"

namespace looplab {
namespace test {

class MockFilesystemProbe : public FilesystemProbe {
 public:
  MOCK_METHOD1(Probe, Result<FilesystemInfo>(const std::string&));
};

inline FilesystemInfo Formatted(const std::string& type,
                                const std::string& uuid,
                                const std::string& partuuid) {
  FilesystemInfo info;
  info.type = type;
  info.uuid = uuid;
  info.partuuid = partuuid;
  return info;
}

}  // namespace test
}  // namespace looplab

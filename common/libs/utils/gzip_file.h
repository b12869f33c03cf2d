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

// Whether `path` starts with the two byte gzip magic number.
Result<bool> HasGzipMagic(const std::string& path);

// Decompresses the gzip file `source` into `destination`, replacing any
// existing file.
Result<void> GunzipFile(const std::string& source,
                        const std::string& destination);

}  // namespace looplab

//
// Copyright (C) 2020 The Android Open Source Project
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <android-base/logging.h>
#include <android-base/unique_fd.h>

#include "common/libs/utils/result.h"

namespace looplab {

std::string FromSeverity(android::base::LogSeverity severity);
Result<android::base::LogSeverity> ToSeverity(const std::string& value);

std::string StderrOutputGenerator(const struct tm& now, int pid, uint64_t tid,
                                  android::base::LogSeverity severity,
                                  const char* tag, const char* file,
                                  unsigned int line, const char* message);

// Read from LL_CONSOLE_SEVERITY and LL_FILE_SEVERITY.
android::base::LogSeverity ConsoleSeverity();
android::base::LogSeverity LogFileSeverity();

enum class MetadataLevel {
  FULL,
  ONLY_MESSAGE,
};

struct SeverityTarget {
  android::base::LogSeverity severity;
  std::shared_ptr<android::base::unique_fd> target;
  MetadataLevel metadata_level;
};

// Log function that copies every message to several destinations, each with
// its own severity threshold. Copies share the destinations.
class TeeLogger {
 public:
  explicit TeeLogger(const std::vector<SeverityTarget>& destinations);
  ~TeeLogger() = default;

  void operator()(android::base::LogId log_id,
                  android::base::LogSeverity severity, const char* tag,
                  const char* file, unsigned int line, const char* message);

 private:
  std::vector<SeverityTarget> destinations_;
  std::shared_ptr<std::mutex> write_mutex_;
};

// Every line on stderr and in `files` carries the severity, timestamp, pid,
// tid and source location unless `stderr_level` says otherwise.
TeeLogger LogToStderrAndFiles(
    const std::vector<std::string>& files,
    MetadataLevel stderr_level = MetadataLevel::FULL);

}  // namespace looplab

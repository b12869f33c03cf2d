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

#include "common/libs/utils/tee_logging.h"

#include <fcntl.h>
#include <inttypes.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <time.h>
#include <unistd.h>

#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <android-base/file.h>
#include <android-base/macros.h>
#include <android-base/stringprintf.h>
#include <android-base/strings.h>
#include <android-base/threads.h>

#include "common/libs/utils/environment.h"
#include "common/libs/utils/result.h"

using android::base::GetThreadId;
using android::base::LogSeverity;
using android::base::StringPrintf;

namespace looplab {

std::string FromSeverity(const LogSeverity severity) {
  switch (severity) {
    case android::base::VERBOSE:
      return "VERBOSE";
    case android::base::DEBUG:
      return "DEBUG";
    case android::base::INFO:
      return "INFO";
    case android::base::WARNING:
      return "WARNING";
    case android::base::ERROR:
      return "ERROR";
    case android::base::FATAL_WITHOUT_ABORT:
      return "FATAL_WITHOUT_ABORT";
    case android::base::FATAL:
      return "FATAL";
  }
  return "Unexpected severity";
}

Result<LogSeverity> ToSeverity(const std::string& value) {
  const std::pair<const char*, LogSeverity> kSeverities[] = {
      {"VERBOSE", android::base::VERBOSE},
      {"DEBUG", android::base::DEBUG},
      {"INFO", android::base::INFO},
      {"WARNING", android::base::WARNING},
      {"ERROR", android::base::ERROR},
      {"FATAL_WITHOUT_ABORT", android::base::FATAL_WITHOUT_ABORT},
      {"FATAL", android::base::FATAL},
  };
  for (const auto& [name, severity] : kSeverities) {
    if (android::base::EqualsIgnoreCase(value, name) ||
        value == std::to_string(static_cast<int>(severity))) {
      return severity;
    }
  }
  return LL_ERR("Unknown log severity \"" << value << "\"");
}

static LogSeverity GuessSeverity(const std::string& env_var,
                                 LogSeverity default_value) {
  auto env_value = StringFromEnv(env_var, "");
  if (env_value.empty()) {
    return default_value;
  }
  auto severity = ToSeverity(env_value);
  return severity.ok() ? *severity : default_value;
}

LogSeverity ConsoleSeverity() {
  return GuessSeverity("LL_CONSOLE_SEVERITY", android::base::INFO);
}

LogSeverity LogFileSeverity() {
  return GuessSeverity("LL_FILE_SEVERITY", android::base::DEBUG);
}

TeeLogger::TeeLogger(const std::vector<SeverityTarget>& destinations)
    : destinations_(destinations),
      write_mutex_(std::make_shared<std::mutex>()) {}

// This splits the message up line by line, by calling log_function with a
// pointer to the start of each line and the size up to the newline character.
// It sends size = -1 for the final line.
template <typename F>
static void SplitByLines(const char* msg, const F& log_function) {
  const char* newline = strchr(msg, '\n');
  while (newline != nullptr) {
    log_function(msg, newline - msg);
    msg = newline + 1;
    newline = strchr(msg, '\n');
  }
  log_function(msg, -1);
}

// Prefixes every line of `message` with the log header.
std::string StderrOutputGenerator(const struct tm& now, int pid, uint64_t tid,
                                  LogSeverity severity, const char* tag,
                                  const char* file, unsigned int line,
                                  const char* message) {
  char timestamp[32];
  strftime(timestamp, sizeof(timestamp), "%m-%d %H:%M:%S", &now);

  static const char log_characters[] = "VDIWEFF";
  static_assert(arraysize(log_characters) - 1 == android::base::FATAL + 1,
                "Mismatch in size of log_characters and values in LogSeverity");
  char severity_char = log_characters[severity];
  std::string line_prefix;
  if (file != nullptr) {
    line_prefix = StringPrintf("%s %c %s %5d %5" PRIu64 " %s:%u] ",
                               tag ? tag : "nullptr", severity_char, timestamp,
                               pid, tid, file, line);
  } else {
    line_prefix = StringPrintf("%s %c %s %5d %5" PRIu64 " ",
                               tag ? tag : "nullptr", severity_char, timestamp,
                               pid, tid);
  }

  std::string output_string;
  SplitByLines(message, [&](const char* msg, int size) {
    output_string.append(line_prefix);
    if (size == -1) {
      output_string.append(msg);
    } else {
      output_string.append(msg, size);
    }
    output_string.append("\n");
  });
  return output_string;
}

void TeeLogger::operator()(android::base::LogId, LogSeverity severity,
                           const char* tag, const char* file, unsigned int line,
                           const char* message) {
  struct tm now;
  time_t t = time(nullptr);
  localtime_r(&t, &now);
  auto full_output = StderrOutputGenerator(now, getpid(), GetThreadId(),
                                           severity, tag, file, line, message);
  auto message_output = std::string(message) + "\n";
  std::lock_guard<std::mutex> lock(*write_mutex_);
  for (const auto& destination : destinations_) {
    if (severity < destination.severity) {
      continue;
    }
    const auto& output = destination.metadata_level == MetadataLevel::FULL
                             ? full_output
                             : message_output;
    // Nowhere left to report a failed log write.
    (void)android::base::WriteStringToFd(output, *destination.target);
  }
}

static std::vector<SeverityTarget> SeverityTargetsForFiles(
    const std::vector<std::string>& files) {
  std::vector<SeverityTarget> log_severities;
  for (const auto& file : files) {
    auto log_file_fd = std::make_shared<android::base::unique_fd>(
        open(file.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC,
             S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP));
    if (log_file_fd->get() < 0) {
      PLOG(FATAL) << "Failed to create log file " << file;
    }
    log_severities.push_back(
        SeverityTarget{LogFileSeverity(), log_file_fd, MetadataLevel::FULL});
  }
  return log_severities;
}

TeeLogger LogToStderrAndFiles(const std::vector<std::string>& files,
                              MetadataLevel stderr_level) {
  std::vector<SeverityTarget> log_severities = SeverityTargetsForFiles(files);
  log_severities.push_back(SeverityTarget{
      ConsoleSeverity(),
      std::make_shared<android::base::unique_fd>(dup(/* stderr */ 2)),
      stderr_level});
  return TeeLogger(log_severities);
}

}  // namespace looplab

/*
 * Copyright (C) 2018 The Android Open Source Project
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

#include "common/libs/utils/process_runner.h"

#include <string>
#include <utility>

#include <android-base/logging.h>
#include <android-base/strings.h>

#include "common/libs/utils/result.h"
#include "common/libs/utils/subprocess.h"

namespace looplab {
namespace {

// apt and debootstrap explain most failures on stdout, close to the end.
constexpr size_t kFailureOutputLines = 20;

std::string LastLines(const std::string& output, size_t count) {
  auto trimmed = android::base::Trim(output);
  size_t start = trimmed.size();
  for (size_t lines = 0; lines < count && start > 0; lines++) {
    auto newline = trimmed.rfind('\n', start - 1);
    if (newline == std::string::npos) {
      return trimmed;
    }
    start = newline;
  }
  return start == trimmed.size() ? trimmed : trimmed.substr(start + 1);
}

}  // namespace

int LocalProcessRunner::Run(Command&& command, const std::string* stdin,
                            std::string* stdout, std::string* stderr) {
  return RunWithManagedStdio(std::move(command), stdin, stdout, stderr);
}

Result<std::string> RunCommand(ProcessRunner& runner, Command&& command,
                               const std::string* stdin) {
  auto command_line = android::base::Join(command.Arguments(), " ");
  std::string stdout_str;
  std::string stderr_str;
  int exit_code =
      runner.Run(std::move(command), stdin, &stdout_str, &stderr_str);
  if (exit_code != 0) {
    auto stdout_tail = LastLines(stdout_str, kFailureOutputLines);
    if (!stdout_tail.empty()) {
      stdout_tail = "\nLast lines of stdout:\n" + stdout_tail;
    }
    return LL_ERR_KIND(ErrorKind::kSubprocessFailure,
                       "`" << command_line << "` exited with " << exit_code
                           << ": " << android::base::Trim(stderr_str)
                           << stdout_tail);
  }
  if (!stdout_str.empty()) {
    LOG(DEBUG) << "`" << command_line << "` stdout: " << stdout_str;
  }
  if (!stderr_str.empty()) {
    LOG(DEBUG) << "`" << command_line << "` stderr: " << stderr_str;
  }
  return stdout_str;
}

}  // namespace looplab

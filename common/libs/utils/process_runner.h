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
#pragma once

#include <string>

#include "common/libs/utils/result.h"
#include "common/libs/utils/subprocess.h"

namespace looplab {

// Abstraction of the blocking subprocess calls made by the image pipeline.
class ProcessRunner {
 public:
  ProcessRunner() = default;
  virtual ~ProcessRunner() = default;

  // Same contract as RunWithManagedStdio: the exit code of the process, or a
  // negative value when the process could not be run to completion.
  virtual int Run(Command&& command, const std::string* stdin,
                  std::string* stdout, std::string* stderr) = 0;

 private:
  ProcessRunner(const ProcessRunner&) = delete;
  ProcessRunner& operator=(const ProcessRunner&) = delete;
};

// Runs commands on the local host.
class LocalProcessRunner : public ProcessRunner {
 public:
  int Run(Command&& command, const std::string* stdin, std::string* stdout,
          std::string* stderr) override;
};

/*
 * Runs `command` through `runner` and returns its standard output.
 *
 * A non-zero exit fails with ErrorKind::kSubprocessFailure; the error message
 * carries the exit code and the captured standard error.
 */
Result<std::string> RunCommand(ProcessRunner& runner, Command&& command,
                               const std::string* stdin = nullptr);

}  // namespace looplab

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

#include <algorithm>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <android-base/strings.h>

#include "common/libs/utils/process_runner.h"
#include "common/libs/utils/subprocess.h"

namespace looplab {
namespace test {

struct RecordedCommand {
  std::vector<std::string> args;
  std::vector<std::string> env;
  std::string input;

  std::string CommandLine() const { return android::base::Join(args, " "); }
};

// Scripted ProcessRunner. Commands are recorded in call order and answered by
// the most recently added rule whose argument prefix matches; unmatched
// commands succeed with empty output.
class FakeProcessRunner : public ProcessRunner {
 public:
  struct Response {
    int exit_code = 0;
    std::string out;
    std::string err;
    // Runs before the response is returned, e.g. to create files a real tool
    // would have produced.
    std::function<void(const RecordedCommand&)> effect;
  };

  FakeProcessRunner& On(std::vector<std::string> prefix, Response response) {
    std::lock_guard<std::mutex> lock(mutex_);
    rules_.emplace_back(std::move(prefix), std::move(response));
    return *this;
  }

  int Run(Command&& command, const std::string* stdin, std::string* stdout,
          std::string* stderr) override {
    RecordedCommand recorded{command.Arguments(), command.Environment(),
                             stdin ? *stdin : ""};
    Response response;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      commands_.push_back(recorded);
      for (auto it = rules_.rbegin(); it != rules_.rend(); ++it) {
        if (Matches(recorded.args, it->first)) {
          response = it->second;
          break;
        }
      }
    }
    if (response.effect) {
      response.effect(recorded);
    }
    if (stdout) {
      *stdout = response.out;
    }
    if (stderr) {
      *stderr = response.err;
    }
    return response.exit_code;
  }

  std::vector<RecordedCommand> Commands() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return commands_;
  }

  std::vector<std::string> CommandLines() const {
    std::vector<std::string> lines;
    for (const auto& command : Commands()) {
      lines.push_back(command.CommandLine());
    }
    return lines;
  }

  // Index of the first recorded command starting with `prefix`, or -1.
  int IndexOf(const std::vector<std::string>& prefix) const {
    auto commands = Commands();
    for (size_t i = 0; i < commands.size(); i++) {
      if (Matches(commands[i].args, prefix)) {
        return static_cast<int>(i);
      }
    }
    return -1;
  }

  size_t Count(const std::vector<std::string>& prefix) const {
    auto commands = Commands();
    return std::count_if(commands.begin(), commands.end(),
                         [&prefix](const RecordedCommand& command) {
                           return Matches(command.args, prefix);
                         });
  }

  bool Ran(const std::vector<std::string>& prefix) const {
    return IndexOf(prefix) >= 0;
  }

 private:
  static bool Matches(const std::vector<std::string>& args,
                      const std::vector<std::string>& prefix) {
    return prefix.size() <= args.size() &&
           std::equal(prefix.begin(), prefix.end(), args.begin());
  }

  mutable std::mutex mutex_;
  std::vector<std::pair<std::vector<std::string>, Response>> rules_;
  std::vector<RecordedCommand> commands_;
};

}  // namespace test
}  // namespace looplab

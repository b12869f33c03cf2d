//
// Copyright (C) 2022 The Android Open Source Project
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

#include "common/libs/utils/environment.h"

#include <stdlib.h>

#include <optional>
#include <string>

#include <gtest/gtest.h>

namespace looplab {
namespace {

// Sets an environment variable for the lifetime of the object.
class ScopedEnv {
 public:
  ScopedEnv(const char* name, const char* value) : name_(name) {
    const char* old = getenv(name);
    if (old) {
      old_ = old;
    }
    if (value) {
      setenv(name, value, 1);
    } else {
      unsetenv(name);
    }
  }
  ~ScopedEnv() {
    if (old_) {
      setenv(name_.c_str(), old_->c_str(), 1);
    } else {
      unsetenv(name_.c_str());
    }
  }

 private:
  std::string name_;
  std::optional<std::string> old_;
};

}  // namespace

TEST(EnvironmentTest, StringFromEnvFallsBack) {
  ScopedEnv unset("LOOPLAB_TEST_UNSET", nullptr);
  ScopedEnv set("LOOPLAB_TEST_SET", "value");

  EXPECT_EQ(StringFromEnv("LOOPLAB_TEST_UNSET", "default"), "default");
  EXPECT_EQ(StringFromEnv("LOOPLAB_TEST_SET", "default"), "value");
}

TEST(EnvironmentTest, NoContinuousIntegrationByDefault) {
  ScopedEnv ci("CI", nullptr);
  ScopedEnv actions("GITHUB_ACTIONS", nullptr);

  EXPECT_FALSE(RunningUnderContinuousIntegration());
}

TEST(EnvironmentTest, DetectsHostedRunner) {
  ScopedEnv ci("CI", nullptr);
  ScopedEnv actions("GITHUB_ACTIONS", "true");

  EXPECT_TRUE(RunningUnderContinuousIntegration());
}

TEST(EnvironmentTest, DetectsGenericCiVariable) {
  ScopedEnv actions("GITHUB_ACTIONS", nullptr);
  {
    ScopedEnv ci("CI", "1");
    EXPECT_TRUE(RunningUnderContinuousIntegration());
  }
  {
    ScopedEnv ci("CI", "false");
    EXPECT_FALSE(RunningUnderContinuousIntegration());
  }
  {
    ScopedEnv ci("CI", "0");
    EXPECT_FALSE(RunningUnderContinuousIntegration());
  }
}

}  // namespace looplab

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

#include "common/libs/utils/archive.h"

#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/fake_process_runner.h"
#include "common/libs/utils/result_matchers.h"

namespace looplab {

using test::FakeProcessRunner;
using ::testing::ElementsAre;

TEST(ArchiveTest, ExtractAllKeepsOwnership) {
  FakeProcessRunner runner;
  Archive archive("/cache/rootfs.tar.xz", runner);

  ASSERT_THAT(archive.ExtractAll("/mnt/looplab/x64"), IsOk());

  ASSERT_EQ(runner.Commands().size(), 1u);
  EXPECT_THAT(runner.Commands()[0].args,
              ElementsAre(kBsdtarPath, "-x", "-p", "--numeric-owner", "-S",
                          "-C", "/mnt/looplab/x64", "-f",
                          "/cache/rootfs.tar.xz"));
}

TEST(ArchiveTest, ExtractionFailureIsSubprocessFailure) {
  FakeProcessRunner runner;
  runner.On({kBsdtarPath}, {.exit_code = 1, .err = "Unrecognized archive"});
  Archive archive("/cache/rootfs.tar.xz", runner);

  auto result = archive.ExtractAll("/mnt/looplab/x64");

  EXPECT_THAT(result, IsErrorOfKind(ErrorKind::kSubprocessFailure));
  EXPECT_THAT(result,
              IsErrorAndMessage(::testing::HasSubstr("Unrecognized archive")));
}

TEST(ArchiveTest, CreateArchivePassesExcludes) {
  FakeProcessRunner runner;

  ASSERT_THAT(CreateArchive(runner, "/mnt/looplab/x64", "/cache/key.tar.gz",
                            {"./proc/*", "./sys/*"}),
              IsOk());

  ASSERT_EQ(runner.Commands().size(), 1u);
  EXPECT_THAT(runner.Commands()[0].args,
              ElementsAre(kBsdtarPath, "-c", "-z", "-p", "--numeric-owner",
                          "-f", "/cache/key.tar.gz", "--exclude", "./proc/*",
                          "--exclude", "./sys/*", "-C", "/mnt/looplab/x64",
                          "."));
}

}  // namespace looplab

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

#include "host/libs/image/mount_stack.h"

#include <string>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/fake_process_runner.h"
#include "common/libs/utils/files.h"
#include "common/libs/utils/result_matchers.h"

namespace looplab {

using test::FakeProcessRunner;
using ::testing::ElementsAre;

class MountStackTest : public ::testing::Test {
 protected:
  MountStackTest() : root_(std::string(dir_.path) + "/root"), mounter_(runner_) {}

  android::base::TemporaryDir dir_;
  std::string root_;
  FakeProcessRunner runner_;
  Mounter mounter_;
};

TEST_F(MountStackTest, MountCreatesTargetAndRunsMount) {
  auto mounted = mounter_.Mount("/dev/loop0p2", root_, "ext4");

  ASSERT_THAT(mounted, IsOk());
  EXPECT_TRUE(DirectoryExists(root_));
  EXPECT_EQ(mounted->FsType(), "ext4");
  EXPECT_TRUE(runner_.Ran({"mount", "-t", "ext4", "/dev/loop0p2", root_}));
}

TEST_F(MountStackTest, MountFailureIsMountFailed) {
  runner_.On({"mount"}, {.exit_code = 32, .err = "mount: wrong fs type"});

  EXPECT_THAT(mounter_.Mount("/dev/loop0p2", root_, "ext4"),
              IsErrorOfKind(ErrorKind::kMountFailed));
  EXPECT_THAT(mounter_.Bind("/proc", root_ + "/proc"),
              IsErrorOfKind(ErrorKind::kMountFailed));
  EXPECT_FALSE(runner_.Ran({"umount"}));
}

TEST_F(MountStackTest, UnmountIsIdempotent) {
  auto mounted = mounter_.Bind("/proc", root_ + "/proc");
  ASSERT_THAT(mounted, IsOk());

  mounted->Unmount();
  mounted->Unmount();
  mounter_.Unmount(*mounted);

  EXPECT_FALSE(mounted->Mounted());
  EXPECT_EQ(runner_.Count({"umount"}), 1u);
}

TEST_F(MountStackTest, BusyTargetIsDetachedLazily) {
  runner_.On({"umount", root_}, {.exit_code = 32, .err = "target is busy"});
  auto mounted = mounter_.Mount("/dev/loop0p2", root_, "ext4");
  ASSERT_THAT(mounted, IsOk());

  mounted->Unmount();

  EXPECT_TRUE(runner_.Ran({"umount", "--lazy", root_}));
}

TEST_F(MountStackTest, VanishedMountIsOnlyLogged) {
  runner_.On({"umount"}, {.exit_code = 32, .err = "not mounted"});
  auto mounted = mounter_.Mount("/dev/loop0p2", root_, "ext4");
  ASSERT_THAT(mounted, IsOk());

  mounted->Unmount();

  EXPECT_FALSE(mounted->Mounted());
}

TEST_F(MountStackTest, TeardownIsReverseOfSetup) {
  {
    MountStack mounts;
    mounts.Push(*mounter_.Mount("/dev/loop0p2", root_, "ext4"));
    mounts.Push(*mounter_.Mount("/dev/loop0p1", root_ + "/boot/efi", "vfat"));
    {
      MountStack pseudo;
      for (const char* fs : {"/proc", "/sys", "/dev", "/dev/pts"}) {
        pseudo.Push(*mounter_.Bind(fs, root_ + fs));
      }
      EXPECT_EQ(pseudo.Size(), 4u);
    }
    EXPECT_EQ(mounts.Size(), 2u);
    EXPECT_EQ(mounts.Top().Target(), root_ + "/boot/efi");
  }

  std::vector<std::string> unmounts;
  for (const auto& command : runner_.Commands()) {
    if (command.args[0] == "umount") {
      unmounts.push_back(command.args.back());
    }
  }
  EXPECT_THAT(unmounts,
              ElementsAre(root_ + "/dev/pts", root_ + "/dev", root_ + "/sys",
                          root_ + "/proc", root_ + "/boot/efi", root_));
}

TEST_F(MountStackTest, PopUnmountsOnlyTheTop) {
  MountStack mounts;
  mounts.Push(*mounter_.Mount("/dev/loop0p2", root_, "ext4"));
  mounts.Push(*mounter_.Bind("/proc", root_ + "/proc"));

  mounts.Pop();

  EXPECT_EQ(mounts.Size(), 1u);
  EXPECT_EQ(runner_.Count({"umount"}), 1u);
  EXPECT_TRUE(runner_.Ran({"umount", root_ + "/proc"}));
}

}  // namespace looplab

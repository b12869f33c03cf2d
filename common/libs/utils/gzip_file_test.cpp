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

#include "common/libs/utils/gzip_file.h"

#include <zlib.h>

#include <string>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/result_matchers.h"

namespace looplab {
namespace {

void WriteGzip(const std::string& path, const std::string& contents) {
  gzFile out = gzopen(path.c_str(), "wb");
  ASSERT_NE(out, nullptr);
  ASSERT_EQ(gzwrite(out, contents.data(), contents.size()),
            static_cast<int>(contents.size()));
  ASSERT_EQ(gzclose(out), Z_OK);
}

}  // namespace

TEST(GzipFileTest, DetectsMagic) {
  android::base::TemporaryDir dir;
  const std::string compressed = std::string(dir.path) + "/vmlinuz.gz";
  const std::string plain = std::string(dir.path) + "/vmlinuz";
  WriteGzip(compressed, "ARMd kernel image");
  ASSERT_TRUE(android::base::WriteStringToFile("MZ pe stub", plain));

  auto compressed_magic = HasGzipMagic(compressed);
  auto plain_magic = HasGzipMagic(plain);

  ASSERT_THAT(compressed_magic, IsOk());
  EXPECT_TRUE(*compressed_magic);
  ASSERT_THAT(plain_magic, IsOk());
  EXPECT_FALSE(*plain_magic);
}

TEST(GzipFileTest, ShortFileHasNoMagic) {
  android::base::TemporaryDir dir;
  const std::string path = std::string(dir.path) + "/tiny";
  ASSERT_TRUE(android::base::WriteStringToFile("\x1f", path));

  auto magic = HasGzipMagic(path);

  ASSERT_THAT(magic, IsOk());
  EXPECT_FALSE(*magic);
}

TEST(GzipFileTest, MissingFileIsAnError) {
  EXPECT_THAT(HasGzipMagic("/nonexistent/looplab/vmlinuz"), IsError());
}

TEST(GzipFileTest, Decompresses) {
  android::base::TemporaryDir dir;
  const std::string compressed = std::string(dir.path) + "/vmlinuz.gz";
  const std::string plain = std::string(dir.path) + "/vmlinuz";
  std::string contents(256 * 1024, 'k');
  contents += "tail";
  WriteGzip(compressed, contents);
  ASSERT_TRUE(android::base::WriteStringToFile("stale", plain));

  ASSERT_THAT(GunzipFile(compressed, plain), IsOk());

  EXPECT_EQ(ReadFile(plain), contents);
}

}  // namespace looplab

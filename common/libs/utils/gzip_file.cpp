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

#include "common/libs/utils/gzip_file.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>
#include <zlib.h>

#include <memory>
#include <string>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <android-base/unique_fd.h>

#include "common/libs/utils/result.h"

namespace looplab {
namespace {

constexpr unsigned char kGzipMagic[] = {0x1f, 0x8b};

struct GzCloser {
  void operator()(gzFile file) const { gzclose(file); }
};
using GzFilePtr = std::unique_ptr<gzFile_s, GzCloser>;

std::string GzErrorString(gzFile file) {
  int errnum = Z_OK;
  const char* message = gzerror(file, &errnum);
  if (errnum == Z_ERRNO) {
    return strerror(errno);
  }
  return message ? message : "unknown zlib error";
}

}  // namespace

Result<bool> HasGzipMagic(const std::string& path) {
  android::base::unique_fd fd(open(path.c_str(), O_RDONLY | O_CLOEXEC));
  LL_EXPECTF(fd.get() >= 0, "Could not open \"{}\": {}", path,
             strerror(errno));
  unsigned char header[sizeof(kGzipMagic)] = {};
  if (!android::base::ReadFully(fd, header, sizeof(header))) {
    // Shorter than the magic number.
    return false;
  }
  return memcmp(header, kGzipMagic, sizeof(kGzipMagic)) == 0;
}

Result<void> GunzipFile(const std::string& source,
                        const std::string& destination) {
  GzFilePtr in(gzopen(source.c_str(), "rb"));
  LL_EXPECTF(in.get() != nullptr, "gzopen(\"{}\") failed: {}", source,
             strerror(errno));
  android::base::unique_fd out(open(destination.c_str(),
                                    O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                                    0644));
  LL_EXPECTF(out.get() >= 0, "Could not open \"{}\" for writing: {}",
             destination, strerror(errno));

  char buffer[1 << 16];
  size_t total = 0;
  while (true) {
    int bytes_read = gzread(in.get(), buffer, sizeof(buffer));
    LL_EXPECTF(bytes_read >= 0, "Failed to inflate \"{}\": {}", source,
               GzErrorString(in.get()));
    if (bytes_read == 0) {
      break;
    }
    LL_EXPECTF(android::base::WriteFully(out, buffer, bytes_read),
               "Failed to write \"{}\": {}", destination, strerror(errno));
    total += bytes_read;
  }
  LOG(DEBUG) << "Inflated " << source << " into " << total << " bytes at "
             << destination;
  return {};
}

}  // namespace looplab

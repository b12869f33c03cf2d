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

#include "host/libs/image/filesystem_probe.h"

#include <string.h>

#include <string>

#include <android-base/logging.h>
#include <blkid.h>

#include "common/libs/utils/result.h"

namespace looplab {

Result<FilesystemInfo> BlkidFilesystemProbe::Probe(const std::string& device) {
  blkid_cache cache;
  // /dev/null as the cache file keeps stale entries from an earlier format out.
  if (blkid_get_cache(&cache, "/dev/null") < 0) {
    return LL_ERR("blkid_get_cache failed for \"" << device << "\"");
  }
  blkid_dev dev = blkid_get_dev(cache, device.c_str(), BLKID_DEV_NORMAL);
  if (!dev) {
    blkid_put_cache(cache);
    return LL_ERR("blkid_get_dev failed for \"" << device << "\"");
  }

  FilesystemInfo info;
  const char *type, *value;
  blkid_tag_iterate iter = blkid_tag_iterate_begin(dev);
  while (blkid_tag_next(iter, &type, &value) == 0) {
    if (!strcmp(type, "TYPE")) {
      info.type = value;
    } else if (!strcmp(type, "UUID")) {
      info.uuid = value;
    } else if (!strcmp(type, "PARTUUID")) {
      info.partuuid = value;
    }
  }
  blkid_tag_iterate_end(iter);
  blkid_put_cache(cache);
  LOG(DEBUG) << device << ": TYPE=" << info.type << " UUID=" << info.uuid
             << " PARTUUID=" << info.partuuid;
  return info;
}

Result<FilesystemInfo> ExpectFilesystem(FilesystemProbe& probe,
                                        const std::string& device,
                                        const std::string& fstype) {
  auto info = probe.Probe(device);
  if (!info.ok()) {
    return LL_ERR_KIND(ErrorKind::kPreconditionViolation,
                       "Malformed partition layout, could not probe \""
                           << device << "\": " << info.error().Message());
  }
  if (info->type != fstype) {
    return LL_ERR_KIND(ErrorKind::kPreconditionViolation,
                       "Malformed partition layout: \""
                           << device << "\" holds \"" << info->type
                           << "\", expected \"" << fstype << "\"");
  }
  return info;
}

}  // namespace looplab

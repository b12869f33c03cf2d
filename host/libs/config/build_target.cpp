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

#include "host/libs/config/build_target.h"

#include <cctype>
#include <cstdint>
#include <limits>
#include <set>
#include <string>
#include <vector>

#include <android-base/parseint.h>
#include <android-base/strings.h>
#include <fmt/core.h>
#include <json/json.h>

#include "common/libs/utils/json.h"
#include "common/libs/utils/result.h"
#include "host/libs/config/arch_info.h"

namespace looplab {
namespace {

constexpr char kArchPlaceholder[] = "{arch}";

std::string JoinPath(const std::string& dir, const std::string& name) {
  if (dir.empty() || android::base::StartsWith(name, "/")) {
    return name;
  }
  return android::base::EndsWith(dir, "/") ? dir + name : dir + "/" + name;
}

Result<std::string> StringMember(const Json::Value& entry, const char* name,
                                 const std::string& fallback) {
  if (!HasValue(entry, {name})) {
    return fallback;
  }
  return LL_EXPECT(GetValue<std::string>(entry, {name}));
}

}  // namespace

Result<uint64_t> ParseImageSize(const std::string& size) {
  auto value = android::base::Trim(size);
  LL_EXPECT(!value.empty(), "Empty image size");
  uint64_t multiplier = 1;
  switch (std::toupper(static_cast<unsigned char>(value.back()))) {
    case 'T':
      multiplier <<= 10;
      [[fallthrough]];
    case 'G':
      multiplier <<= 10;
      [[fallthrough]];
    case 'M':
      multiplier <<= 10;
      [[fallthrough]];
    case 'K':
      multiplier <<= 10;
      value.pop_back();
      break;
    default:
      break;
  }
  uint64_t count = 0;
  LL_EXPECTF(android::base::ParseUint(value, &count),
             "Image size \"{}\" is not a number with an optional K/M/G/T suffix",
             size);
  LL_EXPECTF(count > 0, "Image size \"{}\" must be positive", size);
  LL_EXPECTF(count <= std::numeric_limits<uint64_t>::max() / multiplier,
             "Image size \"{}\" overflows", size);
  return count * multiplier;
}

std::string ExpandArchTemplate(const std::string& path_template, Arch arch) {
  const auto& info = GetArchInfo(arch);
  auto expanded =
      android::base::StringReplace(path_template, kArchPlaceholder, info.tag,
                                   /* all */ true);
  expanded = android::base::StringReplace(expanded, "{debian_arch}",
                                          info.debian_arch, true);
  return android::base::StringReplace(expanded, "{uefi_id}", info.uefi_id,
                                      true);
}

Result<BuildTarget> MakeBuildTarget(Arch arch, const TargetTemplate& defaults) {
  auto image_size_bytes = LL_EXPECT(ParseImageSize(defaults.image_size));
  BuildTarget target{
      .arch = arch,
      .image_path = ExpandArchTemplate(
          JoinPath(defaults.output_dir, defaults.image_name), arch),
      .image_size_bytes = image_size_bytes,
      .rootfs_tarball = ExpandArchTemplate(defaults.rootfs_tarball, arch),
      .uefi_shell = ExpandArchTemplate(defaults.uefi_shell, arch),
      .mount_point = "",
  };
  // Concurrent builds must never share a mount point.
  if (defaults.mount_root.find(kArchPlaceholder) != std::string::npos) {
    target.mount_point = ExpandArchTemplate(defaults.mount_root, arch);
  } else {
    target.mount_point =
        fmt::format("{}_{}", defaults.mount_root, GetArchInfo(arch).tag);
  }
  LL_EXPECT_NE(target.rootfs_tarball, "", "No rootfs tarball for " << arch);
  LL_EXPECT_NE(target.uefi_shell, "", "No UEFI shell binary for " << arch);
  return target;
}

Result<std::vector<BuildTarget>> MakeBuildTargets(
    const std::vector<std::string>& arch_tags, const TargetTemplate& defaults) {
  std::vector<BuildTarget> targets;
  for (const auto& tag : arch_tags) {
    auto arch = LL_EXPECT(ParseArch(android::base::Trim(tag)));
    targets.emplace_back(LL_EXPECT(MakeBuildTarget(arch, defaults)));
  }
  LL_EXPECT(ValidateDistinctResources(targets));
  return targets;
}

Result<std::vector<BuildTarget>> LoadBuildTargets(
    const std::string& config_path, const TargetTemplate& defaults) {
  auto root = LL_EXPECT(LoadFromFile(config_path));
  LL_EXPECTF(root.isObject() && root["targets"].isArray(),
             "\"{}\" has no \"targets\" array", config_path);
  std::vector<BuildTarget> targets;
  for (const auto& entry : root["targets"]) {
    auto arch_tag = LL_EXPECT(GetValue<std::string>(entry, {"arch"}),
                              "Target entry without an architecture");
    auto arch = LL_EXPECT(ParseArch(arch_tag));
    TargetTemplate merged = defaults;
    merged.output_dir =
        LL_EXPECT(StringMember(entry, "output_dir", defaults.output_dir));
    merged.image_name =
        LL_EXPECT(StringMember(entry, "image_name", defaults.image_name));
    merged.rootfs_tarball = LL_EXPECT(
        StringMember(entry, "rootfs_tarball", defaults.rootfs_tarball));
    merged.uefi_shell =
        LL_EXPECT(StringMember(entry, "uefi_shell", defaults.uefi_shell));
    merged.mount_root =
        LL_EXPECT(StringMember(entry, "mount_root", defaults.mount_root));
    if (entry.isMember("image_size") && entry["image_size"].isUInt64()) {
      merged.image_size = std::to_string(entry["image_size"].asUInt64());
    } else {
      merged.image_size =
          LL_EXPECT(StringMember(entry, "image_size", defaults.image_size));
    }
    targets.emplace_back(LL_EXPECTF(MakeBuildTarget(arch, merged),
                                    "In target \"{}\" of {}", arch_tag,
                                    config_path));
  }
  LL_EXPECTF(!targets.empty(), "\"{}\" lists no targets", config_path);
  LL_EXPECT(ValidateDistinctResources(targets));
  return targets;
}

Result<void> ValidateDistinctResources(
    const std::vector<BuildTarget>& targets) {
  std::set<std::string> image_paths;
  std::set<std::string> mount_points;
  for (const auto& target : targets) {
    LL_EXPECTF(image_paths.insert(target.image_path).second,
               "Image path \"{}\" is used by more than one target",
               target.image_path);
    LL_EXPECTF(mount_points.insert(target.mount_point).second,
               "Mount point \"{}\" is used by more than one target",
               target.mount_point);
  }
  return {};
}

std::string StageTag(const BuildTarget& target, const char* stage) {
  return fmt::format("[{}/{}]", target.Info().tag, stage);
}

}  // namespace looplab

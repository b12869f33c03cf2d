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

#include "host/libs/image/rootfs_cache.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <android-base/logging.h>
#include <android-base/unique_fd.h>
#include <fmt/core.h>
#include <json/json.h>
#include <openssl/evp.h>

#include "common/libs/utils/archive.h"
#include "common/libs/utils/files.h"
#include "common/libs/utils/json.h"
#include "common/libs/utils/result.h"
#include "host/libs/image/guest_configuration.h"

namespace looplab {
namespace {

constexpr int kManifestVersion = 2;

// Mount points whose contents never belong in a cached tree.
const std::vector<std::string>& TreeExcludes() {
  static const std::vector<std::string> kExcludes = {
      "./boot/efi/*", "./proc/*", "./sys/*", "./dev/*",
  };
  return kExcludes;
}

std::string HexEncode(const unsigned char* data, size_t size) {
  std::string hex;
  hex.reserve(size * 2);
  for (size_t i = 0; i < size; i++) {
    hex += fmt::format("{:02x}", data[i]);
  }
  return hex;
}

Result<std::string> Sha256(const std::string& data) {
  std::unique_ptr<EVP_MD_CTX, void (*)(EVP_MD_CTX*)> ctx(EVP_MD_CTX_new(),
                                                         EVP_MD_CTX_free);
  LL_EXPECT(ctx.get() != nullptr);
  LL_EXPECT(EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1);
  LL_EXPECT(EVP_DigestUpdate(ctx.get(), data.data(), data.size()) == 1);
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  LL_EXPECT(EVP_DigestFinal_ex(ctx.get(), digest, &length) == 1);
  return HexEncode(digest, length);
}

}  // namespace

Result<std::string> Sha256File(const std::string& path) {
  android::base::unique_fd fd(open(path.c_str(), O_RDONLY | O_CLOEXEC));
  LL_EXPECTF(fd.get() >= 0, "Could not open \"{}\": {}", path,
             strerror(errno));
  std::unique_ptr<EVP_MD_CTX, void (*)(EVP_MD_CTX*)> ctx(EVP_MD_CTX_new(),
                                                         EVP_MD_CTX_free);
  LL_EXPECT(ctx.get() != nullptr);
  LL_EXPECT(EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1);
  std::vector<char> buffer(1 << 20);
  while (true) {
    auto bytes_read =
        TEMP_FAILURE_RETRY(read(fd.get(), buffer.data(), buffer.size()));
    LL_EXPECTF(bytes_read >= 0, "Failed to read \"{}\": {}", path,
               strerror(errno));
    if (bytes_read == 0) {
      break;
    }
    LL_EXPECT(EVP_DigestUpdate(ctx.get(), buffer.data(), bytes_read) == 1);
  }
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  LL_EXPECT(EVP_DigestFinal_ex(ctx.get(), digest, &length) == 1);
  return HexEncode(digest, length);
}

Result<std::string> ConfiguredTreeKey(
    const std::string& tarball_sha256, Arch arch, bool install_iscsi,
    const std::vector<std::string>& packages,
    const std::string& configuration_script) {
  std::string material = fmt::format("v{}\ntarball={}\narch={}\niscsi={}\n",
                                     kManifestVersion, tarball_sha256,
                                     ArchTag(arch), install_iscsi ? 1 : 0);
  for (const auto& package : packages) {
    material += "package=" + package + "\n";
  }
  material += "script=" + LL_EXPECT(Sha256(configuration_script)) + "\n";
  return LL_EXPECT(Sha256(material));
}

RootfsCache::RootfsCache(std::string cache_dir, ProcessRunner& runner)
    : cache_dir_(std::move(cache_dir)), runner_(runner) {}

std::string RootfsCache::ArchivePath(const std::string& key) const {
  return cache_dir_ + "/" + key + ".tar.gz";
}

std::string RootfsCache::ManifestPath(const std::string& key) const {
  return cache_dir_ + "/" + key + ".json";
}

Result<std::string> RootfsCache::KeyFor(const BuildTarget& target,
                                        const ImportOptions& options) const {
  auto tarball_sha256 = LL_EXPECT(Sha256File(target.rootfs_tarball));
  return LL_EXPECT(ConfiguredTreeKey(
      tarball_sha256, target.arch, options.install_iscsi,
      GuestPackages(target.Info(), options),
      GuestConfigurationScript(target.Info(), options)));
}

Result<std::optional<std::string>> RootfsCache::Lookup(
    const std::string& key) const {
  const auto manifest_path = ManifestPath(key);
  const auto archive_path = ArchivePath(key);
  if (!FileExists(manifest_path) || !FileHasContent(archive_path)) {
    LOG(DEBUG) << "No configured tree cached under " << key;
    return std::nullopt;
  }
  auto manifest = LoadFromFile(manifest_path);
  if (!manifest.ok()) {
    LOG(WARNING) << "Ignoring unreadable cache manifest " << manifest_path
                 << ": " << manifest.error().Message();
    return std::nullopt;
  }
  auto recorded_key = GetValue<std::string>(*manifest, {"key"});
  if (!recorded_key.ok() || *recorded_key != key) {
    LOG(WARNING) << "Cache manifest " << manifest_path
                 << " does not match key " << key << ", rebuilding";
    return std::nullopt;
  }
  return archive_path;
}

Result<void> RootfsCache::Restore(const std::string& archive,
                                  const std::string& tree_dir) {
  LOG(INFO) << "Restoring configured tree from " << archive;
  Archive tree(archive, runner_);
  LL_EXPECT(tree.ExtractAll(tree_dir));
  return {};
}

Result<void> RootfsCache::Store(const std::string& key,
                                const std::string& tree_dir,
                                const BuildTarget& target,
                                const ImportOptions& options) {
  LL_EXPECT(EnsureDirectoryExists(cache_dir_));
  const auto archive_path = ArchivePath(key);
  const auto partial_path = archive_path + ".partial";
  LOG(INFO) << "Caching configured tree of " << tree_dir << " as "
            << archive_path;
  LL_EXPECT(CreateArchive(runner_, tree_dir, partial_path, TreeExcludes()));
  LL_EXPECT(RenameFile(partial_path, archive_path));

  Json::Value manifest;
  manifest["version"] = kManifestVersion;
  manifest["key"] = key;
  manifest["arch"] = ArchTag(target.arch);
  manifest["rootfs_tarball"] = target.rootfs_tarball;
  manifest["install_iscsi"] = options.install_iscsi;
  manifest["maintenance_user"] = options.maintenance_user;
  Json::Value packages(Json::arrayValue);
  for (const auto& package : GuestPackages(target.Info(), options)) {
    packages.append(package);
  }
  manifest["packages"] = packages;
  LL_EXPECT(WriteToFile(manifest, ManifestPath(key)));
  return {};
}

}  // namespace looplab

/**
 * @file asset_pool.cpp
 * @brief Asset directory scanning and random pool selection implementation
 */

#include "ytp_forge/asset_pool.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

#include "ytp_forge/logging.hpp"

namespace ytp_forge {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

const std::vector<std::string> IMAGE_EXTS = {".png",  ".jpg", ".jpeg",
                                             ".gif",  ".webp", ".bmp"};
const std::vector<std::string> AUDIO_EXTS = {".mp3", ".wav", ".aac", ".m4a",
                                             ".ogg"};
const std::vector<std::string> VIDEO_EXTS = {".mp4", ".mov", ".mkv", ".webm",
                                             ".avi"};

bool contains(const std::vector<std::string> &exts, const std::string &ext) {
  return std::find(exts.begin(), exts.end(), ext) != exts.end();
}

} // anonymous namespace

// **---- Pool Kinds ----**

std::optional<AssetKind> pool_kind(const std::string &pool) {
  static const std::map<std::string, AssetKind> kinds = {
      {Pool::IMAGES, AssetKind::Image},
      {Pool::MEMES, AssetKind::Visual},
      {Pool::ERRORS, AssetKind::Visual},
      {Pool::ADVERTS, AssetKind::Visual},
      {Pool::OVERLAY_VIDEOS, AssetKind::Video},
      {Pool::SOUNDS, AssetKind::Audio},
      {Pool::MEME_SOUNDS, AssetKind::Audio},
  };
  auto it = kinds.find(pool);
  if (it == kinds.end())
    return std::nullopt;
  return it->second;
}

bool matches_kind(const std::string &filename, AssetKind kind) {
  std::string ext = fs::path(filename).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  switch (kind) {
  case AssetKind::Image:
    return contains(IMAGE_EXTS, ext);
  case AssetKind::Audio:
    return contains(AUDIO_EXTS, ext);
  case AssetKind::Video:
    return contains(VIDEO_EXTS, ext);
  case AssetKind::Visual:
    return contains(IMAGE_EXTS, ext) || contains(VIDEO_EXTS, ext);
  }
  return false;
}

// **---- Scanning ----**

std::vector<std::string> gather_assets(const std::string &dir, AssetKind kind) {
  std::vector<std::string> files;
  if (dir.empty())
    return files;

  std::error_code ec;
  if (!fs::is_directory(dir, ec))
    return files;

  fs::directory_iterator it(dir, ec);
  if (ec) {
    LOG_WARN("Cannot read asset directory {}: {}", dir, ec.message());
    return files;
  }

  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec)
      break;
    std::error_code entry_ec;
    if (!it->is_regular_file(entry_ec))
      continue;
    if (matches_kind(it->path().filename().string(), kind)) {
      files.push_back(it->path().string());
    }
  }
  if (ec) {
    LOG_WARN("Listing asset directory {} failed: {}", dir, ec.message());
    return {};
  }
  std::sort(files.begin(), files.end());
  return files;
}

AssetPools load_asset_pools(const std::map<std::string, std::string> &dirs) {
  AssetPools pools;
  for (const auto &[pool, dir] : dirs) {
    auto kind = pool_kind(pool);
    if (!kind) {
      LOG_WARN("Unknown asset pool '{}' ignored", pool);
      continue;
    }
    if (dir.empty())
      continue;

    pools[pool] = gather_assets(dir, *kind);
    LOG_INFO("Asset pool {:<15} {:>4} files from {}", pool, pools[pool].size(),
             dir);
  }
  return pools;
}

// **---- Selection ----**

std::optional<std::string> choose_asset(const AssetPools &pools,
                                        const std::string &pool,
                                        RandomSource &rng) {
  auto it = pools.find(pool);
  if (it == pools.end() || it->second.empty())
    return std::nullopt;
  const auto &files = it->second;
  return files[rng.index(files.size())];
}

} // namespace ytp_forge

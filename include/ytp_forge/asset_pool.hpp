/**
 * @file asset_pool.hpp
 * @brief Asset directory scanning and random pool selection
 *
 * @details Provides:
 *
 *          - gather_assets(): non-recursive, extension-filtered directory
 *            listing for one pool
 *
 *          - load_asset_pools(): builds AssetPools from pool -> directory
 *
 *          - choose_asset(): uniform pick from a named pool
 *
 * @note Missing or empty directories are never an error; they yield an
 *       empty pool and the effects that need it degrade to a no-op.
 */

#ifndef YTP_FORGE_ASSET_POOL_HPP
#define YTP_FORGE_ASSET_POOL_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "random_source.hpp"
#include "types.hpp"

namespace ytp_forge {

/**
 * @enum AssetKind
 * @brief Which file extensions a pool accepts.
 */
enum class AssetKind {
  Image,  //< .png .jpg .jpeg .gif .webp .bmp
  Audio,  //< .mp3 .wav .aac .m4a .ogg
  Video,  //< .mp4 .mov .mkv .webm .avi
  Visual, //< Image or Video
};

/**
 * @brief Media kind accepted by a known pool.
 * @param pool Pool name (see Pool namespace)
 * @return Kind, or std::nullopt for an unknown pool name
 */
std::optional<AssetKind> pool_kind(const std::string &pool);

/**
 * @brief Check a file name's extension against a kind (case-insensitive).
 */
bool matches_kind(const std::string &filename, AssetKind kind);

/**
 * @brief List asset files directly inside a directory.
 *
 * @param dir Directory to scan (top level only)
 * @param kind Extensions to accept
 * @return Sorted full paths; empty if dir is empty, missing or unreadable
 */
std::vector<std::string> gather_assets(const std::string &dir, AssetKind kind);

/**
 * @brief Scan one directory per pool.
 *
 * @param dirs Pool name -> directory; empty directory strings are skipped
 * @return Pools for every known pool name in dirs
 * @note Unknown pool names are logged and ignored.
 */
AssetPools load_asset_pools(const std::map<std::string, std::string> &dirs);

/**
 * @brief Pick one path uniformly at random from a pool.
 *
 * @param pools All pools
 * @param pool Pool name
 * @param rng Random source; drawn from only when the pool is non-empty
 * @return Chosen path, or std::nullopt if the pool is absent or empty
 */
std::optional<std::string> choose_asset(const AssetPools &pools,
                                        const std::string &pool,
                                        RandomSource &rng);

} // namespace ytp_forge

#endif // YTP_FORGE_ASSET_POOL_HPP

#pragma once
///@file

#include "gcrelay/store/store-dir-config.hh"

#include <filesystem>
#include <map>

namespace gcrelay::roots {

/**
 * A mapping from a store path to the set of links that keep it alive.
 */
typedef std::map<StorePath, StringSet> Roots;

/**
 * Follow symlinks starting at `link` until a path inside the store is
 * reached, and return the store path containing it. Returns
 * `std::nullopt` for dangling chains, chains that leave the store and
 * chains longer than `maxFollow`.
 */
std::optional<StorePath>
followLinksToStorePath(const StoreDirConfig & store, const std::filesystem::path & link, unsigned int maxFollow = 40);

/**
 * Walk `path` recursively and record every symlink whose chain ends in
 * the store. Unreadable entries and dangling links are skipped.
 */
void findRoots(
    const StoreDirConfig & store, const Path & path, std::filesystem::file_type type, Roots & roots);

/**
 * Return the roots under `gcrootsDir`.
 */
Roots findRoots(const StoreDirConfig & store, const std::filesystem::path & gcrootsDir);

/**
 * Return the store paths kept alive by the roots under `gcrootsDir`.
 */
StorePathSet findRootPaths(const StoreDirConfig & store, const std::filesystem::path & gcrootsDir);

} // namespace gcrelay::roots

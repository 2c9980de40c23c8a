#pragma once
///@file

#include "gcrelay/store/store-dir-config.hh"
#include "gcrelay/util/error.hh"

#include <filesystem>
#include <map>

namespace gcrelay {

/**
 * A filesystem operation on a root marker failed. The store's garbage
 * collector may or may not see the marker.
 */
MakeError(MaterializationError, SysError);

/**
 * Creates and removes the on-disk root markers that keep store paths
 * alive. A marker is a symlink in the roots directory named
 * `nix32(sha1(<printed store path>))` and pointing at the printed store
 * path, so the marker for a given path always has the same name.
 *
 * Markers are created under a temporary name and renamed into place,
 * so a concurrent scan of the roots directory sees either no marker or
 * a complete one.
 */
class RootMaterializer
{
    StoreDirConfig storeConfig;
    std::filesystem::path rootsDir;

public:

    RootMaterializer(StoreDirConfig storeConfig, std::filesystem::path rootsDir);

    virtual ~RootMaterializer() = default;

    const std::filesystem::path & getRootsDir() const
    {
        return rootsDir;
    }

    const StoreDirConfig & getStoreConfig() const
    {
        return storeConfig;
    }

    /**
     * Create the marker for `path`. Creating an existing marker
     * succeeds. The roots directory is created if it does not exist.
     *
     * @throws MaterializationError
     */
    virtual void create(const StorePath & path);

    /**
     * Remove the marker for `path`. A missing marker is not an error.
     *
     * @throws MaterializationError
     */
    virtual void remove(const StorePath & path);

    /**
     * Remove the marker with the given file name.
     */
    virtual void removeMarker(std::string_view name);

    std::string markerName(const StorePath & path) const;

    std::filesystem::path markerPath(const StorePath & path) const;

    bool exists(const StorePath & path) const;

    /**
     * @return true if `name` has the shape of a marker name (32 base-32
     * characters).
     */
    static bool isMarkerName(std::string_view name);

    /**
     * @return true if `name` is a temporary link left behind by an
     * interrupted `create()`.
     */
    static bool isTempName(std::string_view name);

    /**
     * Return the markers in the roots directory, as a map from marker
     * name to link target. Entries that are not markers are ignored.
     * A missing roots directory yields an empty map.
     */
    std::map<std::string, Path> listMarkers() const;

    /**
     * Delete leftover temporary links.
     *
     * @return the number of links that were removed.
     */
    size_t removeTempLinks();
};

} // namespace gcrelay

#include "gcrelay/store/root-materializer.hh"
#include "gcrelay/util/base-nix-32.hh"
#include "gcrelay/util/file-system.hh"
#include "gcrelay/util/hash.hh"
#include "gcrelay/util/logging.hh"

#include <unistd.h>

namespace gcrelay {

RootMaterializer::RootMaterializer(StoreDirConfig storeConfig, std::filesystem::path rootsDir)
    : storeConfig(std::move(storeConfig))
    , rootsDir(std::move(rootsDir))
{
}

std::string RootMaterializer::markerName(const StorePath & path) const
{
    return hashString(HashAlgorithm::SHA1, storeConfig.printStorePath(path)).to_string(HashFormat::Nix32, false);
}

std::filesystem::path RootMaterializer::markerPath(const StorePath & path) const
{
    return rootsDir / markerName(path);
}

bool RootMaterializer::exists(const StorePath & path) const
{
    return (bool) maybeLstat(markerPath(path).string());
}

void RootMaterializer::create(const StorePath & path)
{
    auto target = storeConfig.printStorePath(path);
    auto link = markerPath(path);

    try {
        createDirs(rootsDir);
        replaceSymlink(target, link);
    } catch (SysError & e) {
        throw MaterializationError(e.errNo, "creating root marker %s for '%s'", link, target);
    }

    debug("created root marker %s -> '%s'", link, target);
}

void RootMaterializer::remove(const StorePath & path)
{
    removeMarker(markerName(path));
}

void RootMaterializer::removeMarker(std::string_view name)
{
    auto link = rootsDir / name;

    if (unlink(link.c_str()) == -1) {
        if (errno == ENOENT)
            return;
        throw MaterializationError("removing root marker %s", link);
    }

    debug("removed root marker %s", link);
}

bool RootMaterializer::isMarkerName(std::string_view name)
{
    if (name.size() != BaseNix32::encodedLength(regularHashSize(HashAlgorithm::SHA1)))
        return false;
    for (auto c : name)
        if (!BaseNix32::lookupReverse(c))
            return false;
    return true;
}

bool RootMaterializer::isTempName(std::string_view name)
{
    /* Temporary links are named `.<n>_<marker name>`. */
    if (name.size() < 3 || name[0] != '.')
        return false;
    auto underscore = name.find('_');
    if (underscore == name.npos || underscore == 1)
        return false;
    for (auto c : name.substr(1, underscore - 1))
        if (c < '0' || c > '9')
            return false;
    return isMarkerName(name.substr(underscore + 1));
}

std::map<std::string, Path> RootMaterializer::listMarkers() const
{
    std::map<std::string, Path> markers;

    if (!pathExists(rootsDir))
        return markers;

    try {
        for (auto & i : DirectoryIterator{rootsDir}) {
            auto name = i.path().filename().string();
            if (!isMarkerName(name))
                continue;
            if (i.symlink_status().type() != std::filesystem::file_type::symlink) {
                warn("ignoring non-symlink %s in the roots directory", i.path());
                continue;
            }
            markers.emplace(name, readLink(i.path().string()));
        }
    } catch (SysError & e) {
        throw MaterializationError(e.errNo, "listing root markers in %s", rootsDir);
    }

    return markers;
}

size_t RootMaterializer::removeTempLinks()
{
    size_t removed = 0;

    if (!pathExists(rootsDir))
        return removed;

    try {
        for (auto & i : DirectoryIterator{rootsDir}) {
            if (!isTempName(i.path().filename().string()))
                continue;
            if (unlink(i.path().c_str()) == -1) {
                if (errno == ENOENT)
                    continue;
                throw SysError("removing temporary link %s", i.path());
            }
            debug("removed temporary link %s", i.path());
            removed++;
        }
    } catch (SysError & e) {
        throw MaterializationError(e.errNo, "cleaning up temporary links in %s", rootsDir);
    }

    return removed;
}

} // namespace gcrelay

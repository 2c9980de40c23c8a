#include "gcrelay/store/store-dir-config.hh"
#include "gcrelay/util/file-system.hh"
#include "gcrelay/util/util.hh"

namespace gcrelay {

StoreDirConfig::StoreDirConfig(Path storeDir)
    : storeDir(std::move(storeDir))
{
}

StorePath StoreDirConfig::parseStorePath(std::string_view path) const
{
    if (!isAbsolute(path))
        throw BadStorePath("path '%s' is not an absolute path", path);
    if (path.find('\0') != path.npos)
        throw BadStorePath("path '%s' contains a NUL character", path);
    auto p = canonPath(path);
    if (dirOf(p) != storeDir)
        throw BadStorePath("path '%s' is not in the Nix store", p);
    return StorePath(baseNameOf(p));
}

std::optional<StorePath> StoreDirConfig::maybeParseStorePath(std::string_view path) const
{
    try {
        return parseStorePath(path);
    } catch (Error &) {
        return {};
    }
}

std::string StoreDirConfig::printStorePath(const StorePath & path) const
{
    return (storeDir + "/").append(path.to_string());
}

} // namespace gcrelay

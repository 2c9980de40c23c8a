#pragma once
///@file

#include "gcrelay/store/path.hh"
#include "gcrelay/util/error.hh"

#include <optional>
#include <string>
#include <utility>

namespace gcrelay {

MakeError(BadStorePath, Error);
MakeError(BadStorePathName, BadStorePath);

/**
 * The location of the store, and the pure operations that convert
 * between printed paths and `StorePath`s.
 */
struct StoreDirConfig
{
    Path storeDir;

    StoreDirConfig(Path storeDir);

    /**
     * Parse a printed store path, i.e. a direct child of `storeDir`.
     *
     * @throws BadStorePath if the path is not in the store or is not
     * a valid store path.
     */
    StorePath parseStorePath(std::string_view path) const;

    std::optional<StorePath> maybeParseStorePath(std::string_view path) const;

    std::string printStorePath(const StorePath & path) const;
};

} // namespace gcrelay

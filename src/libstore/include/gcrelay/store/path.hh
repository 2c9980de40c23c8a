#pragma once
///@file

#include <set>
#include <string_view>
#include <vector>

#include "gcrelay/util/types.hh"

namespace gcrelay {

struct Hash;

/**
 * Check whether a name is a valid store path name.
 *
 * @throws BadStorePathName if the name is invalid. The message is of the format "name %s is not valid, for this
 * specific reason".
 */
void checkName(std::string_view name);

/**
 * A store path without its store directory, i.e. `<hash>-<name>`.
 * The relay never looks inside the store object it names; it is only
 * checked for existence and used as the target of a root marker.
 */
class StorePath
{
    std::string baseName;

public:

    /**
     * Size of the hash part of store paths, in base-32 characters.
     */
    constexpr static size_t HashLen = 32; // i.e. 160 bits

    constexpr static size_t MaxPathLen = 211;

    StorePath() = delete;

    /** @throws BadStorePath */
    StorePath(std::string_view baseName);

    /** @throws BadStorePath */
    StorePath(const Hash & hash, std::string_view name);

    std::string_view to_string() const noexcept
    {
        return baseName;
    }

    bool operator==(const StorePath & other) const noexcept = default;
    auto operator<=>(const StorePath & other) const noexcept = default;

    std::string_view name() const
    {
        return std::string_view(baseName).substr(HashLen + 1);
    }

    std::string_view hashPart() const
    {
        return std::string_view(baseName).substr(0, HashLen);
    }

    static StorePath dummy;
};

typedef std::set<StorePath> StorePathSet;
typedef std::vector<StorePath> StorePaths;

} // namespace gcrelay

namespace std {

template<>
struct hash<gcrelay::StorePath>
{
    std::size_t operator()(const gcrelay::StorePath & path) const noexcept
    {
        return *(std::size_t *) path.to_string().data();
    }
};

} // namespace std

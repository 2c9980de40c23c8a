#pragma once
///@file

#include "gcrelay/util/types.hh"
#include "gcrelay/util/error.hh"

#include <cassert>
#include <compare>
#include <optional>

namespace gcrelay {


enum struct HashAlgorithm : char { SHA1 = 43, SHA256 };

constexpr inline size_t regularHashSize(HashAlgorithm type)
{
    switch (type) {
    case HashAlgorithm::SHA1:
        return 20;
    case HashAlgorithm::SHA256:
        return 32;
    default:
        assert(false);
    }
}

enum struct HashFormat : int {
    /// @brief Lowercase hexadecimal encoding.
    Base16,
    /// @brief Nix-specific base-32 encoding. @see BaseNix32
    Nix32,
};

struct Hash
{
    constexpr static size_t maxHashSize = 32;
    size_t hashSize = 0;
    uint8_t hash[maxHashSize] = {};

    HashAlgorithm algo;

    /**
     * Create a zero-filled hash object.
     */
    explicit Hash(HashAlgorithm algo);

    bool operator==(const Hash & h2) const noexcept;

    std::strong_ordering operator<=>(const Hash & h2) const noexcept;

    /**
     * Return a string representation of the hash, in base-16 or
     * Nix32. If `includeAlgo` is set, the algorithm is prepended,
     * separated by a colon.
     */
    [[nodiscard]] std::string to_string(HashFormat hashFormat, bool includeAlgo) const;
};

/**
 * Compute the hash of the given string.
 */
Hash hashString(HashAlgorithm ha, std::string_view s);

std::string_view printHashAlgo(HashAlgorithm ha);

} // namespace gcrelay

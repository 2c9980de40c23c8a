#pragma once
///@file

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace gcrelay {

/**
 * Nix's own base-32 encoding, used for the hash part of store paths
 * and for root marker names.
 */
struct BaseNix32
{
    /// omitted: E O U T
    constexpr static std::string_view characters = "0123456789abcdfghijklmnpqrsvwxyz";

private:
    static const std::array<uint8_t, 256> reverseMap;

    const static constexpr uint8_t invalid = 0xFF;

public:
    static inline std::optional<uint8_t> lookupReverse(char base32)
    {
        uint8_t digit = reverseMap[static_cast<unsigned char>(base32)];
        if (digit == invalid)
            return std::nullopt;
        else
            return digit;
    }

    [[nodiscard]] constexpr static inline size_t encodedLength(size_t originalLength)
    {
        if (originalLength == 0)
            return 0;
        return (originalLength * 8 - 1) / 5 + 1;
    }

    static std::string encode(std::span<const std::byte> originalData);
};

} // namespace gcrelay

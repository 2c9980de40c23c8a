#include <algorithm>

#include "gcrelay/util/base-nix-32.hh"
#include "gcrelay/util/hash.hh"

namespace gcrelay {

constexpr const std::array<unsigned char, 256> BaseNix32::reverseMap = [] {
    std::array<unsigned char, 256> map{};

    map.fill(invalid);

    for (unsigned char i = 0; i < 32; ++i)
        map[static_cast<unsigned char>(characters[i])] = i;

    return map;
}();

std::string BaseNix32::encode(std::span<const std::byte> bs)
{
    if (bs.empty())
        return {};

    size_t len = encodedLength(bs.size());
    assert(len);

    std::string s;
    s.reserve(len);

    for (size_t n = len; n-- > 0;) {
        size_t b = n * 5;
        size_t i = b / 8;
        uint8_t j = b % 8;
        std::byte c = (bs.data()[i] >> j) | (i >= bs.size() - 1 ? std::byte{0} : bs.data()[i + 1] << (8 - j));
        s.push_back(characters[uint8_t(c & std::byte{0x1f})]);
    }

    return s;
}

} // namespace gcrelay

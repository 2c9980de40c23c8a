#pragma once
///@file

#include <rapidcheck/gen/Arbitrary.h>

#include "gcrelay/util/hash.hh"

namespace rc {
using namespace gcrelay;

template<>
struct Arbitrary<Hash>
{
    static Gen<Hash> arbitrary();
};

} // namespace rc

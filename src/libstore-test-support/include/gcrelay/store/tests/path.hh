#pragma once
///@file

#include <rapidcheck/gen/Arbitrary.h>

#include "gcrelay/store/path.hh"

namespace gcrelay {

struct StorePathName
{
    std::string name;
};

// For rapidcheck
void showValue(const StorePath & p, std::ostream & os);

} // namespace gcrelay

namespace rc {
using namespace gcrelay;

template<>
struct Arbitrary<StorePathName>
{
    static Gen<StorePathName> arbitrary();
};

template<>
struct Arbitrary<StorePath>
{
    static Gen<StorePath> arbitrary();
};

} // namespace rc

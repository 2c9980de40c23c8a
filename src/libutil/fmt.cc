#include "gcrelay/util/fmt.hh"

#include <ostream>

namespace gcrelay {

std::ostream & operator<<(std::ostream & os, const HintFmt & hf)
{
    return os << hf.str();
}

} // namespace gcrelay
